#pragma once

#include <string>

namespace ds::scan {

// Outbound side of a client connection as seen by the scan layer.
class Channel {
public:
    virtual ~Channel() = default;

    virtual const std::string& channelId() const = 0;
    virtual bool isOpen() const = 0;

    // Takes one serialized JSON text frame.
    virtual void send(const std::string& message) = 0;
};

}
