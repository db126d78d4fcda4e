#pragma once

namespace ds::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;
};

}
