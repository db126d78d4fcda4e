#pragma once

#include "concurrency/AsyncService.hpp"

#include <memory>
#include <thread>

namespace boost::asio { class io_context; }

namespace ds::concurrency { class ThreadPool; }
namespace ds::scan { class Controller; class TaskRegistry; }

namespace ds::protocols {

namespace ws { class Server; }
namespace http { class Server; }

class ProtocolService final : public concurrency::AsyncService {
public:
    ProtocolService();
    ~ProtocolService() override;

protected:
    void runLoop() override;

private:
    std::thread ioThread_;
    std::shared_ptr<boost::asio::io_context> ioContext_;
    std::shared_ptr<ws::Server> wsServer_;
    std::shared_ptr<http::Server> httpServer_;

    std::shared_ptr<concurrency::ThreadPool> scanPool_;
    std::shared_ptr<scan::TaskRegistry> registry_;
    std::shared_ptr<scan::Controller> controller_;

    void initScanning();
    void initProtocols();
    void initWebsocketServer();
    void initHttpServer();
    void runIoContext() const;
    void shutdown();
};

}
