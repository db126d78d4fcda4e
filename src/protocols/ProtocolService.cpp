#include "protocols/ProtocolService.hpp"
#include "protocols/TCPAcceptor.hpp"
#include "protocols/ws/Server.hpp"
#include "protocols/http/Server.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/ConfigRegistry.hpp"
#include "scan/Controller.hpp"
#include "scan/Engine.hpp"
#include "scan/Metadata.hpp"
#include "scan/TaskRegistry.hpp"
#include "log/Registry.hpp"

#include <boost/asio/io_context.hpp>

using namespace ds::protocols;
using namespace ds::config;

ProtocolService::ProtocolService() : AsyncService("diskscout") {}

ProtocolService::~ProtocolService() { stop(); }

void ProtocolService::runLoop() {
    log::Registry::diskscout()->info("[diskscout] Starting disk usage service");

    try {
        initScanning();
        initProtocols();
        log::Registry::diskscout()->debug("[diskscout] Protocols initialized successfully");

        while (!shouldStop()) lazySleep(std::chrono::seconds(1));
    } catch (const std::exception& e) {
        log::Registry::diskscout()->error("[diskscout] Exception in run loop: {}", e.what());
    }

    shutdown();
}

void ProtocolService::initScanning() {
    const auto& cfg = ConfigRegistry::get().scan;

    scanPool_ = std::make_shared<concurrency::ThreadPool>("scan", cfg.worker_threads);
    registry_ = std::make_shared<scan::TaskRegistry>();

    auto engine = std::make_shared<scan::Engine>(
        std::make_shared<scan::LocalMetadata>(),
        scan::Engine::Options{.progressInterval = cfg.progress_interval});

    controller_ = std::make_shared<scan::Controller>(registry_, std::move(engine), scanPool_, cfg);

    log::Registry::scan()->info("[diskscout] Scan pool ready with {} worker(s)", scanPool_->workerCount());
}

void ProtocolService::initProtocols() {
    if (const auto& cfg = ConfigRegistry::get(); !cfg.websocket.enabled && !cfg.http.enabled) {
        log::Registry::diskscout()->warn(
            "[diskscout] Both WebSocket and HTTP servers are disabled in configuration. Nothing to start.");
        return;
    }

    ioContext_ = std::make_shared<asio::io_context>();

    initWebsocketServer();
    initHttpServer();

    ioThread_ = std::thread([this] { runIoContext(); });
}

void ProtocolService::runIoContext() const {
    while (!ioContext_->stopped()) {
        try {
            ioContext_->run();
        } catch (const std::exception& e) {
            log::Registry::diskscout()->error("[diskscout] Unhandled exception in io loop: {}", e.what());
        }
    }
}

void ProtocolService::initWebsocketServer() {
    const auto& cfg = ConfigRegistry::get().websocket;
    if (!cfg.enabled) {
        log::Registry::diskscout()->info("[diskscout] WebSocket server is disabled in configuration.");
        return;
    }

    wsServer_ = std::make_shared<ws::Server>(*ioContext_, makeEndpoint(cfg.host, cfg.port), controller_,
                                             static_cast<size_t>(cfg.max_message_bytes));
    wsServer_->run();
}

void ProtocolService::initHttpServer() {
    const auto& cfg = ConfigRegistry::get().http;
    if (!cfg.enabled) {
        log::Registry::diskscout()->info("[diskscout] HTTP server is disabled in configuration.");
        return;
    }

    httpServer_ = std::make_shared<http::Server>(*ioContext_, makeEndpoint(cfg.host, cfg.port));
    httpServer_->run();
}

void ProtocolService::shutdown() {
    if (registry_) {
        if (const auto n = registry_->abortAll(); n > 0)
            log::Registry::scan()->info("[diskscout] Aborted {} running scan(s) on shutdown", n);
    }

    if (ioContext_) ioContext_->stop();
    if (ioThread_.joinable()) ioThread_.join();

    if (scanPool_) scanPool_->stop();

    wsServer_.reset();
    httpServer_.reset();
    controller_.reset();
}
