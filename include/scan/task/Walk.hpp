#pragma once

#include "concurrency/Task.hpp"

#include <memory>

namespace ds::scan {
class Controller;
class Task;
}

namespace ds::scan::task {

struct Walk final : concurrency::Task {
    Walk(std::shared_ptr<const Controller> controller, std::shared_ptr<scan::Task> task)
        : controller_(std::move(controller)), task_(std::move(task)) {}

    void operator()() override;

private:
    std::shared_ptr<const Controller> controller_;
    std::shared_ptr<scan::Task> task_;
};

}
