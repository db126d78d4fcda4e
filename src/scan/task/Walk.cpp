#include "scan/task/Walk.hpp"
#include "scan/Controller.hpp"

void ds::scan::task::Walk::operator()() {
    controller_->run(task_);
}
