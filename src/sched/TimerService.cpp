#include "lumen/sched/TimerService.hpp"
#include "lumen/log/Log.hpp"

namespace lumen::sched {

TimerService::TimerService()
: io_(std::make_shared<asio::io_context>())
, work_guard_(asio::make_work_guard(*io_))
, t_([this]{ io_->run(); })
{
    logInfo("[TimerService] worker started\n");
}

TimerService::~TimerService() {
    shutdown();
}

void TimerService::shutdown() {
    work_guard_.reset();
    io_->stop();
    if (t_.joinable()) {
        t_.join();
    }
}

} // namespace lumen::sched
