#include "asio_scheduler.H"

namespace perpdesk::stream {

AsioScheduler::AsioScheduler(boost::asio::io_context& io_context) : io_context(io_context) {}

AsioScheduler::~AsioScheduler() {
    for (auto& [id, timer] : timers) {
        timer->cancel();
    }
}

Scheduler::TimerId AsioScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    TimerId id = next_timer_id++;
    auto timer = std::make_unique<boost::asio::steady_timer>(io_context);
    timer->expires_after(delay);
    timer->async_wait([this, id, task = std::move(task)](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        // gone when cancel() ran after the timer expired
        auto it = timers.find(id);
        if (it == timers.end()) {
            return;
        }
        timers.erase(it);
        task();
    });
    timers.emplace(id, std::move(timer));
    return id;
}

void AsioScheduler::cancel(TimerId id) {
    auto it = timers.find(id);
    if (it == timers.end()) {
        return;
    }
    it->second->cancel();
    timers.erase(it);
}

} // namespace perpdesk::stream
