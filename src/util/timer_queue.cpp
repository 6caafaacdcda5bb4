#include <algorithm>
#include <utility>
#include <vector>

#include "util/timer_queue.hpp"

namespace util
{

TimerId TimerQueue::schedule(std::function<void()> fn, std::uint32_t ms)
{
    return schedule_at(Clock::now() + std::chrono::milliseconds(ms), std::move(fn));
}

TimerId TimerQueue::schedule_at(Clock::time_point deadline, std::function<void()> fn)
{
    const TimerId id = next_id_++;
    entries_.emplace(id, Entry{deadline, std::move(fn)});
    return id;
}

void TimerQueue::cancel(TimerId id)
{
    entries_.erase(id);
}

std::size_t TimerQueue::run_due(Clock::time_point now)
{
    // snapshot first: callbacks may cancel or schedule while we run
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto &kv : entries_)
    {
        if (kv.second.deadline <= now)
            due.emplace_back(kv.second.deadline, kv.first);
    }
    std::sort(due.begin(), due.end());

    std::size_t fired = 0;
    for (const auto &d : due)
    {
        auto it = entries_.find(d.second);
        if (it == entries_.end())
            continue;  // cancelled by an earlier callback
        auto fn = std::move(it->second.fn);
        entries_.erase(it);
        if (fn)
            fn();
        fired++;
    }
    return fired;
}

TimerApi TimerQueue::api()
{
    TimerApi api;
    api.schedule = [this](std::function<void()> fn, std::uint32_t ms) {
        return schedule(std::move(fn), ms);
    };
    api.cancel = [this](TimerId id) { cancel(id); };
    return api;
}

}  // namespace util
