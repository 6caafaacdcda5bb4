#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace util
{

using TimerId = std::uint64_t;  // 0 is never handed out

// Injected timer capability: schedule a one-shot callback, cancel it by id.
struct TimerApi
{
    std::function<TimerId(std::function<void()> fn, std::uint32_t ms)> schedule;
    std::function<void(TimerId id)>                                     cancel;

    explicit operator bool() const { return schedule && cancel; }
};

// Single-threaded deadline queue. Nothing fires on its own: the owner calls poll()
// (or run_due() with its own clock) from the same thread that drives everything else.
class TimerQueue
{
  public:
    using Clock = std::chrono::steady_clock;

    TimerId     schedule(std::function<void()> fn, std::uint32_t ms);
    TimerId     schedule_at(Clock::time_point deadline, std::function<void()> fn);
    void        cancel(TimerId id);
    std::size_t run_due(Clock::time_point now);
    std::size_t poll() { return run_due(Clock::now()); }
    std::size_t pending() const { return entries_.size(); }

    // bound to *this; the queue must outlive every user of the api
    TimerApi api();

  private:
    struct Entry
    {
        Clock::time_point     deadline;
        std::function<void()> fn;
    };
    std::map<TimerId, Entry> entries_;
    TimerId                  next_id_{1};
};

}  // namespace util
