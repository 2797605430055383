#ifndef LMS_CAST_EVENT_LOOP_HPP
#define LMS_CAST_EVENT_LOOP_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <list>
#include <map>
#include <mutex>

#include "scheduler.hpp"

namespace utils
{

class event_loop : public scheduler
{
public:

    event_loop();
    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;
    ~event_loop() override;

    void post(task fn) override;

    timer_id schedule(std::chrono::milliseconds delay, task fn) override;

    void cancel(timer_id id) override;

    std::chrono::steady_clock::time_point now() const override
    {
        return std::chrono::steady_clock::now();
    }

    void offload(task work) override;

    // Stops the worker after the task currently running and waits for offloaded
    // work. Pending tasks are dropped.
    void shutdown();

private:

    using timer_key = std::pair<std::chrono::steady_clock::time_point, timer_id>;

    void run();

    void prune_offloaded();

    std::mutex m_mutex;

    std::condition_variable m_cond;

    std::deque<task> m_tasks;

    std::map<timer_key, task> m_timers;         // Ordered by deadline, then by id

    std::map<timer_id, timer_key> m_timer_index;

    timer_id m_next_id = 1;

    bool m_keep = true;

    std::mutex m_offload_mutex;

    std::list<std::future<void>> m_offloaded;

    std::future<void> m_worker;

};

} // namespace utils

#endif
