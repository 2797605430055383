#ifndef LMS_CAST_SCHEDULER_HPP
#define LMS_CAST_SCHEDULER_HPP

#include <chrono>
#include <cstdint>
#include <functional>

namespace utils
{

using task = std::function<void()>;
using timer_id = uint64_t;

// Serial executor all controller state lives on. Tasks posted or scheduled here
// never run concurrently with each other.
class scheduler
{
public:
    virtual ~scheduler() = default;

    virtual void post(task fn) = 0;

    // Returns an id that stays valid for cancel() until the task has run
    virtual timer_id schedule(std::chrono::milliseconds delay, task fn) = 0;

    // Cancelling an unknown or already fired id is a no-op
    virtual void cancel(timer_id id) = 0;

    virtual std::chrono::steady_clock::time_point now() const = 0;

    // Runs blocking work outside of the serial executor. The work has to post
    // its results back with post().
    virtual void offload(task work) = 0;
};

} // namespace utils

#endif
