#include "event_loop.hpp"

#include <exception>

#include "log.hpp"

using namespace std::chrono_literals;

namespace utils
{

event_loop::event_loop()
{
    m_worker = std::async(std::launch::async, [this]()
    {
        this->run();
    });
}

event_loop::~event_loop()
{
    shutdown();
}

void event_loop::post(task fn)
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(!m_keep)
            return;
        m_tasks.push_back(std::move(fn));
    }
    m_cond.notify_one();
}

timer_id event_loop::schedule(std::chrono::milliseconds delay, task fn)
{
    timer_id id;
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        id = m_next_id++;
        timer_key key {std::chrono::steady_clock::now() + delay, id};
        m_timers.emplace(key, std::move(fn));
        m_timer_index.emplace(id, key);
    }
    m_cond.notify_one();
    return id;
}

void event_loop::cancel(timer_id id)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    auto it = m_timer_index.find(id);
    if(it == m_timer_index.end())
        return;

    m_timers.erase(it->second);
    m_timer_index.erase(it);
}

void event_loop::offload(task work)
{
    prune_offloaded();

    std::lock_guard<std::mutex> lock {m_offload_mutex};
    m_offloaded.push_back(std::async(std::launch::async, [work = std::move(work)]()
    {
        try {
            work();
        } catch(const std::exception& e) {
            log::error("[Loop] Offloaded task failed: {}", e.what());
        }
    }));
}

void event_loop::shutdown()
{
    {
        std::lock_guard<std::mutex> lock {m_mutex};
        if(!m_keep)
            return;
        m_keep = false;
        m_tasks.clear();
        m_timers.clear();
        m_timer_index.clear();
    }
    m_cond.notify_all();

    if(m_worker.valid())
        m_worker.get();

    // Offloaded work may still reference objects owned by the caller
    std::lock_guard<std::mutex> lock {m_offload_mutex};
    for(auto& fut : m_offloaded)
        fut.wait();
    m_offloaded.clear();
}

void event_loop::run()
{
    std::unique_lock<std::mutex> lock {m_mutex};
    while(m_keep)
    {
        task next;
        if(!m_tasks.empty())
        {
            next = std::move(m_tasks.front());
            m_tasks.pop_front();
        }
        else if(!m_timers.empty() && m_timers.begin()->first.first <= std::chrono::steady_clock::now())
        {
            auto it = m_timers.begin();
            next = std::move(it->second);
            m_timer_index.erase(it->first.second);
            m_timers.erase(it);
        }
        else
        {
            if(m_timers.empty())
                m_cond.wait(lock);
            else
                m_cond.wait_until(lock, m_timers.begin()->first.first);
            continue;
        }

        lock.unlock();
        try {
            next();
        } catch(const std::exception& e) {
            log::error("[Loop] Task failed: {}", e.what());
        }
        lock.lock();
    }
}

void event_loop::prune_offloaded()
{
    std::lock_guard<std::mutex> lock {m_offload_mutex};
    m_offloaded.remove_if([](const std::future<void>& fut)
    {
        return fut.wait_for(0ms) == std::future_status::ready;
    });
}

} // namespace utils
