#pragma once

#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace cr {

// Owns a set of worker threads and joins every one that is still joinable when
// the group is destroyed, including during stack unwinding. A std::thread
// destroyed while joinable terminates the process.
class ThreadGroup {
public:
    ThreadGroup() = default;
    ~ThreadGroup() { joinAll(); }

    ThreadGroup(const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    void reserve(size_t count) { m_threads.reserve(count); }

    // Throws std::system_error when the thread cannot be started. Threads
    // started before the failure stay owned by the group.
    template <typename Fn>
    void spawn(Fn&& fn)
    {
        m_threads.emplace_back(std::forward<Fn>(fn));
    }

    void joinAll()
    {
        for (std::thread& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }

    size_t size() const { return m_threads.size(); }

private:
    std::vector<std::thread> m_threads;
};

} // namespace cr
