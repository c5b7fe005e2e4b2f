#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

// Cooperative, single-threaded periodic tasks. The owner calls runDue() from
// its own loop; each task runs at most once per call, and missed periods are
// skipped rather than replayed.
class Scheduler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Task      = std::function<void()>;

    void addTask(std::string name, std::chrono::milliseconds interval, Task task, TimePoint start);

    // Returns how many tasks ran. Exceptions from a task propagate after its
    // next due time has been advanced.
    std::size_t runDue(TimePoint now);

    std::optional<TimePoint> nextDue() const;
    std::size_t taskCount() const { return m_tasks.size(); }

private:
    struct Entry {
        std::string name;
        std::chrono::milliseconds interval;
        Task task;
        TimePoint next;
    };
    std::vector<Entry> m_tasks;
};
