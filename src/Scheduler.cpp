#include "Scheduler.hpp"

#include <stdexcept>
#include <utility>

void Scheduler::addTask(std::string name, std::chrono::milliseconds interval, Task task, TimePoint start) {
    if (interval.count() <= 0) throw std::invalid_argument("Scheduler: interval must be positive");
    if (!task) throw std::invalid_argument("Scheduler: empty task " + name);
    m_tasks.push_back(Entry{ std::move(name), interval, std::move(task), start + interval });
}

std::size_t Scheduler::runDue(TimePoint now) {
    std::size_t ran = 0;
    for (auto& e : m_tasks) {
        if (now < e.next) continue;
        // skip whole missed periods
        const auto behind = std::chrono::duration_cast<std::chrono::milliseconds>(now - e.next);
        e.next += e.interval * (behind / e.interval + 1);
        ++ran;
        e.task();
    }
    return ran;
}

std::optional<Scheduler::TimePoint> Scheduler::nextDue() const {
    std::optional<TimePoint> best;
    for (const auto& e : m_tasks) {
        if (!best || e.next < *best) best = e.next;
    }
    return best;
}
