#include "retention_sweeper.hpp"
#include "log.hpp"

std::size_t RetentionSweeper::purge(std::chrono::steady_clock::time_point now) {
    std::size_t removed = registry_.remove_if([&](const Job& j) {
        return is_terminal(j.status) && j.finished_mono && now - *j.finished_mono > ttl_;
    });
    if (removed) log_info("purged " + std::to_string(removed) + " expired job(s)");
    return removed;
}
