#pragma once
#include "job_registry.hpp"
#include <chrono>
#include <string>
#include <vector>

struct StreamEvent {
    enum class Kind { Line, Done };
    Kind kind{Kind::Line};
    std::string text;                   // Line: one output line as emitted
    JobStatus status{JobStatus::Running}; // Done: the terminal status
};

// One subscriber's view of a job's output. Each subscription has its own
// cursor and starts from the first line, so late joiners still see
// everything. The feed ends with a single Done event once the job is
// terminal, or silently if the job disappears from the registry.
class OutputSubscription {
public:
    OutputSubscription(const JobRegistry& registry, std::string job_id,
                       std::chrono::milliseconds poll_interval = std::chrono::milliseconds(300));

    // Waits at most one poll interval and returns whatever is new. An empty
    // result with finished() == false just means nothing happened yet.
    std::vector<StreamEvent> poll();

    bool finished() const { return finished_; }
    std::size_t cursor() const { return cursor_; }
    const std::string& job_id() const { return id_; }

private:
    const JobRegistry& registry_;
    std::string id_;
    std::chrono::milliseconds poll_interval_;
    std::size_t cursor_{0};
    bool finished_{false};
};

// Server-sent-events framing of one event.
std::string format_sse(const StreamEvent& ev);
std::string format_sse_keepalive();
