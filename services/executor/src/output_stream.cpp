#include "output_stream.hpp"

OutputSubscription::OutputSubscription(const JobRegistry& registry, std::string job_id,
                                       std::chrono::milliseconds poll_interval)
    : registry_(registry), id_(std::move(job_id)), poll_interval_(poll_interval) {}

std::vector<StreamEvent> OutputSubscription::poll() {
    std::vector<StreamEvent> events;
    if (finished_) return events;

    auto slice = registry_.wait_for_output(id_, cursor_, poll_interval_);
    if (!slice) {
        // purged mid-stream
        finished_ = true;
        return events;
    }
    events.reserve(slice->lines.size() + 1);
    for (auto& line : slice->lines) {
        events.push_back({StreamEvent::Kind::Line, std::move(line), JobStatus::Running});
    }
    cursor_ = slice->next_cursor;
    if (is_terminal(slice->status)) {
        events.push_back({StreamEvent::Kind::Done, {}, slice->status});
        finished_ = true;
    }
    return events;
}

std::string format_sse(const StreamEvent& ev) {
    if (ev.kind == StreamEvent::Kind::Done) {
        return std::string("event: done\ndata: ") + status_name(ev.status) + "\n\n";
    }
    std::string text = ev.text;
    if (!text.empty() && text.back() == '\n') text.pop_back();
    if (!text.empty() && text.back() == '\r') text.pop_back();
    // A bare CR would be read as a line break by SSE parsers.
    for (auto& c : text) {
        if (c == '\r') c = ' ';
    }
    return "data: " + text + "\n\n";
}

std::string format_sse_keepalive() { return ": keep-alive\n\n"; }
