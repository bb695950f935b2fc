#pragma once
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct SubmitOptions {
    std::optional<std::string> cwd;
    int timeout_seconds{0}; // 0 = server default
    std::map<std::string, std::string> env;
};

struct RemoteJobStatus {
    std::string id;
    std::string status;
    std::string command;
};

struct RemoteJobResult {
    std::string id;
    std::string status;
    std::string stdout_text;
    std::optional<int> returncode;
    std::optional<std::string> error;
};

struct RemoteJobSummary {
    std::string id;
    std::string status;
    std::string command;
    double created_at{0.0};
};

// Non-2xx answer from the server, or a transport failure (http_status 0).
class ExecutorClientError : public std::runtime_error {
public:
    ExecutorClientError(long http_status, const std::string& msg) : std::runtime_error(msg), http_status_(http_status) {}
    long http_status() const { return http_status_; }

private:
    long http_status_;
};

// Incremental text/event-stream parser; chunks may split lines anywhere.
class SseParser {
public:
    struct Event {
        std::string event; // empty for plain messages
        std::string data;
    };
    std::vector<Event> feed(const std::string& chunk);

private:
    void take_line(std::string line, std::vector<Event>& out);

    std::string buf_;
    std::string event_;
    std::string data_;
    bool has_data_{false};
};

class ExecutorClient {
public:
    explicit ExecutorClient(std::string base_url, long timeout_ms = 30000);

    std::string submit(const std::string& command, const SubmitOptions& opts = {});
    RemoteJobStatus status(const std::string& id);
    RemoteJobResult result(const std::string& id);
    std::string cancel(const std::string& id); // server's message
    std::vector<RemoteJobSummary> list();

    // Calls on_line for every output line until the job ends. Returns the
    // terminal status from the done marker, or "" if the stream just closed.
    std::string stream(const std::string& id, const std::function<void(const std::string&)>& on_line);

private:
    struct Response {
        long status{0};
        std::string body;
    };
    Response request(const std::string& method, const std::string& path, const std::string& body = {});

    std::string base_;
    long timeout_ms_;
};
