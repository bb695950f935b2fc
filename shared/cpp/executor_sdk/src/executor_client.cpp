#include "../include/executor_client.hpp"
#include <curl/curl.h>
#include <exception>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw ExecutorClientError(0, "curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct CurlHeaders {
    curl_slist* list{nullptr};
    ~CurlHeaders() { curl_slist_free_all(list); }
};

std::string server_message(long status, const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("error") && j["error"].is_string()) return j["error"].get<std::string>();
    } catch (const json::exception&) {
        // not a JSON error body; fall through to the raw text
    }
    return "HTTP " + std::to_string(status) + (body.empty() ? "" : ": " + body);
}

struct StreamState {
    SseParser parser;
    const std::function<void(const std::string&)>* on_line;
    std::string done_status;
    std::exception_ptr failure;
};

size_t stream_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    auto* st = static_cast<StreamState*>(userp);
    try {
        for (auto& ev : st->parser.feed(std::string(static_cast<char*>(contents), total))) {
            if (ev.event == "done") st->done_status = ev.data;
            else if (ev.event.empty()) (*st->on_line)(ev.data);
        }
    } catch (...) {
        // Exceptions must not unwind through libcurl; rethrown after perform.
        st->failure = std::current_exception();
        return 0;
    }
    return total;
}
}

std::vector<SseParser::Event> SseParser::feed(const std::string& chunk) {
    std::vector<Event> out;
    buf_ += chunk;
    std::size_t start = 0;
    for (std::size_t nl = buf_.find('\n'); nl != std::string::npos; nl = buf_.find('\n', start)) {
        std::string line = buf_.substr(start, nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        take_line(std::move(line), out);
        start = nl + 1;
    }
    buf_.erase(0, start);
    return out;
}

void SseParser::take_line(std::string line, std::vector<Event>& out) {
    if (line.empty()) {
        if (has_data_) out.push_back({event_, data_});
        event_.clear();
        data_.clear();
        has_data_ = false;
        return;
    }
    if (line[0] == ':') return; // comment / keep-alive
    std::string field = line, value;
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
    }
    if (field == "event") {
        event_ = value;
    } else if (field == "data") {
        if (has_data_) data_ += '\n';
        data_ += value;
        has_data_ = true;
    }
}

ExecutorClient::ExecutorClient(std::string base_url, long timeout_ms) : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

ExecutorClient::Response ExecutorClient::request(const std::string& method, const std::string& path,
                                                 const std::string& body) {
    CurlHandle c;
    CurlHeaders headers;
    std::string url = base_ + path;
    Response resp;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c.h, CURLOPT_TIMEOUT_MS, timeout_ms_);
    if (method == "POST") {
        headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw ExecutorClientError(0, std::string("curl_easy_perform failed: ") + curl_easy_strerror(code));
    }
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    if (resp.status < 200 || resp.status >= 300) {
        throw ExecutorClientError(resp.status, server_message(resp.status, resp.body));
    }
    return resp;
}

std::string ExecutorClient::submit(const std::string& command, const SubmitOptions& opts) {
    json j = {{"command", command}};
    if (opts.cwd) j["cwd"] = *opts.cwd;
    if (opts.timeout_seconds > 0) j["timeout"] = opts.timeout_seconds;
    if (!opts.env.empty()) j["env"] = opts.env;
    auto r = json::parse(request("POST", "/exec", j.dump()).body);
    return r.at("job_id").get<std::string>();
}

RemoteJobStatus ExecutorClient::status(const std::string& id) {
    auto j = json::parse(request("GET", "/status/" + id).body);
    return {j.at("job_id").get<std::string>(), j.at("status").get<std::string>(), j.value("command", std::string())};
}

RemoteJobResult ExecutorClient::result(const std::string& id) {
    auto j = json::parse(request("GET", "/result/" + id).body);
    RemoteJobResult r;
    r.id = j.at("job_id").get<std::string>();
    r.status = j.at("status").get<std::string>();
    r.stdout_text = j.value("stdout", std::string());
    if (j.contains("returncode") && !j["returncode"].is_null()) r.returncode = j["returncode"].get<int>();
    if (j.contains("error") && !j["error"].is_null()) r.error = j["error"].get<std::string>();
    return r;
}

std::string ExecutorClient::cancel(const std::string& id) {
    auto j = json::parse(request("POST", "/cancel/" + id).body);
    return j.value("message", std::string());
}

std::vector<RemoteJobSummary> ExecutorClient::list() {
    auto j = json::parse(request("GET", "/jobs").body);
    std::vector<RemoteJobSummary> out;
    for (const auto& item : j.at("jobs")) {
        out.push_back({
            item.at("job_id").get<std::string>(),
            item.at("status").get<std::string>(),
            item.value("command", std::string()),
            item.value("created_at", 0.0)
        });
    }
    return out;
}

std::string ExecutorClient::stream(const std::string& id, const std::function<void(const std::string&)>& on_line) {
    CurlHandle c;
    std::string url = base_ + "/exec/stream/" + id;
    StreamState st{SseParser(), &on_line, {}, nullptr};
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, stream_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &st);
    curl_easy_setopt(c.h, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
    // No overall timeout: the stream lasts as long as the job.
    CURLcode code = curl_easy_perform(c.h);
    if (st.failure) std::rethrow_exception(st.failure);
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    if (status == 404) throw ExecutorClientError(status, "Job not found");
    if (status >= 400) throw ExecutorClientError(status, "stream failed: HTTP " + std::to_string(status));
    if (code != CURLE_OK) {
        throw ExecutorClientError(status, std::string("stream failed: ") + curl_easy_strerror(code));
    }
    return st.done_status;
}
