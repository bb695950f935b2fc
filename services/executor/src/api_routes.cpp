#include "api_routes.hpp"
#include "file_ops.hpp"
#include "log.hpp"

using json = nlohmann::json;

std::string dump_json(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

ApiResponse json_response(int status, const json& j) {
    return ApiResponse{status, dump_json(j), "application/json"};
}

ApiResponse error_response(int status, const std::string& message) {
    return json_response(status, json{{"error", message}});
}

JobRequest parse_job_request(const std::string& body) {
    auto j = json::parse(body);
    JobRequest req;
    req.command = j.at("command").get<std::string>();
    if (j.contains("cwd") && !j["cwd"].is_null()) req.cwd = j["cwd"].get<std::string>();
    if (j.contains("timeout") && !j["timeout"].is_null()) req.timeout_seconds = j["timeout"].get<int>();
    if (j.contains("env") && !j["env"].is_null()) {
        req.env = j["env"].get<std::map<std::string, std::string>>();
    }
    return req;
}

static json optional_int(const std::optional<int>& v) { return v ? json(*v) : json(nullptr); }
static json optional_str(const std::optional<std::string>& v) { return v ? json(*v) : json(nullptr); }

static std::string path_tail(const std::string& path, const std::string& prefix) {
    return path.substr(prefix.size());
}

static std::string query_or(const ApiRequest& req, const std::string& key, const std::string& def) {
    auto it = req.query.find(key);
    return it == req.query.end() || it->second.empty() ? def : it->second;
}

ApiResponse file_error_response(const FileOpError& e) {
    switch (e.code()) {
        case FileErrorCode::NotFound: return error_response(404, e.what());
        case FileErrorCode::NotADirectory: return error_response(400, e.what());
        case FileErrorCode::PermissionDenied:
        case FileErrorCode::InvalidPath: return error_response(403, e.what());
    }
    return error_response(500, e.what());
}

static ApiResponse route(ExecutorService& svc, const ApiRequest& req) {
    const std::string& path = req.path;

    if (req.method == "GET" && path == "/health") {
        auto h = svc.health();
        return json_response(200, {{"status", "ok"}, {"uptime", h.uptime_seconds}, {"jobs_count", h.jobs_count}});
    }
    if (req.method == "POST" && path == "/exec") {
        std::string id = svc.submit(parse_job_request(req.body));
        return json_response(200, {{"job_id", id}});
    }
    if (req.method == "GET" && path.rfind("/status/", 0) == 0) {
        auto s = svc.get_status(path_tail(path, "/status/"));
        return json_response(200, {{"job_id", s.id}, {"status", status_name(s.status)}, {"command", s.command}});
    }
    if (req.method == "GET" && path.rfind("/result/", 0) == 0) {
        auto r = svc.get_result(path_tail(path, "/result/"));
        return json_response(200, {
            {"job_id", r.id},
            {"status", status_name(r.status)},
            {"stdout", r.result.stdout_text},
            {"stderr", ""},
            {"returncode", optional_int(r.result.returncode)},
            {"error", optional_str(r.result.error)}
        });
    }
    if (req.method == "POST" && path.rfind("/cancel/", 0) == 0) {
        auto c = svc.cancel(path_tail(path, "/cancel/"));
        return json_response(200, {{"message", c.message}, {"status", status_name(c.status)}});
    }
    if (req.method == "GET" && path == "/jobs") {
        json arr = json::array();
        for (const auto& s : svc.list()) {
            arr.push_back({
                {"job_id", s.id},
                {"status", status_name(s.status)},
                {"command", s.command},
                {"created_at", s.created_at}
            });
        }
        return json_response(200, {{"jobs", arr}});
    }
    if (req.method == "GET" && path == "/browse") {
        auto b = browse_directory(query_or(req, "path", svc.config().workspace_dir.string()));
        json entries = json::array();
        for (const auto& e : b.entries) {
            entries.push_back({
                {"name", e.name},
                {"type", e.type},
                {"size", e.size ? json(*e.size) : json(nullptr)}
            });
        }
        return json_response(200, {{"path", b.path.string()}, {"entries", entries}});
    }
    if (req.method == "GET" && path == "/files") {
        json files = json::array();
        for (const auto& f : list_files(svc.config().output_dir)) {
            files.push_back({{"name", f.name}, {"size", f.size}});
        }
        return json_response(200, {{"files", files}});
    }
    if (req.method == "GET" && path == "/disk") {
        auto d = disk_usage(svc.config().workspace_dir);
        return json_response(200, {{"total_gb", d.total_gb}, {"used_gb", d.used_gb}, {"free_gb", d.free_gb}});
    }
    return error_response(404, "not found");
}

ApiResponse handle_api_request(ExecutorService& svc, const ApiRequest& req) {
    try {
        return route(svc, req);
    } catch (const CommandRejected& e) {
        return error_response(400, e.what());
    } catch (const JobNotFound&) {
        return error_response(404, "Job not found");
    } catch (const ServiceStopping& e) {
        return error_response(503, e.what());
    } catch (const FileOpError& e) {
        return file_error_response(e);
    } catch (const json::exception& e) {
        return error_response(400, e.what());
    } catch (const std::exception& e) {
        log_error(req.method + " " + req.path + " failed: " + e.what());
        return error_response(500, e.what());
    }
}
