#include "http_server.hpp"
#include "api_routes.hpp"
#include "file_ops.hpp"
#include "log.hpp"
#include "output_stream.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <microhttpd.h>
#include <sys/stat.h>
#include <unistd.h>

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxJsonBody = 1 << 20;
constexpr std::size_t kPostBufferSize = 64 * 1024;
constexpr std::size_t kStreamBlockSize = 4096;
constexpr std::chrono::seconds kKeepAliveInterval{15};

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
    std::string body_error;

    // multipart upload state
    MHD_PostProcessor* pp{nullptr};
    std::unique_ptr<UploadSink> upload;
    std::string upload_filename;
    std::string dest_dir;

    ConnInfo(const char* m, const char* u) : method(m), url(u) {}
    ~ConnInfo() {
        if (pp) MHD_destroy_post_processor(pp);
    }
};

struct StreamContext {
    explicit StreamContext(OutputSubscription s) : sub(std::move(s)), last_write(std::chrono::steady_clock::now()) {}
    OutputSubscription sub;
    std::string pending;
    std::chrono::steady_clock::time_point last_write;
};

void add_header(MHD_Response* resp, const char* name, const std::string& value) {
    if (MHD_add_response_header(resp, name, value.c_str()) != MHD_YES) {
        log_warn(std::string("cannot set response header ") + name);
    }
}

MhdResult send_response(MHD_Connection* conn, int status, const std::string& body,
                        const char* ctype = "application/json") {
    MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    add_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, (unsigned int)status, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult send_api(MHD_Connection* conn, const ApiResponse& r) {
    return send_response(conn, r.status, r.body, r.content_type.c_str());
}

std::map<std::string, std::string> parse_query(MHD_Connection* conn) {
    std::map<std::string, std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string, std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

ssize_t stream_reader(void* cls, uint64_t /*pos*/, char* buf, size_t max) {
    auto* ctx = static_cast<StreamContext*>(cls);
    try {
        while (ctx->pending.empty()) {
            if (ctx->sub.finished()) return MHD_CONTENT_READER_END_OF_STREAM;
            for (const auto& ev : ctx->sub.poll()) ctx->pending += format_sse(ev);
            // A periodic comment lets a dead client surface as a failed write.
            if (ctx->pending.empty() && !ctx->sub.finished() &&
                std::chrono::steady_clock::now() - ctx->last_write >= kKeepAliveInterval) {
                ctx->pending = format_sse_keepalive();
            }
        }
        std::size_t n = std::min(max, ctx->pending.size());
        std::memcpy(buf, ctx->pending.data(), n);
        ctx->pending.erase(0, n);
        ctx->last_write = std::chrono::steady_clock::now();
        return (ssize_t)n;
    } catch (const std::exception& e) {
        log_error("stream " + ctx->sub.job_id() + " aborted: " + e.what());
        return MHD_CONTENT_READER_END_WITH_ERROR;
    }
}

void stream_free(void* cls) { delete static_cast<StreamContext*>(cls); }

MhdResult serve_stream(HttpServer& server, MHD_Connection* conn, const std::string& id) {
    auto ctx = std::make_unique<StreamContext>(server.service().subscribe(id));
    MHD_Response* resp = MHD_create_response_from_callback(MHD_SIZE_UNKNOWN, kStreamBlockSize,
                                                           &stream_reader, ctx.get(), &stream_free);
    if (!resp) return MHD_NO;
    ctx.release(); // owned by the response now
    add_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "text/event-stream");
    add_header(resp, MHD_HTTP_HEADER_CACHE_CONTROL, "no-cache");
    MhdResult ret = MHD_queue_response(conn, MHD_HTTP_OK, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult serve_download(HttpServer& server, MHD_Connection* conn, const std::string& name) {
    auto path = resolve_download(server.config().output_dir, name);
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return send_api(conn, error_response(404, "File not found"));
    struct stat st{};
    if (::fstat(fd, &st) != 0) {
        ::close(fd);
        return send_api(conn, error_response(500, "cannot stat file"));
    }
    MHD_Response* resp = MHD_create_response_from_fd((uint64_t)st.st_size, fd);
    if (!resp) {
        ::close(fd);
        return MHD_NO;
    }
    add_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, "application/octet-stream");
    add_header(resp, MHD_HTTP_HEADER_CONTENT_DISPOSITION,
               "attachment; filename=\"" + path.filename().string() + "\"");
    MhdResult ret = MHD_queue_response(conn, MHD_HTTP_OK, resp);
    MHD_destroy_response(resp);
    return ret;
}

MhdResult upload_iterator(void* cls, enum MHD_ValueKind /*kind*/, const char* key, const char* filename,
                          const char* /*content_type*/, const char* /*transfer_encoding*/,
                          const char* data, uint64_t /*off*/, size_t size) {
    auto* ci = static_cast<ConnInfo*>(cls);
    try {
        std::string k = key ? key : "";
        if (k == "dest_dir") {
            ci->dest_dir.append(data, size);
        } else if (k == "file") {
            if (!ci->upload) {
                ci->upload = std::make_unique<UploadSink>();
                ci->upload_filename = filename ? filename : "";
            }
            if (size) ci->upload->write(data, size);
        }
        return MHD_YES;
    } catch (const std::exception& e) {
        ci->body_error = e.what();
        return MHD_NO;
    }
}

MhdResult serve_upload(HttpServer& server, MHD_Connection* conn, ConnInfo& ci) {
    if (!ci.pp) return send_api(conn, error_response(400, "expected multipart/form-data"));
    if (!ci.body_error.empty()) return send_api(conn, error_response(400, ci.body_error));
    if (!ci.upload) return send_api(conn, error_response(400, "missing file field"));

    std::string dest = ci.dest_dir;
    if (dest.empty()) {
        auto q = parse_query(conn);
        auto it = q.find("dest_dir");
        dest = it != q.end() && !it->second.empty() ? it->second : server.config().workspace_dir.string();
    }
    auto path = ci.upload->commit(dest, ci.upload_filename);
    log_info("uploaded " + path.string() + " (" + std::to_string(ci.upload->bytes_written()) + " bytes)");
    json out = {
        {"message", "File uploaded"},
        {"path", path.string()},
        {"size", ci.upload->bytes_written()}
    };
    return send_api(conn, json_response(200, out));
}

MhdResult handler(void* cls, MHD_Connection* connection, const char* url, const char* method,
                  const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* server = static_cast<HttpServer*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo(method, url);
        *con_cls = ci;
        if (ci->method == "POST" && ci->url == "/upload") {
            ci->pp = MHD_create_post_processor(connection, kPostBufferSize, &upload_iterator, ci);
        }
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            if (ci->pp) {
                if (ci->body_error.empty() && MHD_post_process(ci->pp, upload_data, *upload_data_size) != MHD_YES) {
                    if (ci->body_error.empty()) ci->body_error = "malformed multipart body";
                }
            } else if (ci->body.size() + *upload_data_size > kMaxJsonBody) {
                ci->body_error = "request body too large";
            } else {
                ci->body.append(upload_data, *upload_data_size);
            }
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    std::string path(url);
    try {
        if (ci->method == "GET" && path.rfind("/exec/stream/", 0) == 0) {
            return serve_stream(*server, connection, path.substr(std::strlen("/exec/stream/")));
        }
        if (ci->method == "GET" && path.rfind("/files/", 0) == 0) {
            return serve_download(*server, connection, path.substr(std::strlen("/files/")));
        }
        if (ci->method == "POST" && path == "/upload") {
            return serve_upload(*server, connection, *ci);
        }
        if (!ci->body_error.empty()) return send_api(connection, error_response(413, ci->body_error));

        ApiRequest req{ci->method, path, parse_query(connection), ci->body};
        return send_api(connection, handle_api_request(server->service(), req));
    } catch (const JobNotFound&) {
        return send_api(connection, error_response(404, "Job not found"));
    } catch (const FileOpError& e) {
        return send_api(connection, file_error_response(e));
    } catch (const std::exception& e) {
        log_error(ci->method + " " + path + " failed: " + e.what());
        return send_api(connection, error_response(500, e.what()));
    }
}

void request_completed(void* /*cls*/, MHD_Connection* /*connection*/, void** con_cls,
                       enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

} // namespace

HttpServer::HttpServer(ExecutorService& svc, ServiceConfig cfg) : svc_(svc), cfg_(std::move(cfg)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start() {
    if (daemon_) return true;
    daemon_ = MHD_start_daemon(MHD_USE_THREAD_PER_CONNECTION | MHD_USE_INTERNAL_POLLING_THREAD | MHD_USE_ERROR_LOG,
                               (uint16_t)cfg_.port, nullptr, nullptr, &handler, this,
                               MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                               MHD_OPTION_END);
    if (!daemon_) return false;
    log_info("listening on port " + std::to_string(cfg_.port));
    return true;
}

void HttpServer::stop() {
    if (!daemon_) return;
    MHD_stop_daemon(daemon_);
    daemon_ = nullptr;
    log_info("HTTP server stopped");
}
