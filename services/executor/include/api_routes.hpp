#pragma once
#include "executor_service.hpp"
#include "file_ops.hpp"
#include <map>
#include <nlohmann/json.hpp>
#include <string>

struct ApiRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> query;
    std::string body;
};

struct ApiResponse {
    int status{200};
    std::string body;
    std::string content_type{"application/json"};
};

// JSON routes. Live streaming, download and upload need the connection
// itself and are served by HttpServer.
ApiResponse handle_api_request(ExecutorService& svc, const ApiRequest& req);

// Parses a POST /exec body. Throws nlohmann::json::exception on bad input.
JobRequest parse_job_request(const std::string& body);

// Serializes with invalid UTF-8 replaced, since command output is arbitrary bytes.
std::string dump_json(const nlohmann::json& j);

ApiResponse json_response(int status, const nlohmann::json& j);
ApiResponse error_response(int status, const std::string& message);
ApiResponse file_error_response(const FileOpError& e);
