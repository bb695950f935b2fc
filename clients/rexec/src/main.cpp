#include "../../../shared/cpp/executor_sdk/include/executor_client.hpp"
#include <cstdlib>
#include <curl/curl.h>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

static void usage() {
    std::cerr << "rexec usage:\n"
              << "  submit <command> [--cwd DIR] [--timeout SECONDS] [--env KEY=VALUE]... [--follow]\n"
              << "  status <job_id>\n"
              << "  result <job_id>\n"
              << "  cancel <job_id>\n"
              << "  tail <job_id>\n"
              << "  list\n"
              << "Global: [--url URL] (default $EXECUTOR_URL or http://localhost:8000)\n";
}

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static int print_result(ExecutorClient& client, const std::string& id) {
    auto r = client.result(id);
    std::cout << r.stdout_text;
    std::cerr << "[rexec] " << r.id << " " << r.status;
    if (r.returncode) std::cerr << " rc=" << *r.returncode;
    if (r.error) std::cerr << " error: " << *r.error;
    std::cerr << "\n";
    if (r.status == "finished" && r.returncode) return *r.returncode;
    return 1;
}

static std::string follow(ExecutorClient& client, const std::string& id) {
    return client.stream(id, [](const std::string& line) { std::cout << line << "\n" << std::flush; });
}

int main(int argc, char** argv) {
    std::string url = getenv_or("EXECUTOR_URL", "http://localhost:8000");
    std::vector<std::string> pos;
    SubmitOptions opts;
    bool follow_output = false;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--url" && i + 1 < argc) url = argv[++i];
            else if (a == "--cwd" && i + 1 < argc) opts.cwd = argv[++i];
            else if (a == "--timeout" && i + 1 < argc) opts.timeout_seconds = std::stoi(argv[++i]);
            else if (a == "--env" && i + 1 < argc) {
                std::string kv = argv[++i];
                auto eq = kv.find('=');
                if (eq == std::string::npos || eq == 0) { usage(); return 2; }
                opts.env[kv.substr(0, eq)] = kv.substr(eq + 1);
            }
            else if (a == "--follow") follow_output = true;
            else if (a == "-h" || a == "--help") { usage(); return 0; }
            else pos.push_back(a);
        }
    } catch (const std::exception& e) {
        std::cerr << "[rexec] bad argument: " << e.what() << "\n";
        return 2;
    }
    if (pos.empty()) { usage(); return 1; }

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "[rexec] curl_global_init failed\n";
        return 1;
    }
    int rc = 0;
    try {
        ExecutorClient client(url);
        const std::string& cmd = pos[0];
        if (cmd == "submit" && pos.size() == 2) {
            std::string id = client.submit(pos[1], opts);
            if (!follow_output) {
                std::cout << id << "\n";
            } else {
                std::cerr << "[rexec] job " << id << "\n";
                follow(client, id);
                rc = print_result(client, id);
            }
        } else if (cmd == "status" && pos.size() == 2) {
            auto s = client.status(pos[1]);
            std::cout << s.id << " " << s.status << " " << s.command << "\n";
        } else if (cmd == "result" && pos.size() == 2) {
            rc = print_result(client, pos[1]);
        } else if (cmd == "cancel" && pos.size() == 2) {
            std::cout << client.cancel(pos[1]) << "\n";
        } else if (cmd == "tail" && pos.size() == 2) {
            std::string status = follow(client, pos[1]);
            std::cerr << "[rexec] " << (status.empty() ? "stream closed" : status) << "\n";
        } else if (cmd == "list" && pos.size() == 1) {
            for (const auto& j : client.list()) {
                std::cout << j.id << "  " << std::left << std::setw(9) << j.status << "  "
                          << std::fixed << std::setprecision(0) << j.created_at << "  " << j.command << "\n";
            }
        } else {
            usage();
            rc = 1;
        }
    } catch (const ExecutorClientError& e) {
        std::cerr << "[rexec] " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        rc = 1;
    }
    curl_global_cleanup();
    return rc;
}
