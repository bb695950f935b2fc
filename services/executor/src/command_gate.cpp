#include "command_gate.hpp"
#include <cctype>

const std::vector<std::string>& CommandGate::default_patterns() {
    static const std::vector<std::string> patterns = {
        R"(^(sudo\s+)?rm\s+(-[a-z]*f[a-z]*\s+)?/\s*$)", // rm -rf /
        R"(^(sudo\s+)?ls\s+(-[a-z]*r[a-z]*))",          // ls -R
    };
    return patterns;
}

CommandGate::CommandGate() : CommandGate(default_patterns()) {}

CommandGate::CommandGate(const std::vector<std::string>& patterns) {
    rules_.reserve(patterns.size());
    for (const auto& p : patterns) {
        rules_.push_back({p, std::regex(p, std::regex::ECMAScript | std::regex::icase)});
    }
}

std::string CommandGate::normalize(const std::string& command) {
    std::string out;
    out.reserve(command.size());
    bool in_space = false;
    for (char c : command) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_space = true;
            continue;
        }
        if (in_space && !out.empty()) out.push_back(' ');
        in_space = false;
        out.push_back(c);
    }
    return out;
}

std::optional<std::string> CommandGate::check(const std::string& command) const {
    const std::string cmd = normalize(command);
    for (const auto& rule : rules_) {
        if (std::regex_search(cmd, rule.re)) {
            return "Blocked: command matches dangerous pattern (" + rule.source + ")";
        }
    }
    return std::nullopt;
}
