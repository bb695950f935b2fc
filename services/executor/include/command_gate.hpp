#pragma once
#include <optional>
#include <regex>
#include <string>
#include <vector>

// Advisory deny-list of known-destructive invocations. This is defense in
// depth only: it is trivially bypassed (quoting, variables, other binaries)
// and must not be treated as an access-control boundary.
class CommandGate {
public:
    CommandGate();
    explicit CommandGate(const std::vector<std::string>& patterns);

    // Returns the rejection reason for the first matching pattern, if any.
    std::optional<std::string> check(const std::string& command) const;

    // Trims and collapses every run of whitespace to a single space.
    static std::string normalize(const std::string& command);

    static const std::vector<std::string>& default_patterns();

private:
    struct Rule {
        std::string source;
        std::regex re;
    };
    std::vector<Rule> rules_;
};
