#pragma once
#include "job_registry.hpp"
#include <chrono>

// Evicts terminal jobs whose finish time is older than the retention window.
// Invoked lazily from request handling; there is no background timer, so a
// long idle period delays reclamation but never affects correctness.
class RetentionSweeper {
public:
    RetentionSweeper(JobRegistry& registry, std::chrono::seconds ttl) : registry_(registry), ttl_(ttl) {}

    std::size_t purge(std::chrono::steady_clock::time_point now);
    std::size_t purge() { return purge(std::chrono::steady_clock::now()); }

    std::chrono::seconds ttl() const { return ttl_; }

private:
    JobRegistry& registry_;
    std::chrono::seconds ttl_;
};
