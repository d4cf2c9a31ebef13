// -----------------------------------------------------------------------------
// Seshat Vessel - Processing registry: in-flight claims and cool-down history
// -----------------------------------------------------------------------------
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace seshat {

enum class ClaimResult { Claimed, InFlight, CoolingDown };

const char* claim_result_name(ClaimResult r) noexcept;

// Keys are canonical absolute paths. The lock is never held across I/O.
class ProcessingRegistry {
public:
    using clock = std::chrono::steady_clock;

private:
    mutable std::mutex mtx_;
    std::condition_variable idle_cv_;
    std::unordered_set<std::string> in_flight_;
    std::unordered_map<std::string, clock::time_point> history_;
    std::chrono::milliseconds cooldown_;
    size_t high_water_;

    void evict_oldest_locked();

public:
    explicit ProcessingRegistry(std::chrono::milliseconds cooldown, size_t high_water = 1000);

    ProcessingRegistry(const ProcessingRegistry&) = delete;
    ProcessingRegistry& operator=(const ProcessingRegistry&) = delete;

    ClaimResult try_claim(const std::string& key, clock::time_point now = clock::now());
    void release(const std::string& key);

    bool is_in_flight(const std::string& key) const;
    size_t in_flight_count() const;
    size_t history_size() const;

    // True once nothing is in flight; false if the timeout expired first.
    bool wait_until_idle(std::chrono::milliseconds timeout);
};

// Releases a successful claim when it goes out of scope.
class ClaimGuard {
    ProcessingRegistry& registry_;
    std::string key_;

public:
    ClaimGuard(ProcessingRegistry& registry, std::string key)
        : registry_(registry), key_(std::move(key)) {}
    ~ClaimGuard() { registry_.release(key_); }

    ClaimGuard(const ClaimGuard&) = delete;
    ClaimGuard& operator=(const ClaimGuard&) = delete;
};

}
