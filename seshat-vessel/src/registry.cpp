#include "seshat/registry.hpp"
#include "seshat/constants.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace seshat {

const char* claim_result_name(ClaimResult r) noexcept {
    switch (r) {
        case ClaimResult::Claimed:     return "claimed";
        case ClaimResult::InFlight:    return "in flight";
        case ClaimResult::CoolingDown: return "cooling down";
    }
    return "unknown";
}

ProcessingRegistry::ProcessingRegistry(std::chrono::milliseconds cooldown, size_t high_water)
    : cooldown_(cooldown), high_water_(std::max(high_water, constants::HISTORY_EVICT_BATCH)) {}

ClaimResult ProcessingRegistry::try_claim(const std::string& key, clock::time_point now) {
    std::lock_guard<std::mutex> lock(mtx_);

    if (in_flight_.count(key)) {
        return ClaimResult::InFlight;
    }

    auto it = history_.find(key);
    if (it != history_.end() && now - it->second < cooldown_) {
        return ClaimResult::CoolingDown;
    }

    in_flight_.insert(key);
    history_[key] = now;

    if (history_.size() > high_water_) {
        evict_oldest_locked();
    }

    return ClaimResult::Claimed;
}

void ProcessingRegistry::evict_oldest_locked() {
    std::vector<std::pair<clock::time_point, const std::string*>> entries;
    entries.reserve(history_.size());
    for (const auto& kv : history_) {
        entries.emplace_back(kv.second, &kv.first);
    }

    const size_t batch = std::min(constants::HISTORY_EVICT_BATCH, entries.size());
    std::nth_element(entries.begin(), entries.begin() + (batch - 1), entries.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<std::string> victims;
    victims.reserve(batch);
    for (size_t i = 0; i < batch; ++i) {
        victims.push_back(*entries[i].second);
    }
    for (const auto& key : victims) {
        history_.erase(key);
    }

    SESHAT_LOG_DEBUG("registry", "Evicted %zu oldest history entries", victims.size());
}

void ProcessingRegistry::release(const std::string& key) {
    bool idle;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        in_flight_.erase(key);
        idle = in_flight_.empty();
    }
    if (idle) idle_cv_.notify_all();
}

bool ProcessingRegistry::is_in_flight(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_flight_.count(key) != 0;
}

size_t ProcessingRegistry::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return in_flight_.size();
}

size_t ProcessingRegistry::history_size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return history_.size();
}

bool ProcessingRegistry::wait_until_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_.empty(); });
}

}
