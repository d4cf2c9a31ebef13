#include "seshat/journal.hpp"
#include "seshat/constants.hpp"
#include "seshat/log.hpp"

#include <chrono>
#include <cstring>
#include <ctime>

#include <fcntl.h>
#include <unistd.h>

namespace seshat {

OperationJournal::OperationJournal(const std::string& path) {
    if (path.empty()) return;

    file_.reset(open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0640));
    if (!file_) {
        SESHAT_LOG_WARN("seshat", "Cannot open journal %s: %s", path.c_str(), strerror(errno));
    }
}

void OperationJournal::record(const char* operation, const std::string& src,
                              const std::string& dst, bool success,
                              const char* error) noexcept {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_time{};
    localtime_r(&t, &tm_time);

    char timestamp[32];
    strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &tm_time);

    auto truncate_path = [](const std::string& p) -> std::string {
        if (p.size() <= 256) return p;
        return p.substr(0, 253) + "...";
    };

    try {
        std::string entry = "[JOURNAL][";
        entry += timestamp;
        entry += "][PID:";
        entry += std::to_string(getpid());
        entry += "] ";
        entry += operation;
        entry += ": ";
        entry += truncate_path(src);
        entry += " -> ";
        entry += truncate_path(dst);
        entry += success ? " SUCCESS" : " FAILED";

        if (error && error[0] != '\0') {
            entry += " (";
            // Control characters would split the record
            for (const char* p = error; *p; ++p) {
                entry += static_cast<unsigned char>(*p) < 32 ? '?' : *p;
            }
            entry += ")";
        }

        std::lock_guard<std::mutex> lock(mtx_);
        entries_.push_back(entry);
        if (entries_.size() > constants::MAX_JOURNAL_ENTRIES) {
            entries_.erase(entries_.begin(), entries_.begin() + entries_.size() / 2);
        }
        size_.store(entries_.size(), std::memory_order_relaxed);

        if (file_) {
            entry += '\n';
            if (safe_write(file_.get(), entry.data(), entry.size()) < 0) {
                SESHAT_LOG_DEBUG("seshat", "Journal write failed: %s", strerror(errno));
            }
        }
    } catch (const std::bad_alloc&) {
        SESHAT_LOG_WARN("seshat", "Journal entry dropped: out of memory");
    }
}

std::vector<std::string> OperationJournal::snapshot() {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_;
}

void OperationJournal::clear() noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    entries_.clear();
    size_.store(0, std::memory_order_relaxed);
}

}
