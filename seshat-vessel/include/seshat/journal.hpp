// -----------------------------------------------------------------------------
// Seshat Vessel - Operation journal
// -----------------------------------------------------------------------------
#pragma once

#include "seshat/fs_util.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace seshat {

class OperationJournal {
    std::mutex mtx_;                       // Guards entries_ and file_
    std::vector<std::string> entries_;     // In-memory ring of recent entries
    std::atomic<size_t> size_{0};
    unique_fd file_;                       // Optional persistent journal

public:
    // An empty path keeps the journal in memory only.
    explicit OperationJournal(const std::string& path = {});

    OperationJournal(const OperationJournal&) = delete;
    OperationJournal& operator=(const OperationJournal&) = delete;

    // Records "<operation>: <src> -> <dst> SUCCESS|FAILED (error)"
    void record(const char* operation, const std::string& src,
                const std::string& dst, bool success,
                const char* error = nullptr) noexcept;

    size_t size() const noexcept { return size_.load(std::memory_order_relaxed); }

    std::vector<std::string> snapshot();

    void clear() noexcept;
};

}
