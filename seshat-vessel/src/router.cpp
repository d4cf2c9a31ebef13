#include "seshat/router.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>

#include <sys/stat.h>
#include <unistd.h>

namespace seshat {

std::string DestinationBucket::render() const {
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d/%02d/%02d", year, month, day);
    return buf;
}

DestinationBucket bucket_for_time(std::time_t t) noexcept {
    struct tm tm_time{};
    DestinationBucket b;
    if (localtime_r(&t, &tm_time) == nullptr) {
        return b;
    }
    b.year = tm_time.tm_year + 1900;
    b.month = tm_time.tm_mon + 1;
    b.day = tm_time.tm_mday;
    return b;
}

std::time_t file_timestamp_fallback(const std::string& path) noexcept {
    struct stat st{};
    if (stat(path.c_str(), &st) != 0) {
        SESHAT_LOG_WARN("router", "Cannot get file date for %s: %s", path.c_str(), strerror(errno));
        return time(nullptr);
    }
    return std::min(st.st_mtime, st.st_ctime);
}

DestinationBucket resolve_destination_bucket(const std::string& path,
                                             std::optional<std::time_t> metadata_timestamp) noexcept {
    if (metadata_timestamp) {
        return bucket_for_time(*metadata_timestamp);
    }

    std::time_t t = file_timestamp_fallback(path);
    DestinationBucket b = bucket_for_time(t);
    SESHAT_LOG_DEBUG("router", "Using file date for %s: %04d-%02d-%02d",
                     path.c_str(), b.year, b.month, b.day);
    return b;
}

bool archive_directory_for(const std::string& archive_root, const DestinationBucket& bucket,
                           std::string& out) {
    out = join_path(archive_root, bucket.render());
    if (contains_path_traversal(out) || !path_within(archive_root, out) || out == archive_root) {
        SESHAT_LOG_ERROR("security", "Destination %s escapes archive root %s",
                         out.c_str(), archive_root.c_str());
        return false;
    }
    return true;
}

static bool name_taken(const std::string& path) noexcept {
    struct stat st{};
    return lstat(path.c_str(), &st) == 0;
}

std::string make_unique_destination(const std::string& dir, const std::string& filename,
                                    std::time_t now) {
    std::string candidate = join_path(dir, filename);
    if (!name_taken(candidate)) return candidate;

    std::string stem, ext;
    split_name(filename, stem, ext);

    struct tm tm_time{};
    localtime_r(&now, &tm_time);
    char stamp[32];
    strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &tm_time);

    candidate = join_path(dir, stem + "_" + stamp + ext);
    if (!name_taken(candidate)) return candidate;

    for (int n = 1; n <= constants::MAX_UNIQUE_NAME_COUNTER; ++n) {
        candidate = join_path(dir, stem + "_" + stamp + "_" + std::to_string(n) + ext);
        if (!name_taken(candidate)) return candidate;
    }

    return join_path(dir, stem + "_" + std::to_string(static_cast<long long>(now)) + ext);
}

}
