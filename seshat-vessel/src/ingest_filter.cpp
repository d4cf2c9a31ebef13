#include "seshat/ingest_filter.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace seshat {

namespace {

constexpr std::array<const char*, 9> IMAGE_EXT = {
    ".jpg", ".jpeg", ".png", ".webp", ".heic", ".heif", ".gif", ".bmp", ".tiff"};
constexpr std::array<const char*, 9> RAW_EXT = {
    ".cr2", ".cr3", ".nef", ".arw", ".raf", ".orf", ".rw2", ".dng", ".sr2"};
constexpr std::array<const char*, 6> VIDEO_EXT = {
    ".mp4", ".mov", ".avi", ".mkv", ".mts", ".m2ts"};
constexpr std::array<const char*, 5> IGNORE_EXT = {
    ".tmp", ".temp", ".crdownload", ".part", ".lnk"};
constexpr std::array<const char*, 7> IGNORE_DIRS = {
    ".hist", ".tmp", "temp", "tmp", "cache", "thumbnail", "thumb"};

template <size_t N>
bool contains(const std::array<const char*, N>& set, const std::string& value) {
    return std::any_of(set.begin(), set.end(), [&](const char* s) { return value == s; });
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}

const char* category_name(MediaCategory c) noexcept {
    switch (c) {
        case MediaCategory::Image: return "image";
        case MediaCategory::Raw:   return "raw";
        case MediaCategory::Video: return "video";
        case MediaCategory::Other: return "other";
    }
    return "other";
}

std::optional<MediaCategory> category_for_extension(const std::string& ext) {
    if (contains(IMAGE_EXT, ext)) return MediaCategory::Image;
    if (contains(RAW_EXT, ext)) return MediaCategory::Raw;
    if (contains(VIDEO_EXT, ext)) return MediaCategory::Video;
    return std::nullopt;
}

IngestFilter::IngestFilter(std::string watch_root) : watch_root_(std::move(watch_root)) {
    while (watch_root_.size() > 1 && watch_root_.back() == '/') watch_root_.pop_back();
}

bool IngestFilter::is_ignored_name(const std::string& name) {
    if (name.empty()) return true;
    if (name[0] == '.' || name[0] == '~') return true;
    if (name.compare(0, 9, "Thumbs.db") == 0) return true;
    return contains(IGNORE_EXT, lower_ext(name));
}

bool IngestFilter::is_ignored_dir_name(const std::string& name) {
    if (name == constants::QUARANTINE_DIR) return true;
    return contains(IGNORE_DIRS, to_lower(name));
}

bool IngestFilter::accepts_path(const std::string& path) const {
    if (!path_within(watch_root_, path) || path.size() == watch_root_.size()) {
        return false;
    }

    const std::string name = base_name(path);
    if (is_ignored_name(name)) return false;
    if (!category_for_extension(lower_ext(name))) return false;

    // Directory components strictly between the root and the file
    size_t start = watch_root_.size() + (watch_root_.back() == '/' ? 0 : 1);
    const size_t name_start = path.size() - name.size();
    while (start < name_start) {
        size_t end = path.find('/', start);
        if (end == std::string::npos || end >= name_start) end = name_start - 1;
        if (end > start && is_ignored_dir_name(path.substr(start, end - start))) {
            return false;
        }
        start = end + 1;
    }

    return true;
}

bool IngestFilter::accepts(const std::string& path) const {
    return accepts_path(path) && is_regular_file(path);
}

}
