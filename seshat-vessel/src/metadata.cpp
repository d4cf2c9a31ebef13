#include "seshat/metadata.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <cstdio>
#include <cstring>
#include <exception>
#include <initializer_list>
#include <memory>
#include <mutex>

#ifdef HAS_EXIV2
#include <exiv2/exiv2.hpp>
#endif

#ifdef HAS_LIBAVFORMAT
extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}
#endif

namespace seshat {

// -----------------------------------------------------------------------------
// Date string parsing
// -----------------------------------------------------------------------------
static bool valid_fields(int year, int month, int day, int hour, int minute, int second) noexcept {
    if (year < 1900 || year > 2999) return false;
    if (month < 1 || month > 12) return false;
    if (day < 1 || day > date_utils::days_in_month(year, month)) return false;
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 60) return false;
    return true;
}

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\0' ||
                     s[e - 1] == '\n' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

std::optional<std::time_t> parse_exif_datetime(const std::string& value) {
    const std::string v = trim(value);
    int year, month, day, hour, minute, second;
    char sep1 = 0, sep2 = 0;
    int consumed = 0;

    if (sscanf(v.c_str(), "%4d%c%2d%c%2d %2d:%2d:%2d%n",
               &year, &sep1, &month, &sep2, &day, &hour, &minute, &second, &consumed) != 8) {
        return std::nullopt;
    }
    if (static_cast<size_t>(consumed) != v.size()) return std::nullopt;
    if (sep1 != sep2 || (sep1 != ':' && sep1 != '-')) return std::nullopt;
    if (!valid_fields(year, month, day, hour, minute, second)) return std::nullopt;

    struct tm tm_time{};
    tm_time.tm_year = year - 1900;
    tm_time.tm_mon = month - 1;
    tm_time.tm_mday = day;
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = -1;

    std::time_t t = mktime(&tm_time);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return t;
}

std::optional<std::time_t> parse_iso8601(const std::string& value) {
    const std::string v = trim(value);
    int year, month, day, hour, minute, second;
    char sep = 0;
    int consumed = 0;

    if (sscanf(v.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
               &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7) {
        return std::nullopt;
    }
    if (sep != 'T' && sep != 't' && sep != ' ') return std::nullopt;
    if (!valid_fields(year, month, day, hour, minute, second)) return std::nullopt;

    const char* p = v.c_str() + consumed;
    if (*p == '.' || *p == ',') {
        ++p;
        while (*p >= '0' && *p <= '9') ++p;
    }

    bool has_zone = false;
    long offset_sec = 0;
    if (*p == 'Z' || *p == 'z') {
        has_zone = true;
        ++p;
    } else if (*p == '+' || *p == '-') {
        int sign = (*p == '+') ? 1 : -1;
        int oh = 0, om = 0, n = 0;
        if (sscanf(p + 1, "%2d:%2d%n", &oh, &om, &n) != 2 &&
            sscanf(p + 1, "%2d%2d%n", &oh, &om, &n) != 2) {
            return std::nullopt;
        }
        if (oh > 23 || om > 59) return std::nullopt;
        has_zone = true;
        offset_sec = sign * (oh * 3600L + om * 60L);
        p += 1 + n;
    }
    if (*p != '\0') return std::nullopt;

    struct tm tm_time{};
    tm_time.tm_year = year - 1900;
    tm_time.tm_mon = month - 1;
    tm_time.tm_mday = day;
    tm_time.tm_hour = hour;
    tm_time.tm_min = minute;
    tm_time.tm_sec = second;
    tm_time.tm_isdst = -1;

    std::time_t t = has_zone ? timegm(&tm_time) : mktime(&tm_time);
    if (t == static_cast<std::time_t>(-1)) return std::nullopt;
    return has_zone ? t - offset_sec : t;
}

// -----------------------------------------------------------------------------
// Seshat Vessel - EXIF readers (exiv2)
// -----------------------------------------------------------------------------
#ifdef HAS_EXIV2
static void exiv2_init_once() {
    static std::once_flag once;
    std::call_once(once, [] {
        Exiv2::XmpParser::initialize();
        Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);
    });
}

static std::optional<std::time_t> read_exif_keys(const std::string& path,
                                                 std::initializer_list<const char*> keys) {
    exiv2_init_once();

    auto image = Exiv2::ImageFactory::open(path);
    if (!image.get()) return std::nullopt;

    image->readMetadata();
    auto& exif = image->exifData();
    if (exif.empty()) return std::nullopt;

    // DateTimeOriginal > DateTimeDigitized > DateTime
    for (const char* key : keys) {
        auto it = exif.findKey(Exiv2::ExifKey(key));
        if (it == exif.end()) continue;
        if (auto t = parse_exif_datetime(it->toString())) return t;
        SESHAT_LOG_DEBUG("metadata", "Invalid %s in %s", key, path.c_str());
    }
    return std::nullopt;
}
#endif

std::optional<std::time_t> ExifImageReader::resolve(const std::string& path) const noexcept {
#ifdef HAS_EXIV2
    try {
        return read_exif_keys(path, {"Exif.Photo.DateTimeOriginal",
                                     "Exif.Photo.DateTimeDigitized",
                                     "Exif.Image.DateTime"});
    } catch (const std::exception& e) {
        SESHAT_LOG_DEBUG("metadata", "Cannot read EXIF from %s: %s", path.c_str(), e.what());
    }
#else
    (void)path;
#endif
    return std::nullopt;
}

std::optional<std::time_t> RawImageReader::resolve(const std::string& path) const noexcept {
#ifdef HAS_EXIV2
    try {
        return read_exif_keys(path, {"Exif.Photo.DateTimeOriginal",
                                     "Exif.Photo.DateTimeDigitized",
                                     "Exif.Image.DateTimeOriginal",
                                     "Exif.Image.DateTime"});
    } catch (const std::exception& e) {
        SESHAT_LOG_DEBUG("metadata", "Cannot read RAW metadata from %s: %s", path.c_str(), e.what());
    }
#else
    (void)path;
#endif
    return std::nullopt;
}

// -----------------------------------------------------------------------------
// Seshat Vessel - Container metadata (libavformat)
// -----------------------------------------------------------------------------
#ifdef HAS_LIBAVFORMAT
namespace {
struct FormatContextCloser {
    void operator()(AVFormatContext* ctx) const noexcept { avformat_close_input(&ctx); }
};

const char* creation_tag(AVDictionary* dict) noexcept {
    if (!dict) return nullptr;
    if (AVDictionaryEntry* e = av_dict_get(dict, "creation_time", nullptr, 0)) return e->value;
    if (AVDictionaryEntry* e = av_dict_get(dict, "creation_date", nullptr, 0)) return e->value;
    return nullptr;
}
}
#endif

std::optional<std::time_t> VideoReader::resolve(const std::string& path) const noexcept {
#ifdef HAS_LIBAVFORMAT
    static std::once_flag quiet_once;
    std::call_once(quiet_once, [] { av_log_set_level(AV_LOG_QUIET); });

    AVFormatContext* raw_ctx = nullptr;
    int rc = avformat_open_input(&raw_ctx, path.c_str(), nullptr, nullptr);
    if (rc < 0) {
        char err[128];
        av_strerror(rc, err, sizeof(err));
        SESHAT_LOG_DEBUG("metadata", "Cannot open container %s: %s", path.c_str(), err);
        return std::nullopt;
    }
    std::unique_ptr<AVFormatContext, FormatContextCloser> ctx(raw_ctx);

    const char* value = creation_tag(ctx->metadata);
    for (unsigned i = 0; !value && i < ctx->nb_streams; ++i) {
        value = creation_tag(ctx->streams[i]->metadata);
    }
    if (!value) return std::nullopt;

    try {
        if (auto t = parse_iso8601(value)) return t;
        if (auto t = parse_exif_datetime(value)) return t;
    } catch (const std::exception& e) {
        SESHAT_LOG_DEBUG("metadata", "Cannot parse creation_time of %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }
    SESHAT_LOG_DEBUG("metadata", "Unrecognized creation_time '%s' in %s", value, path.c_str());
#else
    (void)path;
#endif
    return std::nullopt;
}

MetadataReader reader_for(MediaCategory category) noexcept {
    switch (category) {
        case MediaCategory::Image: return ExifImageReader{};
        case MediaCategory::Raw:   return RawImageReader{};
        case MediaCategory::Video: return VideoReader{};
        case MediaCategory::Other: break;
    }
    return NoMetadata{};
}

std::optional<std::time_t> MetadataResolver::resolve(const std::string& path) const noexcept {
    MediaCategory category = MediaCategory::Other;
    try {
        if (auto c = category_for_extension(lower_ext(path))) category = *c;
    } catch (const std::exception& e) {
        SESHAT_LOG_DEBUG("metadata", "Cannot classify %s: %s", path.c_str(), e.what());
        return std::nullopt;
    }

    MetadataReader reader = reader_for(category);
    return std::visit([&path](const auto& r) { return r.resolve(path); }, reader);
}

}
