#include "seshat/duplicate.hpp"
#include "seshat/constants.hpp"
#include "seshat/fs_util.hpp"
#include "seshat/log.hpp"

#include <cerrno>
#include <cstring>
#include <memory>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>

#include <openssl/evp.h>

namespace seshat {

namespace {
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};
}

bool file_md5(const std::string& path, std::string& hex_out) noexcept {
    unique_fd fd(open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC));
    if (!fd) return false;

    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        errno = ENOMEM;
        return false;
    }

    std::vector<unsigned char> buf;
    try {
        buf.resize(constants::HASH_BLOCK_SIZE);
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }

    for (;;) {
        ssize_t n = safe_read(fd.get(), buf.data(), buf.size());
        if (n < 0) return false;
        if (n == 0) break;
        if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
            errno = EIO;
            return false;
        }
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out, &out_len) != 1) {
        errno = EIO;
        return false;
    }

    static const char digits[] = "0123456789abcdef";
    try {
        hex_out.clear();
        hex_out.reserve(out_len * 2);
        for (unsigned int i = 0; i < out_len; ++i) {
            hex_out += digits[out[i] >> 4];
            hex_out += digits[out[i] & 0x0f];
        }
    } catch (const std::bad_alloc&) {
        errno = ENOMEM;
        return false;
    }
    return true;
}

bool DuplicateResolver::is_duplicate(const std::string& source_path,
                                     const std::string& destination_dir) const {
    return same_content(source_path, join_path(destination_dir, base_name(source_path)));
}

bool DuplicateResolver::same_content(const std::string& source_path,
                                     const std::string& candidate) const {
    struct stat dst_st{};
    if (lstat(candidate.c_str(), &dst_st) != 0) {
        if (errno != ENOENT) {
            SESHAT_LOG_DEBUG("dedup", "Cannot stat %s: %s", candidate.c_str(), strerror(errno));
        }
        return false;
    }
    if (!S_ISREG(dst_st.st_mode)) return false;

    struct stat src_st{};
    if (stat(source_path.c_str(), &src_st) != 0) {
        SESHAT_LOG_DEBUG("dedup", "Cannot stat %s: %s", source_path.c_str(), strerror(errno));
        return false;
    }

    if (src_st.st_size != dst_st.st_size) return false;
    if (!verify_checksum_) return true;

    std::string src_hash, dst_hash;
    if (!file_md5(source_path, src_hash)) {
        SESHAT_LOG_DEBUG("dedup", "Cannot hash %s: %s", source_path.c_str(), strerror(errno));
        return false;
    }
    if (!file_md5(candidate, dst_hash)) {
        SESHAT_LOG_DEBUG("dedup", "Cannot hash %s: %s", candidate.c_str(), strerror(errno));
        return false;
    }

    if (src_hash != dst_hash) {
        SESHAT_LOG_DEBUG("dedup", "Same size, different content: %s vs %s",
                         source_path.c_str(), candidate.c_str());
        return false;
    }
    return true;
}

}
