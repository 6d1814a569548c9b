/**
 * @file ContentHasher.cpp
 * @brief Implementation of ContentHasher.
 */

#include "infrastructure/ContentHasher.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <openssl/evp.h>

namespace dropkeeper::infrastructure {

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

EvpMdCtxPtr NewMd5Context() {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
    return ctx;
}

std::string Finish(EVP_MD_CTX* ctx) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx, out, &outLen) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    static const char* kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(outLen * 2);
    for (unsigned int i = 0; i < outLen; ++i) {
        hex.push_back(kHex[out[i] >> 4]);
        hex.push_back(kHex[out[i] & 0x0F]);
    }
    return hex;
}

} // namespace

Fingerprint ContentHasher::FingerprintFile(const std::string& path) {
    errno = 0;
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        int err = errno != 0 ? errno : EIO;
        throw std::filesystem::filesystem_error("cannot open for hashing", path,
                                                std::error_code(err, std::generic_category()));
    }

    EvpMdCtxPtr ctx = NewMd5Context();
    std::vector<char> buf(1 << 16);
    Fingerprint result;
    while (f) {
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = f.gcount();
        if (n > 0) {
            if (EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1) {
                throw std::runtime_error("EVP_DigestUpdate failed");
            }
            result.bytesRead += static_cast<std::uintmax_t>(n);
        }
    }
    if (f.bad()) {
        throw std::filesystem::filesystem_error("read error while hashing", path,
                                                std::make_error_code(std::errc::io_error));
    }

    result.hex = Finish(ctx.get());
    return result;
}

std::string ContentHasher::FingerprintBytes(const std::string& bytes) {
    EvpMdCtxPtr ctx = NewMd5Context();
    if (!bytes.empty() && EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
    return Finish(ctx.get());
}

} // namespace dropkeeper::infrastructure
