/**
 * @file ContentHasher.hpp
 * @brief Content fingerprints for duplicate detection.
 */

#pragma once
#include <cstdint>
#include <string>

namespace dropkeeper::infrastructure {

/**
 * @struct Fingerprint
 * @brief 128-bit digest of a file plus the number of bytes that went into it.
 */
struct Fingerprint {
    std::string hex;
    std::uintmax_t bytesRead = 0;
};

/**
 * @class ContentHasher
 * @brief Streams files through OpenSSL's MD5.
 */
class ContentHasher {
public:
    /**
     * @brief Fingerprints a file.
     * @throws std::filesystem::filesystem_error if the file cannot be opened,
     *         std::runtime_error if reading or hashing fails.
     */
    static Fingerprint FingerprintFile(const std::string& path);

    /** @brief Fingerprint of an in-memory buffer. */
    static std::string FingerprintBytes(const std::string& bytes);
};

} // namespace dropkeeper::infrastructure
