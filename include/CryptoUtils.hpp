#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace presence {

/**
 * @brief Digest helpers used to protect embedding snapshot files
 */
class CryptoUtils {
public:
    /**
     * @brief SHA-256 hash
     * @param input Data to hash
     * @return Hash as lowercase hex string
     */
    static std::string sha256(const std::string& input);

    /**
     * @brief Compare two hex digests without early exit
     * @return true if both digests have equal length and content
     */
    static bool digest_equals(const std::string& a, const std::string& b);

    static std::string bytes_to_hex(const std::vector<uint8_t>& bytes);
};

} // namespace presence
