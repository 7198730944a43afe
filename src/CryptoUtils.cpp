#include "CryptoUtils.hpp"
#include <openssl/crypto.h>
#include <openssl/sha.h>
#include <iomanip>
#include <sstream>

namespace presence {

std::string CryptoUtils::sha256(const std::string& input) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(input.c_str()),
           input.length(), hash);

    return bytes_to_hex(std::vector<uint8_t>(hash, hash + SHA256_DIGEST_LENGTH));
}

bool CryptoUtils::digest_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string CryptoUtils::bytes_to_hex(const std::vector<uint8_t>& bytes) {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');

    for (uint8_t byte : bytes) {
        ss << std::setw(2) << static_cast<int>(byte);
    }

    return ss.str();
}

} // namespace presence
