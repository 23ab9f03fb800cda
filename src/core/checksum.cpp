/**
 * @file checksum.cpp
 * @brief Implementation of payload digests
 */

#include <kcenon/omics_transfer/core/checksum.h>

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>

namespace kcenon::omics_transfer {

auto checksum::sha256(std::span<const std::byte> data) -> result<std::string> {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        return unexpected(error{error_code::internal_error, "SHA-256 digest failed"});
    }

    std::ostringstream oss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

auto checksum::verify_sha256(std::span<const std::byte> data, const std::string& expected)
    -> bool {
    auto actual = sha256(data);
    return actual && actual.value() == expected;
}

}  // namespace kcenon::omics_transfer
