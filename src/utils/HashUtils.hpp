#pragma once

#include <string>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace harbor::utils {

class HashUtils {
public:
    /**
     * @return Lowercase hex SHA-256 of data, or "" if the digest failed
     */
    static std::string sha256String(const std::string& data) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        if (EVP_Digest(data.data(), data.size(), hash, &hashLen, EVP_sha256(), nullptr) != 1) {
            return "";
        }

        std::ostringstream oss;
        for (unsigned int i = 0; i < hashLen; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(hash[i]);
        }
        return oss.str();
    }
};

} // namespace harbor::utils
