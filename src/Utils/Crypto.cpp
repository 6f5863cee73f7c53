// src/Utils/Crypto.cpp
#include <Courier/Utils/Crypto.hpp>
#include <Courier/Utils/Logger.hpp>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace Courier::Utils {

    static std::string bytesToHexString(const unsigned char *bytes, size_t len) {
        std::ostringstream ss;
        ss << std::hex << std::setfill('0');
        for (size_t i = 0; i < len; ++i) {
            ss << std::setw(2) << static_cast<int>(bytes[i]);
        }
        return ss.str();
    }

    std::string sha256Hex(const std::string &data) {
        EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
        if (mdctx == nullptr) {
            CORE_LOG_ERROR("[Crypto] EVP_MD_CTX_new failed for SHA256.");
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        if (1 != EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) ||
            1 != EVP_DigestUpdate(mdctx, data.data(), data.size()) ||
            1 != EVP_DigestFinal_ex(mdctx, hash, &hashLen)) {
            EVP_MD_CTX_free(mdctx);
            CORE_LOG_ERROR("[Crypto] SHA256 digest failed for a {} byte buffer.", data.size());
            throw std::runtime_error("SHA256 digest failed");
        }
        EVP_MD_CTX_free(mdctx);

        return bytesToHexString(hash, hashLen);
    }

    std::vector<unsigned char> randomBytes(std::size_t count) {
        std::vector<unsigned char> buffer(count);
        if (count == 0) {
            return buffer;
        }
        if (1 != RAND_bytes(buffer.data(), static_cast<int>(count))) {
            CORE_LOG_ERROR("[Crypto] RAND_bytes failed for {} bytes.", count);
            throw std::runtime_error("RAND_bytes failed");
        }
        return buffer;
    }

} // namespace Courier::Utils
