// include/Courier/Utils/Crypto.hpp
#ifndef COURIER_CRYPTO_HPP
#define COURIER_CRYPTO_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace Courier {
    namespace Utils {

        /**
         * @brief Calculates the SHA256 digest of an in-memory buffer.
         * @param data The bytes to hash.
         * @return A lowercase hex-encoded string of the digest.
         * @throws std::runtime_error if OpenSSL fails to produce the digest.
         */
        std::string sha256Hex(const std::string& data);

        /**
         * @brief Fills a buffer from OpenSSL's CSPRNG.
         * @param count Number of bytes to generate.
         * @throws std::runtime_error if the generator is not seeded or fails.
         */
        std::vector<unsigned char> randomBytes(std::size_t count);

    } // namespace Utils
} // namespace Courier

#endif //COURIER_CRYPTO_HPP
