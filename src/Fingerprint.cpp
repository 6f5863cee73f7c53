// src/Fingerprint.cpp
#include <Courier/Fingerprint.hpp>
#include <Courier/Utils/Crypto.hpp>

namespace Courier {

std::string fingerprint(const Request& request) {
    return endpointOf(request);
}

std::string storageKey(const std::string& fingerprint) {
    return Utils::sha256Hex(fingerprint);
}

} // namespace Courier
