// include/Courier/Fingerprint.hpp
#ifndef COURIER_FINGERPRINT_HPP
#define COURIER_FINGERPRINT_HPP

#include <Courier/Types/Request.hpp>
#include <string>

namespace Courier {

    // Cache and queue identity of a request: its endpoint URL, nothing else.
    // Requests that differ only in method, headers or body share one fingerprint,
    // so their cache entries overwrite each other.
    std::string fingerprint(const Request& request);

    // File-system safe form of a fingerprint (lowercase hex SHA-256)
    std::string storageKey(const std::string& fingerprint);

} // namespace Courier

#endif // COURIER_FINGERPRINT_HPP
