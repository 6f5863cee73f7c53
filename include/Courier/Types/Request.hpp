// include/Courier/Types/Request.hpp
#ifndef COURIER_REQUEST_HPP
#define COURIER_REQUEST_HPP

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace Courier {

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Delete
    };

    std::string toString(HttpMethod method);

    // Case-sensitive header names; assigning an existing name replaces its value
    using Headers = std::map<std::string, std::string>;

    // Stringifies every member of a JSON object into a header value.
    // Strings are taken verbatim, anything else uses its JSON text (42, true, 1.5).
    // Throws std::invalid_argument if `object` is not a JSON object.
    Headers headersFromJson(const nlohmann::json& object);

    struct FileAttachment {
        std::string data;
        std::string fileName;
        std::string mimeType;
        std::string fieldName = "file";
    };

    using FormParameters = std::map<std::string, std::string>;

    struct GetRequest {
        std::string url;
        Headers headers;
    };

    struct PostRequest {
        std::string url;
        std::optional<std::string> body;
        Headers headers;
    };

    // PUT, DELETE or any other method that carries an optional JSON body
    struct RestRequest {
        std::string url;
        HttpMethod method = HttpMethod::Put;
        std::optional<std::string> body;
        Headers headers;
    };

    struct MultipartUpload {
        std::string url;
        FormParameters parameters;
        std::vector<FileAttachment> files;
        Headers headers;
    };

    using Request = std::variant<GetRequest, PostRequest, RestRequest, MultipartUpload>;

    const std::string& endpointOf(const Request& request);
    const Headers& headersOf(const Request& request);

    // "GET https://host/path", for log lines
    std::string describe(const Request& request);

} // namespace Courier

#endif // COURIER_REQUEST_HPP
