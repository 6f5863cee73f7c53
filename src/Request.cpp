// src/Request.cpp
#include <Courier/Types/Request.hpp>

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace Courier {

std::string toString(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    throw std::invalid_argument("Unknown HttpMethod value");
}

Headers headersFromJson(const nlohmann::json& object) {
    if (!object.is_object()) {
        throw std::invalid_argument("headers must be a JSON object, got " + std::string(object.type_name()));
    }

    Headers headers;
    for (auto& [key, value] : object.items()) {
        headers[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }
    return headers;
}

const std::string& endpointOf(const Request& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.url; }, request);
}

const Headers& headersOf(const Request& request) {
    return std::visit([](const auto& r) -> const Headers& { return r.headers; }, request);
}

namespace {
    struct MethodName {
        std::string operator()(const GetRequest&) const { return "GET"; }
        std::string operator()(const PostRequest&) const { return "POST"; }
        std::string operator()(const RestRequest& r) const { return toString(r.method); }
        std::string operator()(const MultipartUpload&) const { return "POST(multipart)"; }
    };
}

std::string describe(const Request& request) {
    return std::visit(MethodName{}, request) + " " + endpointOf(request);
}

} // namespace Courier
