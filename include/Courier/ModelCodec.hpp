// include/Courier/ModelCodec.hpp
#ifndef COURIER_MODEL_CODEC_HPP
#define COURIER_MODEL_CODEC_HPP

#include <Courier/ApiError.hpp>
#include <Courier/HttpManager.hpp>
#include <nlohmann/json.hpp>
#include <string>

// JSON conversion helpers layered on top of HttpManager. Models convert through
// nlohmann's from_json/to_json overloads found by ADL.
namespace Courier {

    template <typename T>
    T decodeModel(const std::string& bytes) {
        try {
            return nlohmann::json::parse(bytes).get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw ApiError::decodingError(std::string("Failed to decode response: ") + e.what());
        }
    }

    template <typename T>
    std::string encodeModel(const T& model) {
        try {
            return nlohmann::json(model).dump();
        } catch (const nlohmann::json::exception& e) {
            throw ApiError::decodingError(std::string("Failed to encode model into JSON: ") + e.what());
        }
    }

    // Serializes a parameter object into a request body
    inline std::string encodeParameters(const nlohmann::json& parameters) {
        if (!parameters.is_object()) {
            throw ApiError::decodingError(std::string("Failed to convert parameters into JSON: expected an object, got ") + parameters.type_name());
        }
        try {
            return parameters.dump();
        } catch (const nlohmann::json::exception& e) {
            throw ApiError::decodingError(std::string("Failed to convert parameters into JSON: ") + e.what());
        }
    }

    template <typename T>
    T HandleAs(HttpManager& manager, const Request& request, const HttpManager::ProgressCallback& progress = {}) {
        return decodeModel<T>(manager.Handle(request, progress));
    }

} // namespace Courier

#endif // COURIER_MODEL_CODEC_HPP
