// src/Multipart.cpp
#include <Courier/Multipart.hpp>
#include <Courier/Utils/Crypto.hpp>

#include <cstdio>

namespace Courier::Multipart {

std::string generateBoundary() {
    std::vector<unsigned char> bytes = Utils::randomBytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    char uuid[37];
    std::snprintf(uuid, sizeof(uuid),
                  "%02X%02X%02X%02X-%02X%02X-%02X%02X-%02X%02X-%02X%02X%02X%02X%02X%02X",
                  bytes[0], bytes[1], bytes[2], bytes[3], bytes[4], bytes[5], bytes[6], bytes[7],
                  bytes[8], bytes[9], bytes[10], bytes[11], bytes[12], bytes[13], bytes[14], bytes[15]);
    return std::string("Boundary-") + uuid;
}

std::string contentType(const std::string& boundary) {
    return "multipart/form-data; boundary=" + boundary;
}

std::string buildBody(const FormParameters& parameters,
                      const std::vector<FileAttachment>& files,
                      const std::string& boundary) {
    std::string body;

    for (const auto& [key, value] : parameters) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + key + "\"\r\n\r\n";
        body += value;
        body += "\r\n";
    }

    for (const auto& file : files) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + file.fieldName + "\"; filename=\"" + file.fileName + "\"\r\n";
        body += "Content-Type: " + file.mimeType + "\r\n\r\n";
        body += file.data;
        body += "\r\n";
    }

    body += "--" + boundary + "--\r\n";
    return body;
}

} // namespace Courier::Multipart
