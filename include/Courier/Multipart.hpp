// include/Courier/Multipart.hpp
#ifndef COURIER_MULTIPART_HPP
#define COURIER_MULTIPART_HPP

#include <Courier/Types/Request.hpp>
#include <string>
#include <vector>

namespace Courier::Multipart {

    // "Boundary-" followed by an uppercase random (version 4) UUID
    std::string generateBoundary();

    // Value for the Content-Type header of a body built with `boundary`
    std::string contentType(const std::string& boundary);

    /**
     * @brief Encodes form fields and file parts as multipart/form-data.
     *
     * Fields come first in map order, then files in attachment order. Each part is
     * `--{boundary}\r\n`, its headers, a blank line, the raw value and `\r\n`.
     * The body ends with `--{boundary}--\r\n`.
     */
    std::string buildBody(const FormParameters& parameters,
                          const std::vector<FileAttachment>& files,
                          const std::string& boundary);

} // namespace Courier::Multipart

#endif // COURIER_MULTIPART_HPP
