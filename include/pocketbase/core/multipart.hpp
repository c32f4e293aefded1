#pragma once

#include <string>
#include <vector>

namespace pocketbase {

// ---------------------------------------------------------------------------
// MultipartField: one part of a multipart/form-data body.
//
// A part with an empty filename is sent as a plain form field; otherwise it
// is sent as a file upload with the given content type. Encoding and the
// boundary are left to the transport.
// ---------------------------------------------------------------------------
struct MultipartField {
    std::string name;
    std::string content;
    std::string filename;
    std::string content_type;
};

using MultipartForm = std::vector<MultipartField>;

MultipartField TextField(std::string name, std::string value);

MultipartField FileField(std::string name,
                         std::string filename,
                         std::string content,
                         std::string content_type = "application/octet-stream");

// Form fields in order, for logging. File parts show as "name=@filename".
std::string DescribeForm(const MultipartForm& form);

} // namespace pocketbase
