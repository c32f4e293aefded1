#include <pocketbase/core/multipart.hpp>

namespace pocketbase {

MultipartField TextField(std::string name, std::string value) {
    return MultipartField{std::move(name), std::move(value), "", ""};
}

MultipartField FileField(std::string name,
                         std::string filename,
                         std::string content,
                         std::string content_type) {
    if (content_type.empty()) {
        content_type = "application/octet-stream";
    }
    return MultipartField{std::move(name), std::move(content),
                          std::move(filename), std::move(content_type)};
}

std::string DescribeForm(const MultipartForm& form) {
    std::string result;
    for (const auto& field : form) {
        if (!result.empty()) {
            result += ", ";
        }
        result += field.name;
        if (!field.filename.empty()) {
            result += "=@" + field.filename;
        }
    }
    return result;
}

} // namespace pocketbase
