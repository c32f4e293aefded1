#include <pocketbase/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace pocketbase {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string BuildQueryString(const QueryParams& params) {
    std::string query;
    for (const auto& [key, value] : params) {
        query += query.empty() ? '?' : '&';
        query += UrlEncode(key);
        query += '=';
        query += UrlEncode(value);
    }
    return query;
}

} // namespace pocketbase
