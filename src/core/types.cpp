#include <pocketbase/core/types.hpp>

#include <algorithm>

namespace pocketbase {

namespace {

bool IsAsciiAlnumOrUnderscore(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// BaseUrl
// ---------------------------------------------------------------------------
Result<BaseUrl, std::string> BaseUrl::Create(std::string_view url) {
    std::string_view scheme;
    if (url.rfind("http://", 0) == 0) {
        scheme = "http://";
    } else if (url.rfind("https://", 0) == 0) {
        scheme = "https://";
    } else {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must start with http:// or https://");
    }

    auto rest = url.substr(scheme.size());
    while (!rest.empty() && rest.back() == '/') {
        rest.remove_suffix(1);
    }
    url = url.substr(0, scheme.size() + rest.size());

    if (rest.find_first_of("?#") != std::string_view::npos) {
        return Result<BaseUrl, std::string>::Err(
            "Base URL must not contain a query or fragment");
    }

    auto slash = rest.find('/');
    auto host = rest.substr(0, slash);
    if (host.empty()) {
        return Result<BaseUrl, std::string>::Err("Base URL must contain a host");
    }

    std::string path_prefix;
    if (slash != std::string_view::npos) {
        path_prefix = std::string(rest.substr(slash));
    }

    return Result<BaseUrl, std::string>::Ok(BaseUrl(
        std::string(url),
        std::string(scheme) + std::string(host),
        std::move(path_prefix)));
}

// ---------------------------------------------------------------------------
// CollectionName
// ---------------------------------------------------------------------------
Result<CollectionName, std::string> CollectionName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<CollectionName, std::string>::Err(
            "Collection name must not be empty");
    }
    if (!std::all_of(name.begin(), name.end(), IsAsciiAlnumOrUnderscore)) {
        return Result<CollectionName, std::string>::Err(
            "Collection name contains invalid characters: only letters, digits "
            "and underscores are allowed");
    }
    return Result<CollectionName, std::string>::Ok(CollectionName(std::string(name)));
}

} // namespace pocketbase
