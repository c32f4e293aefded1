#pragma once

#include <pocketbase/core/result.hpp>

#include <string>
#include <string_view>

namespace pocketbase {

// ---------------------------------------------------------------------------
// BaseUrl: validated root URL of a PocketBase instance.
//
// Rules:
//   - Must start with http:// or https://
//   - Host must be non-empty
//   - Trailing slashes are trimmed
//
// The URL is split into an origin ("https://pb.example.com:8090") and an
// optional path prefix ("/pb") for deployments behind a reverse proxy.
// ---------------------------------------------------------------------------
class BaseUrl {
public:
    static Result<BaseUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Origin() const noexcept { return origin_; }
    [[nodiscard]] const std::string& PathPrefix() const noexcept { return path_prefix_; }
    [[nodiscard]] bool IsHttps() const noexcept { return value_.rfind("https://", 0) == 0; }

    bool operator==(const BaseUrl& other) const { return value_ == other.value_; }
    bool operator!=(const BaseUrl& other) const { return value_ != other.value_; }

    BaseUrl(const BaseUrl&) = default;
    BaseUrl& operator=(const BaseUrl&) = default;
    BaseUrl(BaseUrl&&) noexcept = default;
    BaseUrl& operator=(BaseUrl&&) noexcept = default;

private:
    BaseUrl(std::string value, std::string origin, std::string path_prefix)
        : value_(std::move(value)),
          origin_(std::move(origin)),
          path_prefix_(std::move(path_prefix)) {}

    std::string value_;
    std::string origin_;
    std::string path_prefix_;
};

// ---------------------------------------------------------------------------
// CollectionName: non-empty, ASCII letters, digits and underscores only
// (system collections such as "_superusers" are allowed).
// ---------------------------------------------------------------------------
class CollectionName {
public:
    static Result<CollectionName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const CollectionName& other) const { return value_ == other.value_; }
    bool operator!=(const CollectionName& other) const { return value_ != other.value_; }

    CollectionName(const CollectionName&) = default;
    CollectionName& operator=(const CollectionName&) = default;
    CollectionName(CollectionName&&) noexcept = default;
    CollectionName& operator=(CollectionName&&) noexcept = default;

private:
    explicit CollectionName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

} // namespace pocketbase
