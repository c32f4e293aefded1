#pragma once

#include <pocketbase/core/types.hpp>
#include <pocketbase/http/i_http_transport.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace pocketbase {

// ---------------------------------------------------------------------------
// HttpTransportOptions: configured once per transport, never per call.
// ---------------------------------------------------------------------------
struct HttpTransportOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
    bool disable_tls_verify = false;
    std::string user_agent;  // empty: "pocketbase-cpp/<version>"
};

// ---------------------------------------------------------------------------
// HttpTransport: IHttpTransport implementation using cpp-httplib.
//
// Uses pimpl to avoid leaking httplib into the public header. One
// httplib::Client per transport (connection keep-alive is handled by
// httplib). Requests on the same transport are serialized, so a transport
// may be shared between PocketBase instances.
// ---------------------------------------------------------------------------
class HttpTransport : public IHttpTransport {
public:
    explicit HttpTransport(const BaseUrl& base_url,
                           const HttpTransportOptions& options = {});

    ~HttpTransport() override;

    [[nodiscard]] Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> PostMultipart(
        std::string_view path,
        const MultipartForm& form,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Patch(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

    [[nodiscard]] Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pocketbase
