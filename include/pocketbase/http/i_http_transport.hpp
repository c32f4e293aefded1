#pragma once

#include <pocketbase/core/multipart.hpp>
#include <pocketbase/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace pocketbase {

// ---------------------------------------------------------------------------
// HttpHeaders: request/response headers. Header names are case-sensitive
// in this representation; callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IHttpTransport: abstract HTTP verb interface.
//
// Paths are absolute request targets on the configured origin, query string
// included ("/api/collections/posts/records?page=2"). Implementations attach
// nothing on their own: authorization is decided by the caller and passed in
// `headers`.
//
// A returned Err always means the exchange did not complete (DNS, connect,
// TLS, timeout) and carries ErrorKind::Unreachable. Any HTTP status,
// including 4xx/5xx, is an Ok HttpResponse.
// ---------------------------------------------------------------------------
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    // Non-copyable, non-movable (polymorphic base).
    IHttpTransport(const IHttpTransport&) = delete;
    IHttpTransport& operator=(const IHttpTransport&) = delete;
    IHttpTransport(IHttpTransport&&) = delete;
    IHttpTransport& operator=(IHttpTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Get(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    // POST a multipart/form-data body built from `form`; the implementation
    // chooses the boundary and sets the Content-Type.
    [[nodiscard]] virtual Result<HttpResponse, Error> PostMultipart(
        std::string_view path,
        const MultipartForm& form,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Patch(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

    [[nodiscard]] virtual Result<HttpResponse, Error> Delete(
        std::string_view path,
        const HttpHeaders& headers = {}) = 0;

protected:
    IHttpTransport() = default;
};

} // namespace pocketbase
