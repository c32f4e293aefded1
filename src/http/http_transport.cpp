#include <pocketbase/http/http_transport.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>
#include <mutex>

namespace pocketbase {

namespace {

constexpr size_t kMaxBodyLog = 2000;

Error MakeTransportError(const std::string& operation,
                         const std::string& path,
                         httplib::Error error) {
    std::string message = "HTTP request failed: " + httplib::to_string(error);
    switch (error) {
        case httplib::Error::Timeout:
        case httplib::Error::ConnectionTimeout:
            message = "Request timed out: " + httplib::to_string(error);
            break;
        case httplib::Error::Connection:
            message = "Failed to connect to server: " + httplib::to_string(error);
            break;
        default:
            break;
    }
    return Error{operation, path, std::nullopt, message, ErrorKind::Unreachable};
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

httplib::Headers ToHttplibHeaders(const HttpHeaders& headers,
                                  const std::string& user_agent) {
    httplib::Headers hdrs;
    hdrs.emplace("User-Agent", user_agent);
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }
    return hdrs;
}

httplib::MultipartFormDataItems ToFormItems(const MultipartForm& form) {
    httplib::MultipartFormDataItems items;
    items.reserve(form.size());
    for (const auto& field : form) {
        items.push_back({field.name, field.content, field.filename, field.content_type});
    }
    return items;
}

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie" ||
           lower_key == "set-cookie";
}

void LogRequest(std::string_view method, std::string_view path,
                const httplib::Headers& hdrs) {
    LogInfo("http", std::string(method) + " " + std::string(path));
    for (const auto& [k, v] : hdrs) {
        if (IsSensitiveHeader(k)) {
            LogDebug("http", "  > " + k + ": <redacted>");
        } else {
            LogDebug("http", "  > " + k + ": " + v);
        }
    }
}

void LogResponse(int status, const std::string& body) {
    LogInfo("http", "  < " + std::to_string(status));
    if (status >= 400 && !body.empty()) {
        if (body.size() <= kMaxBodyLog) {
            LogDebug("http", "  < body: " + body);
        } else {
            LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) + "... (truncated)");
        }
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string user_agent;
    std::mutex mutex;

    Impl(const BaseUrl& base_url, const HttpTransportOptions& opts)
        : user_agent(opts.user_agent.empty()
                         ? std::string("pocketbase-cpp/") + kVersion
                         : opts.user_agent) {
        client = std::make_unique<httplib::Client>(base_url.Origin());
        client->set_connection_timeout(opts.connect_timeout);
        client->set_read_timeout(opts.read_timeout);
        client->set_write_timeout(opts.write_timeout);
        client->set_keep_alive(true);
        // Paths and query strings are percent-encoded by the caller.
        client->set_url_encode(false);

#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        if (base_url.IsHttps() && opts.disable_tls_verify) {
            client->enable_server_certificate_verification(false);
        }
#else
        if (base_url.IsHttps()) {
            LogWarn("http", "Built without OpenSSL support; https:// requests will fail");
        }
#endif
    }

    // Shared tail of every verb: map transport failure or convert response.
    Result<HttpResponse, Error> Finish(const char* operation,
                                       std::string_view path,
                                       const httplib::Result& res) {
        if (!res) {
            auto error = MakeTransportError(operation, std::string(path), res.error());
            LogWarn("http", error.message);
            return Result<HttpResponse, Error>::Err(std::move(error));
        }
        LogResponse(res->status, res->body);
        return Result<HttpResponse, Error>::Ok(HttpResponse{
            res->status, ToHttpHeaders(res->headers), res->body});
    }
};

HttpTransport::HttpTransport(const BaseUrl& base_url,
                             const HttpTransportOptions& options)
    : impl_(std::make_unique<Impl>(base_url, options)) {}

HttpTransport::~HttpTransport() = default;

Result<HttpResponse, Error> HttpTransport::Get(std::string_view path,
                                               const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto hdrs = ToHttplibHeaders(headers, impl_->user_agent);
    LogRequest("GET", path, hdrs);
    auto res = impl_->client->Get(std::string(path), hdrs);
    return impl_->Finish("Get", path, res);
}

Result<HttpResponse, Error> HttpTransport::Post(std::string_view path,
                                                std::string_view body,
                                                std::string_view content_type,
                                                const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto hdrs = ToHttplibHeaders(headers, impl_->user_agent);
    LogRequest("POST", path, hdrs);
    auto res = impl_->client->Post(std::string(path), hdrs,
                                   std::string(body), std::string(content_type));
    return impl_->Finish("Post", path, res);
}

Result<HttpResponse, Error> HttpTransport::PostMultipart(std::string_view path,
                                                         const MultipartForm& form,
                                                         const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto hdrs = ToHttplibHeaders(headers, impl_->user_agent);
    LogRequest("POST", path, hdrs);
    LogDebug("http", "  > form: " + DescribeForm(form));
    auto res = impl_->client->Post(std::string(path), hdrs, ToFormItems(form));
    return impl_->Finish("Post", path, res);
}

Result<HttpResponse, Error> HttpTransport::Patch(std::string_view path,
                                                 std::string_view body,
                                                 std::string_view content_type,
                                                 const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto hdrs = ToHttplibHeaders(headers, impl_->user_agent);
    LogRequest("PATCH", path, hdrs);
    auto res = impl_->client->Patch(std::string(path), hdrs,
                                    std::string(body), std::string(content_type));
    return impl_->Finish("Patch", path, res);
}

Result<HttpResponse, Error> HttpTransport::Delete(std::string_view path,
                                                  const HttpHeaders& headers) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto hdrs = ToHttplibHeaders(headers, impl_->user_agent);
    LogRequest("DELETE", path, hdrs);
    auto res = impl_->client->Delete(std::string(path), hdrs);
    return impl_->Finish("Delete", path, res);
}

} // namespace pocketbase
