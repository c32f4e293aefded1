#include <pocketbase/client/pocketbase.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/records/collection.hpp>

#include <fstream>
#include <mutex>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace pocketbase {

namespace {

constexpr const char* kJsonContentType = "application/json";

std::string DumpJson(const nlohmann::json& body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Error MakeSessionError(const std::string& operation,
                       const std::string& path,
                       const std::string& message,
                       ErrorKind kind) {
    return Error{operation, path, std::nullopt, message, kind};
}

} // anonymous namespace

struct PocketBase::Impl {
    BaseUrl base_url;
    std::shared_ptr<IHttpTransport> transport;
    mutable std::mutex mutex;
    std::optional<AuthSession> session;

    Impl(BaseUrl url, std::shared_ptr<IHttpTransport> t)
        : base_url(std::move(url)), transport(std::move(t)) {}
};

Result<PocketBase, Error> PocketBase::Create(std::string_view base_url,
                                             const HttpTransportOptions& options) {
    auto url = BaseUrl::Create(base_url);
    if (url.IsErr()) {
        return Result<PocketBase, Error>::Err(Error{
            "Create", std::string(base_url), std::nullopt,
            "Invalid base URL: " + url.Error(), ErrorKind::InvalidArgument});
    }
    auto transport = std::make_shared<HttpTransport>(url.Value(), options);
    return Result<PocketBase, Error>::Ok(
        PocketBase(std::move(url).Value(), std::move(transport)));
}

PocketBase::PocketBase(BaseUrl base_url, std::shared_ptr<IHttpTransport> transport)
    : impl_(std::make_unique<Impl>(std::move(base_url), std::move(transport))) {}

PocketBase::~PocketBase() = default;
PocketBase::PocketBase(PocketBase&&) noexcept = default;
PocketBase& PocketBase::operator=(PocketBase&&) noexcept = default;

Result<Collection, Error> PocketBase::GetCollection(std::string_view name) {
    auto collection = CollectionName::Create(name);
    if (collection.IsErr()) {
        return Result<Collection, Error>::Err(Error{
            "GetCollection", std::string(name), std::nullopt,
            collection.Error(), ErrorKind::InvalidArgument});
    }
    return Result<Collection, Error>::Ok(
        Collection(*this, std::move(collection).Value()));
}

const BaseUrl& PocketBase::GetBaseUrl() const {
    return impl_->base_url;
}

// ---------------------------------------------------------------------------
// Session
// ---------------------------------------------------------------------------
std::optional<AuthSession> PocketBase::AuthStore() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session;
}

std::optional<std::string> PocketBase::Token() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->session) {
        return std::nullopt;
    }
    return impl_->session->token;
}

bool PocketBase::IsAuthenticated() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->session.has_value();
}

void PocketBase::UpdateSession(AuthSession session) {
    LogDebug("auth", "Session replaced for record " + session.record.id);
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->session = std::move(session);
}

PocketBase PocketBase::WithSession(AuthSession session) const {
    PocketBase client(impl_->base_url, impl_->transport);
    client.UpdateSession(std::move(session));
    return client;
}

Result<void, Error> PocketBase::SaveSession(const std::string& path) const {
    auto session = AuthStore();
    if (!session) {
        return Result<void, Error>::Err(MakeSessionError(
            "SaveSession", path, "No session to save", ErrorKind::InvalidArgument));
    }

    nlohmann::json j = *session;
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs) {
        return Result<void, Error>::Err(MakeSessionError(
            "SaveSession", path, "Failed to open file for writing",
            ErrorKind::InvalidArgument));
    }
#ifndef _WIN32
    // Owner read/write only; the file holds a bearer token.
    chmod(path.c_str(), S_IRUSR | S_IWUSR);
#endif
    ofs << j.dump(2);
    if (!ofs) {
        return Result<void, Error>::Err(MakeSessionError(
            "SaveSession", path, "Failed to write session file",
            ErrorKind::InvalidArgument));
    }
    LogInfo("auth", "Session saved to " + path);
    return Result<void, Error>::Ok();
}

Result<void, Error> PocketBase::LoadSession(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        return Result<void, Error>::Err(MakeSessionError(
            "LoadSession", path, "Failed to open session file",
            ErrorKind::InvalidArgument));
    }

    AuthSession session;
    try {
        nlohmann::json j;
        ifs >> j;
        session = j.get<AuthSession>();
    } catch (const nlohmann::json::exception& e) {
        return Result<void, Error>::Err(MakeSessionError(
            "LoadSession", path, "Malformed session file: " + std::string(e.what()),
            ErrorKind::ParseError));
    }
    if (session.token.empty()) {
        return Result<void, Error>::Err(MakeSessionError(
            "LoadSession", path, "Malformed session file: empty token",
            ErrorKind::ParseError));
    }

    UpdateSession(std::move(session));
    LogInfo("auth", "Session loaded from " + path);
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// Request helpers
// ---------------------------------------------------------------------------
std::string PocketBase::CollectionPath(const CollectionName& name,
                                       std::string_view suffix) const {
    return impl_->base_url.PathPrefix() + "/api/collections/" + name.Value() +
           std::string(suffix);
}

HttpHeaders PocketBase::AuthHeaders() const {
    auto token = Token();
    if (!token) {
        return {};
    }
    return {{"Authorization", "Bearer " + *token}};
}

Result<HttpResponse, Error> PocketBase::SendGet(const std::string& path,
                                                const QueryParams& query) {
    auto headers = AuthHeaders();
    headers["Accept"] = kJsonContentType;
    return impl_->transport->Get(path + BuildQueryString(query), headers);
}

Result<HttpResponse, Error> PocketBase::SendPostJson(const std::string& path,
                                                     const nlohmann::json& body,
                                                     const HttpHeaders& headers) {
    return impl_->transport->Post(path, DumpJson(body), kJsonContentType, headers);
}

Result<HttpResponse, Error> PocketBase::SendPostForm(const std::string& path,
                                                     const MultipartForm& form,
                                                     const HttpHeaders& headers) {
    return impl_->transport->PostMultipart(path, form, headers);
}

Result<HttpResponse, Error> PocketBase::SendPost(const std::string& path,
                                                 const HttpHeaders& headers) {
    return impl_->transport->Post(path, "", kJsonContentType, headers);
}

Result<HttpResponse, Error> PocketBase::SendPatchJson(const std::string& path,
                                                      const nlohmann::json& body) {
    return impl_->transport->Patch(path, DumpJson(body), kJsonContentType,
                                   AuthHeaders());
}

Result<HttpResponse, Error> PocketBase::SendDelete(const std::string& path) {
    return impl_->transport->Delete(path, AuthHeaders());
}

} // namespace pocketbase
