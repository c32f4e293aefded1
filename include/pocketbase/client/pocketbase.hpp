#pragma once

#include <pocketbase/core/multipart.hpp>
#include <pocketbase/core/result.hpp>
#include <pocketbase/core/types.hpp>
#include <pocketbase/core/url.hpp>
#include <pocketbase/http/http_transport.hpp>
#include <pocketbase/http/i_http_transport.hpp>
#include <pocketbase/records/models.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pocketbase {

class Collection;

// ---------------------------------------------------------------------------
// PocketBase: client for one PocketBase instance.
//
// Holds the base URL, a transport and the current auth session. The session
// is replaced as a whole by the auth operations of Collection and is never
// partially updated. Requests carry `Authorization: Bearer <token>` only
// while a session exists.
//
// Movable, not copyable. The session is guarded by a mutex, so one client
// may be shared between threads; concurrent auth calls are last-writer-wins.
// ---------------------------------------------------------------------------
class PocketBase {
public:
    /// Validate `base_url` and build a client backed by HttpTransport.
    [[nodiscard]] static Result<PocketBase, Error> Create(
        std::string_view base_url,
        const HttpTransportOptions& options = {});

    PocketBase(BaseUrl base_url, std::shared_ptr<IHttpTransport> transport);
    ~PocketBase();

    PocketBase(const PocketBase&) = delete;
    PocketBase& operator=(const PocketBase&) = delete;
    PocketBase(PocketBase&&) noexcept;
    PocketBase& operator=(PocketBase&&) noexcept;

    /// Handle for a collection; InvalidArgument when `name` is not a valid
    /// collection name. The handle must not outlive this client.
    [[nodiscard]] Result<Collection, Error> GetCollection(std::string_view name);

    [[nodiscard]] const BaseUrl& GetBaseUrl() const;

    // -- Session --------------------------------------------------------------

    [[nodiscard]] std::optional<AuthSession> AuthStore() const;
    [[nodiscard]] std::optional<std::string> Token() const;
    [[nodiscard]] bool IsAuthenticated() const;

    /// Write the current session as JSON (mode 0600 on POSIX).
    [[nodiscard]] Result<void, Error> SaveSession(const std::string& path) const;

    /// Replace the session with the one stored at `path`. On failure the
    /// current session is left untouched.
    [[nodiscard]] Result<void, Error> LoadSession(const std::string& path);

private:
    friend class Collection;

    // "<path prefix>/api/collections/<name><suffix>"
    [[nodiscard]] std::string CollectionPath(const CollectionName& name,
                                             std::string_view suffix) const;

    // {"Authorization": "Bearer <token>"} when a session exists, else empty.
    [[nodiscard]] HttpHeaders AuthHeaders() const;

    [[nodiscard]] Result<HttpResponse, Error> SendGet(const std::string& path,
                                                      const QueryParams& query);
    [[nodiscard]] Result<HttpResponse, Error> SendPostJson(const std::string& path,
                                                           const nlohmann::json& body,
                                                           const HttpHeaders& headers);
    [[nodiscard]] Result<HttpResponse, Error> SendPostForm(const std::string& path,
                                                           const MultipartForm& form,
                                                           const HttpHeaders& headers);
    [[nodiscard]] Result<HttpResponse, Error> SendPost(const std::string& path,
                                                       const HttpHeaders& headers);
    [[nodiscard]] Result<HttpResponse, Error> SendPatchJson(const std::string& path,
                                                            const nlohmann::json& body);
    [[nodiscard]] Result<HttpResponse, Error> SendDelete(const std::string& path);

    void UpdateSession(AuthSession session);

    // New client on the same transport and base URL holding `session`.
    [[nodiscard]] PocketBase WithSession(AuthSession session) const;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pocketbase
