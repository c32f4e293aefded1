#pragma once

#include <pocketbase/client/pocketbase.hpp>
#include <pocketbase/core/multipart.hpp>
#include <pocketbase/core/result.hpp>
#include <pocketbase/core/types.hpp>
#include <pocketbase/records/models.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pocketbase {

// ---------------------------------------------------------------------------
// Options: one struct per operation, passed by value into the call.
// ---------------------------------------------------------------------------

struct GetOneOptions {
    std::optional<std::string> expand;
};

struct ListOptions {
    std::optional<int> page;
    std::optional<int> per_page;
    std::optional<std::string> sort;
    std::optional<std::string> filter;
    std::optional<std::string> expand;
    bool skip_total = false;
};

// First-item queries always send page=1&perPage=1&skipTotal=true.
struct FirstItemOptions {
    std::optional<std::string> sort;
    std::optional<std::string> filter;
    std::optional<std::string> expand;
};

inline constexpr int kMaxBatchSize = 500;

struct FullListOptions {
    int batch_size = kMaxBatchSize;  // clamped to [1, 500]
    std::optional<std::string> sort;
    std::optional<std::string> filter;
    std::optional<std::string> expand;
};

struct ImpersonateOptions {
    std::optional<std::uint64_t> duration;  // token lifetime in seconds
};

// ---------------------------------------------------------------------------
// Collection: operations on one collection of a PocketBase client.
//
// Obtained from PocketBase::GetCollection(). Holds a reference to the
// client; it carries no state of its own and must not outlive the client.
// Moving the client invalidates its handles: take new ones from the
// moved-to client.
//
// Typed reads decode records through nlohmann `from_json` for T;
// `nlohmann::json` itself is always a valid T. Typed writes encode through
// `to_json`.
// ---------------------------------------------------------------------------
class Collection {
public:
    [[nodiscard]] const CollectionName& Name() const noexcept { return name_; }

    // -- Reads ----------------------------------------------------------------

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> GetOne(std::string_view id,
                                          GetOneOptions options = {}) const {
        auto body = FetchOne(id, options);
        if (body.IsErr()) {
            return Result<T, Error>::Err(std::move(body).Error());
        }
        return DecodeRecord<T>("GetOne", RecordPath(id), body.Value());
    }

    template <typename T = nlohmann::json>
    [[nodiscard]] Result<RecordList<T>, Error> GetList(ListOptions options = {}) const {
        auto body = FetchList(options);
        if (body.IsErr()) {
            return Result<RecordList<T>, Error>::Err(std::move(body).Error());
        }
        return DecodeRecord<RecordList<T>>("GetList", RecordsPath(), body.Value());
    }

    /// ParseError ("No record found") when nothing matches.
    template <typename T = nlohmann::json>
    [[nodiscard]] Result<T, Error> GetFirstListItem(FirstItemOptions options = {}) const {
        auto item = FetchFirstItem(options);
        if (item.IsErr()) {
            return Result<T, Error>::Err(std::move(item).Error());
        }
        return DecodeRecord<T>("GetFirstListItem", RecordsPath(), item.Value());
    }

    /// Every matching record, fetched page by page until a page comes back
    /// shorter than the batch size.
    template <typename T = nlohmann::json>
    [[nodiscard]] Result<std::vector<T>, Error> GetFullList(FullListOptions options = {}) const {
        auto items = FetchAllItems(options);
        if (items.IsErr()) {
            return Result<std::vector<T>, Error>::Err(std::move(items).Error());
        }
        std::vector<T> records;
        records.reserve(items.Value().size());
        for (const auto& item : items.Value()) {
            auto record = DecodeRecord<T>("GetFullList", RecordsPath(), item);
            if (record.IsErr()) {
                return Result<std::vector<T>, Error>::Err(std::move(record).Error());
            }
            records.push_back(std::move(record).Value());
        }
        return Result<std::vector<T>, Error>::Ok(std::move(records));
    }

    // -- Writes ---------------------------------------------------------------

    template <typename T>
    [[nodiscard]] Result<RecordMeta, Error> Create(const T& record) const {
        return CreateJson(nlohmann::json(record));
    }

    /// Create from a multipart form, for records with file fields.
    [[nodiscard]] Result<RecordMeta, Error> CreateMultipart(const MultipartForm& form) const;

    template <typename T>
    [[nodiscard]] Result<RecordMeta, Error> Update(std::string_view id, const T& record) const {
        return UpdateJson(id, nlohmann::json(record));
    }

    /// BadRequest without touching the network when `id` is empty.
    [[nodiscard]] Result<void, Error> Delete(std::string_view id) const;

    // -- Auth -----------------------------------------------------------------

    /// Authenticate and replace the client's session.
    [[nodiscard]] Result<AuthSession, Error> AuthWithPassword(std::string_view identity,
                                                              std::string_view password) const;

    /// Refresh the current token and replace the client's session.
    [[nodiscard]] Result<AuthSession, Error> AuthRefresh() const;

    /// Refresh `token` on behalf of another user. The client's own session
    /// is neither sent nor changed.
    [[nodiscard]] Result<AuthSession, Error> AuthRefreshForUser(std::string_view token) const;

    /// Superuser only. Returns a new client holding the impersonated
    /// session; the calling client is left as it was.
    [[nodiscard]] Result<PocketBase, Error> Impersonate(std::string_view user_id,
                                                        ImpersonateOptions options = {}) const;

    [[nodiscard]] Result<void, Error> RequestVerification(std::string_view email) const;

private:
    friend class PocketBase;

    Collection(PocketBase& client, CollectionName name)
        : client_(client), name_(std::move(name)) {}

    [[nodiscard]] std::string RecordsPath() const;
    [[nodiscard]] std::string RecordPath(std::string_view id) const;

    [[nodiscard]] Result<nlohmann::json, Error> FetchOne(std::string_view id,
                                                         const GetOneOptions& options) const;
    [[nodiscard]] Result<nlohmann::json, Error> FetchList(const ListOptions& options) const;
    [[nodiscard]] Result<nlohmann::json, Error> FetchFirstItem(const FirstItemOptions& options) const;
    [[nodiscard]] Result<std::vector<nlohmann::json>, Error> FetchAllItems(
        const FullListOptions& options) const;

    [[nodiscard]] Result<RecordMeta, Error> CreateJson(const nlohmann::json& body) const;
    [[nodiscard]] Result<RecordMeta, Error> UpdateJson(std::string_view id,
                                                       const nlohmann::json& body) const;

    [[nodiscard]] Result<AuthSession, Error> RefreshWith(const std::string& operation,
                                                         const HttpHeaders& headers) const;

    template <typename T>
    static Result<T, Error> DecodeRecord(const std::string& operation,
                                         const std::string& endpoint,
                                         const nlohmann::json& body) {
        try {
            return Result<T, Error>::Ok(body.get<T>());
        } catch (const nlohmann::json::exception& e) {
            return Result<T, Error>::Err(Error{
                operation, endpoint, std::nullopt,
                std::string(DefaultMessage(ErrorKind::ParseError)) + ": " + e.what(),
                ErrorKind::ParseError});
        }
    }

    PocketBase& client_;
    CollectionName name_;
};

} // namespace pocketbase
