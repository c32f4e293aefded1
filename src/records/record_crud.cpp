#include <pocketbase/records/collection.hpp>
#include <pocketbase/client/status_policy.hpp>
#include <pocketbase/core/log.hpp>
#include <pocketbase/core/url.hpp>

#include <algorithm>

namespace pocketbase {

namespace {

void AddOptional(QueryParams& query, const char* key,
                 const std::optional<std::string>& value) {
    if (value.has_value()) {
        query.emplace_back(key, *value);
    }
}

void AddOptional(QueryParams& query, const char* key,
                 const std::optional<int>& value) {
    if (value.has_value()) {
        query.emplace_back(key, std::to_string(*value));
    }
}

// Run the read policy and parse the body.
Result<nlohmann::json, Error> ReadJson(const std::string& operation,
                                       const std::string& endpoint,
                                       const Result<HttpResponse, Error>& response) {
    if (response.IsErr()) {
        auto error = response.Error();
        error.operation = operation;
        return Result<nlohmann::json, Error>::Err(std::move(error));
    }
    auto check = CheckResponse(StatusPolicy::Read(operation), endpoint, response.Value());
    if (check.IsErr()) {
        return Result<nlohmann::json, Error>::Err(check.Error());
    }
    return ParseJsonBody(operation, endpoint, response.Value().body);
}

Result<RecordMeta, Error> DecodeMeta(const std::string& operation,
                                     const std::string& endpoint,
                                     const std::string& body) {
    auto j = ParseJsonBody(operation, endpoint, body);
    if (j.IsErr()) {
        return Result<RecordMeta, Error>::Err(j.Error());
    }
    try {
        return Result<RecordMeta, Error>::Ok(j.Value().get<RecordMeta>());
    } catch (const nlohmann::json::exception& e) {
        return Result<RecordMeta, Error>::Err(Error{
            operation, endpoint, std::nullopt,
            std::string(DefaultMessage(ErrorKind::ParseError)) + ": " + e.what(),
            ErrorKind::ParseError});
    }
}

// Shared post-processing for JSON and multipart create, and for update.
Result<RecordMeta, Error> HandleWriteResponse(const StatusPolicy& policy,
                                              const std::string& endpoint,
                                              const Result<HttpResponse, Error>& response) {
    if (response.IsErr()) {
        auto error = response.Error();
        error.operation = policy.operation;
        return Result<RecordMeta, Error>::Err(std::move(error));
    }
    auto check = CheckResponse(policy, endpoint, response.Value());
    if (check.IsErr()) {
        return Result<RecordMeta, Error>::Err(check.Error());
    }
    return DecodeMeta(policy.operation, endpoint, response.Value().body);
}

} // anonymous namespace

std::string Collection::RecordsPath() const {
    return client_.CollectionPath(name_, "/records");
}

std::string Collection::RecordPath(std::string_view id) const {
    return client_.CollectionPath(name_, "/records/" + UrlEncode(std::string(id)));
}

// ---------------------------------------------------------------------------
// Reads
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> Collection::FetchOne(std::string_view id,
                                                   const GetOneOptions& options) const {
    auto endpoint = RecordPath(id);
    QueryParams query;
    AddOptional(query, "expand", options.expand);
    return ReadJson("GetOne", endpoint, client_.SendGet(endpoint, query));
}

Result<nlohmann::json, Error> Collection::FetchList(const ListOptions& options) const {
    auto endpoint = RecordsPath();
    QueryParams query;
    AddOptional(query, "page", options.page);
    AddOptional(query, "perPage", options.per_page);
    AddOptional(query, "sort", options.sort);
    AddOptional(query, "filter", options.filter);
    AddOptional(query, "expand", options.expand);
    if (options.skip_total) {
        query.emplace_back("skipTotal", "true");
    }
    return ReadJson("GetList", endpoint, client_.SendGet(endpoint, query));
}

Result<nlohmann::json, Error> Collection::FetchFirstItem(const FirstItemOptions& options) const {
    auto endpoint = RecordsPath();
    QueryParams query{{"page", "1"}, {"perPage", "1"}, {"skipTotal", "true"}};
    AddOptional(query, "sort", options.sort);
    AddOptional(query, "filter", options.filter);
    AddOptional(query, "expand", options.expand);

    auto body = ReadJson("GetFirstListItem", endpoint, client_.SendGet(endpoint, query));
    if (body.IsErr()) {
        return body;
    }
    const auto& j = body.Value();
    auto items = j.find("items");
    if (!j.is_object() || items == j.end() || !items->is_array()) {
        return Result<nlohmann::json, Error>::Err(Error{
            "GetFirstListItem", endpoint, std::nullopt,
            std::string(DefaultMessage(ErrorKind::ParseError)) + ": missing items array",
            ErrorKind::ParseError});
    }
    if (items->empty()) {
        return Result<nlohmann::json, Error>::Err(Error{
            "GetFirstListItem", endpoint, std::nullopt,
            "No record found", ErrorKind::ParseError});
    }
    return Result<nlohmann::json, Error>::Ok(items->front());
}

Result<std::vector<nlohmann::json>, Error> Collection::FetchAllItems(
    const FullListOptions& options) const {
    using R = Result<std::vector<nlohmann::json>, Error>;

    const int batch = std::clamp(options.batch_size, 1, kMaxBatchSize);
    auto endpoint = RecordsPath();
    std::vector<nlohmann::json> all;

    for (int page = 1;; ++page) {
        QueryParams query{{"page", std::to_string(page)},
                          {"perPage", std::to_string(batch)},
                          {"skipTotal", "true"}};
        AddOptional(query, "sort", options.sort);
        AddOptional(query, "filter", options.filter);
        AddOptional(query, "expand", options.expand);

        auto body = ReadJson("GetFullList", endpoint, client_.SendGet(endpoint, query));
        if (body.IsErr()) {
            return R::Err(std::move(body).Error());
        }
        auto& j = body.Value();
        auto items = j.find("items");
        if (!j.is_object() || items == j.end() || !items->is_array()) {
            return R::Err(Error{
                "GetFullList", endpoint, std::nullopt,
                std::string(DefaultMessage(ErrorKind::ParseError)) + ": missing items array",
                ErrorKind::ParseError});
        }

        const auto count = static_cast<int>(items->size());
        for (auto& item : *items) {
            all.push_back(std::move(item));
        }
        LogDebug("records", "GetFullList page " + std::to_string(page) + ": " +
                                std::to_string(count) + " item(s)");
        if (count < batch) {
            break;
        }
    }

    LogInfo("records", "GetFullList " + name_.Value() + ": " +
                           std::to_string(all.size()) + " record(s)");
    return R::Ok(std::move(all));
}

// ---------------------------------------------------------------------------
// Writes
// ---------------------------------------------------------------------------
Result<RecordMeta, Error> Collection::CreateJson(const nlohmann::json& body) const {
    auto endpoint = RecordsPath();
    return HandleWriteResponse(StatusPolicy::Create(), endpoint,
                               client_.SendPostJson(endpoint, body, client_.AuthHeaders()));
}

Result<RecordMeta, Error> Collection::CreateMultipart(const MultipartForm& form) const {
    auto endpoint = RecordsPath();
    return HandleWriteResponse(StatusPolicy::Create(), endpoint,
                               client_.SendPostForm(endpoint, form, client_.AuthHeaders()));
}

Result<RecordMeta, Error> Collection::UpdateJson(std::string_view id,
                                                 const nlohmann::json& body) const {
    auto endpoint = RecordPath(id);
    return HandleWriteResponse(StatusPolicy::Update(), endpoint,
                               client_.SendPatchJson(endpoint, body));
}

Result<void, Error> Collection::Delete(std::string_view id) const {
    if (id.empty()) {
        return Result<void, Error>::Err(Error{
            "Delete", RecordsPath(), std::nullopt,
            "Record id must not be empty", ErrorKind::BadRequest});
    }

    auto endpoint = RecordPath(id);
    auto response = client_.SendDelete(endpoint);
    if (response.IsErr()) {
        auto error = std::move(response).Error();
        error.operation = "Delete";
        return Result<void, Error>::Err(std::move(error));
    }
    auto check = CheckResponse(StatusPolicy::Delete(), endpoint, response.Value());
    if (check.IsOk()) {
        LogInfo("records", "Deleted " + name_.Value() + "/" + std::string(id));
    }
    return check;
}

} // namespace pocketbase
