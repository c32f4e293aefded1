#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace pocketbase {

// ---------------------------------------------------------------------------
// RecordList<T>: one page of a list query.
//
// total_items / total_pages are -1 when the query was sent with skipTotal.
// ---------------------------------------------------------------------------
template <typename T>
struct RecordList {
    int page = 1;
    int per_page = 0;
    int total_items = -1;
    int total_pages = -1;
    std::vector<T> items;
};

template <typename T>
void from_json(const nlohmann::json& j, RecordList<T>& list) {
    list.page = j.at("page").get<int>();
    list.per_page = j.at("perPage").get<int>();
    list.total_items = j.value("totalItems", -1);
    list.total_pages = j.value("totalPages", -1);
    list.items = j.at("items").get<std::vector<T>>();
}

// ---------------------------------------------------------------------------
// RecordMeta: what create and update return: identity and timestamps only,
// not the echoed record fields.
// ---------------------------------------------------------------------------
struct RecordMeta {
    std::string collection_name;
    std::string collection_id;
    std::string id;
    std::string created;
    std::string updated;
};

void from_json(const nlohmann::json& j, RecordMeta& meta);
void to_json(nlohmann::json& j, const RecordMeta& meta);

// ---------------------------------------------------------------------------
// AuthRecord: the authenticated user as returned by the auth endpoints.
// ---------------------------------------------------------------------------
struct AuthRecord {
    std::string id;
    std::string collection_id;
    std::string collection_name;
    std::string created;
    std::string updated;
    std::string email;
    bool email_visibility = false;
    bool verified = false;
};

void from_json(const nlohmann::json& j, AuthRecord& record);
void to_json(nlohmann::json& j, const AuthRecord& record);

// ---------------------------------------------------------------------------
// AuthSession: bearer token plus the record it was issued for. Always
// replaced as a whole.
// ---------------------------------------------------------------------------
struct AuthSession {
    AuthRecord record;
    std::string token;
};

void from_json(const nlohmann::json& j, AuthSession& session);
void to_json(nlohmann::json& j, const AuthSession& session);

} // namespace pocketbase
