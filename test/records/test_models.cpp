#include <catch2/catch_test_macros.hpp>

#include <pocketbase/records/models.hpp>

#include <nlohmann/json.hpp>

using namespace pocketbase;

namespace {

struct Post {
    std::string id;
    std::string title;
};

void from_json(const nlohmann::json& j, Post& post) {
    post.id = j.at("id").get<std::string>();
    post.title = j.at("title").get<std::string>();
}

} // anonymous namespace

// ===========================================================================
// RecordList
// ===========================================================================

TEST_CASE("RecordList: decodes a full page", "[records][models]") {
    auto j = nlohmann::json::parse(R"({
        "page": 2, "perPage": 10, "totalItems": 25, "totalPages": 3,
        "items": [{"id": "a", "title": "First"}, {"id": "b", "title": "Second"}]
    })");
    auto list = j.get<RecordList<Post>>();
    CHECK(list.page == 2);
    CHECK(list.per_page == 10);
    CHECK(list.total_items == 25);
    CHECK(list.total_pages == 3);
    REQUIRE(list.items.size() == 2);
    CHECK(list.items[1].title == "Second");
}

TEST_CASE("RecordList: skipTotal page leaves totals at -1", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"page":1,"perPage":5,"items":[]})");
    auto list = j.get<RecordList<nlohmann::json>>();
    CHECK(list.total_items == -1);
    CHECK(list.total_pages == -1);
    CHECK(list.items.empty());
}

TEST_CASE("RecordList: missing items throws", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"page":1,"perPage":5})");
    CHECK_THROWS_AS(j.get<RecordList<nlohmann::json>>(), nlohmann::json::exception);
}

TEST_CASE("RecordList: item of the wrong shape throws", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"page":1,"perPage":5,"items":[{"id":"a"}]})");
    CHECK_THROWS_AS(j.get<RecordList<Post>>(), nlohmann::json::exception);
}

// ===========================================================================
// RecordMeta
// ===========================================================================

TEST_CASE("RecordMeta: ignores echoed record fields", "[records][models]") {
    auto j = nlohmann::json::parse(R"({
        "collectionId": "pbc_123", "collectionName": "posts", "id": "r1",
        "created": "2024-01-01 10:00:00.000Z", "updated": "2024-01-01 10:00:00.000Z",
        "title": "Hello", "views": 3
    })");
    auto meta = j.get<RecordMeta>();
    CHECK(meta.id == "r1");
    CHECK(meta.collection_name == "posts");
    CHECK(meta.collection_id == "pbc_123");
    CHECK(meta.created == "2024-01-01 10:00:00.000Z");

    nlohmann::json back = meta;
    CHECK_FALSE(back.contains("title"));
    CHECK(back["collectionName"] == "posts");
}

TEST_CASE("RecordMeta: id is required", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"collectionName":"posts"})");
    CHECK_THROWS_AS(j.get<RecordMeta>(), nlohmann::json::exception);
}

// ===========================================================================
// AuthRecord / AuthSession
// ===========================================================================

TEST_CASE("AuthSession: decodes token and record", "[records][models]") {
    auto j = nlohmann::json::parse(R"({
        "token": "eyJhbGciOi",
        "record": {
            "id": "u1", "collectionId": "_pb_users_auth_", "collectionName": "users",
            "email": "a@b.c", "emailVisibility": true, "verified": false,
            "created": "c", "updated": "u", "name": "extra field"
        }
    })");
    auto session = j.get<AuthSession>();
    CHECK(session.token == "eyJhbGciOi");
    CHECK(session.record.id == "u1");
    CHECK(session.record.collection_name == "users");
    CHECK(session.record.email == "a@b.c");
    CHECK(session.record.email_visibility);
    CHECK_FALSE(session.record.verified);
}

TEST_CASE("AuthRecord: hidden email decodes as empty", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"id":"u1","collectionName":"users"})");
    auto record = j.get<AuthRecord>();
    CHECK(record.email.empty());
    CHECK_FALSE(record.verified);
}

TEST_CASE("AuthSession: missing token throws", "[records][models]") {
    auto j = nlohmann::json::parse(R"({"record":{"id":"u1"}})");
    CHECK_THROWS_AS(j.get<AuthSession>(), nlohmann::json::exception);
}

TEST_CASE("AuthSession: to_json uses wire keys", "[records][models]") {
    AuthSession session;
    session.token = "t";
    session.record.id = "u1";
    session.record.email_visibility = true;
    nlohmann::json j = session;
    CHECK(j["token"] == "t");
    CHECK(j["record"]["id"] == "u1");
    CHECK(j["record"]["emailVisibility"] == true);
    CHECK(j.get<AuthSession>().record.email_visibility);
}
