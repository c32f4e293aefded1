#include <catch2/catch_test_macros.hpp>

#include <pocketbase/records/collection.hpp>
#include "../../test/mocks/mock_http_transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

using namespace pocketbase;
using namespace pocketbase::testing;

namespace {

struct Post {
    std::string id;
    std::string title;
    bool published = false;
};

void from_json(const nlohmann::json& j, Post& post) {
    post.id = j.at("id").get<std::string>();
    post.title = j.at("title").get<std::string>();
    post.published = j.value("published", false);
}

void to_json(nlohmann::json& j, const Post& post) {
    j = nlohmann::json{{"title", post.title}, {"published", post.published}};
}

struct Fixture {
    std::shared_ptr<MockHttpTransport> mock = std::make_shared<MockHttpTransport>();
    PocketBase pb{BaseUrl::Create("http://127.0.0.1:8090").Value(), mock};
    Collection posts = pb.GetCollection("posts").Value();
};

// A page of `count` items whose ids start at `first`.
std::string MakePage(int page, int per_page, int first, int count) {
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < count; ++i) {
        items.push_back({{"id", "r" + std::to_string(first + i)},
                         {"title", "Post " + std::to_string(first + i)}});
    }
    return nlohmann::json{{"page", page}, {"perPage", per_page}, {"items", items}}.dump();
}

const char* kMetaBody = R"({
    "collectionId": "pbc_1", "collectionName": "posts", "id": "new1",
    "created": "2024-01-01 00:00:00.000Z", "updated": "2024-01-01 00:00:00.000Z",
    "title": "Hello"
})";

const char* kNotFoundBody =
    R"({"status":404,"message":"The requested resource wasn't found.","data":{}})";

} // anonymous namespace

// ===========================================================================
// GetOne
// ===========================================================================

TEST_CASE("GetOne: decodes a typed record", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"id":"r1","title":"Hello","published":true})");

    auto post = f.posts.GetOne<Post>("r1");
    REQUIRE(post.IsOk());
    CHECK(post.Value().title == "Hello");
    CHECK(post.Value().published);

    REQUIRE(f.mock->GetCallCount() == 1);
    CHECK(f.mock->GetCalls()[0].path == "/api/collections/posts/records/r1");
}

TEST_CASE("GetOne: expand is sent and id is percent-encoded", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"id":"a b"})");

    GetOneOptions opts;
    opts.expand = "author,comments";
    auto record = f.posts.GetOne("a b", opts);
    REQUIRE(record.IsOk());
    CHECK(record.Value()["id"] == "a b");
    CHECK(f.mock->GetCalls()[0].path ==
          "/api/collections/posts/records/a%20b?expand=author%2Ccomments");
}

TEST_CASE("GetOne: read status mapping", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(401, R"({"status":401,"message":"Unauthorized.","data":{}})");
    f.mock->EnqueueGet(403, R"({"status":403,"message":"Only superusers.","data":{}})");
    f.mock->EnqueueGet(404, kNotFoundBody);
    f.mock->EnqueueGet(429, "");
    f.mock->EnqueueGet(500, "<html>oops</html>");

    CHECK(f.posts.GetOne("x").Error().kind == ErrorKind::Unauthorized);
    CHECK(f.posts.GetOne("x").Error().kind == ErrorKind::Forbidden);
    auto not_found = f.posts.GetOne("x");
    CHECK(not_found.Error().kind == ErrorKind::NotFound);
    CHECK(not_found.Error().operation == "GetOne");
    CHECK(not_found.Error().message.find("wasn't found") != std::string::npos);
    CHECK(f.posts.GetOne("x").Error().kind == ErrorKind::TooManyRequests);

    auto unexpected = f.posts.GetOne("x");
    CHECK(unexpected.Error().kind == ErrorKind::Unexpected);
    CHECK(unexpected.Error().http_status == 500);
}

TEST_CASE("GetOne: undecodable record is ParseError", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"id":"r1"})");
    f.mock->EnqueueGet(200, "not json");

    auto missing_field = f.posts.GetOne<Post>("r1");
    REQUIRE(missing_field.IsErr());
    CHECK(missing_field.Error().kind == ErrorKind::ParseError);

    auto invalid = f.posts.GetOne("r1");
    REQUIRE(invalid.IsErr());
    CHECK(invalid.Error().kind == ErrorKind::ParseError);
}

TEST_CASE("GetOne: transport failure passes through as Unreachable", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(Result<HttpResponse, Error>::Err(Error{
        "Get", "/api/collections/posts/records/r1", std::nullopt,
        "Failed to connect to server: Connection", ErrorKind::Unreachable}));

    auto result = f.posts.GetOne("r1");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Unreachable);
    CHECK(result.Error().operation == "GetOne");
    CHECK(result.Error().message.find("Failed to connect") != std::string::npos);
}

// ===========================================================================
// GetList
// ===========================================================================

TEST_CASE("GetList: query parameters in order", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"page":2,"perPage":5,"totalItems":12,"totalPages":3,"items":[]})");

    ListOptions opts;
    opts.page = 2;
    opts.per_page = 5;
    opts.sort = "-created";
    opts.filter = "published = true";
    auto list = f.posts.GetList(opts);
    REQUIRE(list.IsOk());
    CHECK(list.Value().total_items == 12);
    CHECK(f.mock->GetCalls()[0].path ==
          "/api/collections/posts/records?page=2&perPage=5&sort=-created"
          "&filter=published%20%3D%20true");
}

TEST_CASE("GetList: skipTotal only sent when set", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"page":1,"perPage":30,"totalItems":0,"totalPages":0,"items":[]})");
    f.mock->EnqueueGet(200, R"({"page":1,"perPage":30,"items":[]})");

    REQUIRE(f.posts.GetList().IsOk());
    CHECK(f.mock->GetCalls()[0].path == "/api/collections/posts/records");

    ListOptions opts;
    opts.skip_total = true;
    auto list = f.posts.GetList(opts);
    REQUIRE(list.IsOk());
    CHECK(list.Value().total_items == -1);
    CHECK(f.mock->GetCalls()[1].path == "/api/collections/posts/records?skipTotal=true");
}

TEST_CASE("GetList: typed items", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 30, 1, 3));

    auto list = f.posts.GetList<Post>();
    REQUIRE(list.IsOk());
    REQUIRE(list.Value().items.size() == 3);
    CHECK(list.Value().items[2].id == "r3");
}

// ===========================================================================
// GetFirstListItem
// ===========================================================================

TEST_CASE("GetFirstListItem: forces page size one", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 1, 7, 1));

    FirstItemOptions opts;
    opts.filter = "title='x'";
    auto post = f.posts.GetFirstListItem<Post>(opts);
    REQUIRE(post.IsOk());
    CHECK(post.Value().id == "r7");
    CHECK(f.mock->GetCalls()[0].path ==
          "/api/collections/posts/records?page=1&perPage=1&skipTotal=true"
          "&filter=title%3D%27x%27");
}

TEST_CASE("GetFirstListItem: no match is ParseError", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 1, 1, 0));

    auto result = f.posts.GetFirstListItem();
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ParseError);
    CHECK(result.Error().message == "No record found");
}

TEST_CASE("GetFirstListItem: missing items array is ParseError", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, R"({"page":1})");

    auto result = f.posts.GetFirstListItem();
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::ParseError);
}

// ===========================================================================
// GetFullList
// ===========================================================================

TEST_CASE("GetFullList: stops on a short page", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 2, 1, 2));
    f.mock->EnqueueGet(200, MakePage(2, 2, 3, 2));
    f.mock->EnqueueGet(200, MakePage(3, 2, 5, 1));

    FullListOptions opts;
    opts.batch_size = 2;
    opts.sort = "created";
    auto all = f.posts.GetFullList<Post>(opts);
    REQUIRE(all.IsOk());
    REQUIRE(all.Value().size() == 5);
    CHECK(all.Value().front().id == "r1");
    CHECK(all.Value().back().id == "r5");

    REQUIRE(f.mock->GetCallCount() == 3);
    CHECK(f.mock->GetCalls()[0].path ==
          "/api/collections/posts/records?page=1&perPage=2&skipTotal=true&sort=created");
    CHECK(f.mock->GetCalls()[2].path ==
          "/api/collections/posts/records?page=3&perPage=2&skipTotal=true&sort=created");
}

TEST_CASE("GetFullList: exact multiple needs one trailing request", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 2, 1, 2));
    f.mock->EnqueueGet(200, MakePage(2, 2, 3, 2));
    f.mock->EnqueueGet(200, MakePage(3, 2, 5, 0));

    FullListOptions opts;
    opts.batch_size = 2;
    auto all = f.posts.GetFullList(opts);
    REQUIRE(all.IsOk());
    CHECK(all.Value().size() == 4);
    CHECK(f.mock->GetCallCount() == 3);
}

TEST_CASE("GetFullList: empty collection is one request", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 500, 1, 0));

    auto all = f.posts.GetFullList();
    REQUIRE(all.IsOk());
    CHECK(all.Value().empty());
    REQUIRE(f.mock->GetCallCount() == 1);
    CHECK(f.mock->GetCalls()[0].path ==
          "/api/collections/posts/records?page=1&perPage=500&skipTotal=true");
}

TEST_CASE("GetFullList: batch size is clamped", "[records][crud]") {
    SECTION("above the maximum") {
        Fixture f;
        f.mock->EnqueueGet(200, MakePage(1, 500, 1, 0));
        FullListOptions opts;
        opts.batch_size = 10000;
        REQUIRE(f.posts.GetFullList(opts).IsOk());
        CHECK(f.mock->GetCalls()[0].path.find("perPage=500&") != std::string::npos);
    }

    SECTION("zero and negative") {
        Fixture f;
        f.mock->EnqueueGet(200, MakePage(1, 1, 1, 0));
        FullListOptions opts;
        opts.batch_size = 0;
        REQUIRE(f.posts.GetFullList(opts).IsOk());
        CHECK(f.mock->GetCalls()[0].path.find("perPage=1&") != std::string::npos);
    }
}

TEST_CASE("GetFullList: same records for different batch sizes", "[records][crud]") {
    Fixture by_three;
    by_three.mock->EnqueueGet(200, MakePage(1, 3, 1, 3));
    by_three.mock->EnqueueGet(200, MakePage(2, 3, 4, 2));

    Fixture by_five;
    by_five.mock->EnqueueGet(200, MakePage(1, 5, 1, 5));
    by_five.mock->EnqueueGet(200, MakePage(2, 5, 6, 0));

    FullListOptions three;
    three.batch_size = 3;
    FullListOptions five;
    five.batch_size = 5;

    auto a = by_three.posts.GetFullList(three);
    auto b = by_five.posts.GetFullList(five);
    REQUIRE(a.IsOk());
    REQUIRE(b.IsOk());
    CHECK(a.Value() == b.Value());
    CHECK(by_three.mock->GetCallCount() == 2);
    CHECK(by_five.mock->GetCallCount() == 2);
}

TEST_CASE("GetFullList: error on a later page aborts", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueGet(200, MakePage(1, 2, 1, 2));
    f.mock->EnqueueGet(403, R"({"status":403,"message":"Forbidden.","data":{}})");

    FullListOptions opts;
    opts.batch_size = 2;
    auto all = f.posts.GetFullList(opts);
    REQUIRE(all.IsErr());
    CHECK(all.Error().kind == ErrorKind::Forbidden);
    CHECK(all.Error().operation == "GetFullList");
}

// ===========================================================================
// Create / Update
// ===========================================================================

TEST_CASE("Create: posts JSON and returns record metadata", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(200, kMetaBody);

    Post post;
    post.title = "Hello";
    post.published = true;
    auto meta = f.posts.Create(post);
    REQUIRE(meta.IsOk());
    CHECK(meta.Value().id == "new1");
    CHECK(meta.Value().collection_name == "posts");

    REQUIRE(f.mock->PostCallCount() == 1);
    const auto& call = f.mock->PostCalls()[0];
    CHECK(call.path == "/api/collections/posts/records");
    CHECK(call.content_type == "application/json");
    auto sent = nlohmann::json::parse(call.body);
    CHECK(sent["title"] == "Hello");
    CHECK(sent["published"] == true);
}

TEST_CASE("Create: validation failure carries field errors", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(400, R"({"status":400,"message":"Failed to create record.","data":{)"
                             R"("title":{"code":"validation_required","message":"Missing required value."}}})");

    auto meta = f.posts.Create(nlohmann::json{{"published", true}});
    REQUIRE(meta.IsErr());
    CHECK(meta.Error().kind == ErrorKind::BadRequest);
    CHECK(meta.Error().operation == "Create");
    REQUIRE(meta.Error().field_errors.size() == 1);
    CHECK(meta.Error().field_errors[0].name == "title");
}

TEST_CASE("Create: malformed field error entries stay a BadRequest", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(400, R"({"status":400,"message":"bad","data":{"title":{"code":123,"message":"x"}}})");

    auto meta = f.posts.Create(nlohmann::json{{"title", 5}});
    REQUIRE(meta.IsErr());
    CHECK(meta.Error().kind == ErrorKind::BadRequest);
    REQUIRE(meta.Error().field_errors.size() == 1);
    CHECK(meta.Error().field_errors[0].name == "title");
    CHECK(meta.Error().field_errors[0].code.empty());
    CHECK(meta.Error().field_errors[0].message == "x");
}

TEST_CASE("Create: non-200 success code is Unexpected", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(201, kMetaBody);

    auto meta = f.posts.Create(nlohmann::json{{"title", "x"}});
    REQUIRE(meta.IsErr());
    CHECK(meta.Error().kind == ErrorKind::Unexpected);
    CHECK(meta.Error().http_status == 201);
}

TEST_CASE("Create: unparseable error body uses a synthetic message", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(404, "<html>Not Found</html>");

    auto meta = f.posts.Create(nlohmann::json{{"title", "x"}});
    REQUIRE(meta.IsErr());
    CHECK(meta.Error().kind == ErrorKind::NotFound);
    CHECK(meta.Error().message.find("Unknown error") != std::string::npos);
}

TEST_CASE("CreateMultipart: sends form parts", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePost(200, kMetaBody);

    MultipartForm form{TextField("title", "With file"),
                       FileField("cover", "cover.png", "PNGDATA", "image/png")};
    auto meta = f.posts.CreateMultipart(form);
    REQUIRE(meta.IsOk());

    const auto& call = f.mock->PostCalls()[0];
    CHECK(call.path == "/api/collections/posts/records");
    CHECK(call.content_type == "multipart/form-data");
    REQUIRE(call.form.size() == 2);
    CHECK(call.form[0].name == "title");
    CHECK(call.form[0].content == "With file");
    CHECK(call.form[0].filename.empty());
    CHECK(call.form[1].name == "cover");
    CHECK(call.form[1].filename == "cover.png");
    CHECK(call.form[1].content == "PNGDATA");
    CHECK(call.form[1].content_type == "image/png");
}

TEST_CASE("Update: sends PATCH to the record path", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePatch(200, kMetaBody);

    auto meta = f.posts.Update("new1", nlohmann::json{{"title", "Renamed"}});
    REQUIRE(meta.IsOk());
    CHECK(meta.Value().updated == "2024-01-01 00:00:00.000Z");

    REQUIRE(f.mock->PatchCallCount() == 1);
    CHECK(f.mock->PatchCalls()[0].path == "/api/collections/posts/records/new1");
    CHECK(nlohmann::json::parse(f.mock->PatchCalls()[0].body)["title"] == "Renamed");
}

TEST_CASE("Update: missing record is NotFound", "[records][crud]") {
    Fixture f;
    f.mock->EnqueuePatch(404, kNotFoundBody);

    auto meta = f.posts.Update("gone", nlohmann::json{{"title", "x"}});
    REQUIRE(meta.IsErr());
    CHECK(meta.Error().kind == ErrorKind::NotFound);
    CHECK(meta.Error().operation == "Update");
}

// ===========================================================================
// Delete
// ===========================================================================

TEST_CASE("Delete: 204 and 200 both succeed", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueDelete(204, "");
    f.mock->EnqueueDelete(200, "");

    CHECK(f.posts.Delete("r1").IsOk());
    CHECK(f.posts.Delete("r2").IsOk());
    REQUIRE(f.mock->DeleteCallCount() == 2);
    CHECK(f.mock->DeleteCalls()[0].path == "/api/collections/posts/records/r1");
}

TEST_CASE("Delete: empty id makes no request", "[records][crud]") {
    Fixture f;
    auto result = f.posts.Delete("");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::BadRequest);
    CHECK(f.mock->TotalCallCount() == 0);
}

TEST_CASE("Delete: referenced record is BadRequest", "[records][crud]") {
    Fixture f;
    f.mock->EnqueueDelete(400, R"({"status":400,"message":"Failed to delete record. Make sure that the record is not part of a required relation reference.","data":{}})");

    auto result = f.posts.Delete("r1");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::BadRequest);
    CHECK(result.Error().ExitCode() == 5);
}
