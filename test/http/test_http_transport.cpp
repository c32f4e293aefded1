#include <catch2/catch_test_macros.hpp>

#include <pocketbase/pocketbase.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <thread>

using namespace pocketbase;

// ===========================================================================
// Helper: spin up a local httplib::Server for tests that exercise the real
// transport.
// ===========================================================================
namespace {

// Starts an httplib::Server on a background thread and stops it on
// destruction.
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }
    [[nodiscard]] std::string Url() const {
        return "http://127.0.0.1:" + std::to_string(port_);
    }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

HttpTransportOptions FastOptions() {
    HttpTransportOptions opts;
    opts.connect_timeout = std::chrono::seconds{2};
    opts.read_timeout = std::chrono::seconds{5};
    opts.write_timeout = std::chrono::seconds{5};
    return opts;
}

} // anonymous namespace

// ===========================================================================
// HttpTransport against a local server
// ===========================================================================

TEST_CASE("HttpTransport: GET passes path, query and headers through", "[http][live]") {
    httplib::Server svr;
    std::string received_filter;
    std::string received_auth;
    std::string received_agent;

    svr.Get("/api/collections/posts/records", [&](const httplib::Request& req,
                                                  httplib::Response& res) {
        received_filter = req.get_param_value("filter");
        received_auth = req.get_header_value("Authorization");
        received_agent = req.get_header_value("User-Agent");
        res.set_content(R"({"items":[]})", "application/json");
    });

    LocalServer server(svr);
    HttpTransport transport(BaseUrl::Create(server.Url()).Value(), FastOptions());

    auto result = transport.Get("/api/collections/posts/records?filter=a%20%3D%201",
                                {{"Authorization", "Bearer abc"}});
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(result.Value().body == R"({"items":[]})");
    CHECK(received_filter == "a = 1");
    CHECK(received_auth == "Bearer abc");
    CHECK(received_agent.rfind("pocketbase-cpp/", 0) == 0);
}

TEST_CASE("HttpTransport: error statuses are Ok responses", "[http][live]") {
    httplib::Server svr;
    svr.Get("/missing", [](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content(R"({"status":404,"message":"Missing.","data":{}})", "application/json");
    });

    LocalServer server(svr);
    HttpTransport transport(BaseUrl::Create(server.Url()).Value(), FastOptions());

    auto result = transport.Get("/missing");
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 404);
    CHECK(result.Value().body.find("Missing.") != std::string::npos);
}

TEST_CASE("HttpTransport: POST, PATCH and DELETE send bodies", "[http][live]") {
    httplib::Server svr;
    std::string post_body;
    std::string post_type;
    std::string patch_body;
    bool deleted = false;

    svr.Post("/items", [&](const httplib::Request& req, httplib::Response& res) {
        post_body = req.body;
        post_type = req.get_header_value("Content-Type");
        res.set_content("{}", "application/json");
    });
    svr.Patch("/items/1", [&](const httplib::Request& req, httplib::Response& res) {
        patch_body = req.body;
        res.set_content("{}", "application/json");
    });
    svr.Delete("/items/1", [&](const httplib::Request&, httplib::Response& res) {
        deleted = true;
        res.status = 204;
    });

    LocalServer server(svr);
    HttpTransport transport(BaseUrl::Create(server.Url()).Value(), FastOptions());

    auto post = transport.Post("/items", R"({"a":1})", "application/json");
    REQUIRE(post.IsOk());
    CHECK(post_body == R"({"a":1})");
    CHECK(post_type == "application/json");

    auto patch = transport.Patch("/items/1", R"({"a":2})", "application/json");
    REQUIRE(patch.IsOk());
    CHECK(patch_body == R"({"a":2})");

    auto del = transport.Delete("/items/1");
    REQUIRE(del.IsOk());
    CHECK(del.Value().status_code == 204);
    CHECK(deleted);
}

TEST_CASE("HttpTransport: multipart POST carries fields and files", "[http][live]") {
    httplib::Server svr;
    std::string content_type;
    std::string title;
    std::string cover_name;
    std::string cover_type;
    std::string cover_content;

    svr.Post("/api/collections/posts/records", [&](const httplib::Request& req,
                                                   httplib::Response& res) {
        content_type = req.get_header_value("Content-Type");
        if (req.has_file("title")) {
            title = req.get_file_value("title").content;
        }
        if (req.has_file("cover")) {
            const auto cover = req.get_file_value("cover");
            cover_name = cover.filename;
            cover_type = cover.content_type;
            cover_content = cover.content;
        }
        res.set_content(R"({"id":"r1"})", "application/json");
    });

    LocalServer server(svr);
    HttpTransport transport(BaseUrl::Create(server.Url()).Value(), FastOptions());

    MultipartForm form{TextField("title", "With \"quotes\""),
                       FileField("cover", "cover.png", std::string("PNG\0DATA", 8), "image/png")};
    auto result = transport.PostMultipart("/api/collections/posts/records", form);
    REQUIRE(result.IsOk());
    CHECK(result.Value().status_code == 200);
    CHECK(content_type.rfind("multipart/form-data; boundary=", 0) == 0);
    CHECK(title == "With \"quotes\"");
    CHECK(cover_name == "cover.png");
    CHECK(cover_type == "image/png");
    CHECK(cover_content == std::string("PNG\0DATA", 8));
}

TEST_CASE("HttpTransport: connection refused is Unreachable", "[http][live]") {
    // Nothing listens on port 1 of the loopback interface.
    HttpTransport transport(BaseUrl::Create("http://127.0.0.1:1").Value(), FastOptions());

    auto result = transport.Get("/api/health");
    REQUIRE(result.IsErr());
    CHECK(result.Error().kind == ErrorKind::Unreachable);
    CHECK_FALSE(result.Error().http_status.has_value());
    CHECK(result.Error().ExitCode() == 1);
}

// ===========================================================================
// PocketBase end to end against a local server
// ===========================================================================

TEST_CASE("PocketBase: login then list over HTTP", "[http][live]") {
    httplib::Server svr;
    std::string list_auth;

    svr.Post("/api/collections/users/auth-with-password",
             [](const httplib::Request& req, httplib::Response& res) {
        auto body = nlohmann::json::parse(req.body);
        if (body["password"] != "secret") {
            res.status = 400;
            res.set_content(R"({"status":400,"message":"Failed to authenticate.","data":{}})",
                            "application/json");
            return;
        }
        res.set_content(R"({"token":"live-token","record":{"id":"u1","email":"a@example.com"}})",
                        "application/json");
    });
    svr.Get("/api/collections/posts/records", [&](const httplib::Request& req,
                                                  httplib::Response& res) {
        list_auth = req.get_header_value("Authorization");
        res.set_content(R"({"page":1,"perPage":30,"totalItems":1,"totalPages":1,)"
                        R"("items":[{"id":"p1","title":"Hello"}]})",
                        "application/json");
    });

    LocalServer server(svr);
    auto pb = PocketBase::Create(server.Url(), FastOptions());
    REQUIRE(pb.IsOk());
    auto& client = pb.Value();

    auto users = client.GetCollection("users").Value();
    auto rejected = users.AuthWithPassword("a@example.com", "wrong");
    REQUIRE(rejected.IsErr());
    CHECK(rejected.Error().kind == ErrorKind::InvalidCredentials);
    CHECK_FALSE(client.IsAuthenticated());

    REQUIRE(users.AuthWithPassword("a@example.com", "secret").IsOk());

    auto posts = client.GetCollection("posts").Value();
    auto list = posts.GetList();
    REQUIRE(list.IsOk());
    REQUIRE(list.Value().items.size() == 1);
    CHECK(list.Value().items[0]["title"] == "Hello");
    CHECK(list_auth == "Bearer live-token");
}
