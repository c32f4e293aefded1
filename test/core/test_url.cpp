#include <catch2/catch_test_macros.hpp>

#include <pocketbase/core/url.hpp>

using namespace pocketbase;

TEST_CASE("UrlEncode: unreserved characters pass through", "[core][url]") {
    CHECK(UrlEncode("abcXYZ019-_.~") == "abcXYZ019-_.~");
}

TEST_CASE("UrlEncode: reserved characters are percent-encoded", "[core][url]") {
    CHECK(UrlEncode("a b") == "a%20b");
    CHECK(UrlEncode("status = true && title ~ 'x'") ==
          "status%20%3D%20true%20%26%26%20title%20~%20%27x%27");
    CHECK(UrlEncode("-created,title") == "-created%2Ctitle");
    CHECK(UrlEncode("a/b?c#d") == "a%2Fb%3Fc%23d");
}

TEST_CASE("UrlEncode: UTF-8 bytes use uppercase hex", "[core][url]") {
    CHECK(UrlEncode("\xC3\xA9") == "%C3%A9");
}

TEST_CASE("BuildQueryString: empty params give empty string", "[core][url]") {
    CHECK(BuildQueryString({}).empty());
}

TEST_CASE("BuildQueryString: keeps order and encodes values", "[core][url]") {
    QueryParams params{{"page", "2"}, {"perPage", "50"}, {"filter", "a = 1"}};
    CHECK(BuildQueryString(params) == "?page=2&perPage=50&filter=a%20%3D%201");
}
