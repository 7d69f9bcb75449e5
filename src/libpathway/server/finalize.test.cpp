#include <pathway/server/finalize.hpp>

#include <gtest/gtest.h>

using namespace pathway::server;
using namespace std::literals;

TEST(Finalize, ContentLength) {
    auto req = request();
    auto res = response(200, "hello");

    finalize(res, req);

    EXPECT_EQ("5"sv, res.header("content-length").value_or(""));
}

TEST(Finalize, EmptyBody) {
    auto req = request();
    auto res = response(204);

    finalize(res, req);

    EXPECT_EQ("0"sv, res.header("content-length").value_or(""));
}

TEST(Finalize, ByteLength) {
    auto req = request();
    auto res = response(200, "caf\xc3\xa9");

    finalize(res, req);

    EXPECT_EQ("5"sv, res.header("content-length").value_or(""));
}

TEST(Finalize, AppendsContentLength) {
    auto req = request();
    auto res = response(200, "hello");
    res.append("content-length", "99");

    finalize(res, req);

    const auto expected = std::vector<std::pair<std::string, std::string>> {
        {"content-type", "text/plain; charset=utf-8"},
        {"content-length", "99"},
        {"content-length", "5"}
    };

    EXPECT_EQ(expected, res.headers);
}

TEST(Finalize, CopiesVersion) {
    auto req = request();
    req.version = version { .major = 1, .minor = 0 };

    auto res = response(200, "hello");

    finalize(res, req);

    EXPECT_EQ(req.version, res.version);
    EXPECT_EQ("HTTP/1.0", fmt::format("{}", res.version));
}
