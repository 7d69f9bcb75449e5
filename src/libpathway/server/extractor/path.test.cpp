#include <pathway/server/extractor/path.hpp>

#include <gtest/gtest.h>

using namespace pathway::server::extractor;
using namespace std::literals;

using pathway::server::capture;
using pathway::server::captures;

namespace {
    auto make_request(std::vector<capture>&& params) -> pathway::server::request {
        auto request = pathway::server::request();
        request.extensions.insert(captures(std::move(params)));
        return request;
    }
}

TEST(Path, PercentDecoded) {
    const auto store = captures({{"first", "hello%20world"}, {"second", "a%2Fb"}});

    const auto result = extract_path<std::tuple<std::string, std::string>>(
        store
    );

    EXPECT_EQ("hello world", std::get<0>(result));
    EXPECT_EQ("a/b", std::get<1>(result));
}

TEST(Path, InvalidUtf8) {
    const auto store = captures({{"id", "1"}, {"name", "%FF%FE"}});

    try {
        extract_path<std::tuple<int, std::string>>(store);
        FAIL() << "extraction should fail";
    }
    catch (const path_rejection& rejection) {
        EXPECT_EQ(
            error_kind(invalid_utf8_in_path_param { .key = "name" }),
            rejection.kind()
        );
        EXPECT_EQ(400, rejection.http_code());
        EXPECT_EQ("Invalid URL: Invalid UTF-8 in `name`"sv, rejection.body());
    }
}

TEST(Path, InvalidUtf8BeforeArity) {
    const auto store = captures({{"a", "%C3"}, {"b", "2"}});

    try {
        extract_path<int>(store);
        FAIL() << "extraction should fail";
    }
    catch (const path_rejection& rejection) {
        EXPECT_EQ(
            error_kind(invalid_utf8_in_path_param { .key = "a" }),
            rejection.kind()
        );
    }
}

TEST(Path, CapturesUnchanged) {
    const auto store = captures({{"a", "%41"}, {"b", "2"}});

    extract_path<std::vector<std::string>>(store);

    ASSERT_NE(nullptr, store.find("a"));
    EXPECT_EQ("%41", *store.find("a"));
    EXPECT_EQ(2, store.size());
}

TEST(Path, WrongNumberOfParameters) {
    const auto store = captures(std::vector<capture> {{"id", "42"}});

    try {
        extract_path<std::tuple<int, int>>(store);
        FAIL() << "extraction should fail";
    }
    catch (const path_rejection& rejection) {
        EXPECT_EQ(500, rejection.http_code());
        EXPECT_EQ(
            "Wrong number of path arguments for `Path`. Expected 2 but got 1"sv,
            rejection.body()
        );
    }
}

TEST(Path, FromRequest) {
    auto request = make_request({{"user_id", "7"}, {"team_id", "9"}});

    const auto ids = path<std::pair<int, int>>(request);

    EXPECT_EQ(7, ids->first);
    EXPECT_EQ(9, ids->second);
}

TEST(Path, MissingCaptures) {
    auto request = pathway::server::request();

    EXPECT_THROW(
        static_cast<void>(path<int>(request)),
        pathway::server::missing_extension
    );
}
