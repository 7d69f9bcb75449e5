#include "memory_connection.test.h"

#include <pathway/server/codec.hpp>

#include <gtest/gtest.h>

using namespace pathway::server;
using namespace std::literals;

using pathway::test::memory_connection;

namespace {
    auto read(memory_connection& connection, const limits& limits = {})
        -> request
    {
        auto result = request();
        auto exception = std::exception_ptr();

        netcore::run([&]() -> ext::task<> {
            try {
                result = co_await read_request(connection, limits);
            }
            catch (...) {
                exception = std::current_exception();
            }
        }());

        if (exception) std::rethrow_exception(exception);
        return result;
    }

    auto read(std::string_view input, const limits& limits = {}) -> request {
        auto connection = memory_connection(input);
        return read(connection, limits);
    }

    auto parse_failure(std::string_view head) -> int {
        try {
            parse_head(head);
        }
        catch (const parse_error& error) {
            return error.code();
        }

        return 0;
    }
}

TEST(Codec, ParseHead) {
    const auto request = parse_head(
        "GET /users/7?expand=true HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "Accept:  text/plain \r\n"
        "X-Tag: a\r\n"
        "x-tag: b"
    );

    EXPECT_EQ("GET", request.method);
    EXPECT_EQ("/users/7?expand=true", request.target);
    EXPECT_EQ("/users/7", request.path);
    EXPECT_EQ("expand=true", request.query);
    EXPECT_EQ((version { .major = 1, .minor = 1 }), request.version);
    EXPECT_EQ("example.com", request.headers.at("host"));
    EXPECT_EQ("text/plain", request.headers.at("accept"));
    EXPECT_EQ("a, b", request.headers.at("x-tag"));
}

TEST(Codec, ParseAbsoluteTarget) {
    const auto request = parse_head("GET http://example.com/a/b?c HTTP/1.0");

    EXPECT_EQ("/a/b", request.path);
    EXPECT_EQ("c", request.query);
    EXPECT_EQ((version { .major = 1, .minor = 0 }), request.version);

    EXPECT_EQ("/", parse_head("GET http://example.com HTTP/1.1").path);
}

TEST(Codec, ParseFailures) {
    EXPECT_EQ(400, parse_failure("GET /"));
    EXPECT_EQ(400, parse_failure("GET  / HTTP/1.1"));
    EXPECT_EQ(400, parse_failure("G(T / HTTP/1.1"));
    EXPECT_EQ(400, parse_failure("GET users HTTP/1.1"));
    EXPECT_EQ(400, parse_failure("GET / HTTP/x"));
    EXPECT_EQ(400, parse_failure("GET / HTTP/1.1\r\nno colon"));
    EXPECT_EQ(400, parse_failure("GET / HTTP/1.1\r\nBad Name: x"));
    EXPECT_EQ(400, parse_failure("GET / HTTP/1.1\r\nA: b\r\n  folded"));
    EXPECT_EQ(400, parse_failure("POST / HTTP/1.1\r\nContent-Length: ten"));
    EXPECT_EQ(505, parse_failure("GET / HTTP/2.0"));
    EXPECT_EQ(
        501,
        parse_failure("POST / HTTP/1.1\r\nTransfer-Encoding: chunked")
    );
}

TEST(Codec, ReadRequest) {
    const auto request = read(
        "POST /items HTTP/1.1\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello"
    );

    EXPECT_EQ("POST", request.method);
    EXPECT_EQ("/items", request.path);
    EXPECT_EQ("hello", request.body);
}

TEST(Codec, ReadRequestInChunks) {
    auto connection = memory_connection(
        "PUT /items/1 HTTP/1.1\r\n"
        "Content-Length: 11\r\n"
        "\r\n"
        "hello world",
        3
    );

    const auto request = read(connection);

    EXPECT_EQ("/items/1", request.path);
    EXPECT_EQ("hello world", request.body);
}

TEST(Codec, ReadRequestWithoutBody) {
    const auto request = read("GET / HTTP/1.1\r\nHost: a\r\n\r\n");

    EXPECT_EQ("/", request.path);
    EXPECT_TRUE(request.body.empty());
}

TEST(Codec, ConnectionClosed) {
    EXPECT_THROW(read(""), connection_closed);
}

TEST(Codec, IncompleteHead) {
    try {
        read("GET / HTTP/1.1\r\nHost");
        FAIL() << "read should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(400, error.code());
    }
}

TEST(Codec, IncompleteBody) {
    try {
        read("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\nshort");
        FAIL() << "read should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(400, error.code());
    }
}

TEST(Codec, HeadTooLarge) {
    auto limits = pathway::server::limits();
    limits.max_head_size = 32;

    try {
        read(
            "GET / HTTP/1.1\r\n"
            "X-Padding: aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa\r\n"
            "\r\n",
            limits
        );
        FAIL() << "read should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(431, error.code());
    }
}

TEST(Codec, BodyTooLarge) {
    auto limits = pathway::server::limits();
    limits.max_body_size = 4;

    try {
        read("POST / HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello", limits);
        FAIL() << "read should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(413, error.code());
    }
}

TEST(Codec, WriteResponse) {
    auto connection = memory_connection("");
    auto response = pathway::server::response(404, "Not Found");
    response.append("content-length", "9");

    netcore::run([&]() -> ext::task<> {
        co_await write_response(connection, response);
    }());

    EXPECT_EQ(
        "HTTP/1.1 404 Not Found\r\n"
        "content-type: text/plain; charset=utf-8\r\n"
        "content-length: 9\r\n"
        "\r\n"
        "Not Found"sv,
        connection.output
    );
    EXPECT_EQ(1, connection.flushes);
}

TEST(Codec, SerializeHead) {
    auto response = pathway::server::response(204);
    response.version = version { .major = 1, .minor = 0 };

    EXPECT_EQ("HTTP/1.0 204 No Content\r\n\r\n"sv, serialize_head(response));
}

TEST(Codec, ParseErrorCarriesVersion) {
    auto limits = pathway::server::limits();
    limits.max_body_size = 4;

    try {
        read("POST / HTTP/1.0\r\nContent-Length: 5\r\n\r\nhello", limits);
        FAIL() << "read should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(413, error.code());
        EXPECT_EQ((version { .major = 1, .minor = 0 }), error.version);
    }

    try {
        parse_head("GET / HTTP/1.0\r\nBad Name: x");
        FAIL() << "parse should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ(400, error.code());
        EXPECT_EQ((version { .major = 1, .minor = 0 }), error.version);
    }
}

TEST(Codec, ParseErrorDefaultVersion) {
    try {
        parse_head("GET");
        FAIL() << "parse should fail";
    }
    catch (const parse_error& error) {
        EXPECT_EQ((version { .major = 1, .minor = 1 }), error.version);
    }
}
