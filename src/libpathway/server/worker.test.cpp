#include "memory_connection.test.h"

#include <pathway/pathway>

#include <gtest/gtest.h>

using namespace pathway::server;
using namespace std::literals;

using pathway::test::memory_connection;

namespace {
    class WorkerTest : public testing::Test {
    protected:
        std::optional<std::tuple<int, int>> observed;
        pathway::server::router router;
        pathway::server::worker worker;

        WorkerTest() :
            router(make_paths()),
            worker(router, limits())
        {}

        auto make_paths() -> pathway::server::path {
            auto paths = pathway::server::path();

            paths.insert(
                "/users/:user_id/teams/:team_id",
                get([this](
                    extractor::path<std::tuple<int, int>> ids
                ) -> std::string {
                    observed = *ids;
                    return fmt::format(
                        "{}:{}",
                        std::get<0>(*ids),
                        std::get<1>(*ids)
                    );
                })
            );

            paths.insert(
                "/fail",
                get([]() -> std::string {
                    throw std::runtime_error("handler failed");
                })
            );

            paths.insert(
                "/throw",
                get([]() -> std::string { throw 42; })
            );

            return paths;
        }

        auto run(memory_connection& connection) -> void {
            netcore::run([&]() -> ext::task<> {
                co_await worker.run(connection);
            }());
        }
    };
}

TEST_F(WorkerTest, EndToEnd) {
    auto connection = memory_connection(
        "GET /users/7/teams/9 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "\r\n"
    );

    run(connection);

    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(std::make_tuple(7, 9), *observed);

    EXPECT_EQ(
        "HTTP/1.1 200 OK\r\n"
        "content-type: text/plain; charset=utf-8\r\n"
        "content-length: 3\r\n"
        "\r\n"
        "7:9"sv,
        connection.output
    );
}

TEST_F(WorkerTest, ProtocolVersion) {
    auto connection = memory_connection(
        "GET /users/7/teams/9 HTTP/1.0\r\n\r\n"
    );

    run(connection);

    EXPECT_TRUE(connection.output.starts_with("HTTP/1.0 200 OK\r\n"));
}

TEST_F(WorkerTest, NotFound) {
    auto connection = memory_connection("GET /missing HTTP/1.1\r\n\r\n");

    run(connection);

    EXPECT_EQ(
        "HTTP/1.1 404 Not Found\r\n"
        "content-type: text/plain; charset=utf-8\r\n"
        "content-length: 9\r\n"
        "\r\n"
        "Not Found"sv,
        connection.output
    );
}

TEST_F(WorkerTest, InvalidUtf8) {
    auto connection = memory_connection(
        "GET /users/%FF/teams/9 HTTP/1.1\r\n\r\n"
    );

    run(connection);

    EXPECT_FALSE(observed.has_value());
    EXPECT_TRUE(connection.output.starts_with("HTTP/1.1 400 Bad Request\r\n"));
    EXPECT_TRUE(
        connection.output.ends_with("Invalid URL: Invalid UTF-8 in `user_id`")
    );
}

TEST_F(WorkerTest, ParseFailure) {
    auto connection = memory_connection("GET /users/7/teams/9 HTTP/3.0\r\n\r\n");

    run(connection);

    EXPECT_FALSE(observed.has_value());
    EXPECT_TRUE(connection.output.starts_with(
        "HTTP/1.1 505 HTTP Version Not Supported\r\n"
    ));
    EXPECT_NE(std::string::npos, connection.output.find("content-length: "));
}

TEST_F(WorkerTest, ConnectionClosedQuietly) {
    auto connection = memory_connection("");

    run(connection);

    EXPECT_TRUE(connection.output.empty());
    EXPECT_EQ(0, connection.flushes);
}

TEST_F(WorkerTest, HandlerFailure) {
    auto connection = memory_connection("GET /fail HTTP/1.1\r\n\r\n");

    run(connection);

    EXPECT_TRUE(connection.output.starts_with(
        "HTTP/1.1 500 Internal Server Error\r\n"
    ));
    EXPECT_NE(
        std::string::npos,
        connection.output.find("content-length: 0\r\n")
    );
}

TEST_F(WorkerTest, WriteFailure) {
    auto connection = memory_connection("GET /users/1/teams/2 HTTP/1.1\r\n\r\n");
    connection.fail_writes = true;

    run(connection);

    EXPECT_TRUE(observed.has_value());
    EXPECT_TRUE(connection.output.empty());
}

TEST_F(WorkerTest, ReadFailure) {
    auto connection = memory_connection("GET / HTTP/1.1\r\n\r\n");
    connection.fail_reads = true;

    run(connection);

    EXPECT_TRUE(connection.output.empty());
}

TEST_F(WorkerTest, IndependentConnections) {
    auto first = memory_connection("GET /fail HTTP/1.1\r\n\r\n");
    auto second = memory_connection("GET /users/3/teams/4 HTTP/1.1\r\n\r\n");

    run(first);
    run(second);

    EXPECT_TRUE(first.output.starts_with("HTTP/1.1 500"));
    EXPECT_TRUE(second.output.ends_with("3:4"));
}

TEST_F(WorkerTest, HandlerThrowsNonException) {
    auto connection = memory_connection("GET /throw HTTP/1.1\r\n\r\n");

    run(connection);

    EXPECT_TRUE(connection.output.starts_with(
        "HTTP/1.1 500 Internal Server Error\r\n"
    ));
}

TEST_F(WorkerTest, ReadThrowsNonException) {
    auto connection = memory_connection("GET / HTTP/1.1\r\n\r\n");
    connection.fail_reads_unknown = true;

    EXPECT_NO_THROW(run(connection));
    EXPECT_TRUE(connection.output.empty());
}

TEST_F(WorkerTest, BodyTooLargeKeepsVersion) {
    auto connection = memory_connection(
        "POST /users/1/teams/2 HTTP/1.0\r\n"
        "Content-Length: 99999999\r\n"
        "\r\n"
    );

    run(connection);

    EXPECT_FALSE(observed.has_value());
    EXPECT_TRUE(connection.output.starts_with(
        "HTTP/1.0 413 Payload Too Large\r\n"
    ));
}
