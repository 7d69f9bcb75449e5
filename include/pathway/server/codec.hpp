#pragma once

#include "connection.hpp"
#include "limits.hpp"
#include "request.hpp"
#include "response.hpp"

#include <pathway/error.h>

#include <algorithm>

namespace pathway::server {
    /**
     * The request could not be read. The code is the status of the response
     * sent in its place, in 'version' when the request line was understood.
     */
    struct parse_error : error_code {
        server::version version;

        using error_code::error_code;

        template <typename... T>
        parse_error(
            server::version version,
            int code,
            fmt::format_string<T...> format,
            T&&... args
        ) :
            error_code(code, format, std::forward<T>(args)...),
            version(version)
        {}
    };

    /**
     * The peer closed the connection before sending a request.
     */
    struct connection_closed : std::exception {
        auto what() const noexcept -> const char* override;
    };

    /**
     * Parses a request line and header block, not including the blank line
     * that ends it.
     */
    auto parse_head(std::string_view head) -> request;

    auto serialize_head(const response& response) -> std::string;

    template <connection Connection>
    auto read_request(
        Connection& connection,
        const limits& limits
    ) -> ext::task<request> {
        constexpr auto terminator = std::string_view("\r\n\r\n");

        auto buffer = std::string();
        auto end = std::string::npos;

        while (end == std::string::npos) {
            const auto chunk = co_await connection.read();

            if (chunk.empty()) {
                if (buffer.empty()) throw connection_closed();
                throw parse_error(400, "Request head is incomplete");
            }

            // Resume the search where the terminator could begin.
            const auto from = buffer.size() < terminator.size() ?
                0 : buffer.size() - terminator.size() + 1;

            buffer.append(
                reinterpret_cast<const char*>(chunk.data()),
                chunk.size()
            );

            end = buffer.find(terminator, from);

            const auto head_size = end == std::string::npos ?
                buffer.size() : end;

            if (head_size > limits.max_head_size) {
                throw parse_error(
                    431,
                    "Request head exceeds {} bytes",
                    limits.max_head_size
                );
            }
        }

        auto request = parse_head(std::string_view(buffer).substr(0, end));

        const auto length = request.header<std::optional<std::size_t>>(
            "content-length"
        ).value_or(0);

        if (length > limits.max_body_size) {
            throw parse_error(
                request.version,
                413,
                "Request body exceeds {} bytes",
                limits.max_body_size
            );
        }

        request.body = buffer.substr(end + terminator.size(), length);

        while (request.body.size() < length) {
            const auto chunk = co_await connection.read();

            if (chunk.empty()) {
                throw parse_error(
                    request.version,
                    400,
                    "Request body is incomplete: expected {} bytes, got {}",
                    length,
                    request.body.size()
                );
            }

            request.body.append(
                reinterpret_cast<const char*>(chunk.data()),
                std::min(chunk.size(), length - request.body.size())
            );
        }

        co_return request;
    }

    template <connection Connection>
    auto write_response(
        Connection& connection,
        const response& response
    ) -> ext::task<> {
        const auto head = serialize_head(response);

        co_await connection.write(head.data(), head.size());

        if (!response.body.empty()) {
            co_await connection.write(
                response.body.data(),
                response.body.size()
            );
        }

        co_await connection.flush();
    }
}
