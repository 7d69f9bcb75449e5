#pragma once

#include "codec.hpp"
#include "finalize.hpp"
#include "router.hpp"

#include <timber/timber>

namespace pathway::server {
    /**
     * Serves a single request on a connection:
     * read, dispatch, finalize, write. The steps run in order and a
     * failure in any of them ends only this connection.
     */
    class worker {
        const server::router* router;
        server::limits limits;

        template <connection Connection>
        auto send(Connection& connection, const response& response) const
            -> ext::task<>
        {
            try {
                co_await write_response(connection, response);
            }
            catch (const std::exception& ex) {
                TIMBER_ERROR(
                    "Failed to send response ({}): {}",
                    response.status,
                    ex.what()
                );
            }
            catch (...) {
                TIMBER_ERROR("Failed to send response ({})", response.status);
            }
        }

        template <connection Connection>
        auto serve(Connection& connection) const -> ext::task<> {
            auto request = server::request();
            auto failure = std::optional<response>();

            try {
                request = co_await read_request(connection, limits);
            }
            catch (const connection_closed&) {
                TIMBER_TRACE("Connection closed before a request was sent");
                co_return;
            }
            catch (const parse_error& ex) {
                TIMBER_DEBUG("Failed to read request: {}", ex.what());
                failure = response(ex.code(), ex.what());
                finalize(*failure, ex.version);
            }

            if (failure) {
                co_await send(connection, *failure);
                co_return;
            }

            request.extensions.insert(captures());

            TIMBER_DEBUG("{}", request);

            auto response = to_response(co_await router->dispatch(request));
            finalize(response, request);

            TIMBER_DEBUG(
                "{} {} -> {}",
                request.method,
                request.target,
                response.status
            );

            co_await send(connection, response);
        }
    public:
        worker(const server::router& router, const server::limits& limits);

        /**
         * Never throws: anything escaping the pipeline is logged.
         */
        template <connection Connection>
        auto run(Connection& connection) const -> ext::task<> {
            try {
                co_await serve(connection);
            }
            catch (const std::exception& ex) {
                TIMBER_ERROR("Connection worker failed: {}", ex.what());
            }
            catch (...) {
                TIMBER_ERROR("Connection worker failed");
            }
        }
    };
}
