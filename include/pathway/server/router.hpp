#pragma once

#include "method_router.hpp"
#include "node.hpp"

#include <variant>

namespace pathway::server {
    using path = node<method_router>;

    /**
     * An extractor turned the request away; the response explains why.
     */
    struct extractor_failed {
        server::response response;
    };

    struct no_route_matched {};

    using dispatch_result = std::variant<
        response,
        extractor_failed,
        no_route_matched
    >;

    /**
     * Renders failures: 'extractor_failed' yields its response and
     * 'no_route_matched' a 404.
     */
    auto to_response(dispatch_result&& result) -> response;

    /**
     * Immutable once constructed. One router is shared by every connection
     * without locking.
     */
    class router {
        path paths;
    public:
        router(path&& paths);

        router(const router&) = delete;

        router(router&&) = default;

        auto operator=(const router&) -> router& = delete;

        auto operator=(router&&) -> router& = default;

        /**
         * Matches the request path, merges the route's captures into the
         * request's 'captures' extension and runs the handler registered for
         * the request method.
         *
         * The request must carry a 'captures' extension.
         */
        auto dispatch(request& request) const -> ext::task<dispatch_result>;

        auto to_string() const -> std::string;
    };
}
