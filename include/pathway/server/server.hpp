#pragma once

#include "connection_list.hpp"
#include "worker.hpp"

#include <netcore/netcore>

namespace pathway::server {
    namespace detail {
        class socket_connection;
    }

    class context {
        const server::limits limits;
        server::worker worker;
        connection_list<detail::socket_connection> connections;
    public:
        context(const server::router& router);

        context(const server::router& router, const server::limits& limits);

        auto connection(netcore::socket&& client) -> ext::task<>;

        /**
         * Shuts down the sockets of connections still being served. Their
         * workers observe end of stream, or a failed write, and finish.
         */
        auto shutdown() -> void;
    };

    using server = netcore::server<context>;
}
