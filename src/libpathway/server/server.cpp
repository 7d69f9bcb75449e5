#include <pathway/server/server.hpp>

namespace pathway::server::detail {
    /**
     * Presents end of stream as an empty read, the way workers expect it.
     */
    class socket_connection {
        netcore::buffered_socket socket;
        bool closed = false;
    public:
        socket_connection(netcore::socket&& socket, std::size_t buffer_size) :
            socket(std::forward<netcore::socket>(socket), buffer_size)
        {}

        auto read() -> ext::task<std::span<const std::byte>> {
            try {
                co_return co_await socket.read();
            }
            catch (const netcore::eof&) {
                TIMBER_TRACE("Connection received EOF");
            }

            co_return std::span<const std::byte>();
        }

        auto write(const void* src, std::size_t len) -> ext::task<> {
            co_await socket.write(src, len);
        }

        auto flush() -> ext::task<> {
            co_await socket.flush();
        }

        auto close() noexcept -> void {
            if (closed) return;
            closed = true;

            try {
                socket.shutdown();
            }
            catch (const std::exception& ex) {
                TIMBER_DEBUG("Failed to shut down connection: {}", ex.what());
            }
        }
    };
}

namespace pathway::server {
    context::context(const router& router) : context(router, {}) {}

    context::context(const router& router, const struct limits& limits) :
        limits(limits),
        worker(router, limits)
    {}

    auto context::connection(netcore::socket&& client) -> ext::task<> {
        auto connection = detail::socket_connection(
            std::forward<netcore::socket>(client),
            limits.buffer_size
        );

        const auto entry = connection_list<detail::socket_connection>::entry(
            connections,
            connection
        );

        TIMBER_TRACE("Connection opened");

        co_await worker.run(connection);
        connection.close();

        TIMBER_TRACE("Connection closed");
    }

    auto context::shutdown() -> void {
        TIMBER_DEBUG(
            "HTTP server shutdown requested: closing {} connection{}",
            connections.size(),
            connections.size() == 1 ? "" : "s"
        );

        connections.for_each([](detail::socket_connection& connection) {
            connection.close();
        });
    }
}
