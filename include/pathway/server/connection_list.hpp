#pragma once

#include <cstddef>
#include <list>

namespace pathway::server {
    /**
     * Connections currently being served. A connection is listed for as long
     * as its 'entry' lives.
     */
    template <typename T>
    class connection_list {
        std::list<T*> connections;
    public:
        class entry {
            connection_list* list;
            typename std::list<T*>::iterator position;
        public:
            entry(connection_list& list, T& connection) :
                list(&list),
                position(list.connections.insert(
                    list.connections.end(),
                    &connection
                ))
            {}

            entry(const entry&) = delete;

            ~entry() {
                list->connections.erase(position);
            }

            auto operator=(const entry&) -> entry& = delete;
        };

        connection_list() = default;

        connection_list(const connection_list&) = delete;

        auto operator=(const connection_list&) -> connection_list& = delete;

        auto empty() const noexcept -> bool {
            return connections.empty();
        }

        template <typename F>
        auto for_each(F&& f) -> void {
            auto it = connections.begin();

            while (it != connections.end()) {
                // 'f' may end the current connection's entry.
                auto& connection = **it++;
                f(connection);
            }
        }

        auto size() const noexcept -> std::size_t {
            return connections.size();
        }
    };
}
