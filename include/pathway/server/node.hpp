#pragma once

#include "captures.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pathway::server {
    template <typename T>
    struct match {
        const T* value;
        server::captures params;
    };

    // Children are kept in this order, which is also the match priority.
    enum class node_type {
        static_route,
        param,
        catch_all
    };

    /**
     * Route table keyed by path segments. A segment is either literal text,
     * ':name' (captures one segment) or '*name' (captures the remainder of
     * the path, and must come last).
     */
    template <typename T>
    class node {
        node_type type = node_type::static_route;
        std::string prefix;
        std::optional<T> value;
        std::vector<node> children;

        node(node_type type, std::string_view prefix) :
            type(type),
            prefix(prefix)
        {}

        static auto trim(std::string_view route) -> std::string_view {
            if (route.starts_with('/')) route.remove_prefix(1);
            if (route.ends_with('/')) route.remove_suffix(1);
            return route;
        }

        auto child(node_type type, std::string_view name) -> node& {
            for (auto& child : children) {
                if (child.type != type) continue;

                if (type == node_type::static_route) {
                    if (child.prefix == name) return child;
                    continue;
                }

                if (child.prefix != name) {
                    throw std::runtime_error(fmt::format(
                        "param collision {} -> {}",
                        child.prefix,
                        name
                    ));
                }

                return child;
            }

            const auto position = std::find_if(
                children.begin(),
                children.end(),
                [type](const node& child) { return child.type > type; }
            );

            return *children.insert(position, node(type, name));
        }

        auto find(
            std::string_view route,
            std::vector<capture>& params
        ) const -> const T* {
            if (route.empty()) return value ? &*value : nullptr;

            const auto slash = route.find('/');
            const auto segment = route.substr(0, slash);
            const auto rest = slash == std::string_view::npos ?
                std::string_view() : route.substr(slash + 1);

            for (const auto& child : children) {
                const auto mark = params.size();

                switch (child.type) {
                    case node_type::static_route:
                        if (segment != child.prefix) continue;
                        break;
                    case node_type::param:
                        if (segment.empty()) continue;
                        params.push_back({child.prefix, std::string(segment)});
                        break;
                    case node_type::catch_all:
                        if (!child.value) continue;
                        params.push_back({child.prefix, std::string(route)});
                        return &*child.value;
                }

                if (const auto* const result = child.find(rest, params)) {
                    return result;
                }

                params.resize(mark);
            }

            return nullptr;
        }

        auto format_to(
            std::back_insert_iterator<fmt::memory_buffer>& out,
            int level
        ) const -> void {
            auto type = std::string_view();

            switch (this->type) {
                case node_type::static_route: type = ""; break;
                case node_type::param: type = ":"; break;
                case node_type::catch_all: type = "*"; break;
            }

            const auto indent = level * 2;
            for (auto i = 0; i < indent; ++i) fmt::format_to(out, " ");

            fmt::format_to(
                out,
                "/{}{} {}\n",
                type,
                prefix,
                value ? fmt::to_string(*value) : ""
            );

            for (const auto& child : children) child.format_to(out, level + 1);
        }
    public:
        node() = default;

        /**
         * Looks up an absolute path. A single trailing slash is ignored.
         * Captures are listed in the order they appear in the path.
         */
        auto find(std::string_view path) const -> std::optional<match<T>> {
            auto params = std::vector<capture>();

            if (const auto* const result = find(trim(path), params)) {
                return match<T> {
                    .value = result,
                    .params = server::captures(std::move(params))
                };
            }

            return std::nullopt;
        }

        auto insert(std::string_view route, T&& value) -> node& {
            route = trim(route);

            auto* current = this;

            while (!route.empty()) {
                const auto slash = route.find('/');
                auto segment = route.substr(0, slash);
                route = slash == std::string_view::npos ?
                    std::string_view() : route.substr(slash + 1);

                auto type = node_type::static_route;

                if (segment.starts_with(':')) type = node_type::param;
                else if (segment.starts_with('*')) {
                    type = node_type::catch_all;
                    if (!route.empty()) {
                        throw std::runtime_error("invalid catch-all");
                    }
                }

                if (type != node_type::static_route) {
                    segment.remove_prefix(1);
                    if (segment.empty()) {
                        throw std::runtime_error("unnamed route parameter");
                    }
                }

                current = &current->child(type, segment);
            }

            current->value = std::forward<T>(value);
            return *current;
        }

        auto insert(std::string_view route, T& value) -> node& {
            return insert(route, std::move(value));
        }

        auto to_string() const -> std::string {
            auto buffer = fmt::memory_buffer();
            auto out = std::back_inserter(buffer);

            format_to(out, 0);

            return fmt::to_string(buffer);
        }
    };
}
