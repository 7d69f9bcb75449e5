#pragma once

#include "../response.hpp"

namespace pathway::server {
    template <typename T>
    struct response_type<std::pair<int, T>> {
        static auto send(response& res, std::pair<int, T>&& pair) -> void {
            res.status = pair.first;
            res.send(std::move(pair.second));
        }
    };

    template <>
    struct response_type<response> {
        static auto send(response& res, response&& other) -> void {
            res = std::forward<response>(other);
        }
    };
}
