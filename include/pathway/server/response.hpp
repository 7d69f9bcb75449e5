#pragma once

#include "version.hpp"

#include <concepts>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pathway::server {
    struct response;

    template <typename T>
    struct response_type {};

    template <typename T>
    concept response_data = requires(response& res, T&& t) {
        { response_type<std::remove_cvref_t<T>>::send(
            res,
            std::forward<T>(t)
        ) } -> std::same_as<void>;
    };

    namespace media {
        constexpr auto utf8_text = std::string_view("text/plain; charset=utf-8");
    }

    struct response {
        int status = 200;
        server::version version;
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;

        response() = default;

        response(int status);

        response(int status, std::string_view body);

        /**
         * Adds a header line. Existing lines of the same name are kept.
         */
        auto append(std::string_view name, std::string_view value) -> void;

        auto content_type(std::string_view type) -> void;

        /**
         * Returns the value of the first header line with the given name.
         * Names are compared without regard to case.
         */
        auto header(std::string_view name) const
            -> std::optional<std::string_view>;

        template <response_data T>
        auto send(T&& t) -> void {
            response_type<std::remove_cvref_t<T>>::send(
                *this,
                std::forward<T>(t)
            );
        }
    };

    auto reason_phrase(int status) noexcept -> std::string_view;
}
