#pragma once

#include <pathway/server/error.hpp>

#include <fmt/format.h>
#include <string>
#include <string_view>
#include <variant>

namespace pathway::server::extractor {
    /**
     * The route declares a different number of parameters than the target
     * type holds.
     */
    struct wrong_number_of_parameters {
        std::size_t got;
        std::size_t expected;

        auto operator==(const wrong_number_of_parameters& other) const
            -> bool = default;
    };

    /**
     * A named field or map value could not be parsed.
     */
    struct parse_error_at_key {
        std::string key;
        std::string value;
        std::string_view expected_type;

        auto operator==(const parse_error_at_key& other) const
            -> bool = default;
    };

    /**
     * A tuple or sequence element could not be parsed.
     */
    struct parse_error_at_index {
        std::size_t index;
        std::string value;
        std::string_view expected_type;

        auto operator==(const parse_error_at_index& other) const
            -> bool = default;
    };

    /**
     * A lone scalar could not be parsed.
     */
    struct parse_error {
        std::string value;
        std::string_view expected_type;

        auto operator==(const parse_error& other) const -> bool = default;
    };

    struct invalid_utf8_in_path_param {
        std::string key;

        auto operator==(const invalid_utf8_in_path_param& other) const
            -> bool = default;
    };

    /**
     * The target nests an aggregate the deserializer cannot fill, such as a
     * map inside a map.
     */
    struct unsupported_type {
        std::string_view name;

        auto operator==(const unsupported_type& other) const
            -> bool = default;
    };

    struct message {
        std::string text;

        auto operator==(const message& other) const -> bool = default;
    };

    using error_kind = std::variant<
        wrong_number_of_parameters,
        parse_error_at_key,
        parse_error_at_index,
        parse_error,
        invalid_utf8_in_path_param,
        unsupported_type,
        message
    >;

    /**
     * 400 for malformed client input; 500 when the route declaration and
     * the target type disagree.
     */
    auto http_code(const error_kind& kind) noexcept -> int;

    auto to_string(const error_kind& kind) -> std::string;

    /**
     * Raised by user parsers and record validators. The text becomes the
     * error message verbatim.
     */
    struct validation_error : std::runtime_error {
        validation_error(const std::string& what) : runtime_error(what) {}
    };

    class deserialize_error : public std::runtime_error {
        error_kind error;
    public:
        deserialize_error(error_kind&& kind);

        auto kind() const noexcept -> const error_kind&;
    };

    class path_rejection : public rejection {
        error_kind error;
    public:
        path_rejection(error_kind&& kind);

        auto body() const -> std::string override;

        auto http_code() const noexcept -> int override;

        auto kind() const noexcept -> const error_kind&;
    };
}

template <>
struct fmt::formatter<pathway::server::extractor::error_kind> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(
        const pathway::server::extractor::error_kind& kind,
        FormatContext& ctx
    ) {
        return formatter<std::string_view>::format(
            pathway::server::extractor::to_string(kind),
            ctx
        );
    }
};
