#include <pathway/server/extractor/path_error.hpp>

namespace {
    template <typename... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;

    constexpr auto single_parameter_note = std::string_view(
        ". Note that multiple parameters must be extracted with a tuple "
        "`Path<(_, _)>` or a struct `Path<YourParams>`"
    );
}

namespace pathway::server::extractor {
    auto http_code(const error_kind& kind) noexcept -> int {
        return std::visit(overloaded {
            [](const wrong_number_of_parameters&) { return 500; },
            [](const unsupported_type&) { return 500; },
            [](const auto&) { return 400; }
        }, kind);
    }

    auto to_string(const error_kind& kind) -> std::string {
        return std::visit(overloaded {
            [](const wrong_number_of_parameters& error) {
                auto result = fmt::format(
                    "Wrong number of path arguments for `Path`. "
                    "Expected {} but got {}",
                    error.expected,
                    error.got
                );

                if (error.expected == 1) result.append(single_parameter_note);

                return result;
            },
            [](const parse_error_at_key& error) {
                return fmt::format(
                    "Cannot parse `{}` with value `{:?}` to a `{}`",
                    error.key,
                    error.value,
                    error.expected_type
                );
            },
            [](const parse_error_at_index& error) {
                return fmt::format(
                    "Cannot parse value at index {} with value `{:?}` "
                    "to a `{}`",
                    error.index,
                    error.value,
                    error.expected_type
                );
            },
            [](const parse_error& error) {
                return fmt::format(
                    "Cannot parse `{:?}` to a `{}`",
                    error.value,
                    error.expected_type
                );
            },
            [](const invalid_utf8_in_path_param& error) {
                return fmt::format("Invalid UTF-8 in `{}`", error.key);
            },
            [](const unsupported_type& error) {
                return fmt::format("Unsupported type `{}`", error.name);
            },
            [](const message& error) {
                return error.text;
            }
        }, kind);
    }

    deserialize_error::deserialize_error(error_kind&& kind) :
        runtime_error(to_string(kind)),
        error(std::forward<error_kind>(kind))
    {}

    auto deserialize_error::kind() const noexcept -> const error_kind& {
        return error;
    }

    path_rejection::path_rejection(error_kind&& kind) :
        rejection(to_string(kind)),
        error(std::forward<error_kind>(kind))
    {}

    auto path_rejection::body() const -> std::string {
        if (http_code() == 500) return what();
        return fmt::format("Invalid URL: {}", what());
    }

    auto path_rejection::http_code() const noexcept -> int {
        return extractor::http_code(error);
    }

    auto path_rejection::kind() const noexcept -> const error_kind& {
        return error;
    }
}
