#pragma once

#include "error.h"

#include <cctype>
#include <chrono>
#include <concepts>
#include <filesystem>
#include <fmt/format.h>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <uuid++/uuid++>

namespace pathway {
    struct parser_error : std::runtime_error {
        parser_error(const std::string& what) : runtime_error(what) {}
    };

    namespace detail {
        inline auto leading_space(std::string_view string) -> bool {
            return !string.empty() &&
                std::isspace(static_cast<unsigned char>(string.front()));
        }
    }

    template <typename T>
    struct parser {};

    template <typename T>
    concept parsable = requires(std::string_view string) {
        { parser<T>::parse(string) } -> std::convertible_to<T>;
        { parser<T>::name() } -> std::convertible_to<std::string_view>;
    };

    template <>
    struct parser<std::string_view> {
        static auto parse(std::string_view string) -> std::string_view {
            return string;
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "std::string_view";
        }
    };

    template <>
    struct parser<std::string> {
        static auto parse(std::string_view string) -> std::string {
            return std::string(string);
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "std::string";
        }
    };

    template <typename T>
    struct parser<std::optional<T>> {
        static auto parse(std::string_view string) -> std::optional<T> {
            return parser<T>::parse(string);
        }

        static constexpr auto name() noexcept -> std::string_view {
            return parser<T>::name();
        }
    };

    template <>
    struct parser<bool> {
        static auto parse(std::string_view string) -> bool {
            if (string.size() == 1) {
                switch (string[0]) {
                    case 't':
                    case 'y':
                        return true;
                    case 'f':
                    case 'n':
                        return false;
                    default:
                        break;
                }
            }
            else if (string == "true" || string == "yes") return true;
            else if (string == "false" || string == "no") return false;

            throw parser_error("Expect (t)rue/(f)alse or (y)es/(n)o");
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "bool";
        }
    };

    template <std::integral T>
    class parser<T> {
        static constexpr auto min = std::numeric_limits<T>::min();
        static constexpr auto max = std::numeric_limits<T>::max();
        static constexpr auto base = 10;

        [[noreturn]]
        static auto out_of_range(std::string_view argument) {
            throw parser_error(fmt::format(
                "Argument '{}' is outside the range of {} and {}",
                argument,
                min,
                max
            ));
        }

        [[noreturn]]
        static auto not_an_integer() {
            throw parser_error("Expect an integer");
        }
    public:
        static auto parse(std::string_view argument) -> T {
            const auto string = parser<std::string>::parse(argument);

            // std::sto* skip leading whitespace and stop at the first
            // character that is not a digit.
            if (string.empty() || detail::leading_space(string)) {
                not_an_integer();
            }

            if constexpr (std::is_unsigned_v<T>) {
                if (string.front() == '-') not_an_integer();
            }

            auto pos = std::size_t();

            try {
                if constexpr (std::is_signed_v<T>) {
                    const auto value = std::stoll(string, &pos, base);
                    if (pos != string.size()) not_an_integer();
                    if (value > max || value < min) out_of_range(argument);
                    return static_cast<T>(value);
                }
                else {
                    const auto value = std::stoull(string, &pos, base);
                    if (pos != string.size()) not_an_integer();
                    if (value > max) out_of_range(argument);
                    return static_cast<T>(value);
                }
            }
            catch (const std::invalid_argument& ex) {
                not_an_integer();
            }
            catch (const std::out_of_range& ex) {
                out_of_range(argument);
            }

            __builtin_unreachable();
        }

        static constexpr auto name() noexcept -> std::string_view {
            constexpr auto bits = std::numeric_limits<T>::digits +
                (std::is_signed_v<T> ? 1 : 0);

            if constexpr (std::is_signed_v<T>) {
                if constexpr (bits == 8) return "std::int8_t";
                else if constexpr (bits == 16) return "std::int16_t";
                else if constexpr (bits == 32) return "std::int32_t";
                else return "std::int64_t";
            }
            else {
                if constexpr (bits == 8) return "std::uint8_t";
                else if constexpr (bits == 16) return "std::uint16_t";
                else if constexpr (bits == 32) return "std::uint32_t";
                else return "std::uint64_t";
            }
        }
    };

    template <std::floating_point T>
    struct parser<T> {
        static auto parse(std::string_view argument) -> T {
            const auto string = parser<std::string>::parse(argument);

            if (string.empty() || detail::leading_space(string)) {
                throw parser_error("Expect a number");
            }

            auto pos = std::size_t();

            try {
                auto value = T();

                if constexpr (std::is_same_v<float, T>) {
                    value = std::stof(string, &pos);
                }
                else if constexpr (std::is_same_v<double, T>) {
                    value = std::stod(string, &pos);
                }
                else value = std::stold(string, &pos);

                if (pos != string.size()) throw parser_error("Expect a number");
                return value;
            }
            catch (const std::invalid_argument& ex) {
                throw parser_error("Expect a number");
            }
            catch (const std::out_of_range& ex) {
                throw parser_error(fmt::format(
                    "Argument '{}' is outside the range of {}",
                    argument,
                    name()
                ));
            }
        }

        static constexpr auto name() noexcept -> std::string_view {
            if constexpr (std::is_same_v<float, T>) return "float";
            else if constexpr (std::is_same_v<double, T>) return "double";
            else return "long double";
        }
    };

    template <typename Rep, typename Period>
    struct parser<std::chrono::duration<Rep, Period>> {
        static auto parse(
            std::string_view string
        ) -> std::chrono::duration<Rep, Period> {
            const auto value = parser<Rep>::parse(string);
            return std::chrono::duration<Rep, Period>(value);
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "std::chrono::duration";
        }
    };

    template <>
    struct parser<std::filesystem::path> {
        static auto parse(std::string_view string) -> std::filesystem::path {
            return string;
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "std::filesystem::path";
        }
    };

    template <>
    struct parser<UUID::uuid> {
        static auto parse(std::string_view string) -> UUID::uuid {
            return UUID::uuid(string);
        }

        static constexpr auto name() noexcept -> std::string_view {
            return "uuid";
        }
    };
}
