#pragma once

#include "extensions.hpp"
#include "version.hpp"

#include <pathway/parser.hpp>

#include <optional>
#include <string>
#include <unordered_map>

namespace pathway::server {
    namespace detail {
        template <typename T>
        struct is_optional : std::false_type {};

        template <typename T>
        struct is_optional<std::optional<T>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_optional_v = is_optional<T>::value;

        template <typename T, typename Map>
        auto parse(
            const Map& map,
            std::string_view name,
            std::string_view description
        ) -> T {
            const auto result = map.find(std::string(name));

            if (result != map.end()) {
                const auto& value = result->second;

                if constexpr (is_optional_v<T>) {
                    if (value.empty()) return T();
                }

                try {
                    return parser<T>::parse(value);
                }
                catch (const std::exception& ex) {
                    throw error_code(
                        400,
                        "Failed to parse {} '{}': {}",
                        description,
                        name,
                        ex.what()
                    );
                }
            }
            else if constexpr (!is_optional_v<T>) {
                throw error_code(
                    400,
                    "Missing required {} '{}'",
                    description,
                    name
                );
            }

            return T();
        }
    }

    struct request {
        std::string method;
        std::string target;
        std::string path;
        std::string query;
        server::version version;
        std::unordered_map<std::string, std::string> headers;
        std::string body;
        server::extensions extensions;

        /**
         * Header names are stored in lower case.
         */
        template <typename T>
        auto header(std::string_view name) const -> T {
            return detail::parse<T>(headers, name, "header");
        }
    };
}

template <>
struct fmt::formatter<pathway::server::request> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pathway::server::request& request, FormatContext& ctx) {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(
            out,
            "{} {} {}",
            request.method,
            request.target,
            request.version
        );

        if (!request.headers.empty()) {
            format_to(out, "\nHeaders ({}):", request.headers.size());

            for (const auto& entry : request.headers) {
                format_to(out, "\n\t{}: {}", entry.first, entry.second);
            }
        }

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
