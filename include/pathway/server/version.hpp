#pragma once

#include <cstdint>
#include <fmt/format.h>

namespace pathway::server {
    struct version {
        std::uint8_t major = 1;
        std::uint8_t minor = 1;

        auto operator==(const version& other) const noexcept -> bool = default;
    };
}

template <>
struct fmt::formatter<pathway::server::version> : formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const pathway::server::version& version, FormatContext& ctx) {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        format_to(out, "HTTP/{}.{}", version.major, version.minor);

        return formatter<std::string_view>::format(
            {buffer.data(), buffer.size()},
            ctx
        );
    }
};
