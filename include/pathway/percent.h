#pragma once

#include <string>
#include <string_view>

namespace pathway {
    /**
     * Decodes '%XX' escapes. Malformed escapes are copied through unchanged
     * and '+' is not treated as a space.
     */
    auto percent_decode(std::string_view value) -> std::string;

    auto valid_utf8(std::string_view bytes) noexcept -> bool;
}
