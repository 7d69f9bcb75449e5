#include <pathway/percent.h>

#include <cctype>
#include <cstdint>

namespace {
    auto hex_to_uint(char c) -> std::uint8_t {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;

        return 0;
    }

    auto is_hex(char c) -> bool {
        return std::isxdigit(static_cast<unsigned char>(c));
    }

    auto continuation(std::uint8_t byte) -> bool {
        return (byte & 0xC0) == 0x80;
    }
}

namespace pathway {
    auto percent_decode(std::string_view value) -> std::string {
        auto result = std::string();
        result.reserve(value.size());

        std::size_t i = 0;

        while (i < value.size()) {
            if (
                value[i] != '%' ||
                i + 2 >= value.size() ||
                !is_hex(value[i + 1]) ||
                !is_hex(value[i + 2])
            ) {
                result.push_back(value[i++]);
                continue;
            }

            const auto n =
                (hex_to_uint(value[i + 1]) << 4) +
                hex_to_uint(value[i + 2]);

            result.push_back(static_cast<char>(n));
            i += 3;
        }

        return result;
    }

    auto valid_utf8(std::string_view bytes) noexcept -> bool {
        const auto* it = reinterpret_cast<const std::uint8_t*>(bytes.data());
        const auto* const end = it + bytes.size();

        while (it != end) {
            const auto lead = *it++;

            if (lead < 0x80) continue;

            auto length = 0;
            auto min = std::uint32_t();
            auto code = std::uint32_t();

            if ((lead & 0xE0) == 0xC0) {
                length = 1;
                min = 0x80;
                code = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0) {
                length = 2;
                min = 0x800;
                code = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0) {
                length = 3;
                min = 0x10000;
                code = lead & 0x07;
            }
            else return false;

            if (end - it < length) return false;

            for (auto i = 0; i < length; ++i) {
                const auto byte = *it++;
                if (!continuation(byte)) return false;
                code = (code << 6) | (byte & 0x3F);
            }

            // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
            if (code < min) return false;
            if (code >= 0xD800 && code <= 0xDFFF) return false;
            if (code > 0x10FFFF) return false;
        }

        return true;
    }
}
