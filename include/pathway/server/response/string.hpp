#pragma once

#include "../response.hpp"

namespace pathway::server {
    template <>
    struct response_type<std::string_view> {
        static auto send(response& res, std::string_view string) -> void {
            res.content_type(media::utf8_text);
            res.body = std::string(string);
        }
    };

    template <>
    struct response_type<std::string> {
        static auto send(response& res, std::string&& string) -> void {
            res.content_type(media::utf8_text);
            res.body = std::forward<std::string>(string);
        }

        static auto send(response& res, const std::string& string) -> void {
            response_type<std::string_view>::send(res, string);
        }
    };

    template <>
    struct response_type<const char*> {
        static auto send(response& res, const char* str) -> void {
            response_type<std::string_view>::send(res, str);
        }
    };
}
