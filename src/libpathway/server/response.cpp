#include <pathway/server/response.hpp>

#include <algorithm>
#include <cctype>

namespace {
    auto equal_ignore_case(std::string_view a, std::string_view b) -> bool {
        return std::equal(
            a.begin(),
            a.end(),
            b.begin(),
            b.end(),
            [](char x, char y) {
                return
                    std::tolower(static_cast<unsigned char>(x)) ==
                    std::tolower(static_cast<unsigned char>(y));
            }
        );
    }
}

namespace pathway::server {
    response::response(int status) : status(status) {}

    response::response(int status, std::string_view body) :
        status(status),
        body(body)
    {
        content_type(media::utf8_text);
    }

    auto response::append(std::string_view name, std::string_view value)
        -> void
    {
        headers.emplace_back(name, value);
    }

    auto response::content_type(std::string_view type) -> void {
        for (auto& [name, value] : headers) {
            if (equal_ignore_case(name, "content-type")) {
                value = type;
                return;
            }
        }

        append("content-type", type);
    }

    auto response::header(std::string_view name) const
        -> std::optional<std::string_view>
    {
        for (const auto& [key, value] : headers) {
            if (equal_ignore_case(key, name)) return value;
        }

        return std::nullopt;
    }

    auto reason_phrase(int status) noexcept -> std::string_view {
        switch (status) {
            case 100: return "Continue";
            case 101: return "Switching Protocols";
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 204: return "No Content";
            case 206: return "Partial Content";
            case 301: return "Moved Permanently";
            case 302: return "Found";
            case 303: return "See Other";
            case 304: return "Not Modified";
            case 307: return "Temporary Redirect";
            case 308: return "Permanent Redirect";
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 406: return "Not Acceptable";
            case 408: return "Request Timeout";
            case 409: return "Conflict";
            case 410: return "Gone";
            case 411: return "Length Required";
            case 413: return "Payload Too Large";
            case 414: return "URI Too Long";
            case 415: return "Unsupported Media Type";
            case 422: return "Unprocessable Entity";
            case 429: return "Too Many Requests";
            case 431: return "Request Header Fields Too Large";
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 504: return "Gateway Timeout";
            case 505: return "HTTP Version Not Supported";
            default: return "Unknown";
        }
    }
}
