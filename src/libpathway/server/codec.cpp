#include <pathway/server/codec.hpp>

#include <algorithm>
#include <cctype>

namespace {
    using pathway::server::parse_error;

    constexpr auto crlf = std::string_view("\r\n");

    auto is_token(std::string_view text) -> bool {
        constexpr auto special = std::string_view("!#$%&'*+-.^_`|~");

        return !text.empty() && std::all_of(
            text.begin(),
            text.end(),
            [special](char c) {
                return
                    std::isalnum(static_cast<unsigned char>(c)) ||
                    special.find(c) != std::string_view::npos;
            }
        );
    }

    auto trim(std::string_view text) -> std::string_view {
        constexpr auto whitespace = std::string_view(" \t");

        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos) return {};

        const auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    auto lowercase(std::string_view text) -> std::string {
        auto result = std::string(text);

        std::transform(
            result.begin(),
            result.end(),
            result.begin(),
            [](unsigned char c) { return std::tolower(c); }
        );

        return result;
    }

    auto next_line(std::string_view& text) -> std::string_view {
        const auto end = text.find(crlf);
        const auto line = text.substr(0, end);

        text = end == std::string_view::npos ?
            std::string_view() : text.substr(end + crlf.size());

        return line;
    }

    auto parse_version(std::string_view text) -> pathway::server::version {
        constexpr auto prefix = std::string_view("HTTP/");

        if (
            !text.starts_with(prefix) ||
            text.size() != prefix.size() + 3 ||
            !std::isdigit(static_cast<unsigned char>(text[5])) ||
            text[6] != '.' ||
            !std::isdigit(static_cast<unsigned char>(text[7]))
        ) {
            throw parse_error(400, "Malformed protocol version '{}'", text);
        }

        const auto version = pathway::server::version {
            .major = static_cast<std::uint8_t>(text[5] - '0'),
            .minor = static_cast<std::uint8_t>(text[7] - '0')
        };

        if (version.major != 1 || version.minor > 1) {
            throw parse_error(505, "{} is not supported", text);
        }

        return version;
    }

    /**
     * Returns the origin-form part of a request target, dropping the scheme
     * and authority of an absolute-form target. The result may lack the
     * leading slash.
     */
    auto origin(std::string_view target) -> std::string_view {
        if (target.starts_with('/')) return target;

        constexpr auto separator = std::string_view("://");

        const auto scheme = target.find(separator);

        if (
            scheme != std::string_view::npos &&
            is_token(target.substr(0, scheme))
        ) {
            const auto authority = target.substr(scheme + separator.size());
            const auto path = authority.find_first_of("/?");

            if (path == std::string_view::npos) return {};
            return authority.substr(path);
        }

        throw parse_error(400, "Malformed request target '{}'", target);
    }

    auto parse_request_line(
        std::string_view line,
        pathway::server::request& request
    ) -> void {
        const auto first = line.find(' ');
        const auto last = line.rfind(' ');

        if (first == std::string_view::npos || first == last) {
            throw parse_error(400, "Malformed request line");
        }

        const auto method = line.substr(0, first);
        const auto target = line.substr(first + 1, last - first - 1);

        if (!is_token(method)) {
            throw parse_error(400, "Malformed request method '{}'", method);
        }

        if (target.empty() || target.find(' ') != std::string_view::npos) {
            throw parse_error(400, "Malformed request line");
        }

        request.version = parse_version(line.substr(last + 1));
        request.method = method;
        request.target = target;

        const auto form = origin(target);
        const auto query = form.find('?');

        request.path = form.substr(0, query);
        if (request.path.empty()) request.path = "/";
        if (query != std::string_view::npos) {
            request.query = form.substr(query + 1);
        }
    }

    auto parse_header(
        std::string_view line,
        pathway::server::request& request
    ) -> void {
        if (line.starts_with(' ') || line.starts_with('\t')) {
            throw parse_error(400, "Obsolete header line folding");
        }

        const auto colon = line.find(':');

        if (colon == std::string_view::npos) {
            throw parse_error(400, "Malformed header line");
        }

        const auto name = line.substr(0, colon);

        if (!is_token(name)) {
            throw parse_error(400, "Malformed header name '{}'", name);
        }

        const auto value = trim(line.substr(colon + 1));
        auto [it, inserted] = request.headers.try_emplace(
            lowercase(name),
            value
        );

        if (!inserted) {
            it->second.append(", ");
            it->second.append(value);
        }
    }
}

namespace pathway::server {
    auto connection_closed::what() const noexcept -> const char* {
        return "Connection closed";
    }

    auto parse_head(std::string_view head) -> request {
        auto result = request();

        parse_request_line(next_line(head), result);
        try {
            while (!head.empty()) parse_header(next_line(head), result);
        }
        catch (const parse_error& ex) {
            throw parse_error(result.version, ex.code(), "{}", ex.what());
        }

        if (result.headers.contains("transfer-encoding")) {
            throw parse_error(
                result.version,
                501,
                "Transfer codings are not supported"
            );
        }

        try {
            result.header<std::optional<std::size_t>>("content-length");
        }
        catch (const error_code& ex) {
            throw parse_error(result.version, 400, "{}", ex.what());
        }

        return result;
    }

    auto serialize_head(const response& response) -> std::string {
        auto buffer = fmt::memory_buffer();
        auto out = std::back_inserter(buffer);

        fmt::format_to(
            out,
            "{} {} {}\r\n",
            response.version,
            response.status,
            reason_phrase(response.status)
        );

        for (const auto& [name, value] : response.headers) {
            fmt::format_to(out, "{}: {}\r\n", name, value);
        }

        fmt::format_to(out, "\r\n");

        return fmt::to_string(buffer);
    }
}
