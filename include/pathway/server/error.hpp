#pragma once

#include "response.hpp"

#include <stdexcept>

namespace pathway::server {
    /**
     * A request was turned away before its handler ran. The rejection knows
     * the status and body of the response to send instead.
     */
    struct rejection : std::runtime_error {
        rejection(const std::string& what) : runtime_error(what) {}

        virtual ~rejection() = default;

        virtual auto body() const -> std::string { return what(); }

        virtual auto http_code() const noexcept -> int = 0;
    };

    auto to_response(const rejection& rejection) -> response;
}
