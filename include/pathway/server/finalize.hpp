#pragma once

#include "request.hpp"
#include "response.hpp"

namespace pathway::server {
    /**
     * Prepares a response for the wire: appends a 'content-length' line
     * equal to the body size and answers in the request's protocol version.
     * Headers already present are left alone.
     */
    auto finalize(response& response, const request& request) -> void;

    auto finalize(response& response, version version) -> void;
}
