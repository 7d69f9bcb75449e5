#include <pathway/server/finalize.hpp>

namespace pathway::server {
    auto finalize(response& response, const request& request) -> void {
        finalize(response, request.version);
    }

    auto finalize(response& response, version version) -> void {
        response.append("content-length", std::to_string(response.body.size()));
        response.version = version;
    }
}
