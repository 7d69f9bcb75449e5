#include <pathway/server/error.hpp>

namespace pathway::server {
    auto to_response(const rejection& rejection) -> response {
        return response(rejection.http_code(), rejection.body());
    }
}
