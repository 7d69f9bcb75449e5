#pragma once

#include <pathway/server/request.hpp>

namespace pathway::server::extractor {
    /**
     * Handler arguments that read the request line. Each one views data
     * owned by the request and is valid for the duration of the handler.
     */

    struct method {
        std::string_view value;

        method(request& request) : value(request.method) {}
    };

    struct target {
        std::string_view path;
        std::string_view query;

        target(request& request) :
            path(request.path),
            query(request.query)
        {}
    };

    struct protocol {
        server::version value;

        protocol(request& request) : value(request.version) {}
    };
}
