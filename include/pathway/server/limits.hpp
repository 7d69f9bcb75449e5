#pragma once

#include <cstddef>

namespace pathway::server {
    struct limits {
        /** Read buffer allocated for each connection. */
        std::size_t buffer_size;

        /** Request line and headers; larger heads are answered with 431. */
        std::size_t max_head_size;

        /** Larger bodies are answered with 413. */
        std::size_t max_body_size;

        limits();
    };
}
