#include <pathway/server/worker.hpp>

namespace pathway::server {
    worker::worker(
        const server::router& router,
        const server::limits& limits
    ) :
        router(&router),
        limits(limits)
    {}
}
