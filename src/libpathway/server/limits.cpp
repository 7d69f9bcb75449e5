#include <pathway/server/limits.hpp>

#include <ext/data_size.h>

using namespace ext::literals;

namespace pathway::server {
    limits::limits() :
        buffer_size(8_KiB),
        max_head_size(8_KiB),
        max_body_size(1_MiB)
    {}
}
