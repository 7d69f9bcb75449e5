#pragma once

#include <concepts>
#include <cstddef>
#include <ext/coroutine>
#include <span>

namespace pathway::server {
    /**
     * A byte stream a worker serves. 'read' yields the next chunk of input;
     * an empty chunk means the peer closed the stream.
     */
    template <typename T>
    concept connection = requires(
        T& t,
        const void* src,
        std::size_t len
    ) {
        { t.read() } -> std::same_as<ext::task<std::span<const std::byte>>>;
        t.write(src, len);
        t.flush();
    };
}
