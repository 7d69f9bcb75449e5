#pragma once

#include "deserializer.hpp"

#include <pathway/server/captures.hpp>
#include <pathway/server/request.hpp>

#include <vector>

namespace pathway::server::extractor {
    /**
     * Percent-decodes every capture value in store order. The first value
     * whose decoded bytes are not valid UTF-8 rejects the request with
     * 'invalid_utf8_in_path_param'.
     */
    auto decode(const server::captures& captures)
        -> std::vector<decoded_capture>;

    /**
     * Reads the request's captures into 'T'. Failures are thrown as
     * 'path_rejection'; see 'path_deserializer' for the supported shapes.
     * The captures are left untouched.
     */
    template <typename T>
    auto extract_path(const server::captures& captures) -> T {
        const auto params = decode(captures);

        try {
            return path_deserializer(params).deserialize<T>();
        }
        catch (const deserialize_error& error) {
            throw path_rejection(error_kind(error.kind()));
        }
    }

    /**
     * Handler argument holding the route's captures as a 'T'.
     *
     *     server::get([](path<std::tuple<int, int>> ids) { ... })
     *
     * The request must carry a 'captures' extension, which the worker
     * installs before dispatch.
     */
    template <typename T>
    struct path {
        T value;

        path(request& request) :
            value(extract_path<T>(request.extensions.get<captures>()))
        {}

        operator const T&() const noexcept { return value; }

        auto operator*() const noexcept -> const T& { return value; }

        auto operator->() const noexcept -> const T* { return &value; }
    };
}
