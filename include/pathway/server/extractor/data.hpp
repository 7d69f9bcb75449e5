#pragma once

#include <pathway/server/request.hpp>

#include <cstddef>
#include <vector>

namespace pathway::server::extractor {
    /**
     * Reads the request body into a 'T'. A handler parameter of a readable
     * type receives a copy of the body.
     */
    template <typename T>
    struct data {};

    template <typename T>
    concept readable = requires(const request& request) {
        { data<T>::read(request) } -> std::same_as<T>;
    };

    template <>
    struct data<std::string> {
        static auto read(const request& request) -> std::string;
    };

    template <>
    struct data<std::vector<std::byte>> {
        static auto read(const request& request) -> std::vector<std::byte>;
    };
}
