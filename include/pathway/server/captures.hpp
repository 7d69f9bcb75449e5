#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pathway::server {
    struct capture {
        std::string key;
        std::string value;

        auto operator==(const capture& other) const -> bool = default;
    };

    /**
     * Ordered mapping of route parameter names to their raw, possibly
     * percent-encoded values. Keys are unique. Insertion order is kept:
     * sequence targets consume captures in this order.
     */
    class captures {
        std::vector<capture> entries;
    public:
        using const_iterator = std::vector<capture>::const_iterator;

        captures() = default;

        captures(std::vector<capture>&& entries);

        auto begin() const noexcept -> const_iterator;

        auto empty() const noexcept -> bool;

        auto end() const noexcept -> const_iterator;

        auto find(std::string_view key) const -> const std::string*;

        /**
         * Adds an entry, or replaces the value of an existing entry in place.
         */
        auto insert(std::string_view key, std::string_view value) -> void;

        /**
         * Folds 'other' into this store. On a key collision the incoming
         * value wins and the entry keeps its position; new keys are appended
         * in the order 'other' holds them.
         */
        auto merge(captures&& other) -> void;

        auto size() const noexcept -> std::size_t;
    };
}
