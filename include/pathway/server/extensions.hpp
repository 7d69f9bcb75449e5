#pragma once

#include <any>
#include <fmt/format.h>
#include <stdexcept>
#include <typeindex>
#include <unordered_map>

namespace pathway::server {
    struct missing_extension : std::logic_error {
        missing_extension(const std::type_info& type);
    };

    /**
     * Per-request table holding at most one value of each type. Routers use
     * it to hand data, such as the request's captures, to extractors.
     */
    class extensions {
        std::unordered_map<std::type_index, std::any> values;
    public:
        auto clear() noexcept -> void;

        auto empty() const noexcept -> bool;

        template <typename T>
        auto find() -> T* {
            const auto result = values.find(std::type_index(typeid(T)));
            if (result == values.end()) return nullptr;
            return std::any_cast<T>(&result->second);
        }

        template <typename T>
        auto find() const -> const T* {
            const auto result = values.find(std::type_index(typeid(T)));
            if (result == values.end()) return nullptr;
            return std::any_cast<T>(&result->second);
        }

        /**
         * The caller guarantees the extension was installed; a missing value
         * is a programming error.
         */
        template <typename T>
        auto get() -> T& {
            if (auto* const value = find<T>()) return *value;
            throw missing_extension(typeid(T));
        }

        template <typename T>
        auto get() const -> const T& {
            if (const auto* const value = find<T>()) return *value;
            throw missing_extension(typeid(T));
        }

        template <typename T>
        auto insert(T&& value) -> std::decay_t<T>& {
            using type = std::decay_t<T>;

            auto& slot = values[std::type_index(typeid(type))];
            return slot.emplace<type>(std::forward<T>(value));
        }

        template <typename T>
        auto remove() -> bool {
            return values.erase(std::type_index(typeid(T))) > 0;
        }

        auto size() const noexcept -> std::size_t;
    };
}
