#include <pathway/server/captures.hpp>

#include <algorithm>

namespace pathway::server {
    captures::captures(std::vector<capture>&& entries) :
        entries(std::forward<std::vector<capture>>(entries))
    {}

    auto captures::begin() const noexcept -> const_iterator {
        return entries.begin();
    }

    auto captures::empty() const noexcept -> bool {
        return entries.empty();
    }

    auto captures::end() const noexcept -> const_iterator {
        return entries.end();
    }

    auto captures::find(std::string_view key) const -> const std::string* {
        const auto result = std::find_if(
            entries.begin(),
            entries.end(),
            [key](const capture& entry) { return entry.key == key; }
        );

        if (result == entries.end()) return nullptr;
        return &result->value;
    }

    auto captures::insert(std::string_view key, std::string_view value) -> void {
        for (auto& entry : entries) {
            if (entry.key == key) {
                entry.value = value;
                return;
            }
        }

        entries.push_back({std::string(key), std::string(value)});
    }

    auto captures::merge(captures&& other) -> void {
        if (entries.empty()) {
            entries = std::move(other.entries);
            return;
        }

        for (auto& incoming : other.entries) {
            auto existing = std::find_if(
                entries.begin(),
                entries.end(),
                [&incoming](const capture& entry) {
                    return entry.key == incoming.key;
                }
            );

            if (existing != entries.end()) {
                existing->value = std::move(incoming.value);
            }
            else entries.push_back(std::move(incoming));
        }

        other.entries.clear();
    }

    auto captures::size() const noexcept -> std::size_t {
        return entries.size();
    }
}
