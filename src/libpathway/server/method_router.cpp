#include <pathway/server/method_router.hpp>

#include <algorithm>
#include <fmt/ranges.h>
#include <vector>

namespace pathway::server {
    auto method_router::allowed() const noexcept -> std::string_view {
        return allowed_methods;
    }

    auto method_router::find(std::string_view method) const -> const handler* {
        const auto result = methods.find(std::string(method));

        if (result == methods.end()) return nullptr;
        return result->second.get();
    }

    auto method_router::update_allowed() -> void {
        auto methods = std::vector<std::string_view>();
        methods.reserve(this->methods.size());

        for (const auto& entry : this->methods) {
            methods.push_back(entry.first);
        }

        std::sort(methods.begin(), methods.end());

        allowed_methods = fmt::format("{}", fmt::join(methods, ", "));
    }
}
