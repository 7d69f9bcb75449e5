#include <pathway/server/extensions.hpp>

namespace pathway::server {
    missing_extension::missing_extension(const std::type_info& type) :
        logic_error(fmt::format(
            "Request extension of type '{}' is not installed",
            type.name()
        ))
    {}

    auto extensions::clear() noexcept -> void {
        values.clear();
    }

    auto extensions::empty() const noexcept -> bool {
        return values.empty();
    }

    auto extensions::size() const noexcept -> std::size_t {
        return values.size();
    }
}
