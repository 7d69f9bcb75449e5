#include <pathway/server/extractor/data.hpp>

namespace pathway::server::extractor {
    auto data<std::string>::read(const request& request) -> std::string {
        return request.body;
    }

    auto data<std::vector<std::byte>>::read(const request& request)
        -> std::vector<std::byte>
    {
        const auto* const bytes =
            reinterpret_cast<const std::byte*>(request.body.data());

        return std::vector<std::byte>(bytes, bytes + request.body.size());
    }
}
