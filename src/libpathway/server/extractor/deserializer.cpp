#include <pathway/server/extractor/deserializer.hpp>

#include <algorithm>

namespace pathway::server::extractor {
    path_deserializer::path_deserializer(
        std::span<const decoded_capture> params
    ) :
        params(params)
    {}

    auto path_deserializer::expect(std::size_t count) const -> void {
        if (params.size() != count) {
            throw deserialize_error(wrong_number_of_parameters {
                .got = params.size(),
                .expected = count
            });
        }
    }

    auto path_deserializer::find(
        std::string_view key
    ) const -> const decoded_capture* {
        const auto result = std::find_if(
            params.begin(),
            params.end(),
            [key](const decoded_capture& param) { return param.key == key; }
        );

        if (result == params.end()) return nullptr;
        return &*result;
    }
}
