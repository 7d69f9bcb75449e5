#include <pathway/percent.h>
#include <pathway/server/extractor/path.hpp>

namespace pathway::server::extractor {
    auto decode(const server::captures& captures)
        -> std::vector<decoded_capture>
    {
        auto result = std::vector<decoded_capture>();
        result.reserve(captures.size());

        for (const auto& [key, value] : captures) {
            auto decoded = percent_decode(value);

            if (!valid_utf8(decoded)) {
                throw path_rejection(invalid_utf8_in_path_param { key });
            }

            result.push_back({key, std::move(decoded)});
        }

        return result;
    }
}
