#pragma once

#include "handler.hpp"

#include <fmt/format.h>
#include <string>
#include <unordered_map>

#define PATHWAY_METHOD(name, str) \
    template <typename F> \
    auto name(F&& f) -> method_router& { \
        return use(str, std::forward<F>(f)); \
    }

#define PATHWAY_METHOD_FN(name) \
    template <typename F> \
    auto name(F&& f) -> method_router { \
        auto router = method_router(); \
        router.name(std::forward<F>(f)); \
        return router; \
    }

namespace pathway::server {
    class method_router {
        std::string allowed_methods;
        std::unordered_map<std::string, std::unique_ptr<handler>> methods;

        auto update_allowed() -> void;
    public:
        method_router() = default;

        method_router(const method_router&) = delete;

        method_router(method_router&&) = default;

        auto operator=(const method_router&) -> method_router& = delete;

        auto operator=(method_router&&) -> method_router& = default;

        /**
         * Registered methods in alphabetical order, separated by ", ".
         */
        auto allowed() const noexcept -> std::string_view;

        auto find(std::string_view method) const -> const handler*;

        template <typename F>
        auto use(std::string_view method, F&& f) -> method_router& {
            methods.insert_or_assign(
                std::string(method),
                make_handler(std::forward<F>(f))
            );
            update_allowed();
            return *this;
        }

        PATHWAY_METHOD(del,   "DELETE")
        PATHWAY_METHOD(get,   "GET")
        PATHWAY_METHOD(head,  "HEAD")
        PATHWAY_METHOD(patch, "PATCH")
        PATHWAY_METHOD(post,  "POST")
        PATHWAY_METHOD(put,   "PUT")
    };

    template <typename F>
    auto method(std::string_view method, F&& f) -> method_router {
        auto router = method_router();
        router.use(method, std::forward<F>(f));
        return router;
    }

    PATHWAY_METHOD_FN(del)
    PATHWAY_METHOD_FN(get)
    PATHWAY_METHOD_FN(head)
    PATHWAY_METHOD_FN(patch)
    PATHWAY_METHOD_FN(post)
    PATHWAY_METHOD_FN(put)
}

#undef PATHWAY_METHOD
#undef PATHWAY_METHOD_FN

template <>
struct fmt::formatter<pathway::server::method_router> :
    formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(
        const pathway::server::method_router& router,
        FormatContext& ctx
    ) {
        return formatter<std::string_view>::format(router.allowed(), ctx);
    }
};
