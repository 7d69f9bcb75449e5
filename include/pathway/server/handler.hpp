#pragma once

#include "extractor/extractor.hpp"
#include "request.hpp"
#include "response.hpp"

#include <ext/coroutine>
#include <functional>
#include <memory>
#include <tuple>

namespace pathway::server {
    struct handler {
        virtual ~handler() = default;

        virtual auto handle(
            request& request,
            response& response
        ) const -> ext::task<> = 0;
    };

    namespace detail {
        template <typename T>
        concept argument =
            std::constructible_from<std::remove_cvref_t<T>, request&> ||
            extractor::readable<std::remove_cvref_t<T>>;

        template <std::constructible_from<request&> T>
        auto make_extractor(request& request) -> T {
            return T(request);
        }

        template <extractor::readable T>
        auto make_extractor(request& request) -> T {
            return extractor::data<T>::read(request);
        }

        /**
         * Builds the arguments left to right; the first extractor to throw
         * stops the rest from running.
         */
        template <typename Args, std::size_t... I>
        auto extract(request& request, std::index_sequence<I...>) -> Args {
            return Args {
                make_extractor<std::tuple_element_t<I, Args>>(request)...
            };
        }

        template <argument... Args>
        auto extract(request& request) {
            return extract<std::tuple<std::remove_cvref_t<Args>...>>(
                request,
                std::index_sequence_for<Args...>()
            );
        }

        template <typename... Args>
        auto use(
            request& request,
            response& response,
            const std::function<void(Args...)>& fn
        ) -> ext::task<> {
            std::apply(fn, extract<Args...>(request));
            co_return;
        }

        template <response_data R, typename... Args>
        auto use(
            request& request,
            response& response,
            const std::function<R(Args...)>& fn
        ) -> ext::task<> {
            response.send(std::apply(fn, extract<Args...>(request)));
            co_return;
        }

        template <typename... Args>
        auto use(
            request& request,
            response& response,
            const std::function<ext::task<>(Args...)>& fn
        ) -> ext::task<> {
            co_await std::apply(fn, extract<Args...>(request));
        }

        template <response_data R, typename... Args>
        auto use(
            request& request,
            response& response,
            const std::function<ext::task<R>(Args...)>& fn
        ) -> ext::task<> {
            response.send(
                co_await std::apply(fn, extract<Args...>(request))
            );
        }

        template <typename R, typename... Args>
        class handler : public server::handler {
            using function = std::function<R(Args...)>;

            function fn;
        public:
            handler(function&& fn) : fn(std::forward<function>(fn)) {}

            auto handle(
                request& request,
                response& response
            ) const -> ext::task<> override {
                co_await use(request, response, fn);
            }
        };
    }

    template <typename F>
    auto make_handler(F&& f) -> std::unique_ptr<handler> {
        return std::unique_ptr<handler>(
            new detail::handler(std::function(std::forward<F>(f)))
        );
    }
}
