#include <pathway/server/response/string.hpp>
#include <pathway/server/router.hpp>

#include <timber/timber>

namespace {
    template <typename... Ts>
    struct overloaded : Ts... {
        using Ts::operator()...;
    };

    template <typename... Ts>
    overloaded(Ts...) -> overloaded<Ts...>;
}

namespace pathway::server {
    auto to_response(dispatch_result&& result) -> response {
        return std::visit(overloaded {
            [](response&& res) { return std::move(res); },
            [](extractor_failed&& failure) {
                return std::move(failure.response);
            },
            [](no_route_matched&&) { return response(404, "Not Found"); }
        }, std::move(result));
    }

    router::router(path&& paths) : paths(std::forward<path>(paths)) {
        TIMBER_DEBUG("Router created:\n{}", this->paths.to_string());
    }

    auto router::dispatch(request& request) const -> ext::task<dispatch_result> {
        auto match = paths.find(request.path);
        if (!match) {
            TIMBER_DEBUG(
                "{} {}: no route matched",
                request.method,
                request.path
            );
            co_return no_route_matched();
        }

        request.extensions.get<captures>().merge(std::move(match->params));

        const auto& methods = *match->value;
        auto response = server::response();

        const auto* const handler = methods.find(request.method);
        if (!handler) {
            response.status = 405;
            response.append("allow", methods.allowed());
            co_return std::move(response);
        }

        try {
            co_await handler->handle(request, response);
        }
        catch (const rejection& rejection) {
            TIMBER_DEBUG(
                "{} {}: rejected with status {} ({})",
                request.method,
                request.path,
                rejection.http_code(),
                rejection.what()
            );

            co_return extractor_failed { .response = to_response(rejection) };
        }
        catch (const error_code& error) {
            TIMBER_DEBUG(
                "{} {}: status {} ({})",
                request.method,
                request.path,
                error.code(),
                error.what()
            );

            co_return server::response(error.code(), error.what());
        }
        catch (const std::exception& ex) {
            TIMBER_ERROR(
                "{} {}: status 500 ({})",
                request.method,
                request.path,
                ex.what()
            );

            co_return server::response(500);
        }
        catch (...) {
            TIMBER_ERROR(
                "{} {}: status 500 (unknown exception)",
                request.method,
                request.path
            );

            co_return server::response(500);
        }

        co_return std::move(response);
    }

    auto router::to_string() const -> std::string {
        return paths.to_string();
    }
}
