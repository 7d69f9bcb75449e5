#pragma once

#include "path_error.hpp"
#include "record.hpp"

#include <pathway/parser.hpp>

#include <span>
#include <utility>

namespace pathway::server::extractor {
    /**
     * A capture value after percent-decoding; always valid UTF-8.
     */
    struct decoded_capture {
        std::string_view key;
        std::string value;
    };

    namespace detail {
        template <typename T>
        struct is_pair : std::false_type {};

        template <typename K, typename V>
        struct is_pair<std::pair<K, V>> : std::true_type {};

        template <typename T>
        inline constexpr bool is_pair_v = is_pair<T>::value;

        /**
         * Views are not targets: decoded values do not outlive extraction.
         */
        template <typename T>
        concept scalar =
            parsable<T> &&
            !std::same_as<T, std::string_view>;

        template <typename T>
        concept map_like =
            !scalar<T> &&
            requires(
                T& t,
                typename T::key_type key,
                typename T::mapped_type value
            ) {
                t.insert_or_assign(std::move(key), std::move(value));
            };

        template <typename T>
        concept tuple_like =
            !scalar<T> &&
            requires { std::tuple_size<T>::value; };

        template <typename T>
        concept sequence =
            !scalar<T> &&
            !map_like<T> &&
            requires(T& t, typename T::value_type value) {
                t.push_back(std::move(value));
            };

        template <typename T>
        constexpr auto type_name() noexcept -> std::string_view {
            if constexpr (parsable<T>) return parser<T>::name();
            else if constexpr (record_type<T>) return record<T>::name;
            else if constexpr (map_like<T>) return "map";
            else if constexpr (tuple_like<T>) return "tuple";
            else if constexpr (sequence<T>) return "sequence";
            else return "unknown";
        }
    }

    /**
     * Fills a target type from decoded captures. The shape of the target
     * selects the strategy:
     *
     * - scalar (any type with a 'parser'): exactly one capture
     * - record (see 'record'): captures matched to fields by name; one
     *   capture per field
     * - map ('std::map', 'std::unordered_map'): every capture, by key
     * - tuple ('std::tuple', 'std::pair', 'std::array'): captures in order;
     *   one capture per element
     * - sequence ('std::vector'): every capture in order; elements that are
     *   'std::pair' receive the key and the value
     *
     * Elements, fields and map values must be scalars: a nested aggregate
     * fails with 'unsupported_type'.
     */
    class path_deserializer {
        std::span<const decoded_capture> params;

        auto expect(std::size_t count) const -> void;

        auto find(std::string_view key) const -> const decoded_capture*;

        template <typename T, typename F>
        static auto parse_value(std::string_view value, F&& make_error) -> T {
            if constexpr (!detail::scalar<T>) {
                throw deserialize_error(unsupported_type {
                    detail::type_name<T>()
                });
            }
            else {
                try {
                    return parser<T>::parse(value);
                }
                catch (const validation_error& ex) {
                    throw deserialize_error(message { ex.what() });
                }
                catch (const std::exception& ex) {
                    throw deserialize_error(make_error(parser<T>::name()));
                }
            }
        }

        template <typename T>
        auto element(std::size_t index) const -> T {
            const auto& value = params[index].value;

            return parse_value<T>(
                value,
                [&](std::string_view type) -> error_kind {
                    return parse_error_at_index {
                        .index = index,
                        .value = value,
                        .expected_type = type
                    };
                }
            );
        }

        template <typename T>
        auto entry(const decoded_capture& param) const -> T {
            using key_type = std::remove_const_t<typename T::first_type>;
            using value_type = typename T::second_type;

            auto key = parse_value<key_type>(
                param.key,
                [&](std::string_view type) -> error_kind {
                    return parse_error {
                        .value = std::string(param.key),
                        .expected_type = type
                    };
                }
            );

            auto value = parse_value<value_type>(
                param.value,
                [&](std::string_view type) -> error_kind {
                    return parse_error_at_key {
                        .key = std::string(param.key),
                        .value = param.value,
                        .expected_type = type
                    };
                }
            );

            return T(std::move(key), std::move(value));
        }

        template <typename T, typename Class, typename Member>
        auto assign(T& result, const field<Class, Member>& field) const
            -> void
        {
            const auto* const param = find(field.name);

            if (!param) {
                throw deserialize_error(message {
                    fmt::format("missing field `{}`", field.name)
                });
            }

            result.*field.member = parse_value<Member>(
                param->value,
                [&](std::string_view type) -> error_kind {
                    return parse_error_at_key {
                        .key = std::string(param->key),
                        .value = param->value,
                        .expected_type = type
                    };
                }
            );
        }

        template <typename T>
        auto deserialize_scalar() const -> T {
            expect(1);

            const auto& value = params.front().value;

            return parse_value<T>(
                value,
                [&](std::string_view type) -> error_kind {
                    return parse_error {
                        .value = value,
                        .expected_type = type
                    };
                }
            );
        }

        template <typename T>
        auto deserialize_record() const -> T {
            expect(field_count<T>);

            auto result = T();

            std::apply(
                [&](const auto&... fields) { (assign(result, fields), ...); },
                record<T>::fields
            );

            if constexpr (requires { record<T>::validate(result); }) {
                try {
                    record<T>::validate(std::as_const(result));
                }
                catch (const validation_error& ex) {
                    throw deserialize_error(message { ex.what() });
                }
            }

            return result;
        }

        template <typename T>
        auto deserialize_map() const -> T {
            using entry_type = std::pair<
                typename T::key_type,
                typename T::mapped_type
            >;

            auto result = T();

            for (const auto& param : params) {
                auto [key, value] = entry<entry_type>(param);
                result.insert_or_assign(std::move(key), std::move(value));
            }

            return result;
        }

        template <typename T>
        auto deserialize_tuple() const -> T {
            constexpr auto size = std::tuple_size_v<T>;

            expect(size);

            return [this]<std::size_t... I>(std::index_sequence<I...>) {
                return T { element<std::tuple_element_t<I, T>>(I)... };
            }(std::make_index_sequence<size>());
        }

        template <typename T>
        auto deserialize_sequence() const -> T {
            using value_type = typename T::value_type;

            auto result = T();

            for (std::size_t i = 0; i < params.size(); ++i) {
                if constexpr (detail::is_pair_v<value_type>) {
                    result.push_back(entry<value_type>(params[i]));
                }
                else result.push_back(element<value_type>(i));
            }

            return result;
        }
    public:
        explicit path_deserializer(std::span<const decoded_capture> params);

        template <typename T>
        auto deserialize() const -> T {
            if constexpr (detail::scalar<T>) return deserialize_scalar<T>();
            else if constexpr (record_type<T>) return deserialize_record<T>();
            else if constexpr (detail::map_like<T>) return deserialize_map<T>();
            else if constexpr (detail::tuple_like<T>) {
                return deserialize_tuple<T>();
            }
            else if constexpr (detail::sequence<T>) {
                return deserialize_sequence<T>();
            }
            else {
                throw deserialize_error(unsupported_type {
                    detail::type_name<T>()
                });
            }
        }
    };
}
