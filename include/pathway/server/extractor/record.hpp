#pragma once

#include <concepts>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace pathway::server::extractor {
    template <typename Class, typename Member>
    struct field {
        std::string_view name;
        Member Class::* member;

        constexpr field(std::string_view name, Member Class::* member) :
            name(name),
            member(member)
        {}
    };

    /**
     * Describes a type whose members are filled from captures of the same
     * name. Specialize it next to the type:
     *
     *     template <>
     *     struct record<team_path> {
     *         static constexpr auto name = std::string_view("team_path");
     *         static constexpr auto fields = std::tuple(
     *             field("user_id", &team_path::user_id),
     *             field("team_id", &team_path::team_id)
     *         );
     *     };
     *
     * A specialization may also provide 'static auto validate(const T&)',
     * which runs after every field is set and reports a bad combination of
     * values by throwing 'validation_error'.
     */
    template <typename T>
    struct record {};

    template <typename T>
    concept record_type = requires {
        { record<T>::name } -> std::convertible_to<std::string_view>;
        std::tuple_size<std::remove_cvref_t<decltype(record<T>::fields)>>::value;
    };

    template <record_type T>
    inline constexpr auto field_count = std::tuple_size_v<
        std::remove_cvref_t<decltype(record<T>::fields)>
    >;
}
