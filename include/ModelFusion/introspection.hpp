#pragma once

#include <cstddef>
#include <string_view>
#include <type_traits>
#include <utility>

#include <pfr/core.hpp>
#include <pfr/core_name.hpp>
#include <pfr/tuple_size.hpp>

#include "field_types.hpp"

namespace ModelFusion {

namespace introspection {

namespace detail {

template<class T>
struct DeclarationImpl {
    using DeclT = std::remove_cv_t<T>;

    static constexpr std::size_t fieldsCount = pfr::tuple_size_v<DeclT>;

    template<std::size_t Index>
    using fieldTypeByIndex = pfr::tuple_element_t<Index, DeclT>;

    template<std::size_t Index>
    static constexpr std::string_view fieldNameByIndex = pfr::get_name<Index, DeclT>();

    template<std::size_t Index>
    static const Field& fieldByIndex(const DeclT& d) {
        return pfr::get<Index>(d);
    }
};

} // namespace detail

template<class Decl>
inline constexpr std::size_t fields_count = detail::DeclarationImpl<Decl>::fieldsCount;

template<class Decl>
concept DeclaresOptions = requires { Decl::options(); };

// Calls f(name, field) for every member of an aggregate declaration struct,
// in declaration order.
template<class Decl, class F>
void forEachField(const Decl& decl, F&& f) {
    using Impl = detail::DeclarationImpl<Decl>;
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        ([&] {
            static_assert(std::is_same_v<typename Impl::template fieldTypeByIndex<I>, Field>,
                          "[[[ ModelFusion ]]] Declaration structs may only contain ModelFusion::Field members");
            f(Impl::template fieldNameByIndex<I>, Impl::template fieldByIndex<I>(decl));
        }(), ...);
    }(std::make_index_sequence<Impl::fieldsCount>{});
}

} // namespace introspection

} // namespace ModelFusion
