////////////////////////////////////////////////////////////////////////////////
///
/// Copyright (c) Domagoj Saric.
///
/// Use, modification and distribution is subject to the
/// Boost Software License, Version 1.0.
/// (See accompanying file LICENSE_1_0.txt or copy at
/// http://www.boost.org/LICENSE_1_0.txt)
///
/// For more information, see http://www.boost.org
///
////////////////////////////////////////////////////////////////////////////////
//------------------------------------------------------------------------------
#pragma once

#include <array>
#include <cstddef>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

// template <typename T>
// bool is_trivially_moveable;
//
// buffer<> shifts its elements around on every insertion into and erasure
// from the middle (and relocates them all on growth): for types that support
// 'bitwise moves' - i.e. an object can be picked up from one address and
// dropped at another without its invariants noticing - this is a single
// memmove instead of an element-wise move + destroy loop.
// Unlike the more optimistic heuristics found elsewhere this only assumes
// the property for trivially copyable types (and whatever the compiler
// reports as trivially relocatable) as libstdc++'s SSO std::string is a
// prominent counterexample to 'trivially move constructible implies
// trivially relocatable'.
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p1144r12.html std::is_trivially_relocatable
// https://www.open-std.org/jtc1/sc22/wg21/docs/papers/2024/p2786r11.html Trivial Relocatability

// allowed/expected to be user-specialized for custom types
template <typename T>
bool constexpr is_trivially_moveable
{
#ifdef __clang__
    __is_trivially_relocatable( T ) ||
#endif
#if defined( __cpp_lib_trivially_relocatable /*P1144*/ ) || defined( __cpp_trivial_relocatability /*P2786*/ )
    std::is_trivially_relocatable_v<T> ||
#endif
    std::is_trivially_copyable_v<T> // implies trivial destructibility https://eel.is/c++draft/class.prop#1
}; // is_trivially_moveable

template <typename T>
requires requires{ T::is_trivially_moveable; }
bool constexpr is_trivially_moveable<T>{ T::is_trivially_moveable };

template <typename T1, typename T2>
bool constexpr is_trivially_moveable<std::pair<T1, T2>>{ is_trivially_moveable<T1> && is_trivially_moveable<T2> };
template <typename T, std::size_t size>
bool constexpr is_trivially_moveable<std::array<T, size>>{ is_trivially_moveable<T> };

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
