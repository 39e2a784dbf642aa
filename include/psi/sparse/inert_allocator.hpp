////////////////////////////////////////////////////////////////////////////////
/// An allocator that never allocates: a zero-size type-level placeholder for
/// buffers whose storage is actually owned (and allocated and freed) by an
/// allocator stored elsewhere - see transplant.hpp.
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

#include <psi/sparse/detail/errors.hpp>

#include <cstddef>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

template <typename T>
struct inert_allocator
{
    using value_type      = T;
    using       pointer   = T *;
    using const_pointer   = T const *;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;

    using propagate_on_container_copy_assignment = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap            = std::true_type;
    using is_always_equal                        = std::true_type;

    template <class U> struct rebind { using other = inert_allocator<U>; };

    constexpr inert_allocator() noexcept = default;
    template <typename U>
    constexpr inert_allocator( inert_allocator<U> ) noexcept {}

    //! <b>Effects</b>: Nothing - every request fails.
    //!
    //! <b>Throws</b>: std::bad_alloc, always.
    [[ noreturn ]] static pointer allocate( size_type /*count*/ ) { detail::throw_bad_alloc(); }

    //! Nothing is ever allocated through an inert_allocator so reaching this
    //! means that a buffer still owning memory was destroyed or shrunk while
    //! typed against the inert allocator (i.e. without first being attached to
    //! its real allocator): reports the offending block and aborts.
    [[ noreturn ]] static void deallocate( pointer const ptr, size_type const count ) noexcept
    {
        detail::inert_deallocation( ptr, count * sizeof( T ) );
    }

    friend constexpr bool operator==( inert_allocator, inert_allocator ) noexcept { return true; }
}; // struct inert_allocator

static_assert( std::is_empty_v             <inert_allocator<int>> );
static_assert( std::is_trivially_copyable_v<inert_allocator<int>> );

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
