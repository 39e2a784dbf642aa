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
#include <psi/sparse/detail/errors.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <new>
#include <stdexcept>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

namespace
{
    void print_to_stderr( std::string_view const message ) noexcept
    {
        fmt::print( stderr, "psi::sparse: {}\n", message );
        std::fflush( stderr );
    }

    std::atomic<fatal_handler> current_fatal_handler{ &print_to_stderr };

    template <typename... Args>
    [[ noreturn ]] void fatal( fmt::format_string<Args...> const format, Args &&... args ) noexcept
    {
        // no allocation on this path: the process may be out of memory or
        // have a corrupted heap
        char message[ 256 ];
        auto const result{ fmt::format_to_n( message, std::size( message ), format, std::forward<Args>( args )... ) };
        auto const length{ std::min( result.size, std::size( message ) ) };
        current_fatal_handler.load( std::memory_order_acquire )( std::string_view{ message, length } );
        std::abort();
    }
} // anonymous namespace

fatal_handler set_fatal_handler( fatal_handler const handler ) noexcept
{
    return current_fatal_handler.exchange( handler ? handler : &print_to_stderr, std::memory_order_acq_rel );
}

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_bad_alloc       (                         ) { throw std::bad_alloc(); }
    [[ noreturn, gnu::cold ]] void throw_length_error    ( char const * const what ) { throw std::length_error    ( what ); }
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * const what ) { throw std::invalid_argument( what ); }

    [[ noreturn, gnu::cold ]] void unset_index_access( std::size_t const index ) noexcept
    {
        fatal( "accessed unset index {} (use get() for a non-aborting lookup)", index );
    }

    [[ noreturn, gnu::cold ]] void inert_deallocation( void const * const address, std::size_t const byte_size ) noexcept
    {
        fatal( "inert_allocator asked to deallocate {} bytes at {} (storage was not reattached to its real allocator)", byte_size, address );
    }
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
