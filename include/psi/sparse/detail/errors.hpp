////////////////////////////////////////////////////////////////////////////////
/// Cold, out-of-line error paths shared by the psi::sparse containers.
///
/// Recoverable conditions are reported with the standard exceptions, fatal
/// contract violations go through the (replaceable) fatal handler and then
/// abort the process.
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

#include <cstddef>
#include <string_view>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

// Receives the fully formatted diagnostic of a fatal contract violation. The
// process is aborted after the handler returns (a handler may also end the
// process itself, e.g. with a custom exit status).
using fatal_handler = void (*)( std::string_view message ) noexcept;

// Installs a new process-wide fatal handler (nullptr restores the default,
// which prints the message to stderr) and returns the previous one.
fatal_handler set_fatal_handler( fatal_handler ) noexcept;

namespace detail
{
    [[ noreturn, gnu::cold ]] void throw_bad_alloc       ();
    [[ noreturn, gnu::cold ]] void throw_length_error    ( char const * what );
    [[ noreturn, gnu::cold ]] void throw_invalid_argument( char const * what );

    [[ noreturn, gnu::cold ]] void unset_index_access( std::size_t index ) noexcept;
    [[ noreturn, gnu::cold ]] void inert_deallocation( void const * address, std::size_t byte_size ) noexcept;
} // namespace detail

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
