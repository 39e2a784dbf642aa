////////////////////////////////////////////////////////////////////////////////
/// Moving a buffer's storage between allocator 'identities' without touching
/// the storage itself.
///
/// Several buffers that must always share one allocator (e.g. the parallel
/// arrays of sparse_vector) can be stored typed against the (empty)
/// inert_allocator, with the single real allocator kept by their owner, and
/// get the real allocator 'lent' to them only while an operation actually
/// needs to allocate or free memory:
///   take()       - inert -> real (the stored buffer is left empty)
///   detach()     - real  -> inert (+ the real allocator handed back)
///   attachment<> - scoped take() + detach() pair (also on exceptional exit)
/// All are O(1): only the (data, size, capacity) triple changes hands.
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

#include <psi/sparse/buffer.hpp>
#include <psi/sparse/inert_allocator.hpp>

#include <boost/assert.hpp>

#include <memory>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

template <typename T, buffer_options options = {}>
using detached_buffer = buffer<T, inert_allocator<T>, options>;

//! <b>Effects</b>: Returns a buffer owning the storage of stored, now typed
//!   against (and owning a copy of) real_allocator. stored is left empty.
//!
//! <b>Requires</b>: real_allocator compares equal to the allocator that
//!   allocated the storage of stored. This cannot be verified: violating it
//!   is undefined behaviour.
template <typename Allocator, typename T, buffer_options options>
[[ nodiscard ]] buffer<T, Allocator, options> take( detached_buffer<T, options> & stored, Allocator real_allocator ) noexcept
{
    auto const storage{ stored.release().first };
    return buffer<T, Allocator, options>::from_parts( storage, std::move( real_allocator ) );
}

//! <b>Effects</b>: Inverse of take(): returns the storage of attached typed
//!   against the inert_allocator together with the allocator it was
//!   attached to.
template <typename T, typename Allocator, buffer_options options>
[[ nodiscard ]] std::pair<detached_buffer<T, options>, Allocator> detach( buffer<T, Allocator, options> && attached ) noexcept
{
    auto released{ attached.release() };
    return { detached_buffer<T, options>::from_parts( released.first, {} ), std::move( released.second ) };
}


// Scoped attachment of a stored (detached) buffer to (a copy of, rebound to T)
// its owner's allocator. The owner's allocator must outlive the attachment.
template <typename T, typename OwnerAllocator, buffer_options options = {}>
class [[ nodiscard ]] attachment
{
public:
    using allocator_type = typename std::allocator_traits<OwnerAllocator>::template rebind_alloc<T>;
    using stored_type    = detached_buffer<T, options>;
    using attached_type  = buffer<T, allocator_type, options>;

    attachment( stored_type & stored, OwnerAllocator const & owner ) noexcept
        :
        stored_  { stored },
        owner_   { owner  },
        attached_{ take( stored, allocator_type( owner ) ) }
    {}

    attachment( attachment const & ) = delete;
    attachment & operator=( attachment const & ) = delete;

    ~attachment() noexcept
    {
        auto detached{ detach( std::move( attached_ ) ) };
        BOOST_ASSERT_MSG( OwnerAllocator( detached.second ) == owner_, "Storage handed back with a foreign allocator" );
        BOOST_ASSERT( stored_.capacity() == 0 );
        stored_ = std::move( detached.first );
    }

    [[ nodiscard ]] attached_type & operator* () noexcept { return  attached_; }
    [[ nodiscard ]] attached_type * operator->() noexcept { return &attached_; }

private:
    stored_type          & stored_;
    OwnerAllocator const & owner_;
    attached_type          attached_;
}; // class attachment

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
