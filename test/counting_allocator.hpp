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
#include <memory>
#include <new>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sparse::test
{
//------------------------------------------------------------------------------

struct allocation_stats
{
    std::size_t allocations      { 0 };
    std::size_t deallocations    { 0 };
    std::size_t bytes_allocated  { 0 };
    std::size_t bytes_deallocated{ 0 };

    // deallocations routed to a stats object other than the one that
    // produced the memory are impossible to detect per block: a mismatch in
    // the byte counters of either object shows up instead
    [[ nodiscard ]] bool balanced() const noexcept { return allocations == deallocations && bytes_allocated == bytes_deallocated; }
}; // struct allocation_stats

// Stateful allocator: copies share (and compare equal by) the stats object
// they were created with.
template <typename T>
class counting_allocator
{
public:
    using value_type = T;

    using propagate_on_container_copy_assignment = std::false_type;
    using propagate_on_container_move_assignment = std::false_type;
    using propagate_on_container_swap            = std::false_type;
    using is_always_equal                        = std::false_type;

    counting_allocator() = delete;
    explicit counting_allocator( allocation_stats & stats ) noexcept : p_stats_{ &stats } {}
    template <typename U>
    counting_allocator( counting_allocator<U> const & other ) noexcept : p_stats_{ &other.stats() } {}

    [[ nodiscard ]] T * allocate( std::size_t const count )
    {
        auto const p{ std::allocator<T>{}.allocate( count ) };
        ++p_stats_->allocations;
        p_stats_->bytes_allocated += count * sizeof( T );
        return p;
    }

    void deallocate( T * const p, std::size_t const count ) noexcept
    {
        ++p_stats_->deallocations;
        p_stats_->bytes_deallocated += count * sizeof( T );
        std::allocator<T>{}.deallocate( p, count );
    }

    [[ nodiscard ]] allocation_stats & stats() const noexcept { return *p_stats_; }

    template <typename U>
    friend bool operator==( counting_allocator const & left, counting_allocator<U> const & right ) noexcept { return &left.stats() == &right.stats(); }

private:
    allocation_stats * p_stats_;
}; // class counting_allocator

//------------------------------------------------------------------------------
} // namespace psi::sparse::test
//------------------------------------------------------------------------------
