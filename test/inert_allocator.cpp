////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::inert_allocator unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/sparse/inert_allocator.hpp>
#include <psi/sparse/transplant.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <new>
#include <string>
#include <tuple>
#include <type_traits>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

static_assert( sizeof( detached_buffer<int> ) == 3 * sizeof( void * ) );

TEST( inert_allocator, never_allocates )
{
    inert_allocator<int> allocator;
    EXPECT_THROW( std::ignore = allocator.allocate( 1 ), std::bad_alloc );
    EXPECT_THROW( std::ignore = allocator.allocate( 0 ), std::bad_alloc );
}

TEST( inert_allocator, growing_a_detached_buffer_fails_cleanly )
{
    detached_buffer<int> stored;
    EXPECT_THROW( stored.reserve( 8 ), std::bad_alloc );
    EXPECT_EQ( stored.capacity(), 0 );
    EXPECT_THROW( stored.emplace_back( 42 ), std::bad_alloc );
    EXPECT_TRUE( stored.empty() );
}

TEST( inert_allocator, rebinds_and_compares_equal )
{
    inert_allocator<int>         const a;
    inert_allocator<std::string> const b{ a };
    EXPECT_TRUE( a == inert_allocator<int>{ b } );
    static_assert( std::is_same_v<std::allocator_traits<inert_allocator<int>>::rebind_alloc<char>, inert_allocator<char>> );
}

TEST( inert_allocator_death, destroying_detached_storage_aborts )
{
    EXPECT_DEATH
    (
        {
            auto detached{ detach( buffer<int>( 16, std::allocator<int>{} ) ) };
        },
        "inert_allocator asked to deallocate 64 bytes"
    );
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
