////////////////////////////////////////////////////////////////////////////////
/// psi::sparse::buffer and transplant unit tests
////////////////////////////////////////////////////////////////////////////////

#include <psi/sparse/buffer.hpp>
#include <psi/sparse/transplant.hpp>

#include "counting_allocator.hpp"

#include <gtest/gtest.h>

#include <array>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

static_assert(  is_trivially_moveable<int> );
static_assert(  is_trivially_moveable<std::pair<int, float>> );
namespace
{
    struct relocatable_handle
    {
        static constexpr bool is_trivially_moveable{ true };
        relocatable_handle( relocatable_handle && ) noexcept {}
        int * p_resource;
    };
} // anonymous namespace
static_assert(  is_trivially_moveable<relocatable_handle> );

TEST( buffer, construction )
{
    buffer<int> empty;
    EXPECT_TRUE( empty.empty() );
    EXPECT_EQ  ( empty.capacity(), 0 );
    EXPECT_EQ  ( empty.data(), nullptr );

    buffer<int> sized( 10, std::allocator<int>{} );
    EXPECT_TRUE( sized.empty() );
    EXPECT_EQ  ( sized.capacity(), 10 );

    std::array const source{ 1, 2, 3 };
    buffer<int> copied( std::span<int const>{ source }, std::allocator<int>{} );
    EXPECT_EQ( copied.size(), 3 );
    EXPECT_EQ( copied[ 2 ], 3 );

    buffer<int> const copy{ copied };
    EXPECT_EQ( copy, copied );

    buffer<int> moved{ std::move( copied ) };
    EXPECT_EQ( moved, copy );
    EXPECT_TRUE( copied.empty() );
    EXPECT_EQ  ( copied.capacity(), 0 );
}

TEST( buffer, emplace_and_erase )
{
    buffer<std::string> strings;
    strings.emplace_back( "b" );
    strings.emplace_back( "d" );
    strings.emplace( strings.begin(), "a" );
    strings.emplace( strings.begin() + 2, "c" );
    strings.emplace( strings.end(), "e" );
    ASSERT_EQ( strings.size(), 5 );
    EXPECT_EQ( strings[ 0 ], "a" );
    EXPECT_EQ( strings[ 1 ], "b" );
    EXPECT_EQ( strings[ 2 ], "c" );
    EXPECT_EQ( strings[ 3 ], "d" );
    EXPECT_EQ( strings[ 4 ], "e" );

    strings.erase( strings.begin() + 1 );
    strings.erase( strings.end() - 1 );
    ASSERT_EQ( strings.size(), 3 );
    EXPECT_EQ( strings[ 0 ], "a" );
    EXPECT_EQ( strings[ 1 ], "c" );
    EXPECT_EQ( strings[ 2 ], "d" );

    auto const capacity{ strings.capacity() };
    strings.clear();
    EXPECT_TRUE( strings.empty() );
    EXPECT_EQ  ( strings.capacity(), capacity );
}

TEST( buffer, emplace_from_own_element )
{
    std::string const long_string( 40, 'x' ); // beyond any small string buffer
    buffer<std::string> strings;
    strings.emplace_back( long_string );
    ASSERT_EQ( strings.capacity(), 1 );

    strings.emplace_back( strings[ 0 ] ); // grows
    ASSERT_EQ( strings.size(), 2 );
    ASSERT_EQ( strings.capacity(), 2 );
    EXPECT_EQ( strings[ 1 ], long_string );

    strings.emplace( strings.begin(), strings[ 1 ] + "y" ); // grows and shifts
    ASSERT_EQ( strings.size(), 3 );
    EXPECT_EQ( strings[ 0 ], long_string + "y" );
    EXPECT_EQ( strings[ 1 ], long_string );
    EXPECT_EQ( strings[ 2 ], long_string );

    strings.emplace( strings.begin() + 1, strings[ 0 ] );
    EXPECT_EQ( strings[ 1 ], long_string + "y" );
    EXPECT_EQ( strings[ 3 ], long_string );
}

TEST( buffer, growth )
{
    buffer<int> geometric;
    geometric.reserve( 10 );
    EXPECT_EQ( geometric.capacity(), 10 );
    geometric.reserve( 4 ); // never shrinks
    EXPECT_EQ( geometric.capacity(), 10 );
    for ( int i{ 0 }; i < 10; ++i )
        geometric.emplace_back( i );
    EXPECT_EQ( geometric.capacity(), 10 );
    geometric.emplace_back( 10 );
    EXPECT_EQ( geometric.capacity(), 15 );
    geometric.reserve_additional( 20 );
    EXPECT_EQ( geometric.capacity(), 31 );

    buffer<int, std::allocator<int>, buffer_options{ .geometric_growth = false }> exact;
    exact.reserve( 10 );
    for ( int i{ 0 }; i < 11; ++i )
        exact.emplace_back( i );
    EXPECT_EQ( exact.capacity(), 11 );

    EXPECT_THROW( exact.reserve_additional( exact.max_size() ), std::length_error );
    EXPECT_EQ( exact.size(), 11 );
    EXPECT_EQ( exact[ 10 ], 10 );
}

TEST( buffer, shrink_to_fit )
{
    test::allocation_stats stats;
    {
        buffer<int, test::counting_allocator<int>> numbers{ test::counting_allocator<int>{ stats } };
        numbers.reserve( 8 );
        numbers.emplace_back( 1 );
        numbers.shrink_to_fit();
        EXPECT_EQ( numbers.capacity(), 1 );
        EXPECT_EQ( numbers[ 0 ], 1 );
        numbers.clear();
        numbers.shrink_to_fit();
        EXPECT_EQ( numbers.capacity(), 0 );
        EXPECT_EQ( stats.allocations, 2 );
        EXPECT_EQ( stats.deallocations, 2 );
    }
    EXPECT_TRUE( stats.balanced() );
}

TEST( buffer, release_and_from_parts )
{
    test::allocation_stats stats;
    {
        using counted = buffer<int, test::counting_allocator<int>>;
        counted numbers( 4, test::counting_allocator<int>{ stats } );
        numbers.emplace_back( 7 );
        auto const data{ numbers.data() };

        auto released{ numbers.release() };
        EXPECT_EQ( numbers.capacity(), 0 );
        EXPECT_EQ( numbers.data(), nullptr );
        EXPECT_EQ( released.first.data    , data );
        EXPECT_EQ( released.first.size    , 1 );
        EXPECT_EQ( released.first.capacity, 4 );
        EXPECT_EQ( stats.deallocations, 0 );

        auto const rebuilt{ counted::from_parts( released.first, released.second ) };
        EXPECT_EQ( rebuilt.data(), data );
        EXPECT_EQ( rebuilt[ 0 ], 7 );
    }
    EXPECT_EQ  ( stats.allocations, 1 );
    EXPECT_TRUE( stats.balanced() );
}

TEST( transplant, take_and_detach_preserve_storage )
{
    test::allocation_stats stats;
    test::counting_allocator<std::string> const allocator{ stats };
    {
        buffer<std::string, test::counting_allocator<std::string>> attached( 3, allocator );
        attached.emplace_back( "x" );
        attached.emplace_back( "y" );
        auto const data{ attached.data() };

        auto detached{ detach( std::move( attached ) ) };
        EXPECT_EQ( attached.capacity(), 0 );
        EXPECT_EQ( detached.first.data    (), data );
        EXPECT_EQ( detached.first.size    (), 2 );
        EXPECT_EQ( detached.first.capacity(), 3 );
        EXPECT_TRUE( detached.second == allocator );

        // the detached buffer is still usable as long as it does not allocate
        detached.first.emplace_back( "z" );
        EXPECT_EQ( detached.first[ 2 ], "z" );

        auto retaken{ take( detached.first, allocator ) };
        EXPECT_EQ( detached.first.capacity(), 0 );
        EXPECT_EQ( retaken.data    (), data );
        EXPECT_EQ( retaken.size    (), 3 );
        EXPECT_EQ( retaken.capacity(), 3 );
        EXPECT_EQ( stats.deallocations, 0 );
    }
    EXPECT_EQ  ( stats.allocations, 1 );
    EXPECT_TRUE( stats.balanced() );
}

TEST( transplant, attachment_restores_on_exception )
{
    test::allocation_stats stats;
    test::counting_allocator<char> const owner{ stats };
    detached_buffer<int> stored;
    {
        attachment<int, test::counting_allocator<char>> attached{ stored, owner };
        attached->reserve( 4 );
        attached->emplace_back( 1 );
    }
    EXPECT_EQ( stored.capacity(), 4 );
    EXPECT_EQ( stored[ 0 ], 1 );

    try
    {
        attachment<int, test::counting_allocator<char>> attached{ stored, owner };
        attached->reserve_additional( attached->max_size() );
        FAIL() << "expected std::length_error";
    }
    catch ( std::length_error const & ) {}
    EXPECT_EQ( stored.capacity(), 4 );
    EXPECT_EQ( stored[ 0 ], 1 );

    // hand the storage back to its allocator
    {
        auto const released{ take( stored, test::counting_allocator<int>{ owner } ) };
    }
    EXPECT_TRUE( stats.balanced() );
}

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
