////////////////////////////////////////////////////////////////////////////////
/// Minimal growable array over a standard allocator, with the allocator type
/// baked into its static type (a single allocator value is stored inline - of
/// zero size for empty allocators), geometric growth and bitwise shifting of
/// trivially moveable types.
/// Extensions: release() / from_parts() for taking a buffer apart into its raw
/// (data, size, capacity) triple and putting it back together, possibly
/// against a different allocator type (see transplant.hpp), and an amortized
/// 'reserve additional space' method.
/// The allocator only provides raw memory: elements are constructed and
/// destroyed in place directly (allocator construct/destroy customization
/// points are not used).
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
#include <psi/sparse/is_trivially_moveable.hpp>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstring>
#include <limits>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

struct buffer_options
{
    bool geometric_growth{ true }; // 1.5x on growth caused by insertion, exact otherwise
}; // struct buffer_options

// Ownerless view of a buffer's storage: allocator agnostic so that it can be
// moved between buffers typed against different allocators.
template <typename T>
struct raw_parts
{
    T *         data    { nullptr };
    std::size_t size    { 0 };
    std::size_t capacity{ 0 };
}; // struct raw_parts

template <typename Allocator, typename T>
concept allocator_for =
    std::same_as<typename std::allocator_traits<Allocator>::value_type, T  > &&
    std::same_as<typename std::allocator_traits<Allocator>::pointer   , T *>;


template <typename T, typename Allocator = std::allocator<T>, buffer_options options = {}>
requires allocator_for<Allocator, T>
class [[ nodiscard ]] buffer
{
private:
    using al = std::allocator_traits<Allocator>;

public:
    using value_type      = T;
    using allocator_type  = Allocator;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using       pointer   = value_type       *;
    using const_pointer   = value_type const *;
    using       reference = value_type       &;
    using const_reference = value_type const &;
    using       iterator  =       pointer;
    using const_iterator  = const_pointer;
    using parts           = raw_parts<value_type>;

    static buffer_options constexpr growth_options{ options };

    constexpr buffer() noexcept( std::is_nothrow_default_constructible_v<allocator_type> ) : allocator_{} {}
    constexpr explicit buffer( allocator_type allocator ) noexcept : allocator_{ std::move( allocator ) } {}

    buffer( size_type const initial_capacity, allocator_type allocator )
        : allocator_{ std::move( allocator ) }
    {
        reserve( initial_capacity );
    }

    buffer( std::span<value_type const> const source, allocator_type allocator )
        : allocator_{ std::move( allocator ) }
    {
        append_copy( source );
    }

    buffer( buffer const & other ) : buffer( other.span(), al::select_on_container_copy_construction( other.allocator_ ) ) {}

    buffer( buffer && other ) noexcept
        :
        p_array_  { std::exchange( other.p_array_ , nullptr ) },
        size_     { std::exchange( other.size_    , 0       ) },
        capacity_ { std::exchange( other.capacity_, 0       ) },
        allocator_{ std::move( other.allocator_ ) }
    {}

    buffer & operator=( buffer const & other )
    {
        if ( &other == this ) [[ unlikely ]]
            return *this;
        if constexpr ( al::propagate_on_container_copy_assignment::value )
        {
            if ( allocator_ != other.allocator_ )
                free();
            allocator_ = other.allocator_;
        }
        clear();
        append_copy( other.span() );
        return *this;
    }

    buffer & operator=( buffer && other ) noexcept( al::propagate_on_container_move_assignment::value || al::is_always_equal::value )
    {
        BOOST_ASSERT_MSG( &other != this, "Self move assignment" );
        if constexpr ( !al::propagate_on_container_move_assignment::value && !al::is_always_equal::value )
        {
            if ( allocator_ != other.allocator_ )
            {
                // cannot adopt memory owned by an unequal allocator
                clear();
                reserve( other.size() );
                std::uninitialized_move_n( other.data(), other.size(), data() );
                size_ = other.size();
                other.clear();
                return *this;
            }
        }
        free();
        p_array_  = std::exchange( other.p_array_ , nullptr );
        size_     = std::exchange( other.size_    , 0       );
        capacity_ = std::exchange( other.capacity_, 0       );
        if constexpr ( al::propagate_on_container_move_assignment::value )
            allocator_ = std::move( other.allocator_ );
        return *this;
    }

    ~buffer() noexcept { free(); }

    [[ nodiscard, gnu::pure ]] size_type size    () const noexcept { return size_;     }
    [[ nodiscard, gnu::pure ]] size_type capacity() const noexcept { BOOST_ASSERT( capacity_ >= size_ ); return capacity_; }
    [[ nodiscard, gnu::pure ]] bool      empty   () const noexcept { return BOOST_UNLIKELY( size_ == 0 ); }

    [[ nodiscard ]] size_type max_size() const noexcept
    {
        return std::min<size_type>( al::max_size( allocator_ ), std::numeric_limits<difference_type>::max() / sizeof( value_type ) );
    }

    [[ nodiscard, gnu::pure ]] pointer       data()       noexcept { return p_array_; }
    [[ nodiscard, gnu::pure ]] const_pointer data() const noexcept { return p_array_; }

    [[ nodiscard ]] std::span<value_type      > span()       noexcept { return { p_array_, size_ }; }
    [[ nodiscard ]] std::span<value_type const> span() const noexcept { return { p_array_, size_ }; }

    [[ nodiscard ]]       iterator begin()       noexcept { return p_array_; }
    [[ nodiscard ]] const_iterator begin() const noexcept { return p_array_; }
    [[ nodiscard ]]       iterator end  ()       noexcept { return p_array_ + size_; }
    [[ nodiscard ]] const_iterator end  () const noexcept { return p_array_ + size_; }

    [[ nodiscard ]]       reference operator[]( size_type const n )       noexcept { BOOST_ASSERT( n < size_ ); return p_array_[ n ]; }
    [[ nodiscard ]] const_reference operator[]( size_type const n ) const noexcept { BOOST_ASSERT( n < size_ ); return p_array_[ n ]; }

    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return allocator_; }

    //! <b>Effects</b>: std::vector::reserve semantics - exact, never shrinks.
    //!
    //! <b>Throws</b>: std::length_error if new_capacity > max_size() or
    //!   whatever the allocator throws (i.e. std::bad_alloc).
    void reserve( size_type const new_capacity )
    {
        if ( new_capacity > capacity_ )
            reallocate( new_capacity );
    }

    //! <b>Effects</b>: Ensures there is room for at least additional more
    //!   elements without a reallocation (amortized: grows geometrically
    //!   unless disabled through options).
    //!
    //! <b>Note</b>: Non-standard extension.
    void reserve_additional( size_type const additional )
    {
        if ( additional > capacity_ - size_ ) [[ unlikely ]]
            grow_for( additional );
    }

    void shrink_to_fit()
    {
        if ( capacity_ == size_ )
            return;
        if ( size_ == 0 )
        {
            al::deallocate( allocator_, p_array_, capacity_ );
            mark_freed();
        }
        else
        {
            reallocate( size_ );
        }
    }

    //! <b>Note</b>: args may refer to elements of the buffer (also when it has
    //!   to grow).
    template <typename... Args>
    reference emplace_back( Args &&... args )
    {
        if ( size_ == capacity_ ) [[ unlikely ]]
        {
            value_type new_element( std::forward<Args>( args )... );
            reserve_additional( 1 );
            std::construct_at( p_array_ + size_, std::move( new_element ) );
        }
        else
        {
            std::construct_at( p_array_ + size_, std::forward<Args>( args )... );
        }
        return p_array_[ size_++ ];
    }

    //! <b>Effects</b>: Inserts an object of type T constructed with
    //!   std::forward<Args>(args)... before position.
    //!
    //! <b>Throws</b>: If memory allocation throws or the in-place constructor
    //!   throws (the buffer is then left unchanged) or T's move
    //!   constructor/assignment throws (basic guarantee).
    //!
    //! <b>Note</b>: args may refer to elements of the buffer.
    //!
    //! <b>Complexity</b>: Linear to the number of elements after position.
    template <typename... Args>
    iterator emplace( const_iterator const position, Args &&... args )
    {
        verify_iterator( position );
        auto const position_index{ static_cast<size_type>( position - begin() ) };
        // constructed before growing or shifting: args may point into the
        // current storage and a throwing constructor leaves the contents
        // untouched
        value_type new_element( std::forward<Args>( args )... );
        reserve_additional( 1 );
        auto const target{ p_array_ + position_index };
        if ( position_index == size_ )
        {
            std::construct_at( target, std::move( new_element ) );
        }
        else
        {
            make_space_at( position_index );
            if constexpr ( is_trivially_moveable<value_type> )
            {
                std::construct_at( target, std::move( new_element ) );
            }
            else if constexpr ( std::is_nothrow_move_assignable_v<value_type> )
            {
                *target = std::move( new_element );
            }
            else
            {
                // the slot opened past the end is not (yet) counted by size_
                try { *target = std::move( new_element ); }
                catch ( ... ) { std::destroy_at( p_array_ + size_ ); throw; }
            }
        }
        ++size_;
        return target;
    }

    //! <b>Effects</b>: Erases the element at position.
    //!
    //! <b>Complexity</b>: Linear to the number of elements after position.
    iterator erase( const_iterator const position ) noexcept( std::is_nothrow_move_assignable_v<value_type> )
    {
        verify_iterator( position );
        BOOST_ASSERT( position != end() );
        auto const position_index{ static_cast<size_type>( position - begin() ) };
        auto const target        { p_array_ + position_index };
        auto const trailing_count{ size_ - position_index - 1 };
        if constexpr ( is_trivially_moveable<value_type> )
        {
            std::destroy_at( target );
            std::memmove( static_cast<void *>( target ), target + 1, trailing_count * sizeof( value_type ) );
        }
        else
        {
            std::move( target + 1, end(), target );
            std::destroy_at( p_array_ + size_ - 1 );
        }
        --size_;
        return target;
    }

    // keeps the capacity (as std::vector::clear)
    void clear() noexcept
    {
        std::destroy_n( p_array_, size_ );
        size_ = 0;
    }

    void swap( buffer & other ) noexcept
    {
        using std::swap;
        if constexpr ( al::propagate_on_container_swap::value )
            swap( allocator_, other.allocator_ );
        else
            BOOST_ASSERT_MSG( allocator_ == other.allocator_, "Swapping buffers with unequal non-propagating allocators" );
        swap( p_array_ , other.p_array_  );
        swap( size_    , other.size_     );
        swap( capacity_, other.capacity_ );
    }
    friend void swap( buffer & left, buffer & right ) noexcept { left.swap( right ); }

    //! <b>Effects</b>: Relinquishes ownership of the storage, returning it
    //!   along with the allocator (which is moved out). The buffer is left
    //!   empty and will not deallocate anything.
    //!
    //! <b>Note</b>: Non-standard extension.
    [[ nodiscard ]] std::pair<parts, allocator_type> release() noexcept
    {
        parts const storage{ p_array_, size_, capacity_ };
        mark_freed();
        return { storage, std::move( allocator_ ) };
    }

    //! <b>Requires</b>: storage was obtained from allocator (or an allocator
    //!   that compares equal to it) with exactly storage.capacity elements of
    //!   which the first storage.size are constructed. Unchecked.
    //!
    //! <b>Note</b>: Non-standard extension.
    [[ nodiscard ]] static buffer from_parts( parts const storage, allocator_type allocator ) noexcept
    {
        BOOST_ASSERT( storage.size <= storage.capacity );
        BOOST_ASSERT( storage.data || !storage.capacity );
        buffer result{ std::move( allocator ) };
        result.p_array_  = storage.data;
        result.size_     = storage.size;
        result.capacity_ = storage.capacity;
        return result;
    }

    friend bool operator==( buffer const & left, buffer const & right )
    {
        return std::ranges::equal( left.span(), right.span() );
    }

private:
    void verify_iterator( [[ maybe_unused ]] const_iterator const iter ) const noexcept
    {
        BOOST_ASSERT( iter >= begin() );
        BOOST_ASSERT( iter <= end  () );
    }

    void append_copy( std::span<value_type const> const source )
    {
        BOOST_ASSERT( empty() );
        reserve( source.size() );
        std::uninitialized_copy_n( source.data(), source.size(), p_array_ );
        size_ = source.size();
    }

    // opens an uninitialized (for trivially moveable types) or moved-from
    // slot at position_index (requires spare capacity)
    void make_space_at( size_type const position_index )
    {
        BOOST_ASSERT( size_ < capacity_ );
        BOOST_ASSERT( position_index < size_ );
        auto const source{ p_array_ + position_index };
        if constexpr ( is_trivially_moveable<value_type> )
        {
            std::memmove( static_cast<void *>( source + 1 ), source, ( size_ - position_index ) * sizeof( value_type ) );
        }
        else
        {
            auto const last{ p_array_ + size_ };
            std::construct_at( last, std::move( *( last - 1 ) ) );
            if constexpr ( std::is_nothrow_move_assignable_v<value_type> )
            {
                std::move_backward( source, last - 1, last );
            }
            else
            {
                try { std::move_backward( source, last - 1, last ); }
                catch ( ... ) { std::destroy_at( last ); throw; }
            }
        }
    }

    [[ gnu::cold, gnu::noinline ]]
    void grow_for( size_type const additional )
    {
        if ( additional > max_size() - size_ )
            detail::throw_length_error( "psi::sparse::buffer capacity overflow" );
        auto const required_capacity{ size_ + additional };
        auto const new_capacity
        {
            options.geometric_growth
                ? std::max( required_capacity, std::min( capacity_ + capacity_ / 2, max_size() ) )
                : required_capacity
        };
        reallocate( new_capacity );
    }

    [[ gnu::cold ]]
    void reallocate( size_type const new_capacity )
    {
        BOOST_ASSERT( new_capacity >= size_ );
        if ( new_capacity > max_size() )
            detail::throw_length_error( "psi::sparse::buffer capacity overflow" );
        auto const new_data{ al::allocate( allocator_, new_capacity ) };
        if constexpr ( is_trivially_moveable<value_type> )
        {
            if ( size_ )
                std::memcpy( static_cast<void *>( new_data ), p_array_, size_ * sizeof( value_type ) );
        }
        else
        {
            try
            {
                if constexpr ( std::is_nothrow_move_constructible_v<value_type> || !std::is_copy_constructible_v<value_type> )
                    std::uninitialized_move_n( p_array_, size_, new_data );
                else
                    std::uninitialized_copy_n( p_array_, size_, new_data );
            }
            catch ( ... )
            {
                al::deallocate( allocator_, new_data, new_capacity );
                throw;
            }
            std::destroy_n( p_array_, size_ );
        }
        if ( capacity_ )
            al::deallocate( allocator_, p_array_, capacity_ );
        p_array_  = new_data;
        capacity_ = new_capacity;
    }

    void free() noexcept
    {
        std::destroy_n( p_array_, size_ );
        if ( capacity_ )
            al::deallocate( allocator_, p_array_, capacity_ );
        mark_freed();
    }

    void mark_freed() noexcept
    {
        p_array_  = nullptr;
        size_     = 0;
        capacity_ = 0;
    }

private:
    value_type * p_array_ { nullptr };
    size_type    size_    { 0 };
    size_type    capacity_{ 0 };
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    allocator_type allocator_;
}; // class buffer

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
