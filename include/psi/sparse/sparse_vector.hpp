////////////////////////////////////////////////////////////////////////////////
/// Sparse vector: an ordered associative container from (a subset of)
/// std::size_t indices to values, tuned for dense iteration and a compact
/// footprint rather than for insertion speed.
///
/// Architecture:
///   Two parallel arrays - strictly ascending indices and their values - that
///   share a single allocator instance: the arrays are stored typed against
///   the inert_allocator and the real one (kept once, in the container) is
///   attached to them only for the duration of operations that allocate or
///   free memory (see transplant.hpp). Lookups are binary searches over the
///   index array, insertions and removals shift the tails of both arrays
///   (O(n)).
///
/// Extensions/differences WRT the usual map-like interfaces:
///   - reserve(n) reserves room for n ADDITIONAL entries
///   - set() returns the replaced value (if any), get() returns a pointer
///     (nullptr for unset indices)
///   - operator[] never inserts: accessing an unset index is a fatal error
///   - into_parts()/from_parts() for handing the raw arrays over to/from
///     other code
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
#include <psi/sparse/detail/errors.hpp>
#include <psi/sparse/inert_allocator.hpp>
#include <psi/sparse/transplant.hpp>

#include <boost/assert.hpp>
#include <boost/sort/pdqsort/pdqsort.hpp>

#include <algorithm>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
//------------------------------------------------------------------------------
namespace psi::sparse
{
//------------------------------------------------------------------------------

// Tag for from_parts(): the caller guarantees the indices are unique and
// sorted in ascending order.
struct sorted_unique_t { explicit sorted_unique_t() = default; };
inline constexpr sorted_unique_t sorted_unique{};


template <typename T, typename Allocator = std::allocator<T>, buffer_options options = {}>
class [[ nodiscard ]] sparse_vector
{
private:
    using al = std::allocator_traits<Allocator>;

public:
    using index_type      = std::size_t;
    using value_type      = T;
    using size_type       = std::size_t;
    using difference_type = std::ptrdiff_t;
    using allocator_type  = Allocator;

    using index_allocator_type = typename al::template rebind_alloc<index_type>;
    using value_allocator_type = typename al::template rebind_alloc<value_type>;

    // buffer types handed out by into_parts() and accepted by from_parts()
    using index_buffer = buffer<index_type, index_allocator_type, options>;
    using value_buffer = buffer<value_type, value_allocator_type, options>;

    struct parts
    {
        index_buffer indices;
        value_buffer values;
    }; // struct parts

private:
    using index_attachment = attachment<index_type, allocator_type, options>;
    using value_attachment = attachment<value_type, allocator_type, options>;

    //--------------------------------------------------------------------------
    // Iterator
    //--------------------------------------------------------------------------
    template <bool IsConst>
    class iterator_impl
    {
    public:
        using iterator_concept  = std::random_access_iterator_tag;
        using iterator_category = std::random_access_iterator_tag;
        using value_type        = std::pair<index_type, sparse_vector::value_type>;
        using difference_type   = sparse_vector::difference_type;
        using reference         = std::pair<index_type, std::conditional_t<IsConst, sparse_vector::value_type const &, sparse_vector::value_type &>>;

        struct arrow_proxy {
            reference ref;
            constexpr reference const * operator->() const noexcept { return &ref; }
        };
        using pointer = arrow_proxy;

    private:
        friend sparse_vector;
        friend iterator_impl<!IsConst>;

        using owner_ptr = std::conditional_t<IsConst, sparse_vector const *, sparse_vector *>;

        owner_ptr       owner_   { nullptr };
        difference_type position_{ 0 };

        constexpr iterator_impl( owner_ptr const owner, difference_type const position ) noexcept : owner_{ owner }, position_{ position } {}

    public:
        constexpr iterator_impl() noexcept = default;
        constexpr iterator_impl( iterator_impl const & ) noexcept = default;
        constexpr iterator_impl & operator=( iterator_impl const & ) noexcept = default;

        constexpr iterator_impl( iterator_impl<!IsConst> const & other ) noexcept requires IsConst
            : owner_{ other.owner_ }, position_{ other.position_ } {}

        constexpr reference operator*() const noexcept {
            auto const p{ static_cast<size_type>( position_ ) };
            return { owner_->indices_[ p ], owner_->values_[ p ] };
        }

        constexpr arrow_proxy operator->() const noexcept { return { **this }; }

        constexpr reference operator[]( difference_type const n ) const noexcept { return *( *this + n ); }

        [[ nodiscard ]] constexpr index_type index() const noexcept { return owner_->indices_[ static_cast<size_type>( position_ ) ]; }

        constexpr iterator_impl & operator++(     ) noexcept { ++position_; return *this; }
        constexpr iterator_impl   operator++( int ) noexcept { auto tmp{ *this }; ++position_; return tmp; }
        constexpr iterator_impl & operator--(     ) noexcept { --position_; return *this; }
        constexpr iterator_impl   operator--( int ) noexcept { auto tmp{ *this }; --position_; return tmp; }

        constexpr iterator_impl & operator+=( difference_type const n ) noexcept { position_ += n; return *this; }
        constexpr iterator_impl & operator-=( difference_type const n ) noexcept { position_ -= n; return *this; }

        friend constexpr iterator_impl operator+( iterator_impl const it, difference_type const n ) noexcept { return { it.owner_, it.position_ + n }; }
        friend constexpr iterator_impl operator+( difference_type const n, iterator_impl const it ) noexcept { return { it.owner_, it.position_ + n }; }
        friend constexpr iterator_impl operator-( iterator_impl const it, difference_type const n ) noexcept { return { it.owner_, it.position_ - n }; }

        friend constexpr difference_type operator-( iterator_impl const & a, iterator_impl const & b ) noexcept { return a.position_ - b.position_; }

        friend constexpr bool operator== ( iterator_impl const & a, iterator_impl const & b ) noexcept { BOOST_ASSERT( a.owner_ == b.owner_ ); return a.position_ ==  b.position_; }
        friend constexpr auto operator<=>( iterator_impl const & a, iterator_impl const & b ) noexcept { BOOST_ASSERT( a.owner_ == b.owner_ ); return a.position_ <=> b.position_; }
    }; // iterator_impl

public:
    using iterator               = iterator_impl<false>;
    using const_iterator         = iterator_impl<true>;
    using reverse_iterator       = std::reverse_iterator<iterator>;
    using const_reverse_iterator = std::reverse_iterator<const_iterator>;

    //--------------------------------------------------------------------------
    // Construction & destruction
    //--------------------------------------------------------------------------

    sparse_vector() noexcept( std::is_nothrow_default_constructible_v<allocator_type> ) : allocator_{} {}
    explicit sparse_vector( allocator_type const & allocator ) noexcept : allocator_{ allocator } {}

    //! <b>Effects</b>: Constructs an empty sparse_vector with room for
    //!   capacity entries.
    //!
    //! <b>Throws</b>: Whatever the allocator throws (i.e. std::bad_alloc).
    [[ nodiscard ]] static sparse_vector with_capacity( size_type const capacity, allocator_type const & allocator = allocator_type{} )
    {
        sparse_vector result{ allocator };
        result.reserve( capacity );
        return result;
    }

    sparse_vector( sparse_vector const & other )
        : sparse_vector( other, al::select_on_container_copy_construction( other.allocator_ ) ) {}

    sparse_vector( sparse_vector const & other, allocator_type const & allocator )
        : allocator_{ allocator }
    {
        index_buffer indices( other.indices(), index_allocator_type( allocator_ ) );
        value_buffer values ( other.values (), value_allocator_type( allocator_ ) );
        adopt( std::move( indices ), std::move( values ) );
    }

    sparse_vector( sparse_vector && other ) noexcept
        :
        indices_  { std::move( other.indices_ ) },
        values_   { std::move( other.values_  ) },
        allocator_{ other.allocator_ } // the source stays usable: keep an equal copy there
    {}

    sparse_vector & operator=( sparse_vector const & other )
    {
        if ( &other != this ) [[ likely ]]
        {
            sparse_vector copy( other, al::propagate_on_container_copy_assignment::value ? other.allocator_ : allocator_ );
            swap_all( copy );
        }
        return *this;
    }

    sparse_vector & operator=( sparse_vector && other ) noexcept( al::propagate_on_container_move_assignment::value || al::is_always_equal::value )
    {
        BOOST_ASSERT_MSG( &other != this, "Self move assignment" );
        if constexpr ( !al::propagate_on_container_move_assignment::value && !al::is_always_equal::value )
        {
            if ( allocator_ != other.allocator_ )
            {
                // cannot adopt memory owned by an unequal allocator: move the
                // elements over into our own
                auto const count{ other.count() };
                index_buffer indices( other.indices(), index_allocator_type( allocator_ ) );
                value_buffer values ( count          , value_allocator_type( allocator_ ) );
                for ( auto & value : other.values_ )
                    values.emplace_back( std::move( value ) );
                other.clear();
                release_storage();
                adopt( std::move( indices ), std::move( values ) );
                return *this;
            }
        }
        sparse_vector victim{ std::move( other ) };
        if constexpr ( al::propagate_on_container_move_assignment::value )
            swap_all( victim );
        else
            swap_storage( victim );
        return *this;
    }

    // The arrays are detached (typed against the inert_allocator) at this point
    // so their memory has to be handed back to the real allocator explicitly
    // (letting them destroy themselves would end up in
    // inert_allocator::deallocate()).
    ~sparse_vector() noexcept { release_storage(); }

    //--------------------------------------------------------------------------
    // Iterators
    //--------------------------------------------------------------------------
    iterator       begin()       noexcept { return { this, 0 }; }
    const_iterator begin() const noexcept { return { this, 0 }; }
    iterator       end  ()       noexcept { return { this, static_cast<difference_type>( count() ) }; }
    const_iterator end  () const noexcept { return { this, static_cast<difference_type>( count() ) }; }

    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend  () const noexcept { return end  (); }

    reverse_iterator       rbegin()       noexcept { return reverse_iterator      { end  () }; }
    const_reverse_iterator rbegin() const noexcept { return const_reverse_iterator{ end  () }; }
    reverse_iterator       rend  ()       noexcept { return reverse_iterator      { begin() }; }
    const_reverse_iterator rend  () const noexcept { return const_reverse_iterator{ begin() }; }

    //--------------------------------------------------------------------------
    // Capacity
    //--------------------------------------------------------------------------
    [[ nodiscard ]] size_type count   () const noexcept { BOOST_ASSERT( indices_.size() == values_.size() ); return indices_.size(); }
    [[ nodiscard ]] size_type size    () const noexcept { return count(); }
    [[ nodiscard ]] bool      empty   () const noexcept { return indices_.empty(); }
    [[ nodiscard ]] size_type capacity() const noexcept { return std::min( indices_.capacity(), values_.capacity() ); }
    [[ nodiscard ]] size_type max_size() const noexcept
    {
        return std::min
        (
            index_buffer{ index_allocator_type( allocator_ ) }.max_size(),
            value_buffer{ value_allocator_type( allocator_ ) }.max_size()
        );
    }

    //! <b>Effects</b>: Ensures there is room for additional more entries
    //!   without reallocating either array (amortized).
    //!
    //! <b>Throws</b>: std::length_error or whatever the allocator throws.
    //!
    //! <b>Note</b>: Non-standard semantics - std::vector::reserve() takes the
    //!   total capacity.
    void reserve( size_type const additional )
    {
        index_attachment indices{ indices_, allocator_ };
        value_attachment values { values_ , allocator_ };
        indices->reserve_additional( additional );
        values ->reserve_additional( additional );
    }

    void shrink_to_fit()
    {
        index_attachment indices{ indices_, allocator_ };
        value_attachment values { values_ , allocator_ };
        indices->shrink_to_fit();
        values ->shrink_to_fit();
    }

    //--------------------------------------------------------------------------
    // Lookup & element access
    //--------------------------------------------------------------------------
    [[ nodiscard ]] bool is_set  ( index_type const index ) const noexcept { return is_at( lower_bound( index ), index ); }
    [[ nodiscard ]] bool contains( index_type const index ) const noexcept { return is_set( index ); }

    //! <b>Returns</b>: A pointer to the value stored at index or nullptr if
    //!   index is not set.
    //!
    //! <b>Complexity</b>: Logarithmic.
    [[ nodiscard ]] value_type const * get( index_type const index ) const noexcept
    {
        auto const position{ lower_bound( index ) };
        return is_at( position, index ) ? &values_[ position ] : nullptr;
    }
    [[ nodiscard ]] value_type * get( index_type const index ) noexcept
    {
        return const_cast<value_type *>( std::as_const( *this ).get( index ) );
    }

    //! <b>Requires</b>: is_set( index ) - otherwise the process is aborted
    //!   (after reporting the offending index).
    [[ nodiscard ]] value_type const & operator[]( index_type const index ) const noexcept
    {
        auto const value{ get( index ) };
        if ( !value ) [[ unlikely ]]
            detail::unset_index_access( index );
        return *value;
    }
    [[ nodiscard ]] value_type & operator[]( index_type const index ) noexcept
    {
        return const_cast<value_type &>( std::as_const( *this )[ index ] );
    }

    [[ nodiscard ]] std::span<index_type const> indices() const noexcept { return indices_.span(); }
    [[ nodiscard ]] std::span<value_type const> values () const noexcept { return values_ .span(); }
    [[ nodiscard ]] std::span<value_type      > values ()       noexcept { return values_ .span(); }

    //--------------------------------------------------------------------------
    // Modifiers
    //--------------------------------------------------------------------------

    //! <b>Effects</b>: Stores value at index.
    //!
    //! <b>Returns</b>: The previously stored value if index was already set.
    //!
    //! <b>Throws</b>: If memory allocation or T's construction throws. The
    //!   contents are then left unchanged if T's move constructor and move
    //!   assignment do not throw (otherwise the indices are unchanged but the
    //!   values may have been left in a valid but unspecified state).
    //!
    //! <b>Note</b>: value may refer to an element of *this.
    //!
    //! <b>Complexity</b>: Logarithmic if index was set, linear otherwise.
    template <typename U = value_type>
    requires std::constructible_from<value_type, U &&> && std::movable<value_type>
    std::optional<value_type> set( index_type const index, U && value )
    {
        // materialized before anything is moved or reallocated
        value_type new_value( std::forward<U>( value ) );
        auto const position{ lower_bound( index ) };
        if ( is_at( position, index ) )
            return std::exchange( values_[ position ], std::move( new_value ) );
        insert_at( position, index, std::move( new_value ) );
        return std::nullopt;
    }

    //! <b>Effects</b>: Removes the value stored at index (if any). The
    //!   capacity is left unchanged.
    //!
    //! <b>Returns</b>: The removed value or std::nullopt if index was not set.
    //!
    //! <b>Complexity</b>: Linear.
    std::optional<value_type> unset( index_type const index )
    {
        auto const position{ lower_bound( index ) };
        if ( !is_at( position, index ) )
            return std::nullopt;
        std::optional<value_type> removed{ std::move( values_[ position ] ) };
        // no memory is (de)allocated here: no need to attach the arrays
        values_ .erase( values_ .begin() + position );
        indices_.erase( indices_.begin() + position );
        return removed;
    }

    // keeps the capacity
    void clear() noexcept
    {
        values_ .clear();
        indices_.clear();
    }

    void swap( sparse_vector & other ) noexcept
    {
        if constexpr ( al::propagate_on_container_swap::value )
            swap_all( other );
        else
            swap_storage( other );
    }

    friend void swap( sparse_vector & left, sparse_vector & right ) noexcept { left.swap( right ); }

    //--------------------------------------------------------------------------
    // Raw parts
    //--------------------------------------------------------------------------

    //! <b>Effects</b>: Hands over both arrays, attached to (copies of) the
    //!   allocator. *this is left empty (but usable).
    [[ nodiscard ]] parts into_parts() && noexcept
    {
        return
        {
            take( indices_, index_allocator_type( allocator_ ) ),
            take( values_ , value_allocator_type( allocator_ ) )
        };
    }

    //! <b>Effects</b>: Inverse of into_parts(): takes ownership of the arrays
    //!   without any validation or copying.
    //!
    //! <b>Requires</b>: Equal sizes, strictly ascending indices and equal
    //!   allocators. Checked only by debug assertions - violating these is
    //!   undefined behaviour.
    [[ nodiscard ]] static sparse_vector from_parts( sorted_unique_t, index_buffer indices, value_buffer values ) noexcept
    {
        BOOST_ASSERT_MSG( indices.size() == values.size(), "Mismatched index and value counts" );
        BOOST_ASSERT_MSG( std::adjacent_find( indices.begin(), indices.end(), std::greater_equal<>{} ) == indices.end(), "Indices not strictly ascending" );
        BOOST_ASSERT_MSG( allocator_type( indices.get_allocator() ) == allocator_type( values.get_allocator() ), "Parts owned by unequal allocators" );
        sparse_vector result{ allocator_type( values.get_allocator() ) };
        result.adopt( std::move( indices ), std::move( values ) );
        return result;
    }

    //! <b>Effects</b>: Checked version of from_parts( sorted_unique, ... ):
    //!   sorts the entries by index and drops duplicate indices - the last
    //!   (in input order) of the duplicates wins, i.e. the result is the same
    //!   as set()-ing the entries one by one.
    //!
    //! <b>Throws</b>: std::invalid_argument if the arrays have different
    //!   sizes, or whatever the allocator or T's move constructor throws.
    //!
    //! <b>Complexity</b>: Linear if the indices are already strictly
    //!   ascending, N log N otherwise.
    [[ nodiscard ]] static sparse_vector from_parts( index_buffer indices, value_buffer values )
    {
        if ( indices.size() != values.size() )
            detail::throw_invalid_argument( "psi::sparse::sparse_vector::from_parts: index and value counts differ" );
        if ( std::adjacent_find( indices.begin(), indices.end(), std::greater_equal<>{} ) == indices.end() )
            return from_parts( sorted_unique, std::move( indices ), std::move( values ) );

        auto const input_size{ indices.size() };
        index_buffer order( input_size, indices.get_allocator() );
        for ( size_type position{ 0 }; position < input_size; ++position )
            order.emplace_back( position );
        // ties broken by input position so that the last duplicate sorts last
        boost::sort::pdqsort
        (
            order.begin(), order.end(),
            [ &indices ]( size_type const left, size_type const right ) noexcept
            {
                return ( indices[ left ] < indices[ right ] ) || ( indices[ left ] == indices[ right ] && left < right );
            }
        );

        index_buffer sorted_indices( input_size, indices.get_allocator() );
        value_buffer sorted_values ( input_size, values .get_allocator() );
        for ( size_type i{ 0 }; i < input_size; ++i )
        {
            auto const source{ order[ i ] };
            if ( ( i + 1 < input_size ) && ( indices[ order[ i + 1 ] ] == indices[ source ] ) )
                continue; // superseded
            sorted_indices.emplace_back( indices[ source ] );
            sorted_values .emplace_back( std::move( values[ source ] ) );
        }
        return from_parts( sorted_unique, std::move( sorted_indices ), std::move( sorted_values ) );
    }

    //--------------------------------------------------------------------------
    // Observers
    //--------------------------------------------------------------------------
    [[ nodiscard ]] allocator_type get_allocator() const noexcept { return allocator_; }

    //--------------------------------------------------------------------------
    // Comparison (by contents: capacity and allocators are irrelevant)
    //--------------------------------------------------------------------------
    template <typename OtherT, typename OtherAllocator, buffer_options other_options>
    [[ nodiscard ]] bool operator==( sparse_vector<OtherT, OtherAllocator, other_options> const & other ) const
    {
        return std::ranges::equal( indices(), other.indices() ) && std::ranges::equal( values(), other.values() );
    }

private:
    [[ nodiscard, gnu::pure ]] size_type lower_bound( index_type const index ) const noexcept
    {
        return static_cast<size_type>( std::lower_bound( indices_.begin(), indices_.end(), index ) - indices_.begin() );
    }

    [[ nodiscard, gnu::pure ]] bool is_at( size_type const position, index_type const index ) const noexcept
    {
        return ( position < indices_.size() ) && ( indices_[ position ] == index );
    }

    void insert_at( size_type const position, index_type const index, value_type && new_value )
    {
        index_attachment indices{ indices_, allocator_ };
        value_attachment values { values_ , allocator_ };
        indices->reserve_additional( 1 );
        values ->reserve_additional( 1 );
        // the value goes in first: if shifting it in throws the indices are
        // still intact (inserting the index cannot fail with the room reserved)
        values ->emplace( values ->begin() + position, std::move( new_value ) );
        indices->emplace( indices->begin() + position, index );
        BOOST_ASSERT( position == 0                   || ( *indices )[ position - 1 ] < index );
        BOOST_ASSERT( position + 1 == indices->size() || index < ( *indices )[ position + 1 ] );
    }

    // Takes over storage currently owned by (copies of) our allocator.
    void adopt( index_buffer && indices, value_buffer && values ) noexcept
    {
        BOOST_ASSERT( indices.size() == values.size() );
        BOOST_ASSERT( indices_.capacity() == 0 && values_.capacity() == 0 );
        indices_ = detach( std::move( indices ) ).first;
        values_  = detach( std::move( values  ) ).first;
    }

    // Reattaches both arrays to the real allocator and lets it free them.
    void release_storage() noexcept
    {
        {
            auto const released{ take( values_, value_allocator_type( allocator_ ) ) };
        }
        {
            auto const released{ take( indices_, index_allocator_type( allocator_ ) ) };
        }
    }

    void swap_storage( sparse_vector & other ) noexcept
    {
        BOOST_ASSERT_MSG( allocator_ == other.allocator_, "Exchanging storage owned by unequal allocators" );
        indices_.swap( other.indices_ );
        values_ .swap( other.values_  );
    }

    void swap_all( sparse_vector & other ) noexcept
    {
        using std::swap;
        indices_.swap( other.indices_ );
        values_ .swap( other.values_  );
        swap( allocator_, other.allocator_ );
    }

private:
    detached_buffer<index_type, options> indices_;
    detached_buffer<value_type, options> values_;
#ifdef _MSC_VER
    [[ msvc::no_unique_address ]]
#else
    [[ no_unique_address ]]
#endif
    allocator_type allocator_;
}; // class sparse_vector

//------------------------------------------------------------------------------
} // namespace psi::sparse
//------------------------------------------------------------------------------
