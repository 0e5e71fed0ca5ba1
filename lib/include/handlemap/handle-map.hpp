// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_HANDLE_MAP_2024
#define ORG_HANDLEMAP_HANDLE_MAP_2024

#include <handlemap/container.hpp>
#include <handlemap/error.hpp>
#include <handlemap/memory.hpp>

#include <concepts>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>

namespace hm {

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Handle............................................................ //
//                                                                    //
////////////////////////////////////////////////////////////////////////

//! The default handle type. Declare your own struct with the same two
//! members to get a distinct handle type per store.
//!
//! @code
//! struct entity_handle {
//!     hm::u32 index;
//!     hm::u32 generation;
//! };
//! @endcode
struct handle {
    u32 index      = 0; //!< Position in the storage, 0 means no handle.
    u32 generation = 0; //!< Number of occupations of the slot.

    constexpr bool operator==(const handle&) const noexcept = default;
};

template<typename H>
concept handle_type = std::is_trivially_copyable_v<H> and
                      std::is_default_constructible_v<H> and
                      requires(H h) {
                          requires std::same_as<decltype(h.index), u32>;
                          requires std::same_as<decltype(h.generation), u32>;
                      };

//! The item stored into a handle map embeds its own handle in a member
//! named @c handle.
//!
//! @code
//! struct entity {
//!     float         x, y;
//!     entity_handle handle;
//! };
//! @endcode
template<typename T, typename H>
concept handle_item =
  handle_type<H> and std::is_move_assignable_v<T> and
  std::is_nothrow_destructible_v<T> and requires(T& t) {
      requires std::same_as<decltype(t.handle), H>;
  };

template<handle_type H>
constexpr bool is_null(const H h) noexcept
{
    return h.index == 0u;
}

//! Structural equality, both fields must match.
template<handle_type H>
constexpr bool is_same(const H lhs, const H rhs) noexcept
{
    return lhs.index == rhs.index and lhs.generation == rhs.generation;
}

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Storages.......................................................... //
//                                                                    //
////////////////////////////////////////////////////////////////////////

/**
   @brief Inline storage for @c N items plus the dummy slot.

   No dynamic allocation: the slots and the free list live inside the
   object.
 */
template<typename T, int N>
class fixed_storage
{
public:
    static_assert(N >= 1);
    static_assert(std::is_default_constructible_v<T>,
                  "T must be default constructible to build the dummy slot");

    static constexpr bool is_bounded = true;
    static constexpr u32  slots      = static_cast<u32>(N) + 1u;

    using value_type     = T;
    using free_list_type = free_list<small_vector<u32, N>>;

private:
    alignas(T) std::byte m_buffer[slots * sizeof(T)];
    u32 m_size = 0;

public:
    fixed_storage() noexcept = default;
    ~fixed_storage() noexcept { destroy(); }

    fixed_storage(const fixed_storage&)            = delete;
    fixed_storage& operator=(const fixed_storage&) = delete;

    u32 size() const noexcept { return m_size; }
    u32 capacity() const noexcept { return static_cast<u32>(N); }

    T* at(u32 index) noexcept
    {
        debug::ensure(index < m_size);
        return reinterpret_cast<T*>(&m_buffer[0]) + index;
    }

    const T* at(u32 index) const noexcept
    {
        debug::ensure(index < m_size);
        return reinterpret_cast<const T*>(&m_buffer[0]) + index;
    }

    status can_push() const noexcept
    {
        const auto needed = m_size == 0u ? 2u : m_size + 1u;
        if (needed > slots)
            return new_error_code(container_errc::full);

        return success();
    }

    expected<T*> push(T&& value) noexcept
    {
        if (auto ret = can_push(); not ret)
            return ret.error();

        auto* items = reinterpret_cast<T*>(&m_buffer[0]);

        if (m_size == 0u) {
            std::construct_at(items);
            items->handle = {};
            m_size        = 1u;
        }

        auto* ptr = std::construct_at(items + m_size, std::move(value));
        ++m_size;

        return ptr;
    }

    memory_usage usage() const noexcept
    {
        return memory_usage{ .reserved  = sizeof(m_buffer),
                             .committed = sizeof(m_buffer),
                             .used      = m_size * sizeof(T) };
    }

    void clear() noexcept
    {
        std::destroy_n(reinterpret_cast<T*>(&m_buffer[0]), m_size);
        m_size = 0;
    }

    void destroy() noexcept { clear(); }
};

/**
   @brief A growing sequence carved from a single virtual memory reservation.

   The reservation is sized at the first @c push() for @c max_items items and
   the dummy slot. The sequence grows in place by committing more pages, so
   items never move. A push beyond the reservation fails with
   @c container_errc::reservation_exhausted.
 */
template<typename T, block_provider Provider = default_block_provider>
class static_storage
{
public:
    static_assert(std::is_default_constructible_v<T>,
                  "T must be default constructible to build the dummy slot");

    static constexpr bool is_bounded = true;

    using value_type     = T;
    using provider_type  = Provider;
    using free_list_type = free_list<vector<u32>>;

private:
    static_arena<Provider> m_arena;

    u32 m_max_items     = 0;
    u32 m_size          = 0;
    u32 m_committed_size = 0; // slots backed by committed memory.

public:
    explicit static_storage(std::integral auto max_items) noexcept
      : m_max_items(static_cast<u32>(max_items))
    {
        debug::ensure(std::cmp_greater(max_items, 0));
        debug::ensure(std::cmp_less(max_items, UINT32_MAX));
    }

    ~static_storage() noexcept { destroy(); }

    static_storage(const static_storage&)            = delete;
    static_storage& operator=(const static_storage&) = delete;

    static_storage(static_storage&& other) noexcept
      : m_arena(std::move(other.m_arena))
      , m_max_items(other.m_max_items)
      , m_size(std::exchange(other.m_size, 0u))
      , m_committed_size(std::exchange(other.m_committed_size, 0u))
    {}

    u32 size() const noexcept { return m_size; }
    u32 max_items() const noexcept { return m_max_items; }

    //! Number of slots (dummy included) in the reservation, i.e. the
    //! reserved bytes rounded to the allocation granularity divided by the
    //! item size.
    u32 capacity() const noexcept
    {
        const auto bytes =
          round_up((static_cast<std::size_t>(m_max_items) + 1u) * sizeof(T),
                   provider_type::granularity());

        return static_cast<u32>(
          std::min<std::size_t>(bytes / sizeof(T), UINT32_MAX));
    }

    T* at(u32 index) noexcept
    {
        debug::ensure(index < m_size);
        return reinterpret_cast<T*>(m_arena.data()) + index;
    }

    const T* at(u32 index) const noexcept
    {
        debug::ensure(index < m_size);
        return reinterpret_cast<const T*>(m_arena.data()) + index;
    }

    //! Check the reservation only: a commit failure is reported by
    //! @c push().
    status can_push() const noexcept
    {
        const auto needed = m_size == 0u ? 2u : m_size + 1u;
        if (needed > capacity())
            return new_error_code(container_errc::reservation_exhausted);

        return success();
    }

    expected<T*> push(T&& value) noexcept
    {
        if (not m_arena.is_initialized()) {
            const auto bytes =
              (static_cast<std::size_t>(m_max_items) + 1u) * sizeof(T);

            if (auto ret = m_arena.init(bytes); not ret)
                return ret.error();
        }

        const auto needed = m_size == 0u ? 2u : m_size + 1u;
        if (needed > m_committed_size) {
            if (auto ret = grow(needed); not ret)
                return ret.error();
        }

        auto* items = reinterpret_cast<T*>(m_arena.data());

        if (m_size == 0u) {
            std::construct_at(items);
            items->handle = {};
            m_size        = 1u;
        }

        auto* ptr = std::construct_at(items + m_size, std::move(value));
        ++m_size;

        return ptr;
    }

    memory_usage usage() const noexcept
    {
        auto ret = m_arena.usage();
        ret.used = static_cast<std::size_t>(m_size) * sizeof(T);
        return ret;
    }

    //! Destroy the items but keep the reservation and the committed pages.
    void clear() noexcept
    {
        if (m_arena.is_initialized())
            std::destroy_n(reinterpret_cast<T*>(m_arena.data()), m_size);

        m_size = 0;
    }

    //! Destroy the items and release the reservation in one step.
    void destroy() noexcept
    {
        clear();
        m_arena.release();
        m_committed_size = 0;
    }

private:
    //! Double the committed slots, clamped to the reservation. The buffer
    //! is the only allocation of the arena so the growth is in place.
    status grow(u32 needed) noexcept
    {
        const auto limit = capacity();
        if (needed > limit)
            return new_error_code(container_errc::reservation_exhausted);

        auto new_size = m_committed_size ? m_committed_size * 2u : 8u;
        if (new_size < needed)
            new_size = needed;
        if (new_size > limit)
            new_size = limit;

        if (auto ret = m_arena.resize(static_cast<std::size_t>(new_size) *
                                      sizeof(T));
            not ret)
            return ret;

        m_committed_size = new_size;
        return success();
    }
};

/**
   @brief An unbounded sequence of items allocated one by one in a growing
   arena.

   The sequence stores the addresses of the items, the items themselves are
   never relocated. The slot 0 is a null pointer.
 */
template<typename T, block_provider Provider = default_block_provider>
class growing_storage
{
public:
    static constexpr bool is_bounded = false;

    static constexpr u32 default_min_items_per_block = 1024u;

    using value_type     = T;
    using provider_type  = Provider;
    using free_list_type = free_list<vector<u32>>;

private:
    vector<T*>              m_items;
    growing_arena<Provider> m_arena;
    u32                     m_min_items_per_block;

public:
    explicit growing_storage(std::integral auto min_items_per_block) noexcept
      : m_min_items_per_block(static_cast<u32>(min_items_per_block))
    {
        debug::ensure(std::cmp_greater(min_items_per_block, 0));
    }

    growing_storage() noexcept
      : growing_storage(default_min_items_per_block)
    {}

    ~growing_storage() noexcept { destroy(); }

    growing_storage(const growing_storage&)            = delete;
    growing_storage& operator=(const growing_storage&) = delete;

    growing_storage(growing_storage&& other) noexcept
      : m_items(std::move(other.m_items))
      , m_arena(std::move(other.m_arena))
      , m_min_items_per_block(other.m_min_items_per_block)
    {}

    u32 size() const noexcept { return m_items.size(); }
    u32 min_items_per_block() const noexcept { return m_min_items_per_block; }

    //! Number of items the acquired blocks can hold.
    u32 capacity() const noexcept
    {
        return static_cast<u32>(m_arena.usage().reserved / sizeof(T));
    }

    status can_push() const noexcept { return success(); }

    T* at(u32 index) noexcept { return m_items[index]; }

    const T* at(u32 index) const noexcept { return m_items[index]; }

    expected<T*> push(T&& value) noexcept
    {
        if (m_arena.block_size() == 0u)
            m_arena.init(static_cast<std::size_t>(m_min_items_per_block) *
                           sizeof(T) +
                         alignof(T));

        const bool first = m_items.empty();

        if (not m_items.grow_for(first ? 2 : 1))
            return new_error_code(container_errc::indirection_full);

        auto mem = m_arena.allocate(sizeof(T), alignof(T));
        if (not mem)
            return mem.error();

        if (first)
            m_items.emplace_back(nullptr);

        auto* ptr = std::construct_at(static_cast<T*>(*mem), std::move(value));
        m_items.emplace_back(ptr);

        return ptr;
    }

    memory_usage usage() const noexcept { return m_arena.usage(); }

    //! Destroy the items, keep the first block of the arena.
    void clear() noexcept
    {
        destroy_items();
        m_items.clear();
        m_arena.free_all_but_first();
    }

    //! Destroy the items and release all the blocks.
    void destroy() noexcept
    {
        destroy_items();
        m_items.destroy();
        m_arena.release();
    }

private:
    void destroy_items() noexcept
    {
        if constexpr (not std::is_trivially_destructible_v<T>) {
            for (auto* ptr : m_items)
                if (ptr)
                    std::destroy_at(ptr);
        }
    }
};

template<typename S>
concept handle_map_storage = requires(S& s, const S& cs, u32 i) {
    { S::is_bounded } -> std::convertible_to<bool>;
    typename S::free_list_type;
    { cs.size() } -> std::same_as<u32>;
    { cs.capacity() } -> std::same_as<u32>;
    { s.at(i) } -> std::same_as<typename S::value_type*>;
    { cs.usage() } -> std::same_as<memory_usage>;
    { cs.can_push() } -> std::same_as<status>;
    { s.clear() };
    { s.destroy() };
};

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Handle map........................................................ //
//                                                                    //
////////////////////////////////////////////////////////////////////////

template<typename Map>
class handle_map_iterator;

/**
   @brief A generational handle based object store.

   @c add() returns a @c Handle {index, generation} which stays the permanent
   reference to the item. @c get() resolves the handle into a pointer valid
   until the item is removed or the store is cleared or destroyed. A removed
   slot is recycled by the next @c add() with a generation incremented by one,
   so a stale handle never resolves to the new item.

   The slot 0 is a dummy: a handle with @c index == 0 is never valid.

   Removing an item only writes a tombstone (the @c index of its embedded
   handle is set to 0): the object is not destroyed until the slot is reused
   (move assignment) or the store cleared. The generation is a 32 bits
   counter: after 2^32 reuses of a slot, a very old handle may validate again.

   Not thread safe. Do not add or remove items while iterating.

   @tparam T The item type, with a @c Handle member named @c handle.
   @tparam Handle A struct with two @c u32 members @c index and
   @c generation.
   @tparam Storage @c fixed_storage, @c static_storage or
   @c growing_storage.
 */
template<typename T, typename Handle, typename Storage>
class basic_handle_map
{
    static_assert(handle_item<T, Handle>,
                  "T must embed a member `Handle handle`");
    static_assert(handle_map_storage<Storage>);

public:
    using value_type     = T;
    using handle_type    = Handle;
    using storage_type   = Storage;
    using free_list_type = typename Storage::free_list_type;
    using this_container = basic_handle_map<T, Handle, Storage>;

    static constexpr bool is_bounded = Storage::is_bounded;

private:
    Storage        m_storage;
    free_list_type m_free;

public:
    basic_handle_map() noexcept = default;

    template<typename... Args>
        requires(sizeof...(Args) > 0 and
                 std::is_constructible_v<Storage, Args...>)
    explicit basic_handle_map(Args&&... args) noexcept
      : m_storage(std::forward<Args>(args)...)
    {}

    basic_handle_map(const basic_handle_map&)            = delete;
    basic_handle_map& operator=(const basic_handle_map&) = delete;
    basic_handle_map(basic_handle_map&&) noexcept        = default;

    ~basic_handle_map() noexcept = default;

    //! Add a new item. Reuse the last freed slot if any otherwise append a
    //! new slot.
    //!
    //! @return The handle of the new item or an error if the storage can not
    //! provide a new slot. On error, the store is unchanged.
    expected<handle_type> try_add(T value) noexcept;

    //! Add a new item into a bounded store (@c fixed_storage or
    //! @c static_storage). Exhaustion of the bound is a contract violation
    //! and aborts the program.
    handle_type add(T value) noexcept
        requires(Storage::is_bounded)
    {
        auto ret = try_add(std::move(value));
        fatal::ensure(ret.has_value());

        return *ret;
    }

    //! Add a new item into an unbounded store (@c growing_storage). Memory
    //! exhaustion is returned to the caller.
    expected<handle_type> add(T value) noexcept
        requires(not Storage::is_bounded)
    {
        return try_add(std::move(value));
    }

    //! Get the item from its handle.
    //!
    //! @return @c nullptr if the handle is null, out of range, removed or
    //! superseded by a reuse of the slot.
    T*       get(handle_type h) noexcept;
    const T* get(handle_type h) const noexcept;

    bool valid(handle_type h) const noexcept;

    //! Remove the item. Do nothing if the handle is not valid.
    void remove(handle_type h) noexcept;

    //! Remove all items. Keep the initial memory (the reservation of a
    //! @c static_storage, the first block of a @c growing_storage).
    void clear() noexcept;

    //! Remove all items and release all memory. The store behaves as a newly
    //! constructed store afterwards.
    void destroy() noexcept;

    //! Number of live items.
    unsigned size() const noexcept;
    int      ssize() const noexcept;
    bool     empty() const noexcept;

    //! Number of slots the storage can hold without new memory. The slot 0
    //! is included for @c static_storage and @c growing_storage.
    unsigned capacity() const noexcept;

    memory_usage usage() const noexcept;

    //! Number of slots freed and not yet reused.
    unsigned free_list_size() const noexcept;

    const storage_type& storage() const noexcept { return m_storage; }

    handle_map_iterator<this_container>       make_iter() noexcept;
    handle_map_iterator<const this_container> make_iter() const noexcept;

    template<bool is_const>
    struct iterator_base {
        using iterator_concept = std::forward_iterator_tag;
        using difference_type  = std::ptrdiff_t;
        using value_type       = T;
        using element_type = std::conditional_t<is_const, const T, T>;
        using pointer      = element_type*;
        using reference    = element_type&;
        using container_type =
          std::conditional_t<is_const, const this_container, this_container>;

        iterator_base() noexcept = default;

        iterator_base(container_type* self_, u32 index_) noexcept
          : self{ self_ }
          , index{ index_ }
        {}

        reference operator*() const noexcept
        {
            return *self->m_storage.at(index);
        }

        pointer operator->() const noexcept
        {
            return self->m_storage.at(index);
        }

        iterator_base& operator++() noexcept
        {
            index = self->next_live(index + 1u);
            return *this;
        }

        iterator_base operator++(int) noexcept
        {
            auto old = *this;
            index    = self->next_live(index + 1u);
            return old;
        }

        bool operator==(const iterator_base& other) const noexcept
        {
            return self == other.self and index == other.index;
        }

        container_type* self  = nullptr;
        u32             index = 0;
    };

    using iterator       = iterator_base<false>;
    using const_iterator = iterator_base<true>;

    iterator       begin() noexcept;
    const_iterator begin() const noexcept;
    iterator       end() noexcept;
    const_iterator end() const noexcept;

private:
    template<typename Map>
    friend class handle_map_iterator;

    //! Return the first live slot from @c index or @c m_storage.size().
    u32 next_live(u32 index) const noexcept;
};

/**
   @brief A cursor over the live items of a handle map.

   The cursor starts after the dummy slot and walks the storage in index
   order. It can not be restarted: build a new one with @c make_iter().

   @code
   auto it = map.make_iter();
   entity* e = nullptr;
   entity_handle h;
   while (it.next(e, h)) {
       ...
   }
   @endcode
 */
template<typename Map>
class handle_map_iterator
{
public:
    using map_type    = Map;
    using handle_type = typename std::remove_const_t<Map>::handle_type;
    using value_type =
      std::conditional_t<std::is_const_v<Map>,
                         const typename std::remove_const_t<Map>::value_type,
                         typename std::remove_const_t<Map>::value_type>;

private:
    Map* m_map   = nullptr;
    u32  m_index = 1;

public:
    explicit handle_map_iterator(Map& map) noexcept
      : m_map(&map)
    {}

    //! Yield the next live item and its handle.
    //!
    //! @return false when all the slots are visited, @c item and @c h are
    //! untouched.
    bool next(value_type*& item, handle_type& h) noexcept
    {
        const auto index = m_map->next_live(m_index);
        if (index >= m_map->m_storage.size()) {
            m_index = index;
            return false;
        }

        item    = m_map->m_storage.at(index);
        h       = item->handle;
        m_index = index + 1u;
        return true;
    }

    //! Yield the next live item, see @c next(value_type*&, handle_type&).
    bool next(value_type*& item) noexcept
    {
        handle_type h;
        return next(item, h);
    }
};

template<typename T, typename Handle, int N>
using fixed_handle_map = basic_handle_map<T, Handle, fixed_storage<T, N>>;

template<typename T,
         typename Handle,
         block_provider Provider = default_block_provider>
using static_handle_map =
  basic_handle_map<T, Handle, static_storage<T, Provider>>;

template<typename T,
         typename Handle,
         block_provider Provider = default_block_provider>
using growing_handle_map =
  basic_handle_map<T, Handle, growing_storage<T, Provider>>;

//
// implementation
// basic_handle_map<T, Handle, Storage>
//

template<typename T, typename Handle, typename Storage>
expected<Handle> basic_handle_map<T, Handle, Storage>::try_add(
  T value) noexcept
{
    if (not m_free.empty()) {
        const auto index = m_free.pop();
        auto*      slot  = m_storage.at(index);
        const auto gen   = slot->handle.generation;

        *slot                   = std::move(value);
        slot->handle.index      = index;
        slot->handle.generation = gen + 1u;

        return slot->handle;
    }

    if (auto ret = m_storage.can_push(); not ret)
        return ret.error();

    const auto length = m_storage.size() == 0u ? 2u : m_storage.size() + 1u;
    if (not m_free.reserve(length - 1u))
        return new_error_code(container_errc::free_list_full);

    auto ret = m_storage.push(std::move(value));
    if (not ret)
        return ret.error();

    auto* slot              = *ret;
    slot->handle.index      = m_storage.size() - 1u;
    slot->handle.generation = 1u;

    debug::ensure(slot == m_storage.at(slot->handle.index));

    return slot->handle;
}

template<typename T, typename Handle, typename Storage>
T* basic_handle_map<T, Handle, Storage>::get(Handle h) noexcept
{
    if (h.index == 0u or h.index >= m_storage.size())
        return nullptr;

    auto* slot = m_storage.at(h.index);
    return is_same(slot->handle, h) ? slot : nullptr;
}

template<typename T, typename Handle, typename Storage>
const T* basic_handle_map<T, Handle, Storage>::get(Handle h) const noexcept
{
    if (h.index == 0u or h.index >= m_storage.size())
        return nullptr;

    const auto* slot = m_storage.at(h.index);
    return is_same(slot->handle, h) ? slot : nullptr;
}

template<typename T, typename Handle, typename Storage>
bool basic_handle_map<T, Handle, Storage>::valid(Handle h) const noexcept
{
    return get(h) != nullptr;
}

template<typename T, typename Handle, typename Storage>
void basic_handle_map<T, Handle, Storage>::remove(Handle h) noexcept
{
    if (auto* slot = get(h); slot) {
        m_free.push(h.index);
        slot->handle.index = 0u;
    }
}

template<typename T, typename Handle, typename Storage>
void basic_handle_map<T, Handle, Storage>::clear() noexcept
{
    m_storage.clear();
    m_free.clear();
}

template<typename T, typename Handle, typename Storage>
void basic_handle_map<T, Handle, Storage>::destroy() noexcept
{
    m_storage.destroy();
    m_free.destroy();
}

template<typename T, typename Handle, typename Storage>
unsigned basic_handle_map<T, Handle, Storage>::size() const noexcept
{
    const auto length = m_storage.size() == 0u ? 1u : m_storage.size();

    return length - 1u - m_free.size();
}

template<typename T, typename Handle, typename Storage>
int basic_handle_map<T, Handle, Storage>::ssize() const noexcept
{
    return static_cast<int>(size());
}

template<typename T, typename Handle, typename Storage>
bool basic_handle_map<T, Handle, Storage>::empty() const noexcept
{
    return size() == 0u;
}

template<typename T, typename Handle, typename Storage>
unsigned basic_handle_map<T, Handle, Storage>::capacity() const noexcept
{
    return m_storage.capacity();
}

template<typename T, typename Handle, typename Storage>
memory_usage basic_handle_map<T, Handle, Storage>::usage() const noexcept
{
    return m_storage.usage();
}

template<typename T, typename Handle, typename Storage>
unsigned basic_handle_map<T, Handle, Storage>::free_list_size() const noexcept
{
    return m_free.size();
}

template<typename T, typename Handle, typename Storage>
u32 basic_handle_map<T, Handle, Storage>::next_live(u32 index) const noexcept
{
    const auto length = m_storage.size();

    for (; index < length; ++index) {
        const auto* slot = m_storage.at(index);
        if (slot and slot->handle.index != 0u)
            return index;
    }

    return length;
}

template<typename T, typename Handle, typename Storage>
handle_map_iterator<basic_handle_map<T, Handle, Storage>>
basic_handle_map<T, Handle, Storage>::make_iter() noexcept
{
    return handle_map_iterator<this_container>(*this);
}

template<typename T, typename Handle, typename Storage>
handle_map_iterator<const basic_handle_map<T, Handle, Storage>>
basic_handle_map<T, Handle, Storage>::make_iter() const noexcept
{
    return handle_map_iterator<const this_container>(*this);
}

template<typename T, typename Handle, typename Storage>
typename basic_handle_map<T, Handle, Storage>::iterator
basic_handle_map<T, Handle, Storage>::begin() noexcept
{
    return iterator(this, next_live(1u));
}

template<typename T, typename Handle, typename Storage>
typename basic_handle_map<T, Handle, Storage>::const_iterator
basic_handle_map<T, Handle, Storage>::begin() const noexcept
{
    return const_iterator(this, next_live(1u));
}

template<typename T, typename Handle, typename Storage>
typename basic_handle_map<T, Handle, Storage>::iterator
basic_handle_map<T, Handle, Storage>::end() noexcept
{
    return iterator(this, m_storage.size());
}

template<typename T, typename Handle, typename Storage>
typename basic_handle_map<T, Handle, Storage>::const_iterator
basic_handle_map<T, Handle, Storage>::end() const noexcept
{
    return const_iterator(this, m_storage.size());
}

} // namespace hm

#endif
