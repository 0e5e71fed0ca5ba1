// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_CONTAINER_2024
#define ORG_HANDLEMAP_CONTAINER_2024

#include <handlemap/macros.hpp>

#include <algorithm>
#include <concepts>
#include <limits>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace hm {

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Helpers functions................................................. //
//                                                                    //
////////////////////////////////////////////////////////////////////////

//! Returns the rounded-up multiple of @c multiple.
inline constexpr std::size_t round_up(std::size_t n,
                                      std::size_t multiple) noexcept
{
    return ((n + multiple - 1u) / multiple) * multiple;
}

//! Returns the pointer @c p aligned to the next @c alignment boundary.
//! @c alignment must be a power of two.
inline std::byte* align_forward(std::byte* p, std::size_t alignment) noexcept
{
    const auto addr    = reinterpret_cast<std::uintptr_t>(p);
    const auto aligned = (addr + alignment - 1u) & ~(alignment - 1u);

    return p + (aligned - addr);
}

/**
   Build an human readable version of a number of bytes.

   According to the number of bytes, it will produce an easy to read value of
   byte, kilobytes, megabytes etc.

   A fmt::formatter is provide in the file @c format.hpp
 */
struct human_readable_bytes {
    enum class display_type { B, KB, MB, GB };

    explicit human_readable_bytes(std::size_t bytes) noexcept;

    double       size;
    display_type type;
};

//! Memory introspection of a store or an arena. @c reserved is the address
//! space claimed, @c committed the part backed by physical memory and @c used
//! the part handed out to items.
struct memory_usage {
    std::size_t reserved  = 0;
    std::size_t committed = 0;
    std::size_t used      = 0;

    constexpr memory_usage& operator+=(const memory_usage& other) noexcept
    {
        reserved += other.reserved;
        committed += other.committed;
        used += other.used;
        return *this;
    }
};

class new_delete_memory_resource
{
public:
    class data
    {
    public:
        void* allocate(
          std::size_t bytes,
          std::size_t alignment = alignof(std::max_align_t)) noexcept
        {
            if constexpr (debug::enable_memory_log == true and
                          debug::enable_ensure == true) {
                return debug_allocate(bytes, alignment);
            } else {
                return ::operator new(
                  bytes, std::align_val_t{ alignment }, std::nothrow);
            }
        }

        void deallocate(
          void*       p,
          std::size_t bytes,
          std::size_t alignment = alignof(std::max_align_t)) noexcept
        {
            if constexpr (debug::enable_memory_log == true and
                          debug::enable_ensure == true) {
                debug_deallocate(p, bytes, alignment);
            } else {
                ::operator delete(p, std::align_val_t{ alignment });
            }
        }

    private:
        void* debug_allocate(std::size_t bytes, std::size_t alignment) noexcept;
        void  debug_deallocate(void*       p,
                               std::size_t bytes,
                               std::size_t alignment) noexcept;

        std::size_t allocated   = 0;
        std::size_t deallocated = 0;
    };

    static data& instance() noexcept
    {
        static data d;
        return d;
    }
};

/**
   A stateless allocator class to wrap static memory resource.

   @verbatim
   +-----------+        +---------+        +----------+
   |vector<T,A>+------->|allocator+------->|new-delete|
   +-----------+ static +---------+ static +----------+
   @endverbatim

   Enable the @c HANDLEMAP_ENABLE_DEBUG preprocessor variable to enable a debug
   for all allocation/deallocation for each memory resource.
 */
template<typename MemoryResource = new_delete_memory_resource>
struct allocator {
    using size_type            = std::size_t;
    using difference_type      = std::ptrdiff_t;
    using memory_resource_type = MemoryResource;

    static void* allocate(
      std::size_t bytes,
      std::size_t alignment = alignof(std::max_align_t)) noexcept
    {
        debug::ensure(bytes != 0);

        return bytes
                 ? memory_resource_type::instance().allocate(bytes, alignment)
                 : nullptr;
    }

    static void deallocate(
      void*       p,
      std::size_t bytes,
      std::size_t alignment = alignof(std::max_align_t)) noexcept
    {
        debug::ensure((p != nullptr and bytes > 0) or
                      (p == nullptr and bytes == 0));

        if (p)
            memory_resource_type::instance().deallocate(p, bytes, alignment);
    }
};

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Container: vector, small_vector and free_list..................... //
//                                                                    //
////////////////////////////////////////////////////////////////////////

/**
   @brief A vector like class with dynamic allocation.

   Unlike @c std::vector, the growth functions never throw: @c reserve()
   returns false if the allocator fails and the vector is left untouched. Use
   @c can_alloc() or @c reserve() before @c emplace_back().

   @tparam T Any type (trivial or not).
 */
template<typename T, typename A = allocator<new_delete_memory_resource>>
class vector
{
public:
    using value_type      = T;
    using size_type       = std::uint32_t;
    using index_type      = std::make_signed_t<size_type>;
    using iterator        = T*;
    using const_iterator  = const T*;
    using reference       = T&;
    using const_reference = const T&;
    using pointer         = T*;
    using const_pointer   = const T*;
    using allocator_type  = A;
    using this_container  = vector<T, A>;

private:
    static_assert(std::is_nothrow_destructible_v<T> ||
                  std::is_trivially_destructible_v<T>);

    T* m_data = nullptr;

    index_type m_size     = 0;
    index_type m_capacity = 0;

public:
    constexpr vector() noexcept = default;
    ~vector() noexcept;

    vector(const vector& other) noexcept            = delete;
    vector& operator=(const vector& other) noexcept = delete;
    constexpr vector(vector&& other) noexcept;

    bool reserve(std::integral auto new_capacity) noexcept;

    //! Grow the capacity to at least @c size + @c number elements using the
    //! 3/2 growth policy.
    bool grow_for(std::integral auto number = 1) noexcept;

    void destroy() noexcept; // clear all elements and free memory (size
                             // = 0, capacity = 0 after).

    constexpr void clear() noexcept; // clear all elements (size = 0 after).

    constexpr T*       data() noexcept;
    constexpr const T* data() const noexcept;

    constexpr reference       back() noexcept;
    constexpr const_reference back() const noexcept;

    constexpr reference       operator[](std::integral auto index) noexcept;
    constexpr const_reference operator[](
      std::integral auto index) const noexcept;

    constexpr iterator       begin() noexcept;
    constexpr const_iterator begin() const noexcept;
    constexpr iterator       end() noexcept;
    constexpr const_iterator end() const noexcept;

    constexpr bool     can_alloc(std::integral auto number = 1) const noexcept;
    constexpr unsigned size() const noexcept;
    constexpr int      ssize() const noexcept;
    constexpr int      capacity() const noexcept;
    constexpr bool     empty() const noexcept;
    constexpr bool     full() const noexcept;

    //! Construct a new element at the end of the vector. The capacity must
    //! be available, see @c can_alloc() and @c grow_for().
    template<typename... Args>
    constexpr reference emplace_back(Args&&... args) noexcept;

    constexpr void pop_back() noexcept;

private:
    int compute_new_capacity(int size) const noexcept;
};

//! @brief A vector like class but without dynamic allocation.
//! @tparam T Any type (trivial or not).
//! @tparam length The capacity of the vector.
template<typename T, int length>
class small_vector
{
public:
    static_assert(length >= 1);
    static_assert(std::is_nothrow_destructible_v<T> ||
                  std::is_trivially_destructible_v<T>);

    using value_type = T;
    using size_type  = std::conditional_t<
       (length < std::numeric_limits<std::uint8_t>::max()),
       std::uint8_t,
       std::conditional_t<(length < std::numeric_limits<std::uint16_t>::max()),
                          std::uint16_t,
                          std::uint32_t>>;
    using index_type = std::make_signed_t<size_type>;

private:
    alignas(T) std::byte m_buffer[length * sizeof(T)];
    size_type m_size = 0;

public:
    using iterator        = T*;
    using const_iterator  = const T*;
    using reference       = T&;
    using const_reference = const T&;
    using pointer         = T*;
    using const_pointer   = const T*;

    constexpr small_vector() noexcept = default;
    constexpr ~small_vector() noexcept;

    small_vector(const small_vector& other) noexcept            = delete;
    small_vector& operator=(const small_vector& other) noexcept = delete;

    constexpr void clear() noexcept;

    constexpr reference       back() noexcept;
    constexpr const_reference back() const noexcept;

    constexpr T*       data() noexcept;
    constexpr const T* data() const noexcept;

    constexpr reference       operator[](std::integral auto index) noexcept;
    constexpr const_reference operator[](
      std::integral auto index) const noexcept;

    constexpr iterator       begin() noexcept;
    constexpr const_iterator begin() const noexcept;
    constexpr iterator       end() noexcept;
    constexpr const_iterator end() const noexcept;

    constexpr bool can_alloc(std::integral auto number = 1) const noexcept;
    constexpr int  available() const noexcept;
    constexpr unsigned size() const noexcept;
    constexpr int      ssize() const noexcept;
    constexpr int      capacity() const noexcept;
    constexpr bool     empty() const noexcept;
    constexpr bool     full() const noexcept;

    template<typename... Args>
    constexpr reference emplace_back(Args&&... args) noexcept;

    constexpr void pop_back() noexcept;
};

//! @brief A stack of reusable slot indices.
//!
//! The last removed index is the first reused (LIFO) to keep the recently
//! touched slot hot in cache. The same logic is shared by the three stores:
//! the @c fixed_handle_map uses a @c small_vector, the others a @c vector.
//!
//! @tparam Container @c small_vector<u32, N> or @c vector<u32, A>.
template<typename Container>
class free_list
{
public:
    using container_type = Container;
    using index_type     = std::uint32_t;

private:
    container_type m_indices;

public:
    constexpr free_list() noexcept = default;

    //! Ensure the capacity is at least @c number indices, so @c number calls
    //! to @c push() on an empty list can not fail. A dynamic container grows
    //! by 3/2. For an inline container, returns true if the @c number fits.
    bool reserve(std::integral auto number) noexcept
    {
        if (std::cmp_less_equal(number, m_indices.capacity()))
            return true;

        if constexpr (requires(container_type& c) { c.reserve(1); }) {
            const auto capacity = m_indices.capacity();
            const auto grown    = capacity ? capacity + capacity / 2 : 8;

            return std::cmp_less(number, grown) ? m_indices.reserve(grown)
                                                : m_indices.reserve(number);
        } else {
            return false;
        }
    }

    void push(index_type index) noexcept
    {
        debug::ensure(index != 0u);
        fatal::ensure(m_indices.can_alloc(1));

        m_indices.emplace_back(index);
    }

    //! Pop the last pushed index. The list must not be empty.
    index_type pop() noexcept
    {
        debug::ensure(not m_indices.empty());

        const auto index = m_indices.back();
        m_indices.pop_back();
        return index;
    }

    bool     empty() const noexcept { return m_indices.empty(); }
    unsigned size() const noexcept { return m_indices.size(); }
    int      capacity() const noexcept { return m_indices.capacity(); }

    void clear() noexcept { m_indices.clear(); }

    void destroy() noexcept
    {
        if constexpr (requires(container_type& c) { c.destroy(); })
            m_indices.destroy();
        else
            m_indices.clear();
    }
};

//
// implementation
// vector<T, A>
//

template<typename T, typename A>
inline vector<T, A>::~vector() noexcept
{
    destroy();
}

template<typename T, typename A>
inline constexpr vector<T, A>::vector(vector<T, A>&& other) noexcept
  : m_data(std::exchange(other.m_data, nullptr))
  , m_size(std::exchange(other.m_size, 0))
  , m_capacity(std::exchange(other.m_capacity, 0))
{}

template<typename T, typename A>
bool vector<T, A>::reserve(std::integral auto new_capacity) noexcept
{
    if (std::cmp_greater_equal(new_capacity,
                               std::numeric_limits<index_type>::max()))
        return false;

    if (std::cmp_greater(new_capacity, m_capacity)) {
        T* new_data = reinterpret_cast<T*>(
          A::allocate(sizeof(T) * new_capacity, alignof(T)));
        if (!new_data)
            return false;

        if constexpr (std::is_move_constructible_v<T>)
            std::uninitialized_move_n(data(), m_size, new_data);
        else
            std::uninitialized_copy_n(data(), m_size, new_data);

        std::destroy_n(data(), m_size);

        if (m_data)
            A::deallocate(m_data, sizeof(T) * m_capacity, alignof(T));

        m_data     = new_data;
        m_capacity = static_cast<index_type>(new_capacity);
    }

    return true;
}

template<typename T, typename A>
bool vector<T, A>::grow_for(std::integral auto number) noexcept
{
    if (can_alloc(number))
        return true;

    const auto needed = static_cast<ssz>(m_size) + static_cast<ssz>(number);
    if (std::cmp_greater_equal(needed, std::numeric_limits<index_type>::max()))
        return false;

    return reserve(compute_new_capacity(static_cast<int>(needed)));
}

template<typename T, typename A>
inline void vector<T, A>::destroy() noexcept
{
    clear();

    if (m_data)
        A::deallocate(m_data, m_capacity * sizeof(T), alignof(T));

    m_data     = nullptr;
    m_size     = 0;
    m_capacity = 0;
}

template<typename T, typename A>
inline constexpr void vector<T, A>::clear() noexcept
{
    std::destroy_n(data(), m_size);

    m_size = 0;
}

template<typename T, typename A>
inline constexpr T* vector<T, A>::data() noexcept
{
    return m_data;
}

template<typename T, typename A>
inline constexpr const T* vector<T, A>::data() const noexcept
{
    return m_data;
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::reference vector<T, A>::back() noexcept
{
    debug::ensure(m_size > 0);
    return m_data[m_size - 1];
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::const_reference vector<T, A>::back()
  const noexcept
{
    debug::ensure(m_size > 0);
    return m_data[m_size - 1];
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::reference vector<T, A>::operator[](
  std::integral auto index) noexcept
{
    debug::ensure(std::cmp_greater_equal(index, 0));
    debug::ensure(std::cmp_less(index, m_size));

    return data()[index];
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::const_reference
vector<T, A>::operator[](std::integral auto index) const noexcept
{
    debug::ensure(std::cmp_greater_equal(index, 0));
    debug::ensure(std::cmp_less(index, m_size));

    return data()[index];
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::iterator vector<T, A>::begin() noexcept
{
    return data();
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::const_iterator vector<T, A>::begin()
  const noexcept
{
    return data();
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::iterator vector<T, A>::end() noexcept
{
    return data() + m_size;
}

template<typename T, typename A>
inline constexpr typename vector<T, A>::const_iterator vector<T, A>::end()
  const noexcept
{
    return data() + m_size;
}

template<typename T, typename A>
inline constexpr bool vector<T, A>::can_alloc(
  std::integral auto number) const noexcept
{
    return std::cmp_greater_equal(m_capacity - m_size, number);
}

template<typename T, typename A>
inline constexpr unsigned vector<T, A>::size() const noexcept
{
    return static_cast<unsigned>(m_size);
}

template<typename T, typename A>
inline constexpr int vector<T, A>::ssize() const noexcept
{
    return m_size;
}

template<typename T, typename A>
inline constexpr int vector<T, A>::capacity() const noexcept
{
    return m_capacity;
}

template<typename T, typename A>
inline constexpr bool vector<T, A>::empty() const noexcept
{
    return m_size == 0;
}

template<typename T, typename A>
inline constexpr bool vector<T, A>::full() const noexcept
{
    return m_size >= m_capacity;
}

template<typename T, typename A>
template<typename... Args>
inline constexpr typename vector<T, A>::reference vector<T, A>::emplace_back(
  Args&&... args) noexcept
{
    static_assert(std::is_constructible_v<T, Args...> ||
                    std::is_nothrow_constructible_v<T, Args...>,
                  "T must but trivially or nothrow constructible from this "
                  "argument(s)");

    debug::ensure(can_alloc(1));

    std::construct_at(data() + m_size, std::forward<Args>(args)...);

    ++m_size;

    return data()[m_size - 1];
}

template<typename T, typename A>
inline constexpr void vector<T, A>::pop_back() noexcept
{
    debug::ensure(m_size);

    if (m_size) {
        std::destroy_at(data() + m_size - 1);
        --m_size;
    }
}

template<typename T, typename A>
int vector<T, A>::compute_new_capacity(int size) const noexcept
{
    int new_capacity = m_capacity ? (m_capacity + m_capacity / 2) : 8;
    return new_capacity > size ? new_capacity : size;
}

//
// implementation
// small_vector<T, length>
//

template<typename T, int length>
inline constexpr small_vector<T, length>::~small_vector() noexcept
{
    clear();
}

template<typename T, int length>
inline constexpr void small_vector<T, length>::clear() noexcept
{
    std::destroy_n(data(), m_size);

    m_size = 0;
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::reference
small_vector<T, length>::back() noexcept
{
    debug::ensure(m_size > 0);
    return data()[m_size - 1];
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::const_reference
small_vector<T, length>::back() const noexcept
{
    debug::ensure(m_size > 0);
    return data()[m_size - 1];
}

template<typename T, int length>
inline constexpr T* small_vector<T, length>::data() noexcept
{
    return reinterpret_cast<T*>(&m_buffer[0]);
}

template<typename T, int length>
inline constexpr const T* small_vector<T, length>::data() const noexcept
{
    return reinterpret_cast<const T*>(&m_buffer[0]);
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::reference
small_vector<T, length>::operator[](std::integral auto index) noexcept
{
    debug::ensure(std::cmp_greater_equal(index, 0));
    debug::ensure(std::cmp_less(index, m_size));

    return data()[index];
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::const_reference
small_vector<T, length>::operator[](std::integral auto index) const noexcept
{
    debug::ensure(std::cmp_greater_equal(index, 0));
    debug::ensure(std::cmp_less(index, m_size));

    return data()[index];
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::iterator
small_vector<T, length>::begin() noexcept
{
    return data();
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::const_iterator
small_vector<T, length>::begin() const noexcept
{
    return data();
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::iterator
small_vector<T, length>::end() noexcept
{
    return data() + m_size;
}

template<typename T, int length>
inline constexpr typename small_vector<T, length>::const_iterator
small_vector<T, length>::end() const noexcept
{
    return data() + m_size;
}

template<typename T, int length>
inline constexpr bool small_vector<T, length>::can_alloc(
  std::integral auto number) const noexcept
{
    return std::cmp_greater_equal(length - m_size, number);
}

template<typename T, int length>
inline constexpr int small_vector<T, length>::available() const noexcept
{
    return length - m_size;
}

template<typename T, int length>
inline constexpr unsigned small_vector<T, length>::size() const noexcept
{
    return static_cast<unsigned>(m_size);
}

template<typename T, int length>
inline constexpr int small_vector<T, length>::ssize() const noexcept
{
    return static_cast<int>(m_size);
}

template<typename T, int length>
inline constexpr int small_vector<T, length>::capacity() const noexcept
{
    return length;
}

template<typename T, int length>
inline constexpr bool small_vector<T, length>::empty() const noexcept
{
    return m_size == 0;
}

template<typename T, int length>
inline constexpr bool small_vector<T, length>::full() const noexcept
{
    return m_size >= length;
}

template<typename T, int length>
template<typename... Args>
inline constexpr typename small_vector<T, length>::reference
small_vector<T, length>::emplace_back(Args&&... args) noexcept
{
    static_assert(std::is_nothrow_constructible_v<T, Args...>,
                  "T must but trivially or nothrow constructible from this "
                  "argument(s)");

    debug::ensure(can_alloc(1));

    std::construct_at(data() + m_size, std::forward<Args>(args)...);
    ++m_size;

    return data()[m_size - 1];
}

template<typename T, int length>
inline constexpr void small_vector<T, length>::pop_back() noexcept
{
    debug::ensure(m_size);

    if (m_size) {
        std::destroy_at(data() + m_size - 1);
        --m_size;
    }
}

} // namespace hm

#endif
