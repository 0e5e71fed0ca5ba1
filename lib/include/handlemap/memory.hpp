// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_MEMORY_2024
#define ORG_HANDLEMAP_MEMORY_2024

#include <handlemap/container.hpp>
#include <handlemap/error.hpp>

#include <type_traits>
#include <utility>

#include <cstddef>

namespace hm {

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Virtual memory.................................................... //
//                                                                    //
////////////////////////////////////////////////////////////////////////

namespace vm {

struct page_info {
    std::size_t page_size   = 4096u; //!< Commit unit.
    std::size_t granularity = 4096u; //!< Reservation unit (64KiB on Windows).
};

//! Query once the operating system for the page size and the allocation
//! granularity.
const page_info& get_page_info() noexcept;

//! Reserve @c bytes of address space without physical memory. @c bytes must
//! be a multiple of @c page_info::granularity.
expected<std::byte*> reserve(std::size_t bytes) noexcept;

//! Back the range [ptr, ptr + bytes) of a reservation with physical memory.
//! @c ptr and @c bytes must be multiples of @c page_info::page_size.
status commit(std::byte* ptr, std::size_t bytes) noexcept;

//! Release the entire reservation starting at @c ptr.
void release(std::byte* ptr, std::size_t bytes) noexcept;

//! Build a @c category::system error code from an operating system error
//! value (@c errno or @c GetLastError()). A value out of the @c error_code
//! range is logged and reported as @c memory_errc::block_allocation_failure.
error_code new_system_error(unsigned long value) noexcept;

} // namespace vm

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Block providers................................................... //
//                                                                    //
////////////////////////////////////////////////////////////////////////

//! A contiguous memory block owned by an arena.
//!
//! @verbatim
//! base                                                    base + reserved
//! +-------------------+---------------------+-----------------------+
//! |       used        |  committed, unused  |   reserved only       |
//! +-------------------+---------------------+-----------------------+
//! @endverbatim
struct memory_block {
    std::byte*  base      = nullptr;
    std::size_t reserved  = 0;
    std::size_t committed = 0;
    std::size_t used      = 0;
};

//! Blocks are address space reservations, physical memory is committed page
//! by page when the arena grows. Addresses of a block never change.
struct virtual_block_provider {
    static constexpr std::size_t default_block_size = 1024u * 1024u;
    static constexpr std::size_t commit_chunk_size  = 64u * 1024u;

    static std::size_t granularity() noexcept;

    //! Reserve a block of @c round_up(bytes, granularity()) bytes. Nothing is
    //! committed.
    static expected<memory_block> acquire(std::size_t bytes) noexcept;

    //! Ensure at least @c bytes of the block are committed.
    static status commit(memory_block& block, std::size_t bytes) noexcept;

    static void release(memory_block& block) noexcept;
};

//! Blocks are plain heap allocations for platforms without virtual memory.
//! A block is committed entirely when acquired, so the default block is
//! smaller than the virtual one to bound the memory committed eagerly.
struct heap_block_provider {
    static constexpr std::size_t default_block_size = 64u * 1024u;
    static constexpr std::size_t block_alignment    = 64u;

    static std::size_t granularity() noexcept;

    static expected<memory_block> acquire(std::size_t bytes) noexcept;

    static status commit(memory_block& block, std::size_t bytes) noexcept;

    static void release(memory_block& block) noexcept;
};

using default_block_provider = std::conditional_t<has_virtual_memory,
                                                  virtual_block_provider,
                                                  heap_block_provider>;

template<typename P>
concept block_provider = requires(memory_block& b, std::size_t n) {
    { P::default_block_size } -> std::convertible_to<std::size_t>;
    { P::granularity() } -> std::same_as<std::size_t>;
    { P::acquire(n) } -> std::same_as<expected<memory_block>>;
    { P::commit(b, n) } -> std::same_as<status>;
    { P::release(b) };
};

////////////////////////////////////////////////////////////////////////
//                                                                    //
// Arenas............................................................ //
//                                                                    //
////////////////////////////////////////////////////////////////////////

/**
   @brief An arena made of a single reservation serving a single allocation.

   The buffer starts at the beginning of the reservation and @c resize()
   extends it in place by committing more pages. Since nothing else is
   allocated from the arena, the buffer never moves: pointers into it stay
   valid until @c release().
 */
template<block_provider Provider = default_block_provider>
class static_arena
{
public:
    using provider_type = Provider;

private:
    memory_block m_block;

public:
    constexpr static_arena() noexcept = default;
    ~static_arena() noexcept { release(); }

    static_arena(const static_arena&)            = delete;
    static_arena& operator=(const static_arena&) = delete;

    static_arena(static_arena&& other) noexcept
      : m_block(std::exchange(other.m_block, memory_block{}))
    {}

    //! Reserve the address space. The reservation is rounded to the
    //! provider granularity.
    status init(std::size_t reserve_bytes) noexcept
    {
        debug::ensure(not is_initialized());
        debug::ensure(reserve_bytes > 0u);

        auto block = provider_type::acquire(reserve_bytes);
        if (not block)
            return block.error();

        m_block = *block;
        return success();
    }

    //! Grow or shrink the allocation in place. Memory is committed but never
    //! decommitted.
    status resize(std::size_t bytes) noexcept
    {
        if (not is_initialized())
            return new_error_code(memory_errc::not_initialized);

        if (bytes > m_block.reserved)
            return new_error_code(memory_errc::commit_out_of_reserve);

        if (bytes > m_block.committed) {
            if (auto ret = provider_type::commit(m_block, bytes); not ret)
                return ret;
        }

        m_block.used = bytes;
        return success();
    }

    //! Forget the allocation but keep the reservation and the committed
    //! pages.
    void reset() noexcept { m_block.used = 0; }

    //! Release the reservation.
    void release() noexcept
    {
        if (m_block.base)
            provider_type::release(m_block);

        m_block = memory_block{};
    }

    bool       is_initialized() const noexcept { return m_block.base != nullptr; }
    std::byte* data() const noexcept { return m_block.base; }

    std::size_t reserved() const noexcept { return m_block.reserved; }
    std::size_t committed() const noexcept { return m_block.committed; }
    std::size_t used() const noexcept { return m_block.used; }

    memory_usage usage() const noexcept
    {
        return memory_usage{ .reserved  = m_block.reserved,
                             .committed = m_block.committed,
                             .used      = m_block.used };
    }
};

/**
   @brief A bump allocator over a list of blocks.

   Allocations are linear in the last block. When the last block is full, a
   new block of @c block_size() bytes is acquired. Allocations are never
   freed individually and never relocated: @c free_all_but_first() and
   @c release() free them in bulk.
 */
template<block_provider Provider = default_block_provider>
class growing_arena
{
public:
    using provider_type = Provider;

private:
    vector<memory_block> m_blocks;
    std::size_t          m_block_size = 0;

public:
    constexpr growing_arena() noexcept = default;
    ~growing_arena() noexcept { release(); }

    growing_arena(const growing_arena&)            = delete;
    growing_arena& operator=(const growing_arena&) = delete;

    growing_arena(growing_arena&& other) noexcept
      : m_blocks(std::move(other.m_blocks))
      , m_block_size(std::exchange(other.m_block_size, 0))
    {}

    //! Set the size of the blocks. No memory is acquired before the first
    //! @c allocate().
    void init(std::size_t min_block_size) noexcept
    {
        debug::ensure(m_blocks.empty());

        const auto bytes = min_block_size > provider_type::default_block_size
                             ? min_block_size
                             : provider_type::default_block_size;

        m_block_size = round_up(bytes, provider_type::granularity());
    }

    //! Allocate @c bytes aligned on @c alignment from the last block or from
    //! a new block. On failure, the arena is left unchanged.
    expected<void*> allocate(std::size_t bytes,
                             std::size_t alignment) noexcept
    {
        debug::ensure(bytes > 0u);
        debug::ensure(alignment > 0u and (alignment & (alignment - 1u)) == 0u);

        if (m_block_size == 0u)
            return new_error_code(memory_errc::not_initialized);

        if (bytes + alignment > m_block_size)
            return new_error_code(memory_errc::block_too_large);

        if (not m_blocks.empty()) {
            auto& last = m_blocks.back();
            if (auto* ptr = try_allocate(last, bytes, alignment))
                return static_cast<void*>(ptr);
        }

        if (not m_blocks.grow_for(1))
            return new_error_code(memory_errc::block_allocation_failure);

        auto block = provider_type::acquire(m_block_size);
        if (not block)
            return block.error();

        auto* ptr = try_allocate(*block, bytes, alignment);
        if (not ptr) {
            provider_type::release(*block);
            return new_error_code(memory_errc::block_allocation_failure);
        }

        m_blocks.emplace_back(*block);
        return static_cast<void*>(ptr);
    }

    //! Release all blocks except the first which is kept, committed, for
    //! the next allocations.
    void free_all_but_first() noexcept
    {
        while (m_blocks.size() > 1u) {
            provider_type::release(m_blocks.back());
            m_blocks.pop_back();
        }

        if (not m_blocks.empty())
            m_blocks[0].used = 0;
    }

    //! Release all blocks and the block list itself.
    void release() noexcept
    {
        for (auto& block : m_blocks)
            provider_type::release(block);

        m_blocks.destroy();
    }

    std::size_t block_size() const noexcept { return m_block_size; }
    unsigned    block_count() const noexcept { return m_blocks.size(); }

    memory_usage usage() const noexcept
    {
        memory_usage ret;

        for (const auto& block : m_blocks)
            ret += memory_usage{ .reserved  = block.reserved,
                                 .committed = block.committed,
                                 .used      = block.used };

        return ret;
    }

private:
    //! Return @c nullptr if the block is too small or if the commit fails.
    static std::byte* try_allocate(memory_block& block,
                                   std::size_t   bytes,
                                   std::size_t   alignment) noexcept
    {
        auto* first = align_forward(block.base + block.used, alignment);
        const auto end =
          static_cast<std::size_t>(first - block.base) + bytes;

        if (end > block.reserved)
            return nullptr;

        if (end > block.committed) {
            if (not provider_type::commit(block, end))
                return nullptr;
        }

        block.used = end;
        return first;
    }
};

} // namespace hm

#endif
