// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <handlemap/container.hpp>
#include <handlemap/format.hpp>
#include <handlemap/memory.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <new>

namespace hm {

human_readable_bytes::human_readable_bytes(const std::size_t bytes) noexcept
{
    const auto b  = static_cast<double>(bytes);
    const auto kb = b / 1024.0;
    const auto mb = b / (1024.0 * 1024.0);
    const auto gb = b / (1024.0 * 1024.0 * 1024.0);

    if (gb > 1) {
        size = gb;
        type = human_readable_bytes::display_type::GB;
    } else if (mb > 1.0) {
        size = mb;
        type = human_readable_bytes::display_type::MB;
    } else if (kb > 1.0) {
        size = kb;
        type = human_readable_bytes::display_type::KB;
    } else {
        size = b;
        type = human_readable_bytes::display_type::B;
    }
}

void* new_delete_memory_resource::data::debug_allocate(
  std::size_t bytes,
  std::size_t alignment) noexcept
{
    fmt::print(debug::mem_file(),
               "new-delete::allocate   {},{} {},{}\n",
               human_readable_bytes(bytes),
               human_readable_bytes(alignment),
               human_readable_bytes(allocated),
               human_readable_bytes(deallocated));

    auto ptr =
      ::operator new(bytes, std::align_val_t{ alignment }, std::nothrow);
    if (ptr)
        allocated += bytes;

    fmt::print(debug::mem_file(),
               "                       {},{} {},{} = {}\n",
               human_readable_bytes(bytes),
               human_readable_bytes(alignment),
               human_readable_bytes(allocated),
               human_readable_bytes(deallocated),
               ptr);

    return ptr;
}

void new_delete_memory_resource::data::debug_deallocate(
  void*       ptr,
  std::size_t bytes,
  std::size_t alignment) noexcept
{
    fmt::print(debug::mem_file(),
               "new-delete::deallocate {},{} {},{} {}\n",
               human_readable_bytes(bytes),
               human_readable_bytes(alignment),
               human_readable_bytes(allocated),
               human_readable_bytes(deallocated),
               ptr);

    if (ptr) {
        deallocated += bytes;
        ::operator delete(ptr, std::align_val_t{ alignment });
    }

    fmt::print(debug::mem_file(),
               "                       {},{} {},{}\n",
               human_readable_bytes(bytes),
               human_readable_bytes(alignment),
               human_readable_bytes(allocated),
               human_readable_bytes(deallocated));
}

//
// heap_block_provider
//

std::size_t heap_block_provider::granularity() noexcept
{
    return block_alignment;
}

expected<memory_block> heap_block_provider::acquire(std::size_t bytes) noexcept
{
    debug::ensure(bytes > 0u);

    const auto size = round_up(bytes, granularity());
    auto*      ptr  = static_cast<std::byte*>(::operator new(
      size, std::align_val_t{ block_alignment }, std::nothrow));

    if (not ptr) {
        debug_log("heap-block: fail to allocate {}\n",
                  human_readable_bytes(size));
        return new_error_code(memory_errc::block_allocation_failure);
    }

    if constexpr (debug::enable_memory_log)
        fmt::print(debug::mem_file(),
                   "heap-block::acquire    {} = {}\n",
                   human_readable_bytes(size),
                   static_cast<void*>(ptr));

    return memory_block{
        .base = ptr, .reserved = size, .committed = size, .used = 0u
    };
}

status heap_block_provider::commit(memory_block& block,
                                   std::size_t   bytes) noexcept
{
    if (bytes > block.reserved)
        return new_error_code(memory_errc::commit_out_of_reserve);

    return success();
}

void heap_block_provider::release(memory_block& block) noexcept
{
    if (not block.base)
        return;

    if constexpr (debug::enable_memory_log)
        fmt::print(debug::mem_file(),
                   "heap-block::release    {} {}\n",
                   human_readable_bytes(block.reserved),
                   static_cast<void*>(block.base));

    ::operator delete(block.base, std::align_val_t{ block_alignment });
    block = memory_block{};
}

} // namespace hm
