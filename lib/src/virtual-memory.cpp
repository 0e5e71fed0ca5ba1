// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <handlemap/format.hpp>
#include <handlemap/memory.hpp>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <utility>

#include <cerrno>
#include <cstdint>

#if defined(HANDLEMAP_NO_VIRTUAL_MEMORY)
#elif defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <sys/mman.h>
#include <unistd.h>
#endif

namespace hm {

namespace vm {

error_code new_system_error(unsigned long value) noexcept
{
    if (std::cmp_less_equal(value, INT16_MAX))
        return new_error_code(value, category::system);

    debug_log("vm: system error {:#x} out of the error code range\n", value);
    return new_error_code(memory_errc::block_allocation_failure);
}

#if defined(HANDLEMAP_NO_VIRTUAL_MEMORY)

static page_info build_page_info() noexcept { return page_info{}; }

expected<std::byte*> reserve(std::size_t /*bytes*/) noexcept
{
    return new_error_code(ENOSYS, category::generic);
}

status commit(std::byte* /*ptr*/, std::size_t /*bytes*/) noexcept
{
    return new_error_code(ENOSYS, category::generic);
}

void release(std::byte* /*ptr*/, std::size_t /*bytes*/) noexcept {}

#elif defined(_WIN32)

static page_info build_page_info() noexcept
{
    SYSTEM_INFO si;
    ::GetSystemInfo(&si);

    return page_info{ .page_size   = si.dwPageSize,
                      .granularity = si.dwAllocationGranularity };
}

expected<std::byte*> reserve(std::size_t bytes) noexcept
{
    debug::ensure(bytes % get_page_info().granularity == 0u);

    auto* ptr = ::VirtualAlloc(nullptr, bytes, MEM_RESERVE, PAGE_NOACCESS);
    if (not ptr)
        return new_system_error(::GetLastError());

    return static_cast<std::byte*>(ptr);
}

status commit(std::byte* ptr, std::size_t bytes) noexcept
{
    debug::ensure(bytes % get_page_info().page_size == 0u);

    if (not ::VirtualAlloc(ptr, bytes, MEM_COMMIT, PAGE_READWRITE))
        return new_system_error(::GetLastError());

    return success();
}

void release(std::byte* ptr, std::size_t /*bytes*/) noexcept
{
    ::VirtualFree(ptr, 0, MEM_RELEASE);
}

#else

static page_info build_page_info() noexcept
{
    const auto size = ::sysconf(_SC_PAGESIZE);
    const auto page = size > 0 ? static_cast<std::size_t>(size) : 4096u;

    return page_info{ .page_size = page, .granularity = page };
}

expected<std::byte*> reserve(std::size_t bytes) noexcept
{
    debug::ensure(bytes % get_page_info().granularity == 0u);

    auto* ptr = ::mmap(nullptr,
                       bytes,
                       PROT_NONE,
                       MAP_PRIVATE | MAP_ANONYMOUS | MAP_NORESERVE,
                       -1,
                       0);

    if (ptr == MAP_FAILED)
        return new_system_error(static_cast<unsigned long>(errno));

    return static_cast<std::byte*>(ptr);
}

status commit(std::byte* ptr, std::size_t bytes) noexcept
{
    debug::ensure(bytes % get_page_info().page_size == 0u);

    if (::mprotect(ptr, bytes, PROT_READ | PROT_WRITE) != 0)
        return new_system_error(static_cast<unsigned long>(errno));

    return success();
}

void release(std::byte* ptr, std::size_t bytes) noexcept
{
    ::munmap(ptr, bytes);
}

#endif

const page_info& get_page_info() noexcept
{
    static const page_info info = build_page_info();

    return info;
}

} // namespace vm

//
// virtual_block_provider
//

std::size_t virtual_block_provider::granularity() noexcept
{
    return vm::get_page_info().granularity;
}

expected<memory_block> virtual_block_provider::acquire(
  std::size_t bytes) noexcept
{
    debug::ensure(bytes > 0u);

    const auto size = round_up(bytes, granularity());
    auto       ptr  = vm::reserve(size);

    if (not ptr) {
        debug_log("virtual-block: fail to reserve {}: {}\n",
                  human_readable_bytes(size),
                  ptr.error());
        return ptr.error();
    }

    if constexpr (debug::enable_memory_log)
        fmt::print(debug::mem_file(),
                   "virtual-block::acquire {} = {}\n",
                   human_readable_bytes(size),
                   static_cast<void*>(*ptr));

    return memory_block{
        .base = *ptr, .reserved = size, .committed = 0u, .used = 0u
    };
}

status virtual_block_provider::commit(memory_block& block,
                                      std::size_t   bytes) noexcept
{
    debug::ensure(block.base != nullptr);

    if (bytes > block.reserved)
        return new_error_code(memory_errc::commit_out_of_reserve);

    if (bytes <= block.committed)
        return success();

    const auto page   = vm::get_page_info().page_size;
    const auto target = std::min(
      block.reserved,
      round_up(round_up(bytes, commit_chunk_size), page));

    if (auto ret = vm::commit(block.base + block.committed,
                              target - block.committed);
        not ret) {
        debug_log("virtual-block: fail to commit {}: {}\n",
                  human_readable_bytes(target - block.committed),
                  ret.error());
        return ret;
    }

    if constexpr (debug::enable_memory_log)
        fmt::print(debug::mem_file(),
                   "virtual-block::commit  {} -> {} {}\n",
                   human_readable_bytes(block.committed),
                   human_readable_bytes(target),
                   static_cast<void*>(block.base));

    block.committed = target;
    return success();
}

void virtual_block_provider::release(memory_block& block) noexcept
{
    if (not block.base)
        return;

    if constexpr (debug::enable_memory_log)
        fmt::print(debug::mem_file(),
                   "virtual-block::release {} {}\n",
                   human_readable_bytes(block.reserved),
                   static_cast<void*>(block.base));

    vm::release(block.base, block.reserved);
    block = memory_block{};
}

} // namespace hm
