// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <handlemap/format.hpp>
#include <handlemap/memory.hpp>

#include <boost/ut.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <cstring>

template<typename Provider>
static void check_static_arena()
{
    using namespace boost::ut;

    hm::static_arena<Provider> arena;
    expect(not arena.is_initialized());
    expect(arena.resize(16u) ==
           hm::error_code(hm::memory_errc::not_initialized,
                          hm::category::memory));

    expect(arena.init(10'000u).has_value() >> fatal);
    expect(arena.is_initialized());
    expect(eq(arena.reserved(), hm::round_up(10'000u, Provider::granularity())));
    expect(eq(arena.used(), 0u));

    auto* first = arena.data();
    expect(arena.resize(100u).has_value() >> fatal);
    expect(arena.committed() >= 100u);
    std::memset(arena.data(), 0xfe, 100u);

    expect(arena.resize(arena.reserved()).has_value() >> fatal);
    expect(eq(arena.committed(), arena.reserved()));
    expect(arena.data() == first);
    expect(eq(static_cast<unsigned>(arena.data()[99]), 0xfeu));
    std::memset(arena.data(), 0, arena.reserved());

    expect(arena.resize(arena.reserved() + 1u) ==
           hm::error_code(hm::memory_errc::commit_out_of_reserve,
                          hm::category::memory));
    expect(eq(arena.used(), arena.reserved()));

    arena.reset();
    expect(eq(arena.used(), 0u));
    expect(eq(arena.committed(), arena.reserved()));

    hm::static_arena<Provider> other(std::move(arena));
    expect(not arena.is_initialized());
    expect(other.is_initialized());
    expect(other.data() == first);

    other.release();
    expect(not other.is_initialized());
    expect(eq(other.usage().reserved, 0u));
}

template<typename Provider>
static void check_growing_arena()
{
    using namespace boost::ut;

    hm::growing_arena<Provider> arena;
    expect(arena.allocate(8u, 8u) ==
           hm::error_code(hm::memory_errc::not_initialized,
                          hm::category::memory));

    arena.init(1u);
    expect(eq(arena.block_size(), Provider::default_block_size));
    expect(eq(arena.block_count(), 0u));

    auto a = arena.allocate(24u, 8u);
    expect(a.has_value() >> fatal);
    expect(eq(arena.block_count(), 1u));
    expect(eq(reinterpret_cast<std::uintptr_t>(*a) % 8u, 0u));

    auto b = arena.allocate(1u, 1u);
    auto c = arena.allocate(16u, 64u);
    expect(b.has_value() >> fatal);
    expect(c.has_value() >> fatal);
    expect(eq(reinterpret_cast<std::uintptr_t>(*c) % 64u, 0u));
    expect(static_cast<std::byte*>(*b) >= static_cast<std::byte*>(*a) + 24);
    expect(static_cast<std::byte*>(*c) > static_cast<std::byte*>(*b));

    std::memset(*a, 1, 24u);
    std::memset(*c, 2, 16u);

    expect(arena.allocate(arena.block_size(), 1u) ==
           hm::error_code(hm::memory_errc::block_too_large,
                          hm::category::memory));
    expect(eq(arena.block_count(), 1u));

    // Fill the first block, the next allocation acquires a second block and
    // the previous addresses are untouched.
    const auto half = arena.block_size() / 2u;
    expect(arena.allocate(half, 8u).has_value() >> fatal);
    auto d = arena.allocate(half, 8u);
    expect(d.has_value() >> fatal);
    expect(eq(arena.block_count(), 2u));
    expect(eq(static_cast<unsigned>(static_cast<std::byte*>(*a)[0]), 1u));
    expect(eq(static_cast<unsigned>(static_cast<std::byte*>(*c)[15]), 2u));

    const auto usage = arena.usage();
    expect(eq(usage.reserved, 2u * arena.block_size()));
    expect(usage.committed >= usage.used);
    expect(usage.used > arena.block_size());

    arena.free_all_but_first();
    expect(eq(arena.block_count(), 1u));
    expect(eq(arena.usage().used, 0u));

    auto e = arena.allocate(24u, 8u);
    expect(e.has_value() >> fatal);
    expect(*e == *a);

    arena.release();
    expect(eq(arena.block_count(), 0u));
    expect(eq(arena.usage().reserved, 0u));
}

int main()
{
    using namespace boost::ut;

    "page-info"_test = [] {
        const auto& info = hm::vm::get_page_info();

        expect(info.page_size > 0u);
        expect(info.granularity >= info.page_size);
        expect(eq(info.page_size & (info.page_size - 1u), 0u));

        fmt::print("page size: {} granularity: {}\n",
                   hm::human_readable_bytes(info.page_size),
                   hm::human_readable_bytes(info.granularity));
    };

    "system-error-range"_test = [] {
        expect(hm::vm::new_system_error(ENOMEM) ==
               hm::error_code(ENOMEM, hm::category::system));
        expect(hm::vm::new_system_error(32767ul) ==
               hm::error_code(32767, hm::category::system));

        // HRESULT like values do not fit and are never truncated.
        const auto oom = hm::error_code(
          hm::memory_errc::block_allocation_failure, hm::category::memory);
        expect(hm::vm::new_system_error(32768ul) == oom);
        expect(hm::vm::new_system_error(0x8007000eul) == oom);
        expect(hm::vm::new_system_error(0x1000cul) == oom);
    };

    "heap-block-provider"_test = [] {
        auto block = hm::heap_block_provider::acquire(100u);
        expect(block.has_value() >> fatal);
        expect(eq(block->reserved, 128u));
        expect(eq(block->committed, 128u));
        expect(eq(reinterpret_cast<std::uintptr_t>(block->base) % 64u, 0u));

        expect(hm::heap_block_provider::commit(*block, 128u).has_value());
        expect(not hm::heap_block_provider::commit(*block, 129u).has_value());

        hm::heap_block_provider::release(*block);
        expect(block->base == nullptr);
    };

    "static-arena-heap"_test = [] {
        check_static_arena<hm::heap_block_provider>();
    };

    "growing-arena-heap"_test = [] {
        check_growing_arena<hm::heap_block_provider>();
    };

    if constexpr (hm::has_virtual_memory) {
        "virtual-memory"_test = [] {
            const auto& info  = hm::vm::get_page_info();
            const auto  bytes = 16u * info.granularity;

            auto ptr = hm::vm::reserve(bytes);
            expect(ptr.has_value() >> fatal);

            expect(hm::vm::commit(*ptr, info.page_size).has_value() >> fatal);
            std::memset(*ptr, 0xab, info.page_size);
            expect(eq(static_cast<unsigned>((*ptr)[info.page_size - 1u]),
                      0xabu));

            hm::vm::release(*ptr, bytes);
        };

        "virtual-block-provider"_test = [] {
            using provider = hm::virtual_block_provider;

            auto block = provider::acquire(1u);
            expect(block.has_value() >> fatal);
            expect(eq(block->reserved, provider::granularity()));
            expect(eq(block->committed, 0u));

            expect(provider::commit(*block, 1u).has_value() >> fatal);
            expect(block->committed >= hm::vm::get_page_info().page_size);
            expect(block->committed <= block->reserved);

            const auto committed = block->committed;
            expect(provider::commit(*block, 1u).has_value());
            expect(eq(block->committed, committed));

            expect(provider::commit(*block, block->reserved + 1u) ==
                   hm::error_code(hm::memory_errc::commit_out_of_reserve,
                                  hm::category::memory));

            provider::release(*block);
            expect(block->base == nullptr);
        };

        "static-arena-virtual"_test = [] {
            check_static_arena<hm::virtual_block_provider>();
        };

        "growing-arena-virtual"_test = [] {
            check_growing_arena<hm::virtual_block_provider>();
        };

        "large-reservation-is-lazy"_test = [] {
            hm::static_arena<hm::virtual_block_provider> arena;

            expect(arena.init(std::size_t{ 1 } << 32).has_value() >> fatal);
            expect(eq(arena.committed(), 0u));
            expect(arena.resize(64u * 1024u).has_value() >> fatal);
            expect(arena.committed() < arena.reserved());

            fmt::print("large reservation: {}\n", arena.usage());
        };
    }
}
