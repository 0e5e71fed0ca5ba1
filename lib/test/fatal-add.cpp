// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

// `add` past the bound of a fixed or static store must abort the program.
// The CTest entries are registered with WILL_FAIL: any normal return from
// main() is a test failure.

#include <handlemap/format.hpp>
#include <handlemap/handle-map.hpp>

#include <fmt/format.h>

#include <string_view>

#include <cstdio>
#include <cstdlib>

struct entity_handle {
    hm::u32 index;
    hm::u32 generation;
};

struct entity {
    float         x = 0.f;
    float         y = 0.f;
    entity_handle handle{};
};

static int unexpected_return(std::string_view what) noexcept
{
    fmt::print(stderr, "fatal-add: {}\n", what);
    return EXIT_SUCCESS;
}

static int add_past_fixed_capacity() noexcept
{
    hm::fixed_handle_map<entity, entity_handle, 3> map;

    for (int i = 0; i < 3; ++i) {
        const auto h = map.add(entity{ .x = static_cast<float>(i) });
        if (hm::is_null(h))
            return unexpected_return("null handle before the capacity");
    }

    if (map.size() != 3u)
        return unexpected_return("fixed store does not hold 3 items");

    fmt::print(stderr, "fixed: {} items, adding one more\n", map.size());
    std::fflush(stderr);

    [[maybe_unused]] const auto h = map.add(entity{});

    return unexpected_return("fixed: add past the capacity returned");
}

static int add_past_static_reservation() noexcept
{
    hm::static_handle_map<entity, entity_handle, hm::heap_block_provider> map(
      7);

    const auto slots = map.capacity();
    if (slots < 2u)
        return unexpected_return("static store without reservation");

    for (hm::u32 i = 1; i < slots; ++i) {
        const auto h = map.add(entity{ .x = static_cast<float>(i) });
        if (hm::is_null(h))
            return unexpected_return("null handle before the reservation");
    }

    if (map.size() + 1u != map.capacity())
        return unexpected_return("static store does not fill its reservation");

    fmt::print(stderr,
               "static: {} items in {}, adding one more\n",
               map.size(),
               map.usage());
    std::fflush(stderr);

    [[maybe_unused]] const auto h = map.add(entity{});

    return unexpected_return("static: add past the reservation returned");
}

int main(int argc, char* argv[])
{
    const std::string_view mode = argc > 1 ? argv[1] : "";

    if (mode == "fixed")
        return add_past_fixed_capacity();

    if (mode == "static")
        return add_past_static_reservation();

    return unexpected_return("usage: handlemap-test-fatal-add fixed|static");
}
