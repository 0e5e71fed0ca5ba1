// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <handlemap/container.hpp>
#include <handlemap/error.hpp>
#include <handlemap/format.hpp>

#include <boost/ut.hpp>

#include <fmt/format.h>

#include <memory>
#include <numeric>
#include <string>

#include <cerrno>
#include <cstring>

class counters
{
public:
    static inline int default_ctor = 0;
    static inline int copy_ctor    = 0;
    static inline int move_ctor    = 0;
    static inline int dtor         = 0;

public:
    counters() noexcept { default_ctor++; }
    counters(const counters&) noexcept { copy_ctor++; }
    counters(counters&&) noexcept { move_ctor++; }
    ~counters() noexcept { dtor++; }

    counters& operator=(const counters&) noexcept = default;
    counters& operator=(counters&&) noexcept      = default;

    static void reset() noexcept
    {
        counters::default_ctor = 0;
        counters::copy_ctor    = 0;
        counters::move_ctor    = 0;
        counters::dtor         = 0;
    }
};

static int error_callback_calls = 0;

static void count_error_callback() noexcept { ++error_callback_calls; }

int main()
{
    using namespace boost::ut;

    "expected-unique-ptr"_test = [] {
        auto ret = []() -> hm::expected<std::unique_ptr<int>> {
            return std::make_unique<int>(230);
        }();

        expect(ret.has_value() >> fatal);
        expect(!!ret.value() >> fatal);
        expect(eq(*ret.value(), 230));

        auto moved = std::move(ret);
        expect(moved.has_value() >> fatal);
        expect(eq(*moved.value(), 230));
    };

    "counters-expected"_test = [] {
        counters::reset();

        {
            auto fn = [](bool fail) noexcept -> hm::expected<counters> {
                if (fail)
                    return hm::new_error_code(hm::memory_errc::not_initialized);

                return hm::expected<counters>();
            };

            auto ret_1 = fn(true);
            auto ret_2 = fn(false);
            expect(not ret_1.has_value());
            expect(ret_2.has_value());
        }

        expect(eq(counters::default_ctor, 1));
        expect(eq(counters::copy_ctor, 0));
        expect(eq(counters::dtor, counters::default_ctor + counters::move_ctor));
    };

    "status"_test = [] {
        hm::status ok = hm::success();
        expect(ok.has_value());

        hm::status ko = hm::new_error_code(hm::container_errc::free_list_full);
        expect(not ko.has_value());
        expect(ko.error().cat_type() == hm::category::container);
        expect(ko == hm::error_code(hm::container_errc::free_list_full,
                                    hm::category::container));
        expect(ko != hm::error_code(hm::container_errc::full,
                                    hm::category::container));
    };

    "error-callback"_test = [] {
        error_callback_calls = 0;
        hm::on_error_callback = count_error_callback;

        [[maybe_unused]] auto e1 = hm::new_error_code(hm::container_errc::full);
        [[maybe_unused]] auto e2 = hm::new_error_code(12, hm::category::system);
        [[maybe_unused]] auto e3 =
          hm::new_error_code(hm::memory_errc::block_too_large);

        hm::on_error_callback = nullptr;

        expect(eq(error_callback_calls, 3));
        expect(eq(e2.value(), 12));
        expect(e2.cat_type() == hm::category::system);
    };

    "error-code-format"_test = [] {
        expect(eq(fmt::format("{}",
                              hm::error_code(hm::container_errc::full,
                                             hm::category::container)),
                  std::string("container: full")));

        expect(eq(fmt::format("{}",
                              hm::error_code(hm::memory_errc::block_too_large,
                                             hm::category::memory)),
                  std::string("memory: block-too-large")));

        expect(eq(fmt::format("{}", hm::error_code(ENOSYS, hm::category::generic)),
                  fmt::format("generic: {} ({})", ENOSYS, std::strerror(ENOSYS))));

        const auto nomem =
          fmt::format("{}", hm::error_code(ENOMEM, hm::category::system));
        expect(nomem.starts_with(fmt::format("system: {} (", ENOMEM)));
        expect(nomem.ends_with(")"));
        expect(nomem.size() > fmt::format("system: {} ()", ENOMEM).size());

#if !defined(_WIN32)
        expect(eq(nomem,
                  fmt::format("system: {} ({})", ENOMEM, std::strerror(ENOMEM))));
#endif

        expect(eq(fmt::format("{}", hm::error_code(0, hm::category::system)),
                  std::string("system: 0")));
    };

    "system-message"_test = [] {
        char buffer[256];

        expect(not hm::system_message(
                      hm::error_code(ENOMEM, hm::category::generic), buffer)
                      .empty());
        expect(hm::system_message(hm::error_code(hm::container_errc::full,
                                                 hm::category::container),
                                  buffer)
                 .empty());

        char small[4];
        const auto truncated = hm::system_message(
          hm::error_code(ENOMEM, hm::category::generic), small);
        expect(truncated.size() <= 4u);
        expect(truncated.data() == &small[0]);
    };

    "human-readable-bytes"_test = [] {
        expect(eq(fmt::format("{}", hm::human_readable_bytes(512)),
                  std::string("512.0000 B")));
        expect(eq(fmt::format("{}", hm::human_readable_bytes(2048)),
                  std::string("2.0000 KB")));
        expect(eq(fmt::format("{}", hm::human_readable_bytes(3 * 1024 * 1024)),
                  std::string("3.0000 MB")));

        const hm::memory_usage mu{ .reserved  = 4096u * 1024u,
                                   .committed = 8192u,
                                   .used      = 100u };

        expect(eq(fmt::format("{}", mu),
                  std::string(
                    "reserved: 4.0000 MB committed: 8.0000 KB used: 100.0000 B")));
    };

    "memory-usage-sum"_test = [] {
        hm::memory_usage a{ .reserved = 10u, .committed = 5u, .used = 1u };
        a += hm::memory_usage{ .reserved = 20u, .committed = 6u, .used = 2u };

        expect(eq(a.reserved, 30u));
        expect(eq(a.committed, 11u));
        expect(eq(a.used, 3u));
    };

    "round-up-align-forward"_test = [] {
        expect(eq(hm::round_up(1u, 4096u), 4096u));
        expect(eq(hm::round_up(4096u, 4096u), 4096u));
        expect(eq(hm::round_up(4097u, 4096u), 8192u));

        alignas(64) std::byte buffer[128];
        expect(hm::align_forward(&buffer[0], 64) == &buffer[0]);
        expect(hm::align_forward(&buffer[1], 64) == &buffer[64]);
        expect(hm::align_forward(&buffer[3], 4) == &buffer[4]);
    };

    "vector<T>"_test = [] {
        hm::vector<int> v;
        expect(v.empty());
        expect(eq(v.capacity(), 0));

        expect(v.reserve(4) >> fatal);
        expect(eq(v.capacity(), 4));

        for (int i = 0; i < 4; ++i)
            v.emplace_back(i);

        expect(v.full());
        expect(eq(v.ssize(), 4));

        expect(v.grow_for(1) >> fatal);
        expect(eq(v.capacity(), 6));
        v.emplace_back(4);

        expect(eq(std::accumulate(v.begin(), v.end(), 0), 10));
        expect(eq(v.back(), 4));

        v.pop_back();
        expect(eq(v.ssize(), 4));
        expect(eq(v.back(), 3));

        hm::vector<int> moved(std::move(v));
        expect(v.empty());
        expect(eq(v.capacity(), 0));
        expect(eq(moved.ssize(), 4));
        expect(eq(moved[2], 2));

        moved.destroy();
        expect(moved.empty());
        expect(eq(moved.capacity(), 0));
    };

    "vector<T>-grow-from-empty"_test = [] {
        hm::vector<int> v;
        expect(v.grow_for(1) >> fatal);
        expect(eq(v.capacity(), 8));
        expect(v.grow_for(20) >> fatal);
        expect(eq(v.capacity(), 20));
    };

    "vector-no-trivial"_test = [] {
        counters::reset();

        {
            hm::vector<counters> v;
            expect(v.reserve(2) >> fatal);
            v.emplace_back();
            v.emplace_back();

            expect(v.reserve(16) >> fatal);
            expect(eq(counters::default_ctor, 2));
            expect(eq(counters::move_ctor, 2));
        }

        expect(eq(counters::dtor,
                  counters::default_ctor + counters::move_ctor));
    };

    "small-vector<T>"_test = [] {
        hm::small_vector<int, 8> v;
        expect(v.empty());
        expect(v.capacity() == 8);

        for (int i = 0; i < 8; ++i)
            v.emplace_back(i);

        expect(v.size() == 8);
        expect(v.full());
        expect(not v.can_alloc(1));
        expect(eq(v.available(), 0));
        expect(v[0] == 0);
        expect(v[7] == 7);

        v.pop_back();
        expect(v.size() == 7);
        expect(!v.full());
        expect(eq(v.back(), 6));

        v.clear();
        expect(v.empty());
    };

    "small-vector-no-trivial"_test = [] {
        counters::reset();

        {
            hm::small_vector<counters, 4> v;
            v.emplace_back();
            v.emplace_back();
            v.pop_back();
        }

        expect(eq(counters::default_ctor, 2));
        expect(eq(counters::dtor, 2));
    };

    "free-list-lifo"_test = [] {
        hm::free_list<hm::vector<hm::u32>> fl;
        expect(fl.empty());
        expect(fl.reserve(3) >> fatal);

        fl.push(3u);
        fl.push(1u);
        fl.push(2u);
        expect(eq(fl.size(), 3u));

        expect(eq(fl.pop(), 2u));
        expect(eq(fl.pop(), 1u));
        expect(eq(fl.pop(), 3u));
        expect(fl.empty());
    };

    "free-list-reserve-growth"_test = [] {
        hm::free_list<hm::vector<hm::u32>> fl;

        expect(fl.reserve(1) >> fatal);
        expect(eq(fl.capacity(), 8));

        expect(fl.reserve(8) >> fatal);
        expect(eq(fl.capacity(), 8));

        expect(fl.reserve(9) >> fatal);
        expect(eq(fl.capacity(), 12));

        expect(fl.reserve(100) >> fatal);
        expect(eq(fl.capacity(), 100));

        fl.destroy();
        expect(eq(fl.capacity(), 0));
    };

    "free-list-inline"_test = [] {
        hm::free_list<hm::small_vector<hm::u32, 3>> fl;

        expect(fl.reserve(3));
        expect(not fl.reserve(4));

        fl.push(1u);
        fl.push(2u);
        fl.push(3u);
        expect(eq(fl.size(), 3u));

        fl.clear();
        expect(fl.empty());
    };
}
