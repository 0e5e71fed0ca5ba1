// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_FORMAT_2024
#define ORG_HANDLEMAP_FORMAT_2024

#include <handlemap/container.hpp>
#include <handlemap/error.hpp>
#include <handlemap/handle-map.hpp>

#include <fmt/format.h>

#include <span>
#include <string_view>

#include <cstdio>

namespace hm {

/// Debug log. Use the underlying @c fmt::print function.
///
///     debug_log("to-do {}\n", 1); /* -> "to-do 1\n"
#ifdef HANDLEMAP_ENABLE_DEBUG
template<typename S, typename... Args>
constexpr void debug_log(const S& s, Args&&... args) noexcept
{
    fmt::vprint(stderr, s, fmt::make_format_args(args...));
}
#else
template<typename S, typename... Args>
constexpr void debug_log([[maybe_unused]] const S& s,
                         [[maybe_unused]] Args&&... args) noexcept
{}
#endif

//! Copy into @c buffer the operating system message of a
//! @c category::generic (@c std::strerror) or @c category::system
//! (@c FormatMessage on Win32, @c std::strerror otherwise) error code.
//!
//! @return A view into @c buffer, empty for other categories or unknown
//! values.
std::string_view system_message(const error_code& ec,
                                std::span<char>   buffer) noexcept;

inline constexpr std::string_view category_names[] = {
    "generic",
    "system",
    "container",
    "memory",
};

inline constexpr std::string_view container_errc_names[] = {
    "none",
    "full",
    "reservation-exhausted",
    "free-list-full",
    "indirection-full",
};

inline constexpr std::string_view memory_errc_names[] = {
    "none",
    "block-allocation-failure",
    "block-too-large",
    "commit-out-of-reserve",
    "not-initialized",
};

} // namespace hm

template<>
struct fmt::formatter<::hm::human_readable_bytes> {

    constexpr auto parse(format_parse_context& ctx) noexcept
      -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const ::hm::human_readable_bytes& hr,
                format_context& ctx) const noexcept -> format_context::iterator
    {
        switch (hr.type) {
        case ::hm::human_readable_bytes::display_type::B:
            return format_to(ctx.out(), "{:.4f} B", hr.size);
        case ::hm::human_readable_bytes::display_type::KB:
            return format_to(ctx.out(), "{:.4f} KB", hr.size);
        case ::hm::human_readable_bytes::display_type::MB:
            return format_to(ctx.out(), "{:.4f} MB", hr.size);
        case ::hm::human_readable_bytes::display_type::GB:
            return format_to(ctx.out(), "{:.4f} GB", hr.size);
        }

        hm::unreachable();
    }
};

template<>
struct fmt::formatter<::hm::memory_usage> {

    constexpr auto parse(format_parse_context& ctx) noexcept
      -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const ::hm::memory_usage& mu,
                format_context& ctx) const noexcept -> format_context::iterator
    {
        return format_to(ctx.out(),
                         "reserved: {} committed: {} used: {}",
                         ::hm::human_readable_bytes(mu.reserved),
                         ::hm::human_readable_bytes(mu.committed),
                         ::hm::human_readable_bytes(mu.used));
    }
};

template<>
struct fmt::formatter<::hm::handle> {

    constexpr auto parse(format_parse_context& ctx) noexcept
      -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const ::hm::handle& h,
                format_context& ctx) const noexcept -> format_context::iterator
    {
        return format_to(ctx.out(), "{{{}, {}}}", h.index, h.generation);
    }
};

template<>
struct fmt::formatter<::hm::error_code> {

    constexpr auto parse(format_parse_context& ctx) noexcept
      -> format_parse_context::iterator
    {
        return ctx.begin();
    }

    auto format(const ::hm::error_code& ec,
                format_context& ctx) const noexcept -> format_context::iterator
    {
        const auto cat = static_cast<unsigned>(ec.cat_type());
        const auto val = static_cast<unsigned>(ec.value());

        switch (ec.cat_type()) {
        case ::hm::category::container:
            if (val < std::size(::hm::container_errc_names))
                return format_to(ctx.out(),
                                 "{}: {}",
                                 ::hm::category_names[cat],
                                 ::hm::container_errc_names[val]);
            break;

        case ::hm::category::memory:
            if (val < std::size(::hm::memory_errc_names))
                return format_to(ctx.out(),
                                 "{}: {}",
                                 ::hm::category_names[cat],
                                 ::hm::memory_errc_names[val]);
            break;

        case ::hm::category::generic:
        case ::hm::category::system: {
            char       buffer[256];
            const auto msg = ::hm::system_message(ec, buffer);
            if (not msg.empty())
                return format_to(ctx.out(),
                                 "{}: {} ({})",
                                 ::hm::category_names[cat],
                                 ec.value(),
                                 msg);
        } break;
        }

        return format_to(
          ctx.out(), "{}: {}", ::hm::category_names[cat], ec.value());
    }
};

#endif
