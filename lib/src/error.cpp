// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#include <handlemap/error.hpp>
#include <handlemap/format.hpp>

#include <algorithm>

#include <csignal>
#include <cstring>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace hm {

static std::string_view trim_message(std::string_view msg) noexcept
{
    while (not msg.empty() and
           (msg.back() == '\n' or msg.back() == '\r' or msg.back() == ' '))
        msg.remove_suffix(1);

    return msg;
}

std::string_view system_message(const error_code& ec,
                                std::span<char>   buffer) noexcept
{
    if (buffer.empty() or ec.value() <= 0)
        return {};

    if (ec.cat_type() != category::generic and
        ec.cat_type() != category::system)
        return {};

#if defined(_WIN32)
    if (ec.cat_type() == category::system) {
        const auto len =
          ::FormatMessageA(FORMAT_MESSAGE_FROM_SYSTEM |
                             FORMAT_MESSAGE_IGNORE_INSERTS,
                           nullptr,
                           static_cast<DWORD>(ec.value()),
                           0,
                           buffer.data(),
                           static_cast<DWORD>(buffer.size()),
                           nullptr);

        return trim_message(std::string_view(buffer.data(), len));
    }
#endif

    const char* msg = std::strerror(ec.value());
    if (not msg)
        return {};

    const auto len = std::min(std::strlen(msg), buffer.size());
    std::copy_n(msg, len, buffer.data());

    return trim_message(std::string_view(buffer.data(), len));
}

namespace debug {

void breakpoint() noexcept
{
#if ((defined(__i386__) || defined(__x86_64__)) && defined(__GNUC__) &&        \
     __GNUC__ >= 2)
    __asm__ __volatile__("int $03");
#elif defined(_MSC_VER)
    __debugbreak();
#elif defined(__APPLE__) || defined(__clang__)
    __builtin_trap();
#else
    std::raise(SIGTRAP);
#endif
}

} // namespace debug
} // namespace hm
