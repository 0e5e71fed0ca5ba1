// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_MACROS_2024
#define ORG_HANDLEMAP_MACROS_2024

#include <cstddef>
#include <cstdint>
#include <cstdlib>

#include <fstream>
#include <iostream>

#if defined(_MSC_VER) && !defined(__clang__)
#define hm_force_inline_attribute [[msvc::forceinline]]
#else
#define hm_force_inline_attribute [[gnu::always_inline]]
#endif

//! Platforms without a reserve/commit virtual memory API fall back to heap
//! blocks for the arenas.
#if defined(__EMSCRIPTEN__) && !defined(HANDLEMAP_NO_VIRTUAL_MEMORY)
#define HANDLEMAP_NO_VIRTUAL_MEMORY
#endif

namespace hm {

using u32 = uint32_t;
using ssz = ptrdiff_t;

#ifdef HANDLEMAP_NO_VIRTUAL_MEMORY
static constexpr bool has_virtual_memory = false;
#else
static constexpr bool has_virtual_memory = true;
#endif

namespace fatal {

//! @brief A c++ function to replace assert macro.
//!
//! Call @c std::abort if the assertion fail. This function can not be
//! disabled. Used for closed-world contracts, for example adding an item into
//! a full @c fixed_handle_map.
//!
//! @tparam T The type of the assertion to test.
//! @param assertion The instance of the assertion to test.
template<typename T>
inline constexpr void ensure(T&& assertion) noexcept
{
    if (!static_cast<bool>(assertion))
        std::abort();
}

} // fatal

namespace debug {

#ifdef HANDLEMAP_ENABLE_DEBUG
static constexpr bool enable_ensure     = true;
static constexpr bool enable_memory_log = true;
#else
static constexpr bool enable_ensure     = false;
static constexpr bool enable_memory_log = false;
#endif

inline std::ostream& mem_file() noexcept
{
    static std::ofstream ofs("handlemap-mem.txt");
    if (ofs.is_open())
        return ofs;

    return std::cout;
}

//! @brief A c++ function to replace assert macro controlled via constexpr
//! boolean variable.
//!
//! Call @c std::abort if the assertion fail. This function is disabled if
//! @c HANDLEMAP_ENABLE_DEBUG is not defined.
//!
//! @tparam T The type of the assertion to test.
//! @param assertion The instance of the assertion to test.
template<typename T>
    requires(::hm::debug::enable_ensure == true)
inline constexpr void ensure(T&& assertion) noexcept
{
    if (!static_cast<bool>(assertion))
        std::abort();
}

template<typename T>
    requires(::hm::debug::enable_ensure == false)
hm_force_inline_attribute constexpr void ensure(
  [[maybe_unused]] T&& assertion) noexcept
{}

//! Add a breakpoint (@c __debugbreak(), @c __builtin_trap(), into the code.
//! This function can be use with the @c on_error_callback to stop the
//! application when a @c new_error_code function is called.
void breakpoint() noexcept;

} // namespace debug

[[noreturn]] inline void unreachable() noexcept
{
#if defined(_MSC_VER) && !defined(__clang__) // MSVC
    __assume(false);
#else // GCC, Clang
    __builtin_unreachable();
#endif
}

} // namespace hm

#endif
