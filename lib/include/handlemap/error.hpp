// Copyright (c) 2024 INRAE Distributed under the Boost Software License,
// Version 1.0. (See accompanying file LICENSE_1_0.txt or copy at
// http://www.boost.org/LICENSE_1_0.txt)

#ifndef ORG_HANDLEMAP_ERROR_2024
#define ORG_HANDLEMAP_ERROR_2024

#include <handlemap/macros.hpp>

#include <concepts>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

#include <climits>

namespace hm {

using error_handler = void(void) noexcept;

//! Called each time a new @c error_code is built with @c new_error_code. Set
//! it to @c debug::breakpoint to stop into a debugger on the first failure.
inline error_handler* on_error_callback = nullptr;

//! Identify the interface which produces the error code value.
enum class category : std::int16_t {
    generic,   //!< errno or std::errc values.
    system,    //!< errno or GetLastError() values from the virtual memory.
    container, //!< @c container_errc values.
    memory,    //!< @c memory_errc values.
};

//! Errors reported by the stores when no slot can be provided.
enum class container_errc : std::int16_t {
    full = 1,              //!< @c fixed_handle_map holds its N items.
    reservation_exhausted, //!< @c static_handle_map reached its reservation.
    free_list_full,        //!< The free list can not grow.
    indirection_full,      //!< The growing index array can not grow.
};

//! Errors reported by the arenas and the block providers.
enum class memory_errc : std::int16_t {
    block_allocation_failure = 1, //!< No memory to build a new block.
    block_too_large,              //!< Request greater than the block size.
    commit_out_of_reserve,        //!< Commit greater than the reservation.
    not_initialized,              //!< Arena used before @c init.
};

/**
 * @a error_code represents a platform-dependent error code value. Each
 * @a error_code object holds an error code value originating from the
 * operating system or some low-level interface and a value to identify the
 * category which corresponds to the said interface. The error code values are
 * not required to be unique across different error categories.
 */
class error_code
{
private:
    std::int16_t ec  = 0;
    category     cat = category::generic;

public:
    constexpr error_code() noexcept = default;

    constexpr error_code(std::int16_t error, category c) noexcept
      : ec(error)
      , cat(c)
    {}

    template<typename ErrorCodeEnum>
        requires(std::is_enum_v<ErrorCodeEnum> and
                 std::is_convertible_v<std::underlying_type_t<ErrorCodeEnum>,
                                       std::int16_t>)
    constexpr error_code(ErrorCodeEnum e, category c) noexcept
      : ec(static_cast<std::int16_t>(e))
      , cat(c)
    {}

    //!< Returns the platform dependent error code value.
    constexpr std::int16_t value() const noexcept { return ec; }

    //!< Returns the error category of the error code.
    constexpr category cat_type() const noexcept { return cat; }

    //!< Checks if the error code value is valid, i.e. non-zero.
    //!< @return @a false if @a value() == 0, true otherwise.
    constexpr explicit operator bool() const noexcept { return ec != 0; }
};

constexpr bool operator==(const error_code& lhs, const error_code& rhs)
{
    return lhs.value() == rhs.value() and lhs.cat_type() == rhs.cat_type();
}

constexpr bool operator!=(const error_code& lhs, const error_code& rhs)
{
    return !(lhs == rhs);
}

inline error_code new_error_code(std::integral auto e,
                                 category c = category::generic) noexcept
{
    debug::ensure(std::cmp_less_equal(e, INT16_MAX));
    debug::ensure(std::cmp_greater_equal(e, INT16_MIN));

    if (on_error_callback) {
        on_error_callback();
    }

    return error_code(static_cast<std::int16_t>(e), c);
}

inline error_code new_error_code(container_errc e) noexcept
{
    if (on_error_callback) {
        on_error_callback();
    }

    return error_code(e, category::container);
}

inline error_code new_error_code(memory_errc e) noexcept
{
    if (on_error_callback) {
        on_error_callback();
    }

    return error_code(e, category::memory);
}

template<typename Value>
class expected
{
private:
    static_assert(not std::is_reference_v<Value>);
    static_assert(not std::is_function_v<Value>);
    static_assert(not std::is_same_v<std::remove_cv_t<Value>, std::in_place_t>);
    static_assert(not std::is_same_v<std::remove_cv_t<Value>, error_code>);

public:
    using value_type = Value;
    using error_type = error_code;
    using this_type  = expected<value_type>;

private:
    union storage_type {
        std::monostate _;
        Value          val;
        error_code     ec;

        constexpr storage_type() noexcept {}
        constexpr ~storage_type() noexcept {}
    } storage;

    enum class state_type : std::int8_t { value, error } state;

    constexpr void destroy_value() noexcept
    {
        if constexpr (not std::is_trivially_destructible_v<value_type>) {
            if (state == state_type::value)
                std::destroy_at(std::addressof(storage.val));
        }
    }

public:
    constexpr expected() noexcept
      : state{ state_type::value }
    {
        if constexpr (std::is_default_constructible_v<value_type>)
            std::construct_at(std::addressof(storage.val));
    }

    constexpr ~expected() noexcept { destroy_value(); }

    constexpr expected(const value_type& value_) noexcept
      : state{ state_type::value }
    {
        std::construct_at(std::addressof(storage.val), value_);
    }

    constexpr expected(value_type&& value_) noexcept
      : state{ state_type::value }
    {
        std::construct_at(std::addressof(storage.val), std::move(value_));
    }

    constexpr expected(const expected& other) noexcept
      : state{ other.state }
    {
        static_assert(std::is_copy_constructible_v<value_type>);

        if (state == state_type::error) {
            std::construct_at(std::addressof(storage.ec), other.storage.ec);
        } else {
            std::construct_at(std::addressof(storage.val), other.storage.val);
        }
    }

    constexpr expected(expected&& other) noexcept
      : state{ other.state }
    {
        static_assert(std::is_move_constructible_v<value_type>);

        if (state == state_type::error) {
            std::construct_at(std::addressof(storage.ec),
                              std::move(other.storage.ec));
        } else {
            std::construct_at(std::addressof(storage.val),
                              std::move(other.storage.val));
        }
    }

    constexpr expected(const error_code& ec) noexcept
      : state{ state_type::error }
    {
        std::construct_at(std::addressof(storage.ec), ec);
    }

    constexpr this_type& operator=(const this_type& other) noexcept
    {
        static_assert(std::is_copy_constructible_v<value_type>);

        if (this == &other)
            return *this;

        destroy_value();
        state = other.state;

        if (state == state_type::error) {
            std::construct_at(std::addressof(storage.ec), other.storage.ec);
        } else {
            std::construct_at(std::addressof(storage.val), other.storage.val);
        }

        return *this;
    }

    constexpr this_type& operator=(this_type&& other) noexcept
    {
        static_assert(std::is_move_constructible_v<value_type>);

        if (this == &other)
            return *this;

        destroy_value();
        state = other.state;

        if (state == state_type::error) {
            std::construct_at(std::addressof(storage.ec),
                              std::move(other.storage.ec));
        } else {
            std::construct_at(std::addressof(storage.val),
                              std::move(other.storage.val));
        }

        return *this;
    }

    constexpr this_type& operator=(const error_code& ec) noexcept
    {
        destroy_value();
        state = state_type::error;
        std::construct_at(std::addressof(storage.ec), ec);

        return *this;
    }

    constexpr value_type& value() & noexcept
    {
        debug::ensure(has_value());
        return storage.val;
    }

    constexpr const value_type& value() const& noexcept
    {
        debug::ensure(has_value());
        return storage.val;
    }

    constexpr value_type&& value() && noexcept
    {
        debug::ensure(has_value());
        return std::move(storage.val);
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return state_type::value == state;
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr error_type& error() & noexcept
    {
        debug::ensure(not has_value());
        return storage.ec;
    }

    [[nodiscard]]
    constexpr const error_type& error() const& noexcept
    {
        debug::ensure(not has_value());
        return storage.ec;
    }

    value_type* operator->() noexcept
    {
        debug::ensure(has_value());

        return std::addressof(storage.val);
    }

    const value_type* operator->() const noexcept
    {
        debug::ensure(has_value());

        return std::addressof(storage.val);
    }

    value_type& operator*() noexcept
    {
        debug::ensure(has_value());

        return storage.val;
    }

    const value_type& operator*() const noexcept
    {
        debug::ensure(has_value());

        return storage.val;
    }
};

template<>
class expected<void>
{
public:
    using value_type = void;
    using error_type = error_code;
    using this_type  = expected<value_type>;

private:
    error_code ec;

public:
    constexpr expected() noexcept = default;

    constexpr expected(const error_code& ec_) noexcept
      : ec(ec_)
    {
        debug::ensure(static_cast<bool>(ec_));
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return not static_cast<bool>(ec);
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]]
    constexpr const error_type& error() const& noexcept
    {
        debug::ensure(not has_value());
        return ec;
    }
};

using status = expected<void>;

/**
 * @brief a readability function for returning successful results;
 *
 * For functions that return `status`, rather than returning `{}` to default
 * initialize the status object as "success", use this function to make it more
 * clear to the reader.
 *
 *     hm::status some_function() {
 *        return hm::success();
 *     }
 */
inline status success() noexcept { return status{}; }

template<typename T>
constexpr bool operator==(const expected<T>& lhs, const error_code& rhs)
{
    if (lhs.has_value())
        return false;

    return lhs.error() == rhs;
}

template<typename T>
constexpr bool operator!=(const expected<T>& lhs, const error_code& rhs)
{
    return !(lhs == rhs);
}

} // namespace hm

#endif
