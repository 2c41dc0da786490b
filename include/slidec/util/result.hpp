#ifndef SLIDEC_RESULT_HPP
#define SLIDEC_RESULT_HPP

#include <expected>
#include <type_traits>
#include <utility>

#include "slidec/util/assert.hpp"

namespace slidec {

/// @brief Holds either a value of type `T` or an error of type `E`.
/// Unlike `std::expected`, a `Result` is implicitly constructible from both `T` and `E`,
/// so that functions can simply `return` either of them.
/// `T` and `E` shall be different types.
template <typename T, typename E>
struct [[nodiscard]] Result {
    static_assert(!std::is_same_v<T, E>);

private:
    std::expected<T, E> m_data;

public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<T>
    = default;

    [[nodiscard]]
    constexpr Result(const T& value)
        : m_data { value }
    {
    }

    [[nodiscard]]
    constexpr Result(T&& value)
        : m_data { std::move(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr T& operator*() &
    {
        SLIDEC_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr const T& operator*() const&
    {
        SLIDEC_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr T&& operator*() &&
    {
        SLIDEC_ASSERT(has_value());
        return std::move(*m_data);
    }

    [[nodiscard]]
    constexpr T* operator->()
    {
        SLIDEC_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr const T* operator->() const
    {
        SLIDEC_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        SLIDEC_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        SLIDEC_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        SLIDEC_ASSERT(!has_value());
        return std::move(m_data.error());
    }
};

template <typename E>
struct [[nodiscard]] Result<void, E> {
private:
    std::expected<void, E> m_data;

public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]]
    constexpr Result() noexcept
        = default;

    [[nodiscard]]
    constexpr Result(const E& error)
        : m_data { std::unexpect, error }
    {
    }

    [[nodiscard]]
    constexpr Result(E&& error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr E& error() &
    {
        SLIDEC_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        SLIDEC_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        SLIDEC_ASSERT(!has_value());
        return std::move(m_data.error());
    }
};

} // namespace slidec

#endif
