/// @file Expected.hpp
/// @brief `BENC::Utilities::Expected<T, E>`: value-or-error return type used by every fallible API.
#pragma once

#include <BENC/Defines.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace BENC::Utilities
{
    /// @brief Wrapper used to explicitly construct an error value for `Expected<T, E>`.
    ///
    /// @tparam E Error type.
    template<class E>
    class Unexpected
    {
    public:
        /// @brief Error type.
        using ErrorType = E;

        constexpr explicit Unexpected(const E& error) noexcept(std::is_nothrow_copy_constructible_v<E>)
            : m_error {error}
        {
        }

        constexpr explicit Unexpected(E&& error) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error {std::move(error)}
        {
        }

        [[nodiscard]] constexpr E&       Error() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& Error() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      Error() && noexcept { return std::move(m_error); }

    private:
        E m_error;
    };

    namespace detail
    {
        [[noreturn]] inline void ExpectedFailNoValue() noexcept
        {
            BENC_ASSERT(false && "BENC::Utilities::Expected::Value called when holding error");
            BENC_ABORT("BENC::Utilities::Expected::Value called when holding error");
        }

        [[noreturn]] inline void ExpectedFailNoError() noexcept
        {
            BENC_ASSERT(false && "BENC::Utilities::Expected::Error called when holding value");
            BENC_ABORT("BENC::Utilities::Expected::Error called when holding value");
        }
    }// namespace detail

    /// @brief Inline "value or error" return type with explicit lifetime and zero allocations.
    ///
    /// @details
    /// - Checked accessors (`Value()`, `Error()`) are contract-fatal when the wrong alternative is active.
    /// - Unchecked accessors (`ValueUnsafe()`, `ErrorUnsafe()`) are undefined behavior in that case.
    ///
    /// @tparam T Value type.
    /// @tparam E Error type.
    template<class T, class E>
    class [[nodiscard]] Expected
    {
        static_assert(!std::is_reference_v<T>, "Expected<T&,...> is not supported.");
        static_assert(!std::is_reference_v<E>, "Expected<...,E&> is not supported.");

    public:
        using ValueType = T;
        using ErrorType = E;

        constexpr explicit Expected(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            requires(std::is_copy_constructible_v<T>)
            : m_value(value), m_hasValue(true)
        {
        }

        constexpr explicit Expected(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_value(std::move(value)), m_hasValue(true)
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error(std::move(unexpected).Error()), m_hasValue(false)
        {
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), other.m_value);
            else
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                      std::is_nothrow_move_constructible_v<E>)
            : m_hasValue(other.m_hasValue)
        {
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), std::move(other.m_value));
            else
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<T> && std::is_copy_constructible_v<E>)
        {
            if (this == &other)
                return *this;
            DestroyActive();
            m_hasValue = other.m_hasValue;
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), other.m_value);
            else
                std::construct_at(std::addressof(m_error), other.m_error);
            return *this;
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<T> &&
                                                                 std::is_nothrow_move_constructible_v<E>)
        {
            if (this == &other)
                return *this;
            DestroyActive();
            m_hasValue = other.m_hasValue;
            if (m_hasValue)
                std::construct_at(std::addressof(m_value), std::move(other.m_value));
            else
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
            return *this;
        }

        constexpr ~Expected() noexcept
        {
            DestroyActive();
        }

        /// @brief Returns true if this object currently holds a value.
        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr T& Value() & noexcept
        {
            if (BENC_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] constexpr const T& Value() const& noexcept
        {
            if (BENC_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return m_value;
        }

        [[nodiscard]] constexpr T&& Value() && noexcept
        {
            if (BENC_UNLIKELY(!m_hasValue))
                detail::ExpectedFailNoValue();
            return std::move(m_value);
        }

        [[nodiscard]] constexpr E& Error() & noexcept
        {
            if (BENC_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (BENC_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr T&        ValueUnsafe() & noexcept { return m_value; }
        [[nodiscard]] constexpr const T&  ValueUnsafe() const& noexcept { return m_value; }
        [[nodiscard]] constexpr T&&       ValueUnsafe() && noexcept { return std::move(m_value); }
        [[nodiscard]] constexpr E&        ErrorUnsafe() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E&  ErrorUnsafe() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&       ErrorUnsafe() && noexcept { return std::move(m_error); }

        [[nodiscard]] constexpr T ValueOr(T fallback) const& noexcept(std::is_nothrow_copy_constructible_v<T>)
        {
            return m_hasValue ? m_value : std::move(fallback);
        }

    private:
        constexpr void DestroyActive() noexcept
        {
            if (m_hasValue)
            {
                if constexpr (!std::is_trivially_destructible_v<T>)
                    std::destroy_at(std::addressof(m_value));
            }
            else
            {
                if constexpr (!std::is_trivially_destructible_v<E>)
                    std::destroy_at(std::addressof(m_error));
            }
        }

        union
        {
            T m_value;
            E m_error;
        };
        bool m_hasValue {false};
    };

    /// @brief Specialization for operations that only report success or an error.
    template<class E>
    class [[nodiscard]] Expected<void, E>
    {
    public:
        using ValueType = void;
        using ErrorType = E;

        /// @brief Constructs a success value.
        constexpr Expected() noexcept
            : m_empty {}, m_hasValue(true)
        {
        }

        constexpr explicit Expected(Unexpected<E>&& unexpected) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_error(std::move(unexpected).Error()), m_hasValue(false)
        {
        }

        constexpr Expected(const Expected& other)
            requires(std::is_copy_constructible_v<E>)
            : m_empty {}, m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), other.m_error);
        }

        constexpr Expected(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
            : m_empty {}, m_hasValue(other.m_hasValue)
        {
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
        }

        constexpr Expected& operator=(const Expected& other)
            requires(std::is_copy_constructible_v<E>)
        {
            if (this == &other)
                return *this;
            DestroyError();
            m_hasValue = other.m_hasValue;
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), other.m_error);
            return *this;
        }

        constexpr Expected& operator=(Expected&& other) noexcept(std::is_nothrow_move_constructible_v<E>)
        {
            if (this == &other)
                return *this;
            DestroyError();
            m_hasValue = other.m_hasValue;
            if (!m_hasValue)
                std::construct_at(std::addressof(m_error), std::move(other.m_error));
            return *this;
        }

        constexpr ~Expected() noexcept
        {
            DestroyError();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return HasValue(); }

        [[nodiscard]] constexpr E& Error() & noexcept
        {
            if (BENC_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr const E& Error() const& noexcept
        {
            if (BENC_UNLIKELY(m_hasValue))
                detail::ExpectedFailNoError();
            return m_error;
        }

        [[nodiscard]] constexpr E&       ErrorUnsafe() & noexcept { return m_error; }
        [[nodiscard]] constexpr const E& ErrorUnsafe() const& noexcept { return m_error; }
        [[nodiscard]] constexpr E&&      ErrorUnsafe() && noexcept { return std::move(m_error); }

    private:
        constexpr void DestroyError() noexcept
        {
            if constexpr (!std::is_trivially_destructible_v<E>)
            {
                if (!m_hasValue)
                    std::destroy_at(std::addressof(m_error));
            }
        }

        union
        {
            char m_empty;
            E    m_error;
        };
        bool m_hasValue {true};
    };
}// namespace BENC::Utilities
