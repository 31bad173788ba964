/// @file Optional.hpp
/// @brief `BENC::Utilities::Optional<T>`: inline maybe-value, also the decoder's optional shape.
#pragma once

#include <BENC/Defines.hpp>

#include <memory>
#include <type_traits>
#include <utility>

namespace BENC::Utilities
{
    /// @brief Inline "maybe a T" with explicit lifetime and zero allocations.
    ///
    /// @details
    /// - Checked accessors (`Value()`) are contract-fatal when empty.
    /// - Unchecked accessors (`ValueUnsafe()`, `operator*`, `operator->`) are undefined behavior if empty.
    /// - Trivially copyable whenever `T` is, so decoded trees stay plain data.
    ///
    /// @tparam T Stored value type. References are not supported.
    template<class T>
    class Optional
    {
        static_assert(!std::is_reference_v<T>, "Optional<T&> is not supported.");

    public:
        using ValueType = T;

        /// @brief Constructs an empty optional.
        constexpr Optional() noexcept
            : m_empty {}, m_hasValue {false}
        {
        }

        constexpr explicit Optional(const T& value) noexcept(std::is_nothrow_copy_constructible_v<T>)
            : m_value(value), m_hasValue {true}
        {
        }

        constexpr explicit Optional(T&& value) noexcept(std::is_nothrow_move_constructible_v<T>)
            : m_value(std::move(value)), m_hasValue {true}
        {
        }

        constexpr Optional(const Optional& other) noexcept
            requires(std::is_trivially_copy_constructible_v<T>)
        = default;

        constexpr Optional(const Optional& other) noexcept(std::is_nothrow_copy_constructible_v<T>)
            requires(!std::is_trivially_copy_constructible_v<T> && std::is_copy_constructible_v<T>)
            : m_empty {}, m_hasValue {false}
        {
            if (other.m_hasValue)
                Emplace(other.m_value);
        }

        constexpr Optional(Optional&& other) noexcept
            requires(std::is_trivially_move_constructible_v<T>)
        = default;

        constexpr Optional(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
            requires(!std::is_trivially_move_constructible_v<T>)
            : m_empty {}, m_hasValue {false}
        {
            if (other.m_hasValue)
                Emplace(std::move(other.m_value));
        }

        constexpr Optional& operator=(const Optional& other) noexcept
            requires(std::is_trivially_copy_assignable_v<T> && std::is_trivially_copy_constructible_v<T> &&
                     std::is_trivially_destructible_v<T>)
        = default;

        constexpr Optional& operator=(const Optional& other)
            requires(!(std::is_trivially_copy_assignable_v<T> && std::is_trivially_copy_constructible_v<T> &&
                       std::is_trivially_destructible_v<T>) &&
                     std::is_copy_constructible_v<T>)
        {
            if (this == &other)
                return *this;
            Reset();
            if (other.m_hasValue)
                Emplace(other.m_value);
            return *this;
        }

        constexpr Optional& operator=(Optional&& other) noexcept
            requires(std::is_trivially_move_assignable_v<T> && std::is_trivially_move_constructible_v<T> &&
                     std::is_trivially_destructible_v<T>)
        = default;

        constexpr Optional& operator=(Optional&& other) noexcept(std::is_nothrow_move_constructible_v<T>)
            requires(!(std::is_trivially_move_assignable_v<T> && std::is_trivially_move_constructible_v<T> &&
                       std::is_trivially_destructible_v<T>))
        {
            if (this == &other)
                return *this;
            Reset();
            if (other.m_hasValue)
                Emplace(std::move(other.m_value));
            return *this;
        }

        constexpr ~Optional() noexcept
            requires(std::is_trivially_destructible_v<T>)
        = default;

        constexpr ~Optional() noexcept
            requires(!std::is_trivially_destructible_v<T>)
        {
            Reset();
        }

        [[nodiscard]] constexpr bool HasValue() const noexcept { return m_hasValue; }

        constexpr explicit operator bool() const noexcept { return m_hasValue; }

        /// @brief Checked access to the contained value.
        [[nodiscard]] constexpr T& Value() & noexcept
        {
            if (BENC_UNLIKELY(!m_hasValue))
            {
                BENC_ASSERT(false && "BENC::Utilities::Optional::Value called on empty optional");
                BENC_ABORT("BENC::Utilities::Optional::Value called on empty optional");
            }
            return m_value;
        }

        [[nodiscard]] constexpr const T& Value() const& noexcept
        {
            if (BENC_UNLIKELY(!m_hasValue))
            {
                BENC_ASSERT(false && "BENC::Utilities::Optional::Value called on empty optional");
                BENC_ABORT("BENC::Utilities::Optional::Value called on empty optional");
            }
            return m_value;
        }

        [[nodiscard]] constexpr T&       ValueUnsafe() noexcept { return m_value; }
        [[nodiscard]] constexpr const T& ValueUnsafe() const noexcept { return m_value; }

        [[nodiscard]] constexpr T ValueOr(T fallback) const noexcept(std::is_nothrow_copy_constructible_v<T>)
        {
            return m_hasValue ? m_value : std::move(fallback);
        }

        constexpr T&       operator*() noexcept { return m_value; }
        constexpr const T& operator*() const noexcept { return m_value; }
        constexpr T*       operator->() noexcept { return std::addressof(m_value); }
        constexpr const T* operator->() const noexcept { return std::addressof(m_value); }

        /// @brief Destroys the contained value, if any.
        constexpr void Reset() noexcept
        {
            if (!m_hasValue)
                return;
            if constexpr (!std::is_trivially_destructible_v<T>)
                std::destroy_at(std::addressof(m_value));
            m_hasValue = false;
        }

        /// @brief Replaces the contents with a value constructed from `args...`.
        template<class... Args>
        constexpr T& Emplace(Args&&... args)
        {
            Reset();
            std::construct_at(std::addressof(m_value), std::forward<Args>(args)...);
            m_hasValue = true;
            return m_value;
        }

    private:
        union
        {
            char m_empty;
            T    m_value;
        };
        bool m_hasValue {false};
    };
}// namespace BENC::Utilities
