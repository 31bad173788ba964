#pragma once

#include <BENC/Primitives.hpp>

#include <span>
#include <string_view>

namespace BENC::Serialization
{
    /// @brief Allocator-owned copy of a byte string payload.
    ///
    /// @details
    /// Plain data: copying the handle aliases the storage, and exactly one copy
    /// must be handed to `BencodeDecoder::Release`. When @p NullTerminated is
    /// true one extra zero byte follows the payload so `CStr()` can be passed
    /// to C APIs; the terminator is not counted by `Size()`.
    template<bool NullTerminated>
    class BasicOwnedBytes
    {
    public:
        static constexpr bool HasSentinel = NullTerminated;

        constexpr BasicOwnedBytes() noexcept = default;

        /// @brief Adopts @p size payload bytes at @p data (plus the sentinel, if any).
        constexpr BasicOwnedBytes(char* data, UIntSize size) noexcept
            : m_data(data), m_size(size)
        {
        }

        [[nodiscard]] constexpr const char* Data() const noexcept { return m_data; }
        [[nodiscard]] constexpr char*       Data() noexcept { return m_data; }
        [[nodiscard]] constexpr UIntSize    Size() const noexcept { return m_size; }
        [[nodiscard]] constexpr bool        Empty() const noexcept { return m_size == 0; }

        /// @brief Number of bytes obtained from the allocator for this payload.
        [[nodiscard]] constexpr UIntSize AllocatedSize() const noexcept
        {
            return m_data ? m_size + (NullTerminated ? 1 : 0) : 0;
        }

        [[nodiscard]] constexpr std::string_view View() const noexcept
        {
            return m_data ? std::string_view {m_data, m_size} : std::string_view {};
        }

        [[nodiscard]] std::span<const Byte> Bytes() const noexcept
        {
            return std::span<const Byte> {reinterpret_cast<const Byte*>(m_data), m_size};
        }

        [[nodiscard]] constexpr const char* CStr() const noexcept
            requires(NullTerminated)
        {
            return m_data ? m_data : "";
        }

        constexpr operator std::string_view() const noexcept { return View(); }

    private:
        char*    m_data {nullptr};
        UIntSize m_size {0};
    };

    using OwnedBytes  = BasicOwnedBytes<false>;
    using OwnedString = BasicOwnedBytes<true>;

    /// @brief Allocator-owned, dynamically sized sequence of decoded elements.
    ///
    /// Like `BasicOwnedBytes`, a `List` is a handle: it does not free its
    /// storage on destruction. Release it with `BencodeDecoder::Release`.
    template<class T>
    class List
    {
    public:
        using Value = T;

        constexpr List() noexcept = default;

        constexpr List(T* data, UIntSize size, UIntSize capacity) noexcept
            : m_data(data), m_size(size), m_capacity(capacity)
        {
        }

        [[nodiscard]] constexpr UIntSize Size() const noexcept { return m_size; }
        [[nodiscard]] constexpr UIntSize Capacity() const noexcept { return m_capacity; }
        [[nodiscard]] constexpr bool     Empty() const noexcept { return m_size == 0; }

        constexpr T&       operator[](UIntSize idx) noexcept { return m_data[idx]; }
        constexpr const T& operator[](UIntSize idx) const noexcept { return m_data[idx]; }

        [[nodiscard]] constexpr T*       data() noexcept { return m_data; }
        [[nodiscard]] constexpr const T* data() const noexcept { return m_data; }
        [[nodiscard]] constexpr T*       begin() noexcept { return m_data; }
        [[nodiscard]] constexpr const T* begin() const noexcept { return m_data; }
        [[nodiscard]] constexpr T*       end() noexcept { return m_data + m_size; }
        [[nodiscard]] constexpr const T* end() const noexcept { return m_data + m_size; }

    private:
        T*       m_data {nullptr};
        UIntSize m_size {0};
        UIntSize m_capacity {0};
    };
}// namespace BENC::Serialization
