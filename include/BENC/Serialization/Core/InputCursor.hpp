#pragma once

#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Core/ParseError.hpp>

#include <span>
#include <string_view>

namespace BENC::Serialization
{
    /// @brief Lightweight read-only cursor over a contiguous byte buffer.
    class InputCursor
    {
    public:
        explicit InputCursor(std::span<const Byte> data) noexcept
            : m_begin(reinterpret_cast<const char*>(data.data())), m_current(m_begin), m_end(m_begin + data.size())
        {
        }

        explicit InputCursor(std::string_view data) noexcept
            : m_begin(data.data()), m_current(m_begin), m_end(m_begin + data.size())
        {
        }

        [[nodiscard]] bool IsEof() const noexcept { return m_current >= m_end; }

        [[nodiscard]] char Peek() const noexcept
        {
            if (IsEof())
                return '\0';
            return *m_current;
        }

        /// @brief Advances by @p count bytes, clamped to the end of input.
        void Advance(UIntSize count = 1) noexcept
        {
            const UIntSize remaining = Remaining();
            m_current += count < remaining ? count : remaining;
        }

        [[nodiscard]] UIntSize Offset() const noexcept { return static_cast<UIntSize>(m_current - m_begin); }
        [[nodiscard]] UIntSize Remaining() const noexcept { return static_cast<UIntSize>(m_end - m_current); }
        [[nodiscard]] UIntSize Size() const noexcept { return static_cast<UIntSize>(m_end - m_begin); }

        [[nodiscard]] ParseLocation Location() const noexcept
        {
            return ParseLocation {Offset()};
        }

        [[nodiscard]] const char* BeginPtr() const noexcept { return m_begin; }
        [[nodiscard]] const char* CurrentPtr() const noexcept { return m_current; }
        [[nodiscard]] const char* EndPtr() const noexcept { return m_end; }

    private:
        const char* m_begin {nullptr};
        const char* m_current {nullptr};
        const char* m_end {nullptr};
    };
}// namespace BENC::Serialization
