#pragma once

#include <BENC/Defines.hpp>
#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Bencode/BencodeToken.hpp>
#include <BENC/Serialization/Core/InputCursor.hpp>
#include <BENC/Serialization/Core/ParseError.hpp>
#include <BENC/Utilities/Expected.hpp>
#include <BENC/Utilities/Optional.hpp>

#include <span>
#include <string_view>

namespace BENC::Serialization
{
    /// @brief Splits a Bencode buffer into a flat stream of tokens.
    ///
    /// @details
    /// The tokenizer validates the lexical grammar (integer and length
    /// prefix digits, byte string bounds) and tracks container nesting, but
    /// does not check that containers are balanced. `Depth()` goes negative
    /// when an `e` closes a container that was never opened; consumers treat
    /// that as a structural error.
    class BENC_API BencodeTokenizer
    {
    public:
        using NextResult = Utilities::Expected<Utilities::Optional<BencodeToken>, ParseError>;

        /// @param maxDepth Maximum container nesting; 0 disables the limit.
        explicit BencodeTokenizer(std::span<const Byte> input, UIntSize maxDepth = 0) noexcept;
        explicit BencodeTokenizer(std::string_view input, UIntSize maxDepth = 0) noexcept;

        /// @brief Produces the next token, or an empty optional at end of input.
        NextResult Next() noexcept;

        [[nodiscard]] IntSize  Depth() const noexcept { return m_depth; }
        [[nodiscard]] UIntSize Offset() const noexcept { return m_cursor.Offset(); }
        [[nodiscard]] bool     IsEof() const noexcept { return m_cursor.IsEof(); }
        [[nodiscard]] UIntSize MaxDepth() const noexcept { return m_maxDepth; }

        /// @brief Input bytes covered by @p token, as characters.
        [[nodiscard]] std::string_view Text(const BencodeToken& token) const noexcept
        {
            return std::string_view {m_cursor.BeginPtr() + token.offset, token.length};
        }

        /// @brief Input bytes covered by @p token.
        [[nodiscard]] std::span<const Byte> Bytes(const BencodeToken& token) const noexcept
        {
            return std::span<const Byte> {reinterpret_cast<const Byte*>(m_cursor.BeginPtr()) + token.offset, token.length};
        }

    private:
        NextResult ReadInteger() noexcept;
        NextResult ReadByteString() noexcept;
        NextResult OpenContainer(BencodeToken::Kind kind) noexcept;

        [[nodiscard]] ParseError MakeError(ParseErrorCode code, const char* message) const noexcept;

        InputCursor m_cursor;
        IntSize     m_depth {0};
        UIntSize    m_maxDepth {0};
    };
}// namespace BENC::Serialization
