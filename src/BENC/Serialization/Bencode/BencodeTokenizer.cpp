#include <BENC/Serialization/Bencode/BencodeTokenizer.hpp>

#include <charconv>
#include <system_error>

namespace BENC::Serialization
{
    namespace
    {
        using TokenOrEnd = Utilities::Optional<BencodeToken>;

        [[nodiscard]] bool IsDigit(char c) noexcept
        {
            return c >= '0' && c <= '9';
        }

        [[nodiscard]] BencodeTokenizer::NextResult MakeToken(BencodeToken::Kind kind, UIntSize offset, UIntSize length) noexcept
        {
            return BencodeTokenizer::NextResult(TokenOrEnd(BencodeToken {kind, offset, length}));
        }
    }// namespace

    BencodeTokenizer::BencodeTokenizer(std::span<const Byte> input, UIntSize maxDepth) noexcept
        : m_cursor(input), m_maxDepth(maxDepth)
    {
    }

    BencodeTokenizer::BencodeTokenizer(std::string_view input, UIntSize maxDepth) noexcept
        : m_cursor(input), m_maxDepth(maxDepth)
    {
    }

    ParseError BencodeTokenizer::MakeError(ParseErrorCode code, const char* message) const noexcept
    {
        ParseError err;
        err.code     = code;
        err.location = m_cursor.Location();
        err.message  = message;
        return err;
    }

    BencodeTokenizer::NextResult BencodeTokenizer::Next() noexcept
    {
        if (m_cursor.IsEof())
            return NextResult(TokenOrEnd {});

        const char c = m_cursor.Peek();
        switch (c)
        {
            case 'i':
                return ReadInteger();
            case 'l':
                return OpenContainer(BencodeToken::Kind::ListBegin);
            case 'd':
                return OpenContainer(BencodeToken::Kind::DictionaryBegin);
            case 'e': {
                const UIntSize offset = m_cursor.Offset();
                m_cursor.Advance();
                --m_depth;
                return MakeToken(BencodeToken::Kind::End, offset, 1);
            }
            default:
                break;
        }
        if (IsDigit(c))
            return ReadByteString();
        return NextResult(Utilities::Unexpected<ParseError>(
                MakeError(ParseErrorCode::UnexpectedCharacter, "Unexpected character")));
    }

    BencodeTokenizer::NextResult BencodeTokenizer::OpenContainer(BencodeToken::Kind kind) noexcept
    {
        if (m_maxDepth != 0 && m_depth >= static_cast<IntSize>(m_maxDepth))
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::DepthExceeded, "Container nesting too deep")));
        }
        const UIntSize offset = m_cursor.Offset();
        m_cursor.Advance();
        ++m_depth;
        return MakeToken(kind, offset, 1);
    }

    BencodeTokenizer::NextResult BencodeTokenizer::ReadInteger() noexcept
    {
        m_cursor.Advance();// 'i'
        const UIntSize begin = m_cursor.Offset();
        if (m_cursor.IsEof())
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::UnexpectedEnd, "Unterminated integer")));
        }

        bool negative = false;
        if (m_cursor.Peek() == '-')
        {
            negative = true;
            m_cursor.Advance();
        }

        const char*    digits      = m_cursor.CurrentPtr();
        const UIntSize digitsBegin = m_cursor.Offset();
        while (!m_cursor.IsEof())
        {
            const char c = m_cursor.Peek();
            if (IsDigit(c))
            {
                m_cursor.Advance();
                continue;
            }
            if (c != 'e')
            {
                return NextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ParseErrorCode::InvalidInteger, "Unexpected character in integer")));
            }

            const UIntSize digitCount = m_cursor.Offset() - digitsBegin;
            if (digitCount == 0)
            {
                return NextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ParseErrorCode::InvalidInteger, "Integer has no digits")));
            }
            if (digits[0] == '0' && (negative || digitCount > 1))
            {
                return NextResult(Utilities::Unexpected<ParseError>(
                        MakeError(ParseErrorCode::InvalidInteger, "Integer has a leading zero")));
            }

            const UIntSize length = m_cursor.Offset() - begin;
            m_cursor.Advance();// 'e'
            return MakeToken(BencodeToken::Kind::Integer, begin, length);
        }

        return NextResult(Utilities::Unexpected<ParseError>(
                MakeError(ParseErrorCode::UnexpectedEnd, "Unterminated integer")));
    }

    BencodeTokenizer::NextResult BencodeTokenizer::ReadByteString() noexcept
    {
        const char*    digits = m_cursor.CurrentPtr();
        const UIntSize begin  = m_cursor.Offset();
        while (!m_cursor.IsEof() && IsDigit(m_cursor.Peek()))
            m_cursor.Advance();

        if (m_cursor.IsEof())
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::UnexpectedEnd, "Unterminated byte string length")));
        }
        if (m_cursor.Peek() != ':')
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::InvalidByteString, "Expected ':' after byte string length")));
        }

        const UIntSize digitCount = m_cursor.Offset() - begin;
        if (digitCount > 1 && digits[0] == '0')
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::InvalidInteger, "Byte string length has a leading zero")));
        }

        UIntSize   length = 0;
        const auto parsed = std::from_chars(digits, digits + digitCount, length);
        if (parsed.ec != std::errc {} || parsed.ptr != digits + digitCount)
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::InvalidByteString, "Byte string length out of range")));
        }

        m_cursor.Advance();// ':'
        if (length > m_cursor.Remaining())
        {
            return NextResult(Utilities::Unexpected<ParseError>(
                    MakeError(ParseErrorCode::UnexpectedEnd, "Byte string exceeds input")));
        }

        const UIntSize payload = m_cursor.Offset();
        m_cursor.Advance(length);
        return MakeToken(BencodeToken::Kind::ByteString, payload, length);
    }
}// namespace BENC::Serialization
