#include <BENC/Serialization/Bencode/BencodeDecoder.hpp>

namespace BENC::Serialization::detail
{
    ParseError MakeError(const BencodeTokenizer& tokenizer, ParseErrorCode code, const char* message) noexcept
    {
        ParseError err;
        err.code     = code;
        err.location = ParseLocation {tokenizer.Offset()};
        err.message  = message;
        return err;
    }

    ParseError MakeError(const BencodeToken& token, ParseErrorCode code, const char* message) noexcept
    {
        ParseError err;
        err.code     = code;
        err.location = ParseLocation {token.offset};
        err.message  = message;
        return err;
    }

    TokenResult NextToken(BencodeTokenizer& tokenizer) noexcept
    {
        auto next = tokenizer.Next();
        if (!next.HasValue())
            return TokenResult(Utilities::Unexpected<ParseError>(std::move(next).ErrorUnsafe()));
        if (!next.ValueUnsafe().HasValue())
        {
            return TokenResult(Utilities::Unexpected<ParseError>(
                    MakeError(tokenizer, ParseErrorCode::UnexpectedEnd, "Unexpected end of input")));
        }
        return TokenResult(next.ValueUnsafe().ValueUnsafe());
    }

    TokenResult NextValueToken(BencodeTokenizer& tokenizer) noexcept
    {
        auto token = NextToken(tokenizer);
        if (token.HasValue() && token.ValueUnsafe().IsEnd())
        {
            return TokenResult(Utilities::Unexpected<ParseError>(
                    MakeError(token.ValueUnsafe(), ParseErrorCode::UnexpectedEnd, "Container ended before a value")));
        }
        return token;
    }

    DecodeStatus SkipValue(BencodeTokenizer& tokenizer) noexcept
    {
        const IntSize start = tokenizer.Depth();

        auto first = NextToken(tokenizer);
        if (!first.HasValue())
            return Fail(std::move(first).ErrorUnsafe());
        if (tokenizer.Depth() < start)
            return Fail(first.ValueUnsafe(), ParseErrorCode::UnexpectedEnd, "Container ended before a value");

        // Scalars leave the depth unchanged; containers are consumed until it returns.
        while (tokenizer.Depth() > start)
        {
            auto next = NextToken(tokenizer);
            if (!next.HasValue())
                return Fail(std::move(next).ErrorUnsafe());
        }
        return {};
    }
}// namespace BENC::Serialization::detail
