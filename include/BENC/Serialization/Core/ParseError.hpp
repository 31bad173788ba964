#pragma once

#include <BENC/Defines.hpp>
#include <BENC/Primitives.hpp>

#include <string_view>

namespace BENC::Serialization
{
    /// @brief Failure categories reported by the tokenizer and the decoder.
    enum class ParseErrorCode : UInt8
    {
        None,
        UnexpectedEnd,
        UnexpectedCharacter,
        UnexpectedToken,
        InvalidInteger,
        InvalidByteString,
        IntegerOverflow,
        MissingField,
        AllocatorRequired,
        DepthExceeded,
        OutOfMemory,
        TrailingCharacters,
    };

    /// @brief Byte offset into the encoded input.
    struct ParseLocation
    {
        UIntSize offset {0};

        [[nodiscard]] static constexpr ParseLocation Unknown() noexcept
        {
            return ParseLocation {};
        }
    };

    /// @brief Parsing error payload with code, location, and message.
    ///
    /// `message` always refers to static storage. `field` names the record
    /// field a `MissingField` error refers to and is empty otherwise.
    struct ParseError
    {
        ParseErrorCode   code {ParseErrorCode::None};
        ParseLocation    location {};
        std::string_view message {};
        std::string_view field {};
    };

    /// @brief Returns the enumerator name of @p code.
    [[nodiscard]] BENC_API std::string_view ToString(ParseErrorCode code) noexcept;
}// namespace BENC::Serialization
