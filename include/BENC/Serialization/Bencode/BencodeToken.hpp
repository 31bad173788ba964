#pragma once

#include <BENC/Primitives.hpp>

namespace BENC::Serialization
{
    /// @brief Structural unit produced by `BencodeTokenizer`.
    ///
    /// Tokens never copy input. `Integer` spans the optional sign and the
    /// digits between `i` and `e`; `ByteString` spans the payload after the
    /// `:`. Structural tokens span their single marker byte.
    struct BencodeToken
    {
        enum class Kind : UInt8
        {
            Integer,
            ByteString,
            ListBegin,
            DictionaryBegin,
            End,
        };

        Kind     kind {Kind::End};
        UIntSize offset {0};
        UIntSize length {0};

        [[nodiscard]] constexpr bool IsInteger() const noexcept { return kind == Kind::Integer; }
        [[nodiscard]] constexpr bool IsByteString() const noexcept { return kind == Kind::ByteString; }
        [[nodiscard]] constexpr bool IsListBegin() const noexcept { return kind == Kind::ListBegin; }
        [[nodiscard]] constexpr bool IsDictionaryBegin() const noexcept { return kind == Kind::DictionaryBegin; }
        [[nodiscard]] constexpr bool IsEnd() const noexcept { return kind == Kind::End; }
    };
}// namespace BENC::Serialization
