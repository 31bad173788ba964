#include <BENC/Serialization/Core/ParseError.hpp>

namespace BENC::Serialization
{
    std::string_view ToString(ParseErrorCode code) noexcept
    {
        switch (code)
        {
            case ParseErrorCode::None:
                return "None";
            case ParseErrorCode::UnexpectedEnd:
                return "UnexpectedEnd";
            case ParseErrorCode::UnexpectedCharacter:
                return "UnexpectedCharacter";
            case ParseErrorCode::UnexpectedToken:
                return "UnexpectedToken";
            case ParseErrorCode::InvalidInteger:
                return "InvalidInteger";
            case ParseErrorCode::InvalidByteString:
                return "InvalidByteString";
            case ParseErrorCode::IntegerOverflow:
                return "IntegerOverflow";
            case ParseErrorCode::MissingField:
                return "MissingField";
            case ParseErrorCode::AllocatorRequired:
                return "AllocatorRequired";
            case ParseErrorCode::DepthExceeded:
                return "DepthExceeded";
            case ParseErrorCode::OutOfMemory:
                return "OutOfMemory";
            case ParseErrorCode::TrailingCharacters:
                return "TrailingCharacters";
        }
        return "Unknown";
    }
}// namespace BENC::Serialization
