#pragma once

#include <BENC/Defines.hpp>
#include <BENC/Primitives.hpp>

#include <string_view>

namespace BENC::IO
{
    /// @brief Error codes for low-level IO operations.
    enum class IOErrorCode : UInt8
    {
        None,
        EndOfStream,
        InvalidArgument,
        SystemError,
    };

    /// @brief IO error payload with optional system code.
    ///
    /// `message` refers to static storage.
    struct IOError
    {
        IOErrorCode      code {IOErrorCode::None};
        Int32            systemCode {0};
        std::string_view message {};
    };

    /// @brief Returns the enumerator name of @p code.
    [[nodiscard]] BENC_API std::string_view ToString(IOErrorCode code) noexcept;
}// namespace BENC::IO
