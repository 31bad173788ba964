#pragma once

#include <BENC/Defines.hpp>
#include <BENC/IO/IOError.hpp>
#include <BENC/Primitives.hpp>
#include <BENC/Utilities/Expected.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace BENC::IO
{
    /// @brief Read-only file handle wrapper using platform APIs.
    class BENC_API File
    {
    public:
        File() noexcept              = default;
        File(const File&)            = delete;
        File& operator=(const File&) = delete;
        File(File&& other) noexcept;
        File& operator=(File&& other) noexcept;
        ~File();

        BENC::Utilities::Expected<void, IOError> Open(std::string_view path) noexcept;
        void                                     Close() noexcept;

        [[nodiscard]] bool IsOpen() const noexcept;

        BENC::Utilities::Expected<UIntSize, IOError> Read(std::span<BENC::Byte> destination) noexcept;
        BENC::Utilities::Expected<UIntSize, IOError> Size() const noexcept;

        /// @brief Reads the remaining contents of the file.
        ///
        /// @param maxBytes Files larger than this fail with `InvalidArgument`; 0 disables the limit.
        BENC::Utilities::Expected<std::vector<BENC::Byte>, IOError> ReadAll(UIntSize maxBytes = 0) noexcept;

    private:
#if defined(_WIN32)
        void* m_handle {nullptr};
#else
        int m_handle {-1};
#endif
    };
}// namespace BENC::IO
