#include <BENC/IO/File.hpp>

#include <BENC/Utilities/Expected.hpp>

#include <cerrno>
#include <new>
#include <string>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace BENC::IO
{
    namespace
    {
        [[nodiscard]] IOError MakeSystemError(const char* message, int code) noexcept
        {
            IOError err;
            err.code       = IOErrorCode::SystemError;
            err.systemCode = code;
            err.message    = message ? message : "system error";
            return err;
        }

        [[nodiscard]] IOError MakeNotOpenError() noexcept
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "file not open";
            return err;
        }
    }// namespace

    std::string_view ToString(IOErrorCode code) noexcept
    {
        switch (code)
        {
            case IOErrorCode::None:
                return "None";
            case IOErrorCode::EndOfStream:
                return "EndOfStream";
            case IOErrorCode::InvalidArgument:
                return "InvalidArgument";
            case IOErrorCode::SystemError:
                return "SystemError";
        }
        return "Unknown";
    }

    File::File(File&& other) noexcept
    {
        *this = std::move(other);
    }

    File& File::operator=(File&& other) noexcept
    {
        if (this != &other)
        {
            Close();
#if defined(_WIN32)
            m_handle       = other.m_handle;
            other.m_handle = nullptr;
#else
            m_handle       = other.m_handle;
            other.m_handle = -1;
#endif
        }
        return *this;
    }

    File::~File()
    {
        Close();
    }

    BENC::Utilities::Expected<void, IOError> File::Open(std::string_view path) noexcept
    {
        Close();
        if (path.empty())
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "empty path";
            return BENC::Utilities::Expected<void, IOError>(BENC::Utilities::Unexpected<IOError>(std::move(err)));
        }

        std::string nativePath;
        try
        {
            nativePath.assign(path);
        }
        catch (const std::bad_alloc&)
        {
            return BENC::Utilities::Expected<void, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("out of memory", ENOMEM)));
        }

#if defined(_WIN32)
        HANDLE handle = CreateFileA(nativePath.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle == INVALID_HANDLE_VALUE)
        {
            return BENC::Utilities::Expected<void, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("CreateFileA failed", static_cast<int>(GetLastError()))));
        }
        m_handle = handle;
#else
        const int fd = ::open(nativePath.c_str(), O_RDONLY);
        if (fd < 0)
        {
            return BENC::Utilities::Expected<void, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("open failed", errno)));
        }
        m_handle = fd;
#endif
        return {};
    }

    void File::Close() noexcept
    {
#if defined(_WIN32)
        if (m_handle)
        {
            CloseHandle(static_cast<HANDLE>(m_handle));
            m_handle = nullptr;
        }
#else
        if (m_handle >= 0)
        {
            ::close(m_handle);
            m_handle = -1;
        }
#endif
    }

    bool File::IsOpen() const noexcept
    {
#if defined(_WIN32)
        return m_handle != nullptr;
#else
        return m_handle >= 0;
#endif
    }

    BENC::Utilities::Expected<UIntSize, IOError> File::Read(std::span<BENC::Byte> destination) noexcept
    {
        if (!IsOpen())
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(MakeNotOpenError()));
        if (destination.empty())
            return BENC::Utilities::Expected<UIntSize, IOError>(UIntSize {0});
#if defined(_WIN32)
        DWORD bytesRead = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), destination.data(), static_cast<DWORD>(destination.size()), &bytesRead, nullptr))
        {
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("ReadFile failed", static_cast<int>(GetLastError()))));
        }
        return BENC::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(bytesRead));
#else
        const ssize_t result = ::read(m_handle, destination.data(), destination.size());
        if (result < 0)
        {
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("read failed", errno)));
        }
        return BENC::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(result));
#endif
    }

    BENC::Utilities::Expected<UIntSize, IOError> File::Size() const noexcept
    {
        if (!IsOpen())
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(MakeNotOpenError()));
#if defined(_WIN32)
        LARGE_INTEGER size;
        if (!GetFileSizeEx(static_cast<HANDLE>(m_handle), &size))
        {
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("GetFileSizeEx failed", static_cast<int>(GetLastError()))));
        }
        return BENC::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(size.QuadPart));
#else
        struct stat st;
        if (fstat(m_handle, &st) != 0)
        {
            return BENC::Utilities::Expected<UIntSize, IOError>(BENC::Utilities::Unexpected<IOError>(
                    MakeSystemError("fstat failed", errno)));
        }
        return BENC::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(st.st_size));
#endif
    }

    BENC::Utilities::Expected<std::vector<BENC::Byte>, IOError> File::ReadAll(UIntSize maxBytes) noexcept
    {
        using Result = BENC::Utilities::Expected<std::vector<BENC::Byte>, IOError>;

        auto sizeResult = Size();
        if (!sizeResult.HasValue())
            return Result(BENC::Utilities::Unexpected<IOError>(std::move(sizeResult.ErrorUnsafe())));
        const UIntSize fileSize = sizeResult.ValueUnsafe();
        if (maxBytes != 0 && fileSize > maxBytes)
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "file exceeds size limit";
            return Result(BENC::Utilities::Unexpected<IOError>(std::move(err)));
        }

        std::vector<BENC::Byte> data;
        try
        {
            data.resize(fileSize);
        }
        catch (const std::bad_alloc&)
        {
            return Result(BENC::Utilities::Unexpected<IOError>(MakeSystemError("out of memory", ENOMEM)));
        }

        UIntSize total = 0;
        while (total < fileSize)
        {
            auto readResult = Read(std::span<BENC::Byte>(data.data() + total, fileSize - total));
            if (!readResult.HasValue())
                return Result(BENC::Utilities::Unexpected<IOError>(std::move(readResult.ErrorUnsafe())));
            const UIntSize readBytes = readResult.ValueUnsafe();
            if (readBytes == 0)
                break;
            total += readBytes;
        }
        data.resize(total);

        return Result(std::move(data));
    }
}// namespace BENC::IO
