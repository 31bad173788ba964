#pragma once

#include <BENC/Defines.hpp>
#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Bencode/BencodeRelease.hpp>
#include <BENC/Serialization/Bencode/BencodeSchema.hpp>
#include <BENC/Serialization/Bencode/BencodeToken.hpp>
#include <BENC/Serialization/Bencode/BencodeTokenizer.hpp>
#include <BENC/Serialization/Bencode/BencodeTypes.hpp>
#include <BENC/Serialization/Core/ParseError.hpp>
#include <BENC/Utilities/Expected.hpp>

#include <array>
#include <charconv>
#include <cstring>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace BENC::Serialization
{
    /// @brief Bencode decoding configuration.
    struct BencodeDecodeOptions
    {
        /// Storage for `OwnedBytes`, `OwnedString` and `List` nodes. Leave
        /// empty for targets that only borrow from the input.
        Memory::PolyAllocatorRef allocator {};
        /// Maximum container nesting; 0 disables the limit.
        UIntSize maxDepth {256};
        bool     rejectTrailingData {false};
    };

    namespace detail
    {
        using DecodeStatus = Utilities::Expected<void, ParseError>;
        using TokenResult  = Utilities::Expected<BencodeToken, ParseError>;

        struct DecodeContext
        {
            BencodeTokenizer         tokenizer;
            Memory::PolyAllocatorRef allocator;
        };

        [[nodiscard]] BENC_API ParseError MakeError(const BencodeTokenizer& tokenizer, ParseErrorCode code, const char* message) noexcept;
        [[nodiscard]] BENC_API ParseError MakeError(const BencodeToken& token, ParseErrorCode code, const char* message) noexcept;

        /// @brief Pulls the next token; the end of the stream is `UnexpectedEnd`.
        [[nodiscard]] BENC_API TokenResult NextToken(BencodeTokenizer& tokenizer) noexcept;

        /// @brief Like `NextToken`, but a container `End` in value position is also `UnexpectedEnd`.
        [[nodiscard]] BENC_API TokenResult NextValueToken(BencodeTokenizer& tokenizer) noexcept;

        /// @brief Iterative skip of one value; see `BencodeDecoder::SkipValue`.
        [[nodiscard]] BENC_API DecodeStatus SkipValue(BencodeTokenizer& tokenizer) noexcept;

        [[nodiscard]] inline DecodeStatus Fail(ParseError error) noexcept
        {
            return DecodeStatus(Utilities::Unexpected<ParseError>(std::move(error)));
        }

        [[nodiscard]] inline DecodeStatus Fail(const BencodeToken& token, ParseErrorCode code, const char* message) noexcept
        {
            return Fail(MakeError(token, code, message));
        }

        /// @brief Decodes the value starting at @p token into @p out.
        ///
        /// On failure @p out holds no owned memory.
        template<BencodeShape T>
        DecodeStatus DecodeInto(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept;

        template<IntegerShape T>
        DecodeStatus DecodeInteger(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsInteger())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected an integer");

            const std::string_view text = ctx.tokenizer.Text(token);
            if constexpr (std::is_unsigned_v<T>)
            {
                if (text.front() == '-')
                    return Fail(token, ParseErrorCode::IntegerOverflow, "Negative value for unsigned integer");
            }

            T          value {};
            const auto parsed = std::from_chars(text.data(), text.data() + text.size(), value);
            if (parsed.ec == std::errc::result_out_of_range)
                return Fail(token, ParseErrorCode::IntegerOverflow, "Integer does not fit the target type");
            if (parsed.ec != std::errc {} || parsed.ptr != text.data() + text.size())
                return Fail(token, ParseErrorCode::InvalidInteger, "Invalid integer");
            out = value;
            return {};
        }

        template<FixedBytesShape T>
        DecodeStatus DecodeFixedBytes(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsByteString())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a byte string");
            if (token.length != out.size())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Byte string length does not match fixed size");
            if (token.length > 0)
                std::memcpy(out.data(), ctx.tokenizer.Bytes(token).data(), token.length);
            return {};
        }

        template<BorrowedBytesShape T>
        DecodeStatus DecodeBorrowedBytes(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsByteString())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a byte string");
            if constexpr (std::is_same_v<T, std::string_view>)
                out = ctx.tokenizer.Text(token);
            else
                out = ctx.tokenizer.Bytes(token);
            return {};
        }

        template<OwnedBytesShape T>
        DecodeStatus DecodeOwnedBytes(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsByteString())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a byte string");

            const UIntSize allocationSize = token.length + (T::HasSentinel ? 1 : 0);
            if (allocationSize == 0)
            {
                out = T {};
                return {};
            }

            char* data = static_cast<char*>(ctx.allocator.Allocate(allocationSize, alignof(char)));
            if (!data)
                return Fail(token, ParseErrorCode::OutOfMemory, "Allocation failed for byte string");
            if (token.length > 0)
                std::memcpy(data, ctx.tokenizer.Text(token).data(), token.length);
            if constexpr (T::HasSentinel)
                data[token.length] = '\0';
            out = T {data, token.length};
            return {};
        }

        template<FixedListShape T>
        DecodeStatus DecodeFixedList(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsListBegin())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a list");

            for (UIntSize i = 0; i < out.size(); ++i)
            {
                auto element = NextValueToken(ctx.tokenizer);
                if (!element.HasValue())
                {
                    ReleaseRange(out.data(), i, ctx.allocator);
                    return Fail(std::move(element).ErrorUnsafe());
                }
                auto status = DecodeInto(ctx, element.ValueUnsafe(), out[i]);
                if (!status.HasValue())
                {
                    ReleaseRange(out.data(), i, ctx.allocator);
                    return status;
                }
            }

            auto end = NextToken(ctx.tokenizer);
            if (!end.HasValue() || !end.ValueUnsafe().IsEnd())
            {
                ReleaseRange(out.data(), out.size(), ctx.allocator);
                if (!end.HasValue())
                    return Fail(std::move(end).ErrorUnsafe());
                return Fail(end.ValueUnsafe(), ParseErrorCode::UnexpectedToken, "List has more elements than expected");
            }
            return {};
        }

        template<class T>
        [[nodiscard]] bool GrowListStorage(DecodeContext& ctx, T*& items, UIntSize size, UIntSize& capacity) noexcept
        {
            const UIntSize newCapacity = capacity ? capacity * 2 : 1;
            if (newCapacity > ctx.allocator.MaxSize() / sizeof(T))
                return false;

            T* grown = static_cast<T*>(ctx.allocator.Allocate(newCapacity * sizeof(T), alignof(T)));
            if (!grown)
                return false;
            for (UIntSize i = 0; i < size; ++i)
            {
                std::construct_at(grown + i, std::move(items[i]));
                std::destroy_at(items + i);
            }
            if (items)
                ctx.allocator.Deallocate(items, capacity * sizeof(T), alignof(T));
            items    = grown;
            capacity = newCapacity;
            return true;
        }

        template<DynamicListShape T>
        DecodeStatus DecodeDynamicList(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            using Element = typename T::Value;

            if (!token.IsListBegin())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a list");

            Element* items    = nullptr;
            UIntSize size     = 0;
            UIntSize capacity = 0;
            for (;;)
            {
                auto element = NextToken(ctx.tokenizer);
                if (!element.HasValue())
                {
                    ReleaseListStorage(items, size, capacity, ctx.allocator);
                    return Fail(std::move(element).ErrorUnsafe());
                }
                if (element.ValueUnsafe().IsEnd())
                    break;

                if (size == capacity && !GrowListStorage(ctx, items, size, capacity))
                {
                    ReleaseListStorage(items, size, capacity, ctx.allocator);
                    return Fail(element.ValueUnsafe(), ParseErrorCode::OutOfMemory, "Allocation failed for list");
                }

                std::construct_at(items + size);
                auto status = DecodeInto(ctx, element.ValueUnsafe(), items[size]);
                if (!status.HasValue())
                {
                    std::destroy_at(items + size);
                    ReleaseListStorage(items, size, capacity, ctx.allocator);
                    return status;
                }
                ++size;
            }

            out = T {items, size, capacity};
            return {};
        }

        template<RecordShape T>
        DecodeStatus DecodeRecord(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if (!token.IsDictionaryBegin())
                return Fail(token, ParseErrorCode::UnexpectedToken, "Expected a dictionary");

            std::array<bool, RecordFieldCount<T>> seen {};
            const auto failAndRelease = [&](ParseError error) noexcept {
                ReleaseSeenFields(out, seen, ctx.allocator);
                return Fail(std::move(error));
            };

            for (;;)
            {
                auto key = NextToken(ctx.tokenizer);
                if (!key.HasValue())
                    return failAndRelease(std::move(key).ErrorUnsafe());
                if (key.ValueUnsafe().IsEnd())
                    break;
                if (!key.ValueUnsafe().IsByteString())
                    return failAndRelease(MakeError(key.ValueUnsafe(), ParseErrorCode::UnexpectedToken, "Dictionary key must be a byte string"));

                const std::string_view name    = ctx.tokenizer.Text(key.ValueUnsafe());
                bool                   matched = false;
                DecodeStatus           status {};
                ForEachField<T>([&](const auto& field, auto index) {
                    using Member = typename std::remove_cvref_t<decltype(field)>::MemberType;
                    if (matched || field.name != name)
                        return;
                    matched = true;

                    Member& member = out.*(field.member);
                    if (seen[index])
                    {
                        // Duplicate key: the last occurrence wins.
                        ReleaseValue(member, ctx.allocator);
                        member      = Member {};
                        seen[index] = false;
                    }

                    auto value = NextValueToken(ctx.tokenizer);
                    if (!value.HasValue())
                    {
                        status = Fail(std::move(value).ErrorUnsafe());
                        return;
                    }
                    status = DecodeInto(ctx, value.ValueUnsafe(), member);
                    if (status.HasValue())
                        seen[index] = true;
                });

                if (!matched)
                {
                    auto skipped = SkipValue(ctx.tokenizer);
                    if (!skipped.HasValue())
                        return failAndRelease(std::move(skipped).ErrorUnsafe());
                }
                else if (!status.HasValue())
                {
                    return failAndRelease(std::move(status).ErrorUnsafe());
                }
            }

            DecodeStatus completion {};
            ForEachField<T>([&](const auto& field, auto index) {
                using Field = std::remove_cvref_t<decltype(field)>;
                if (!completion.HasValue() || seen[index])
                    return;
                if constexpr (Field::HasDefault)
                {
                    out.*(field.member) = field.defaultValue;
                }
                else if constexpr (OptionalShape<typename Field::MemberType>)
                {
                    (out.*(field.member)).Reset();
                }
                else
                {
                    ParseError error = MakeError(ctx.tokenizer, ParseErrorCode::MissingField, "Missing required field");
                    error.field      = field.name;
                    completion       = Fail(std::move(error));
                }
            });
            if (!completion.HasValue())
                return failAndRelease(std::move(completion).ErrorUnsafe());
            return {};
        }

        template<BencodeShape T>
        DecodeStatus DecodeInto(DecodeContext& ctx, const BencodeToken& token, T& out) noexcept
        {
            if constexpr (IntegerShape<T>)
            {
                return DecodeInteger(ctx, token, out);
            }
            else if constexpr (FixedBytesShape<T>)
            {
                return DecodeFixedBytes(ctx, token, out);
            }
            else if constexpr (BorrowedBytesShape<T>)
            {
                return DecodeBorrowedBytes(ctx, token, out);
            }
            else if constexpr (OwnedBytesShape<T>)
            {
                if (!ctx.allocator)
                    return Fail(token, ParseErrorCode::AllocatorRequired, "An allocator is required for owned byte strings");
                return DecodeOwnedBytes(ctx, token, out);
            }
            else if constexpr (FixedListShape<T>)
            {
                return DecodeFixedList(ctx, token, out);
            }
            else if constexpr (DynamicListShape<T>)
            {
                if (!ctx.allocator)
                    return Fail(token, ParseErrorCode::AllocatorRequired, "An allocator is required for dynamic lists");
                return DecodeDynamicList(ctx, token, out);
            }
            else if constexpr (OptionalShape<T>)
            {
                out.Emplace();
                auto status = DecodeInto(ctx, token, out.ValueUnsafe());
                if (!status.HasValue())
                    out.Reset();
                return status;
            }
            else
            {
                return DecodeRecord(ctx, token, out);
            }
        }
    }// namespace detail

    /// @brief Holds a decoded value and releases its owned nodes on destruction.
    template<BencodeShape T>
    class DecodedValue
    {
    public:
        DecodedValue(T value, Memory::PolyAllocatorRef allocator) noexcept
            : m_value(std::move(value)), m_allocator(allocator), m_engaged(true)
        {
        }

        DecodedValue(const DecodedValue&)            = delete;
        DecodedValue& operator=(const DecodedValue&) = delete;

        DecodedValue(DecodedValue&& other) noexcept
            : m_value(std::move(other.m_value)), m_allocator(other.m_allocator), m_engaged(other.m_engaged)
        {
            other.m_engaged = false;
        }

        DecodedValue& operator=(DecodedValue&& other) noexcept
        {
            if (this == &other)
                return *this;
            Reset();
            m_value         = std::move(other.m_value);
            m_allocator     = other.m_allocator;
            m_engaged       = other.m_engaged;
            other.m_engaged = false;
            return *this;
        }

        ~DecodedValue() { Reset(); }

        [[nodiscard]] T&       Get() noexcept { return m_value; }
        [[nodiscard]] const T& Get() const noexcept { return m_value; }

        T&       operator*() noexcept { return m_value; }
        const T& operator*() const noexcept { return m_value; }
        T*       operator->() noexcept { return std::addressof(m_value); }
        const T* operator->() const noexcept { return std::addressof(m_value); }

        /// @brief Gives up ownership; the caller must `BencodeDecoder::Release` the result.
        [[nodiscard]] T Detach() noexcept
        {
            m_engaged = false;
            return std::move(m_value);
        }

    private:
        void Reset() noexcept
        {
            if (!m_engaged)
                return;
            detail::ReleaseValue(m_value, m_allocator);
            m_engaged = false;
        }

        T                        m_value;
        Memory::PolyAllocatorRef m_allocator;
        bool                     m_engaged {false};
    };

    /// @brief Schema-driven Bencode decoder.
    ///
    /// @details
    /// The target type selects the decode rules (see BencodeSchema.hpp).
    /// Borrowed views in the result point into @p input and must not outlive
    /// it. Owned nodes come from `options.allocator` and are released with
    /// `Release`, or automatically when using `DecodeOwned`. A failed decode
    /// never leaves owned memory behind.
    class BENC_API BencodeDecoder
    {
    public:
        template<BencodeShape T>
        static Utilities::Expected<T, ParseError> Decode(std::span<const Byte> input, const BencodeDecodeOptions& options = {}) noexcept
        {
            return DecodeImpl<T>(BencodeTokenizer(input, options.maxDepth), options);
        }

        template<BencodeShape T>
        static Utilities::Expected<T, ParseError> Decode(std::string_view input, const BencodeDecodeOptions& options = {}) noexcept
        {
            return DecodeImpl<T>(BencodeTokenizer(input, options.maxDepth), options);
        }

        template<BencodeShape T>
        static Utilities::Expected<DecodedValue<T>, ParseError>
        DecodeOwned(std::span<const Byte> input, const BencodeDecodeOptions& options = {}) noexcept
        {
            return Adopt(Decode<T>(input, options), options.allocator);
        }

        template<BencodeShape T>
        static Utilities::Expected<DecodedValue<T>, ParseError>
        DecodeOwned(std::string_view input, const BencodeDecodeOptions& options = {}) noexcept
        {
            return Adopt(Decode<T>(input, options), options.allocator);
        }

        /// @brief Frees every owned node of @p value and leaves it empty.
        ///
        /// @p allocator must be the allocator the value was decoded with.
        template<BencodeShape T>
        static void Release(T& value, Memory::PolyAllocatorRef allocator) noexcept
        {
            detail::ReleaseValue(value, allocator);
        }

        /// @brief Consumes exactly one complete value, including nested containers.
        static Utilities::Expected<void, ParseError> SkipValue(BencodeTokenizer& tokenizer) noexcept
        {
            return detail::SkipValue(tokenizer);
        }

    private:
        template<BencodeShape T>
        static Utilities::Expected<T, ParseError> DecodeImpl(BencodeTokenizer tokenizer, const BencodeDecodeOptions& options) noexcept
        {
            using Result = Utilities::Expected<T, ParseError>;

            detail::DecodeContext ctx {std::move(tokenizer), options.allocator};
            auto                  first = detail::NextToken(ctx.tokenizer);
            if (!first.HasValue())
                return Result(Utilities::Unexpected<ParseError>(std::move(first).ErrorUnsafe()));

            T    value {};
            auto status = detail::DecodeInto(ctx, first.ValueUnsafe(), value);
            if (!status.HasValue())
                return Result(Utilities::Unexpected<ParseError>(std::move(status).ErrorUnsafe()));

            if (options.rejectTrailingData && !ctx.tokenizer.IsEof())
            {
                detail::ReleaseValue(value, ctx.allocator);
                return Result(Utilities::Unexpected<ParseError>(
                        detail::MakeError(ctx.tokenizer, ParseErrorCode::TrailingCharacters, "Trailing data after value")));
            }
            return Result(std::move(value));
        }

        template<BencodeShape T>
        static Utilities::Expected<DecodedValue<T>, ParseError> Adopt(Utilities::Expected<T, ParseError>&& decoded,
                                                                      Memory::PolyAllocatorRef          allocator) noexcept
        {
            using Result = Utilities::Expected<DecodedValue<T>, ParseError>;
            if (!decoded.HasValue())
                return Result(Utilities::Unexpected<ParseError>(std::move(decoded).ErrorUnsafe()));
            return Result(DecodedValue<T>(std::move(decoded).ValueUnsafe(), allocator));
        }
    };
}// namespace BENC::Serialization
