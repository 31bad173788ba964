/// @file BencodeSchema.hpp
/// @brief Compile-time description of decode targets.
///
/// @details
/// The C++ type of a decode target is its schema:
/// - standard integer types (not `bool` or character types) decode Bencode integers;
/// - `std::array<B, N>` with a byte-like `B` receives exactly N raw bytes;
/// - `std::string_view` and `std::span<const Byte>` borrow from the input;
/// - `OwnedBytes` / `OwnedString` copy into allocator-owned storage;
/// - `std::array<T, N>` with any other `T` is a fixed-length list;
/// - `List<T>` is an allocator-owned dynamic list;
/// - `Utilities::Optional<T>` marks a record member that may be absent;
/// - a struct with a `BencodeRecord<T>` specialization maps a dictionary.
///
/// @code
/// struct File { UInt64 length; List<std::string_view> path; };
///
/// template<>
/// struct BENC::Serialization::BencodeRecord<File>
/// {
///     static constexpr auto Fields = std::tuple {
///             Field("length", &File::length),
///             Field("path", &File::path),
///     };
/// };
/// @endcode
#pragma once

#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Bencode/BencodeTypes.hpp>
#include <BENC/Utilities/Optional.hpp>

#include <array>
#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace BENC::Serialization
{
    /// @brief Specialize for every struct decoded from a dictionary.
    ///
    /// The specialization exposes `static constexpr auto Fields`, a
    /// `std::tuple` of `Field(...)` descriptors.
    template<class T>
    struct BencodeRecord;

    /// @brief Marker for a field without a default value.
    struct NoDefault
    {
    };

    namespace detail
    {
        template<class T>
        struct IsStdArray : std::false_type
        {
        };
        template<class T, std::size_t N>
        struct IsStdArray<std::array<T, N>> : std::true_type
        {
        };

        template<class T>
        struct IsList : std::false_type
        {
        };
        template<class T>
        struct IsList<List<T>> : std::true_type
        {
        };

        template<class T>
        struct IsOwnedBytes : std::false_type
        {
        };
        template<bool NullTerminated>
        struct IsOwnedBytes<BasicOwnedBytes<NullTerminated>> : std::true_type
        {
        };

        template<class T>
        struct IsOptional : std::false_type
        {
        };
        template<class T>
        struct IsOptional<Utilities::Optional<T>> : std::true_type
        {
        };

        template<class T>
        inline constexpr bool IsCharacterType = std::same_as<T, char> || std::same_as<T, wchar_t> ||
                                                std::same_as<T, char8_t> || std::same_as<T, char16_t> ||
                                                std::same_as<T, char32_t>;

        template<class T>
        inline constexpr bool IsByteLike = std::same_as<T, char> || std::same_as<T, signed char> ||
                                           std::same_as<T, unsigned char> || std::same_as<T, std::byte>;
    }// namespace detail

    template<class T>
    concept IntegerShape = std::integral<T> && !std::same_as<T, bool> && !detail::IsCharacterType<T>;

    template<class T>
    concept FixedBytesShape = detail::IsStdArray<T>::value && detail::IsByteLike<typename T::value_type>;

    template<class T>
    concept BorrowedBytesShape = std::same_as<T, std::string_view> || std::same_as<T, std::span<const Byte>>;

    template<class T>
    concept OwnedBytesShape = detail::IsOwnedBytes<T>::value;

    template<class T>
    concept FixedListShape = detail::IsStdArray<T>::value && !detail::IsByteLike<typename T::value_type>;

    template<class T>
    concept DynamicListShape = detail::IsList<T>::value;

    template<class T>
    concept OptionalShape = detail::IsOptional<T>::value;

    template<class T>
    concept RecordShape = std::default_initializable<T> && requires { BencodeRecord<T>::Fields; };

    template<class T>
    concept BencodeShape = IntegerShape<T> || FixedBytesShape<T> || BorrowedBytesShape<T> || OwnedBytesShape<T> ||
                           FixedListShape<T> || DynamicListShape<T> || OptionalShape<T> || RecordShape<T>;

    /// @brief Describes one dictionary key of a record.
    ///
    /// @tparam Owner   Record type.
    /// @tparam Member  Member type, itself a `BencodeShape`.
    /// @tparam Default `NoDefault`, or `Member` when a default value is attached.
    template<class Owner, class Member, class Default = NoDefault>
    struct BencodeField
    {
        using OwnerType  = Owner;
        using MemberType = Member;

        static constexpr bool HasDefault = !std::same_as<Default, NoDefault>;

        std::string_view               name;
        Member Owner::*                member;
        [[no_unique_address]] Default defaultValue {};

        /// @brief Value used when the key is absent from the dictionary.
        ///
        /// Defaults are copied into the record, so they are restricted to
        /// shapes without owned nodes.
        [[nodiscard]] constexpr BencodeField<Owner, Member, Member> WithDefault(Member value) const noexcept
            requires(!HasDefault);
    };

    template<class Owner, class Member>
    [[nodiscard]] constexpr BencodeField<Owner, Member> Field(std::string_view name, Member Owner::* member) noexcept
    {
        return BencodeField<Owner, Member> {name, member, NoDefault {}};
    }

    namespace detail
    {
        template<class T>
        struct ContainsOwnedNodeImpl;
    }

    /// @brief True when decoding @p T may allocate and therefore needs an allocator and a `Release`.
    template<class T>
    inline constexpr bool ContainsOwnedNode = detail::ContainsOwnedNodeImpl<T>::value;

    namespace detail
    {
        template<class Fields>
        struct AnyFieldOwns;

        template<class... F>
        struct AnyFieldOwns<std::tuple<F...>>
            : std::bool_constant<(ContainsOwnedNodeImpl<typename F::MemberType>::value || ...)>
        {
        };

        template<class T>
        struct ContainsOwnedNodeImpl
        {
            static constexpr bool Compute() noexcept
            {
                if constexpr (OwnedBytesShape<T> || DynamicListShape<T>)
                    return true;
                else if constexpr (FixedListShape<T>)
                    return ContainsOwnedNodeImpl<typename T::value_type>::value;
                else if constexpr (OptionalShape<T>)
                    return ContainsOwnedNodeImpl<typename T::ValueType>::value;
                else if constexpr (RecordShape<T>)
                    return AnyFieldOwns<std::remove_cvref_t<decltype(BencodeRecord<T>::Fields)>>::value;
                else
                    return false;
            }

            static constexpr bool value = Compute();
        };
    }// namespace detail

    template<class Owner, class Member, class Default>
    constexpr BencodeField<Owner, Member, Member> BencodeField<Owner, Member, Default>::WithDefault(Member value) const noexcept
        requires(!HasDefault)
    {
        static_assert(!ContainsOwnedNode<Member>, "Defaults cannot be attached to members that own allocations.");
        return BencodeField<Owner, Member, Member> {name, member, std::move(value)};
    }

    /// @brief Number of fields declared for record @p T.
    template<RecordShape T>
    inline constexpr UIntSize RecordFieldCount =
            std::tuple_size_v<std::remove_cvref_t<decltype(BencodeRecord<T>::Fields)>>;

    /// @brief Invokes `fn(field, std::integral_constant<UIntSize, I>)` for every field of record @p T.
    template<RecordShape T, class Fn>
    constexpr void ForEachField(Fn&& fn)
    {
        [&]<UIntSize... I>(std::index_sequence<I...>) {
            (fn(std::get<I>(BencodeRecord<T>::Fields), std::integral_constant<UIntSize, I> {}), ...);
        }(std::make_index_sequence<RecordFieldCount<T>> {});
    }
}// namespace BENC::Serialization
