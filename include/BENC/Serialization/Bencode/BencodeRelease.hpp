/// @file BencodeRelease.hpp
/// @brief Frees the owned nodes of a decoded value, guided by its type.
#pragma once

#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Primitives.hpp>
#include <BENC/Serialization/Bencode/BencodeSchema.hpp>

#include <array>
#include <memory>
#include <tuple>
#include <type_traits>
#include <utility>

namespace BENC::Serialization::detail
{
    template<BencodeShape T>
    void ReleaseValue(T& value, Memory::PolyAllocatorRef& allocator) noexcept;

    /// @brief Releases `items[count - 1]` down to `items[0]`.
    template<class T>
    void ReleaseRange(T* items, UIntSize count, Memory::PolyAllocatorRef& allocator) noexcept
    {
        if constexpr (ContainsOwnedNode<T>)
        {
            while (count > 0)
            {
                --count;
                ReleaseValue(items[count], allocator);
            }
        }
    }

    /// @brief Releases every element of @p items and returns the storage itself.
    template<class T>
    void ReleaseListStorage(T* items, UIntSize size, UIntSize capacity, Memory::PolyAllocatorRef& allocator) noexcept
    {
        if (!items)
            return;
        ReleaseRange(items, size, allocator);
        if constexpr (!std::is_trivially_destructible_v<T>)
            std::destroy(items, items + size);
        allocator.Deallocate(items, capacity * sizeof(T), alignof(T));
    }

    /// @brief Releases the record fields whose `seen` flag is set, last field first.
    template<RecordShape T, UIntSize N>
    void ReleaseSeenFields(T& record, const std::array<bool, N>& seen, Memory::PolyAllocatorRef& allocator) noexcept
    {
        if constexpr (ContainsOwnedNode<T>)
        {
            [&]<UIntSize... I>(std::index_sequence<I...>) {
                constexpr UIntSize last = N - 1;
                (([&] {
                     const auto& field = std::get<last - I>(BencodeRecord<T>::Fields);
                     if (seen[last - I])
                         ReleaseValue(record.*(field.member), allocator);
                 }()),
                 ...);
            }(std::make_index_sequence<N> {});
        }
    }

    template<BencodeShape T>
    void ReleaseValue(T& value, Memory::PolyAllocatorRef& allocator) noexcept
    {
        if constexpr (!ContainsOwnedNode<T>)
        {
            return;
        }
        else if constexpr (OwnedBytesShape<T>)
        {
            if (value.Data())
                allocator.Deallocate(value.Data(), value.AllocatedSize(), alignof(char));
            value = T {};
        }
        else if constexpr (DynamicListShape<T>)
        {
            ReleaseListStorage(value.data(), value.Size(), value.Capacity(), allocator);
            value = T {};
        }
        else if constexpr (FixedListShape<T>)
        {
            ReleaseRange(value.data(), value.size(), allocator);
        }
        else if constexpr (OptionalShape<T>)
        {
            if (value.HasValue())
                ReleaseValue(value.ValueUnsafe(), allocator);
            value.Reset();
        }
        else if constexpr (RecordShape<T>)
        {
            std::array<bool, RecordFieldCount<T>> all {};
            all.fill(true);
            ReleaseSeenFields(value, all, allocator);
        }
    }
}// namespace BENC::Serialization::detail
