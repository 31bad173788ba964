/// @file AllocatorConcept.hpp
/// @brief Allocator concept and capability traits used by the decoder and its owned value types.
#pragma once

#include <concepts>
#include <cstddef>
#include <limits>

namespace BENC::Memory
{
    // -------------------------------------------------------------------------
    // Core allocator concept
    // -------------------------------------------------------------------------
    //
    // Only Allocate/Deallocate are required. Allocate returns nullptr on failure.
    // Decoded values always hand back the exact size and alignment they were
    // allocated with, so sized allocators may rely on both.

    template<class A>
    concept AllocatorConcept =
            requires(A a, std::size_t n, std::size_t align, void* p) {
                { a.Allocate(n, align) } -> std::same_as<void*>;
                { a.Deallocate(p, n, align) } noexcept;
            };

    template<class A>
    concept AllocatorReportsMaxSize =
            requires(const A a) {
                { a.MaxSize() } -> std::same_as<std::size_t>;
            };

    template<class A>
    struct AllocatorTraits
    {
        static constexpr bool HasMaxSizeCapability = AllocatorReportsMaxSize<A>;

        static std::size_t MaxSize(const A& allocator) noexcept
        {
            if constexpr (HasMaxSizeCapability)
                return allocator.MaxSize();
            else
                return std::numeric_limits<std::size_t>::max();
        }
    };
}// namespace BENC::Memory
