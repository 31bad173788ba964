/// @file TrackingAllocator.hpp
/// @brief Decorator allocator recording live and cumulative allocation statistics.
#pragma once

#include <cstddef>
#include <utility>

#include <BENC/Memory/AllocatorConcept.hpp>

namespace BENC::Memory
{
    struct AllocationStats
    {
        std::size_t currentBytes {0};
        std::size_t peakBytes {0};
        std::size_t totalBytes {0};
        std::size_t currentCount {0};
        std::size_t totalCount {0};
        std::size_t failedCount {0};
    };

    /// @brief Wraps `Inner` and counts every allocation that is still outstanding.
    ///
    /// A decode that fails, or a value that was released, must leave
    /// `GetStats().currentCount == 0`.
    template<AllocatorConcept Inner>
    class Tracking
    {
    public:
        Tracking() = default;
        explicit Tracking(Inner inner) : m_inner(std::move(inner)) {}

        [[nodiscard]] void* Allocate(std::size_t size, std::size_t align) noexcept
        {
            void* p = m_inner.Allocate(size, align);
            if (!p)
            {
                ++m_stats.failedCount;
                return nullptr;
            }
            m_stats.currentBytes += size;
            m_stats.totalBytes += size;
            ++m_stats.currentCount;
            ++m_stats.totalCount;
            if (m_stats.currentBytes > m_stats.peakBytes)
                m_stats.peakBytes = m_stats.currentBytes;
            return p;
        }

        void Deallocate(void* ptr, std::size_t size, std::size_t align) noexcept
        {
            if (ptr)
            {
                m_stats.currentBytes = m_stats.currentBytes >= size ? m_stats.currentBytes - size : 0;
                if (m_stats.currentCount > 0)
                    --m_stats.currentCount;
            }
            m_inner.Deallocate(ptr, size, align);
        }

        [[nodiscard]] std::size_t MaxSize() const noexcept
        {
            return AllocatorTraits<Inner>::MaxSize(m_inner);
        }

        [[nodiscard]] const AllocationStats& GetStats() const noexcept
        {
            return m_stats;
        }

        [[nodiscard]] bool HasLiveAllocations() const noexcept
        {
            return m_stats.currentCount != 0 || m_stats.currentBytes != 0;
        }

        Inner& InnerAllocator() noexcept
        {
            return m_inner;
        }

    private:
        [[no_unique_address]] Inner m_inner {};
        AllocationStats             m_stats {};
    };
}// namespace BENC::Memory
