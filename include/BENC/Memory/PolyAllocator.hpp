/// @file PolyAllocator.hpp
/// @brief Nullable, non-owning, type-erased allocator reference.
///
/// @details
/// The decoder receives its allocator through this reference so that the
/// decode entry points stay non-template in the allocator type. An empty
/// reference (default-constructed) means "no allocator supplied": decoding
/// any owned node then fails with `ParseErrorCode::AllocatorRequired`.
#pragma once

#include <concepts>
#include <cstddef>

#include <BENC/Memory/AllocatorConcept.hpp>

namespace BENC::Memory
{
    class PolyAllocatorRef
    {
    public:
        PolyAllocatorRef() noexcept
            : m_object(nullptr),
              m_vt({
                      // Allocate
                      [](void*, std::size_t, std::size_t) noexcept -> void* { return nullptr; },
                      // Deallocate
                      [](void*, void*, std::size_t, std::size_t) noexcept {},
                      // MaxSize
                      [](const void*) noexcept -> std::size_t { return 0; },
              })
        {
        }

        template<AllocatorConcept A>
            requires(!std::same_as<A, PolyAllocatorRef>)
        explicit PolyAllocatorRef(A& allocator) noexcept
            : m_object(&allocator),
              m_vt({
                      // Allocate
                      [](void* o, std::size_t n, std::size_t al) noexcept -> void* {
                          return static_cast<A*>(o)->Allocate(n, al);
                      },
                      // Deallocate
                      [](void* o, void* p, std::size_t n, std::size_t al) noexcept {
                          static_cast<A*>(o)->Deallocate(p, n, al);
                      },
                      // MaxSize
                      [](const void* o) noexcept -> std::size_t {
                          return AllocatorTraits<A>::MaxSize(*static_cast<const A*>(o));
                      },
              })
        {
        }

        [[nodiscard]] void* Allocate(std::size_t n, std::size_t alignmentInBytes) noexcept
        {
            return m_vt.allocate(m_object, n, alignmentInBytes);
        }

        void Deallocate(void* p, std::size_t n, std::size_t alignmentInBytes) noexcept
        {
            m_vt.deallocate(m_object, p, n, alignmentInBytes);
        }

        [[nodiscard]] std::size_t MaxSize() const noexcept
        {
            return m_vt.maxSize(m_object);
        }

        [[nodiscard]] bool HasValue() const noexcept { return m_object != nullptr; }
        explicit           operator bool() const noexcept { return HasValue(); }

    private:
        struct VTable
        {
            void* (*allocate)(void*, std::size_t, std::size_t) noexcept;
            void (*deallocate)(void*, void*, std::size_t, std::size_t) noexcept;
            std::size_t (*maxSize)(const void*) noexcept;
        };

        void*  m_object;
        VTable m_vt;
    };

    static_assert(AllocatorConcept<PolyAllocatorRef>);
}// namespace BENC::Memory
