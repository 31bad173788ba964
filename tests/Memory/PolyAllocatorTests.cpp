/// @file PolyAllocatorTests.cpp
/// @brief Tests for the type-erased PolyAllocatorRef.

#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Memory/SystemAllocator.hpp>
#include <BENC/Memory/TrackingAllocator.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("PolyAllocatorRef default constructs empty", "[Memory][PolyAllocator]")
{
    BENC::Memory::PolyAllocatorRef ref;
    CHECK_FALSE(ref.HasValue());
    CHECK_FALSE(static_cast<bool>(ref));
    CHECK(ref.Allocate(16, 8) == nullptr);
    CHECK(ref.MaxSize() == 0U);
    ref.Deallocate(nullptr, 16, 8);
}

TEST_CASE("PolyAllocatorRef forwards to the referenced allocator", "[Memory][PolyAllocator]")
{
    BENC::Memory::Tracking<BENC::Memory::SystemAllocator> tracked;
    BENC::Memory::PolyAllocatorRef                        ref {tracked};
    REQUIRE(ref.HasValue());

    void* p = ref.Allocate(24, 8);
    REQUIRE(p != nullptr);
    CHECK(tracked.GetStats().currentBytes == 24U);
    CHECK(ref.MaxSize() == tracked.MaxSize());

    BENC::Memory::PolyAllocatorRef copy = ref;
    copy.Deallocate(p, 24, 8);
    CHECK_FALSE(tracked.HasLiveAllocations());
}
