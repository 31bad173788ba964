/// @file OptionalTests.cpp
/// @brief Tests for BENC::Utilities::Optional.

#include <BENC/Utilities/Optional.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>
#include <type_traits>
#include <utility>

namespace
{
    struct CountingType
    {
        inline static int s_defaultCtorCount = 0;
        inline static int s_copyCtorCount    = 0;
        inline static int s_moveCtorCount    = 0;
        inline static int s_dtorCount        = 0;

        CountingType() { ++s_defaultCtorCount; }
        CountingType(const CountingType& other)
            : value {other.value}
        {
            ++s_copyCtorCount;
        }
        CountingType(CountingType&& other) noexcept
            : value {other.value}
        {
            ++s_moveCtorCount;
        }
        CountingType& operator=(const CountingType&)     = default;
        CountingType& operator=(CountingType&&) noexcept = default;
        ~CountingType() { ++s_dtorCount; }

        static void ResetCounts()
        {
            s_defaultCtorCount = 0;
            s_copyCtorCount    = 0;
            s_moveCtorCount    = 0;
            s_dtorCount        = 0;
        }

        int value {0};
    };

    struct NoCopyAssign
    {
        inline static int s_dtorCount = 0;

        NoCopyAssign() = default;
        explicit NoCopyAssign(int v)
            : value {v}
        {
        }

        NoCopyAssign(const NoCopyAssign&)     = default;
        NoCopyAssign(NoCopyAssign&&) noexcept = default;

        NoCopyAssign& operator=(const NoCopyAssign&)     = delete;
        NoCopyAssign& operator=(NoCopyAssign&&) noexcept = default;

        ~NoCopyAssign() { ++s_dtorCount; }

        int value {0};
    };
}// namespace

TEST_CASE("Optional default constructs empty", "[Utilities][Optional]")
{
    BENC::Utilities::Optional<int> opt;
    CHECK(!opt.HasValue());
    CHECK(static_cast<bool>(opt) == false);
    CHECK(opt.ValueOr(7) == 7);
}

TEST_CASE("Optional emplace/value access", "[Utilities][Optional]")
{
    BENC::Utilities::Optional<int> opt;
    opt.Emplace(123);
    REQUIRE(opt.HasValue());
    CHECK(opt.Value() == 123);
    CHECK(*opt == 123);
    CHECK(opt.ValueUnsafe() == 123);
    CHECK(opt.ValueOr(7) == 123);
}

TEST_CASE("Optional constructed from a value is engaged", "[Utilities][Optional]")
{
    const BENC::Utilities::Optional<std::string_view> opt {std::string_view {"spam"}};
    REQUIRE(opt.HasValue());
    CHECK(opt->size() == 4);
    CHECK(*opt == "spam");
}

TEST_CASE("Optional reset destroys when non-trivial", "[Utilities][Optional]")
{
    CountingType::ResetCounts();

    BENC::Utilities::Optional<CountingType> opt;
    opt.Emplace();
    REQUIRE(opt.HasValue());

    opt.Reset();
    CHECK(!opt.HasValue());
    CHECK(CountingType::s_dtorCount == 1);

    opt.Reset();
    CHECK(CountingType::s_dtorCount == 1);
}

TEST_CASE("Optional copy/move preserve engaged state", "[Utilities][Optional]")
{
    CountingType::ResetCounts();

    BENC::Utilities::Optional<CountingType> a;
    a.Emplace().value = 5;

    BENC::Utilities::Optional<CountingType> b {a};
    REQUIRE(b.HasValue());
    CHECK(b.Value().value == 5);
    CHECK(CountingType::s_copyCtorCount == 1);

    BENC::Utilities::Optional<CountingType> c {std::move(a)};
    REQUIRE(c.HasValue());
    CHECK(c.Value().value == 5);
    CHECK(CountingType::s_moveCtorCount == 1);
}

TEST_CASE("Optional triviality for trivially copyable T", "[Utilities][Optional]")
{
    using OptInt = BENC::Utilities::Optional<int>;
    static_assert(std::is_trivially_copyable_v<OptInt>);
    static_assert(std::is_trivially_destructible_v<OptInt>);

    using OptView = BENC::Utilities::Optional<std::string_view>;
    static_assert(std::is_trivially_copyable_v<OptView>);
}

TEST_CASE("Optional copy assignment reconstructs when T not copy-assignable", "[Utilities][Optional]")
{
    NoCopyAssign::s_dtorCount = 0;

    BENC::Utilities::Optional<NoCopyAssign> a;
    a.Emplace(1);
    BENC::Utilities::Optional<NoCopyAssign> b;
    b.Emplace(2);

    b = a;
    REQUIRE(b.HasValue());
    CHECK(b.Value().value == 1);
    CHECK(NoCopyAssign::s_dtorCount == 1);
}

TEST_CASE("Optional self-assignment is a no-op", "[Utilities][Optional]")
{
    BENC::Utilities::Optional<int> opt;
    opt.Emplace(42);
    auto& self = opt;
    opt        = self;
    CHECK(opt.HasValue());
    CHECK(opt.Value() == 42);
}
