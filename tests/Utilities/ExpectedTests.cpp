#include <BENC/Utilities/Expected.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>
#include <type_traits>
#include <utility>

namespace
{
    struct MoveOnly
    {
        int value {0};

        explicit MoveOnly(int v) noexcept
            : value {v}
        {
        }

        MoveOnly(const MoveOnly&)            = delete;
        MoveOnly& operator=(const MoveOnly&) = delete;

        MoveOnly(MoveOnly&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        MoveOnly& operator=(MoveOnly&& other) noexcept
        {
            value       = other.value;
            other.value = -1;
            return *this;
        }
    };

    struct CountingError
    {
        inline static int s_destructCount = 0;

        int value {0};

        explicit CountingError(int v) noexcept
            : value {v}
        {
        }

        CountingError(const CountingError& other) noexcept
            : value {other.value}
        {
        }

        CountingError(CountingError&& other) noexcept
            : value {other.value}
        {
            other.value = -1;
        }

        CountingError& operator=(const CountingError&) = default;
        CountingError& operator=(CountingError&&)      = default;

        ~CountingError() { ++s_destructCount; }

        static void Reset() { s_destructCount = 0; }
    };
}// namespace

TEST_CASE("Expected<T,E> basic value construction", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<int, int>;

    Expected a {42};
    REQUIRE(a.HasValue());
    REQUIRE(static_cast<bool>(a));
    REQUIRE(a.Value() == 42);
    REQUIRE(a.ValueUnsafe() == 42);
}

TEST_CASE("Expected<T,E> basic error construction", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<int, std::string_view>;

    Expected e {BENC::Utilities::Unexpected<std::string_view> {"boom"}};
    REQUIRE_FALSE(e.HasValue());
    REQUIRE_FALSE(static_cast<bool>(e));
    REQUIRE(e.Error() == "boom");
    REQUIRE(e.ErrorUnsafe() == "boom");
}

TEST_CASE("Expected<T,E> move-only value", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<MoveOnly, int>;

    Expected a {MoveOnly {5}};
    REQUIRE(a.HasValue());
    REQUIRE(a.Value().value == 5);

    Expected b {std::move(a)};
    REQUIRE(b.HasValue());
    REQUIRE(b.Value().value == 5);
    REQUIRE(a.ValueUnsafe().value == -1);

    static_assert(!std::is_copy_constructible_v<Expected>);
}

TEST_CASE("Expected<T,E> ValueOr", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<int, int>;

    const Expected hasValue {3};
    const Expected hasError {BENC::Utilities::Unexpected<int> {11}};

    REQUIRE(hasValue.ValueOr(99) == 3);
    REQUIRE(hasError.ValueOr(99) == 99);
}

TEST_CASE("Expected<T,E> rvalue Value accessor moves", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<MoveOnly, int>;
    Expected a {MoveOnly {42}};

    MoveOnly extracted = std::move(a).Value();
    REQUIRE(extracted.value == 42);
    REQUIRE(a.HasValue());
    REQUIRE(a.ValueUnsafe().value == -1);
}

TEST_CASE("Expected<T,E> assignment switches alternatives", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<int, CountingError>;

    CountingError::Reset();
    {
        Expected e {BENC::Utilities::Unexpected<CountingError> {CountingError {7}}};
        const int destroyedBefore = CountingError::s_destructCount;

        e = Expected {1};
        REQUIRE(e.HasValue());
        REQUIRE(e.Value() == 1);
        // The held error is destroyed when the value replaces it.
        REQUIRE(CountingError::s_destructCount == destroyedBefore + 1);

        e = Expected {BENC::Utilities::Unexpected<CountingError> {CountingError {9}}};
        REQUIRE_FALSE(e.HasValue());
        REQUIRE(e.Error().value == 9);
    }
}

TEST_CASE("Expected<void,E> success and error", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<void, int>;

    Expected ok;
    REQUIRE(ok.HasValue());

    Expected err {BENC::Utilities::Unexpected<int> {8}};
    REQUIRE_FALSE(err.HasValue());
    REQUIRE(err.Error() == 8);

    ok = std::move(err);
    REQUIRE_FALSE(ok.HasValue());
    REQUIRE(ok.Error() == 8);
}

TEST_CASE("Expected<void,E> destroys its error", "[Utilities][Expected]")
{
    using Expected = BENC::Utilities::Expected<void, CountingError>;

    CountingError::Reset();
    int destroyedBefore = 0;
    {
        Expected e {BENC::Utilities::Unexpected<CountingError> {CountingError {17}}};
        REQUIRE_FALSE(e.HasValue());
        REQUIRE(e.Error().value == 17);
        destroyedBefore = CountingError::s_destructCount;
    }

    REQUIRE(CountingError::s_destructCount == destroyedBefore + 1);
}
