#include <BENC/Memory/PolyAllocator.hpp>
#include <BENC/Memory/SystemAllocator.hpp>
#include <BENC/Memory/TrackingAllocator.hpp>
#include <BENC/Serialization/Bencode/BencodeDecoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string_view>
#include <tuple>

using namespace BENC;
using namespace BENC::Serialization;

namespace
{
    struct Empty
    {
    };

    struct FooBarBaz
    {
        Int32        foo {0};
        OwnedBytes   bar;
        List<Int32>  baz;
    };

    struct FooBar
    {
        Int32            foo {0};
        std::string_view bar;
    };

    struct OptionalFooBar
    {
        Utilities::Optional<Int32>      foo;
        Utilities::Optional<OwnedBytes> bar;
        List<Int32>                     baz;
    };

    struct Defaulted
    {
        Int32 foo {0};
        Int32 bar {0};
    };

    struct Peer
    {
        std::string_view        ip;
        UInt16                  port {0};
        std::array<UInt8, 2>    flags {};
    };

    struct Swarm
    {
        List<Peer>              peers;
        Utilities::Optional<Peer> tracker;
    };
}// namespace

template<>
struct BENC::Serialization::BencodeRecord<Empty>
{
    static constexpr auto Fields = std::tuple {};
};

template<>
struct BENC::Serialization::BencodeRecord<FooBarBaz>
{
    static constexpr auto Fields = std::tuple {
            Field("foo", &FooBarBaz::foo),
            Field("bar", &FooBarBaz::bar),
            Field("baz", &FooBarBaz::baz),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<FooBar>
{
    static constexpr auto Fields = std::tuple {
            Field("foo", &FooBar::foo),
            Field("bar", &FooBar::bar),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<OptionalFooBar>
{
    static constexpr auto Fields = std::tuple {
            Field("foo", &OptionalFooBar::foo),
            Field("bar", &OptionalFooBar::bar),
            Field("baz", &OptionalFooBar::baz),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<Defaulted>
{
    static constexpr auto Fields = std::tuple {
            Field("foo", &Defaulted::foo),
            Field("bar", &Defaulted::bar).WithDefault(2),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<Peer>
{
    static constexpr auto Fields = std::tuple {
            Field("ip", &Peer::ip),
            Field("port", &Peer::port),
            Field("flags", &Peer::flags).WithDefault(std::array<UInt8, 2> {7, 9}),
    };
};

template<>
struct BENC::Serialization::BencodeRecord<Swarm>
{
    static constexpr auto Fields = std::tuple {
            Field("peers", &Swarm::peers),
            Field("tracker", &Swarm::tracker),
    };
};

static_assert(RecordShape<FooBarBaz>);
static_assert(ContainsOwnedNode<FooBarBaz>);
static_assert(!ContainsOwnedNode<FooBar>);
static_assert(!ContainsOwnedNode<Peer>);
static_assert(ContainsOwnedNode<Swarm>);
static_assert(!RecordShape<int>);

namespace
{
    using TrackedAllocator = Memory::Tracking<Memory::SystemAllocator>;

    BencodeDecodeOptions WithAllocator(TrackedAllocator& allocator)
    {
        BencodeDecodeOptions options;
        options.allocator = Memory::PolyAllocatorRef {allocator};
        return options;
    }
}// namespace

TEST_CASE("Bencode record decodes an empty dictionary", "[serialization][bencode]")
{
    auto result = BencodeDecoder::Decode<Empty>(std::string_view {"de"});
    CHECK(result.HasValue());

    auto ignored = BencodeDecoder::Decode<Empty>(std::string_view {"d3:fooi1ee"});
    CHECK(ignored.HasValue());
}

TEST_CASE("Bencode record matches keys independent of order", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    for (std::string_view input: {std::string_view {"d3:bar4:spam3:fooi42e3:bazli1ei2eee"},
                                  std::string_view {"d3:bazli1ei2ee3:fooi42e3:bar4:spame"}})
    {
        auto result = BencodeDecoder::Decode<FooBarBaz>(input, options);
        REQUIRE(result.HasValue());
        FooBarBaz& value = result.ValueUnsafe();
        CHECK(value.foo == 42);
        CHECK(value.bar.View() == "spam");
        REQUIRE(value.baz.Size() == 2);
        CHECK(value.baz[0] == 1);
        CHECK(value.baz[1] == 2);

        BencodeDecoder::Release(value, options.allocator);
        CHECK_FALSE(allocator.HasLiveAllocations());
    }
}

TEST_CASE("Bencode record skips unknown keys and their nested values", "[serialization][bencode]")
{
    auto result = BencodeDecoder::Decode<FooBar>(std::string_view {"d3:bar4:spam3:fooi42e3:bazli1ei2eee"});
    REQUIRE(result.HasValue());
    CHECK(result.ValueUnsafe().foo == 42);
    CHECK(result.ValueUnsafe().bar == "spam");

    auto deep = BencodeDecoder::Decode<FooBar>(std::string_view {"d5:extrad1:xllli1eeee1:y0:e3:fooi1e3:bar0:e"});
    REQUIRE(deep.HasValue());
    CHECK(deep.ValueUnsafe().foo == 1);
    CHECK(deep.ValueUnsafe().bar.empty());
}

TEST_CASE("Bencode record leaves absent optional fields empty", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    auto result = BencodeDecoder::Decode<OptionalFooBar>(std::string_view {"d3:bar4:spam3:bazli1ei2eee"}, options);
    REQUIRE(result.HasValue());
    OptionalFooBar& value = result.ValueUnsafe();
    CHECK_FALSE(value.foo.HasValue());
    REQUIRE(value.bar.HasValue());
    CHECK(value.bar->View() == "spam");
    REQUIRE(value.baz.Size() == 2);
    CHECK(value.baz[1] == 2);

    BencodeDecoder::Release(value, options.allocator);
    CHECK_FALSE(value.bar.HasValue());
    CHECK_FALSE(allocator.HasLiveAllocations());
}

TEST_CASE("Bencode record applies declared defaults", "[serialization][bencode]")
{
    auto result = BencodeDecoder::Decode<Defaulted>(std::string_view {"d3:fooi1ee"});
    REQUIRE(result.HasValue());
    CHECK(result.ValueUnsafe().foo == 1);
    CHECK(result.ValueUnsafe().bar == 2);

    auto overridden = BencodeDecoder::Decode<Defaulted>(std::string_view {"d3:bari5e3:fooi1ee"});
    REQUIRE(overridden.HasValue());
    CHECK(overridden.ValueUnsafe().bar == 5);
}

TEST_CASE("Bencode record reports missing required fields", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    auto result = BencodeDecoder::Decode<FooBarBaz>(std::string_view {"d3:fooi42e3:bazli1ei2eee"}, options);
    REQUIRE_FALSE(result.HasValue());
    CHECK(result.ErrorUnsafe().code == ParseErrorCode::MissingField);
    CHECK(result.ErrorUnsafe().field == "bar");
    CHECK_FALSE(allocator.HasLiveAllocations());

    auto missingFoo = BencodeDecoder::Decode<Defaulted>(std::string_view {"de"});
    REQUIRE_FALSE(missingFoo.HasValue());
    CHECK(missingFoo.ErrorUnsafe().field == "foo");
}

TEST_CASE("Bencode record reports truncated dictionaries", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    for (std::string_view input: {std::string_view {"d"}, std::string_view {"d3:bar4:spam3:fooi42e3:bazli1ei2ee"},
                                  std::string_view {"d3:foo"}, std::string_view {"d3:fooe"}})
    {
        auto result = BencodeDecoder::Decode<FooBarBaz>(input, options);
        REQUIRE_FALSE(result.HasValue());
        CHECK(result.ErrorUnsafe().code == ParseErrorCode::UnexpectedEnd);
        CHECK_FALSE(allocator.HasLiveAllocations());
    }
}

TEST_CASE("Bencode record rejects non-string keys", "[serialization][bencode]")
{
    auto result = BencodeDecoder::Decode<FooBar>(std::string_view {"di1ei2ee"});
    REQUIRE_FALSE(result.HasValue());
    CHECK(result.ErrorUnsafe().code == ParseErrorCode::UnexpectedToken);

    auto notADict = BencodeDecoder::Decode<FooBar>(std::string_view {"le"});
    REQUIRE_FALSE(notADict.HasValue());
    CHECK(notADict.ErrorUnsafe().code == ParseErrorCode::UnexpectedToken);
}

TEST_CASE("Bencode record keeps the last duplicate key", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    auto result = BencodeDecoder::Decode<FooBarBaz>(std::string_view {"d3:bar4:spam3:fooi1e3:bazle3:bar3:egg3:fooi2ee"}, options);
    REQUIRE(result.HasValue());
    CHECK(result.ValueUnsafe().foo == 2);
    CHECK(result.ValueUnsafe().bar.View() == "egg");
    CHECK(allocator.GetStats().currentBytes == 3U);

    BencodeDecoder::Release(result.ValueUnsafe(), options.allocator);
    CHECK_FALSE(allocator.HasLiveAllocations());
}

TEST_CASE("Bencode record decodes nested records, lists and fixed bytes", "[serialization][bencode]")
{
    TrackedAllocator allocator;
    const auto       options = WithAllocator(allocator);

    const std::string_view input =
            "d5:peersld2:ip9:127.0.0.14:porti6881eed5:flags2:\x01\x02"
            "2:ip3:::14:porti51413eee7:trackerd2:ip4:host4:porti80eee";
    auto result = BencodeDecoder::Decode<Swarm>(input, options);
    REQUIRE(result.HasValue());
    Swarm& swarm = result.ValueUnsafe();

    REQUIRE(swarm.peers.Size() == 2);
    CHECK(swarm.peers[0].ip == "127.0.0.1");
    CHECK(swarm.peers[0].port == 6881);
    CHECK(swarm.peers[0].flags[0] == 7);
    CHECK(swarm.peers[0].flags[1] == 9);
    CHECK(swarm.peers[1].ip == "::1");
    CHECK(swarm.peers[1].port == 51413);
    CHECK(swarm.peers[1].flags[0] == 1);
    CHECK(swarm.peers[1].flags[1] == 2);

    REQUIRE(swarm.tracker.HasValue());
    CHECK(swarm.tracker->ip == "host");
    CHECK(swarm.tracker->port == 80);

    BencodeDecoder::Release(swarm, options.allocator);
    CHECK(swarm.peers.Empty());
    CHECK_FALSE(allocator.HasLiveAllocations());
}
