#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestParticipants.h"

using namespace SnAPI::StateSync;
using namespace SnAPI::StateSync::Testing;

TEST_CASE("Event wire layout")
{
    TestRuntime Test;
    HealthComponent Component(Test.Runtime, "World/Wire");
    REQUIRE(Component.Initialize());

    const auto Args = SyncEventArgs::Method("SetHealth", {Variant::FromValue<int32_t>(-2)});
    const auto Bytes = SerializeEventBinary(Component, Args);
    REQUIRE(Bytes);

    // id, kind byte, name length and characters, argument count, tag and zig-zag payload
    const std::vector<uint8_t> Expected = [&] {
        std::vector<uint8_t> Result;
        const auto Id = ToBytes(Component.UniqueId());
        Result.insert(Result.end(), Id.begin(), Id.end());
        Result.push_back(static_cast<uint8_t>(ESyncEventKind::MethodInvoked));
        Result.push_back(9);
        for (char Character : std::string("SetHealth"))
        {
            Result.push_back(static_cast<uint8_t>(Character));
        }
        Result.push_back(1);
        Result.push_back(static_cast<uint8_t>(EVarType::Int32));
        Result.push_back(3);
        return Result;
    }();
    REQUIRE(*Bytes == Expected);
}

TEST_CASE("Events decode back to the same call")
{
    TestRuntime Test;
    HealthComponent Component(Test.Runtime, "World/Decode");
    REQUIRE(Component.Initialize());

    const auto Args = SyncEventArgs::Property("Speed", Variant::FromValue<float>(2.5f));
    const auto Bytes = SerializeEventBinary(Component, Args);
    REQUIRE(Bytes);

    const auto Decoded = DeserializeEventBinary(*Bytes, kCurrentBinaryVersion, Test.Runtime.UniqueIds());
    REQUIRE(Decoded);
    REQUIRE(Decoded->Target == &Component);
    REQUIRE(Decoded->Args.Kind == ESyncEventKind::PropertyChanged);
    REQUIRE(Decoded->Args.MemberName == "Speed");
    REQUIRE(Decoded->Args.ToString() == "Speed = 2.5");
}

TEST_CASE("Event text form")
{
    const auto Method = SyncEventArgs::Method("Move", {Variant::FromValue<int32_t>(1), Variant::FromValue<std::string>("up")});
    REQUIRE(Method.ToString() == "Move(1, \"up\")");
    REQUIRE(SyncEventArgs::Method("Reset", {}).ToString() == "Reset()");
    REQUIRE(ToString(ESyncEventKind::PropertyChanged) == "PropertyChanged");
}

TEST_CASE("Malformed events are rejected")
{
    TestRuntime Test;
    HealthComponent Component(Test.Runtime, "World/Malformed");
    REQUIRE(Component.Initialize());
    auto Bytes = SerializeEventBinary(Component, SyncEventArgs::Method("SetHealth", {Variant::FromValue<int32_t>(1)})).value();

    SECTION("unknown kind")
    {
        Bytes[16] = 7;
        const auto Decoded = DecodeEventBinary(Bytes, kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::DeserializationFailed);
    }

    SECTION("trailing bytes")
    {
        Bytes.push_back(0);
        const auto Decoded = DecodeEventBinary(Bytes, kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::DeserializationFailed);
    }

    SECTION("truncated arguments")
    {
        Bytes.pop_back();
        const auto Decoded = DecodeEventBinary(Bytes, kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::DeserializationFailed);
    }

    SECTION("unknown variant tag")
    {
        Bytes[Bytes.size() - 2] = 200;
        const auto Decoded = DecodeEventBinary(Bytes, kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::UnknownVariant);
    }

    SECTION("property events carry exactly one value")
    {
        SyncEventArgs Broken = SyncEventArgs::Property("Speed", Variant::FromValue<float>(1.0f));
        Broken.Args.push_back(Variant::FromValue<float>(2.0f));
        const auto Encoded = SerializeEventBinary(Component, Broken);
        REQUIRE(Encoded);
        const auto Decoded = DecodeEventBinary(*Encoded, kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::DeserializationFailed);
    }

    SECTION("unresolvable target")
    {
        UniqueIdRegistry Empty;
        SyncEventArgs Args;
        const auto Decoded = DeserializeEventBinary(Bytes, kCurrentBinaryVersion, Empty, &Args);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::UnknownTarget);
        REQUIRE(Args.MemberName == "SetHealth");
        REQUIRE(Args.Args.size() == 1);
    }
}

TEST_CASE("Variant list nesting is bounded")
{
    TestRuntime Test;
    HealthComponent Component(Test.Runtime, "World/Nested");
    REQUIRE(Component.Initialize());

    const auto Nested = [&](int Depth) {
        std::vector<uint8_t> Bytes;
        const auto Id = ToBytes(Component.UniqueId());
        Bytes.insert(Bytes.end(), Id.begin(), Id.end());
        Bytes.push_back(static_cast<uint8_t>(ESyncEventKind::MethodInvoked));
        Bytes.push_back(1);
        Bytes.push_back(static_cast<uint8_t>('X'));
        Bytes.push_back(1);
        // each level is a one-element list; the innermost element is null
        for (int Level = 0; Level < Depth; ++Level)
        {
            Bytes.push_back(static_cast<uint8_t>(EVarType::VariantList));
            Bytes.push_back(1);
        }
        Bytes.push_back(static_cast<uint8_t>(EVarType::Null));
        return Bytes;
    };

    SECTION("shallow lists decode")
    {
        const auto Decoded = DecodeEventBinary(Nested(3), kCurrentBinaryVersion);
        REQUIRE(Decoded);
        REQUIRE(Decoded->Args.Args.size() == 1);
    }

    SECTION("deep lists are rejected")
    {
        const auto Decoded = DecodeEventBinary(Nested(200), kCurrentBinaryVersion);
        REQUIRE_FALSE(Decoded);
        REQUIRE(Decoded.error().Code == EErrorCode::DeserializationFailed);
    }

    SECTION("the limit is released after a rejection")
    {
        REQUIRE_FALSE(DecodeEventBinary(Nested(200), kCurrentBinaryVersion));
        REQUIRE(DecodeEventBinary(Nested(kMaxVariantNesting - 1), kCurrentBinaryVersion));
    }
}

TEST_CASE("Objects without an id cannot send events")
{
    TestRuntime Test;
    HealthComponent Unregistered(Test.Runtime, "World/Unregistered");
    const auto Bytes = SerializeEventBinary(Unregistered, SyncEventArgs::Method("Reset", {}));
    REQUIRE_FALSE(Bytes);
    REQUIRE(Bytes.error().Code == EErrorCode::NotReady);
}
