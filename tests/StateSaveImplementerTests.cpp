#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "TestParticipants.h"

using namespace SnAPI::StateSync;
using namespace SnAPI::StateSync::Testing;

namespace
{
/**
 * @brief Participant with two fixed-size fields, so record sizes are predictable.
 */
class TrackedValues final : public StateComponent
{
public:
    explicit TrackedValues(StateSyncRuntime& InRuntime)
        : StateComponent(InRuntime, "SnAPI::StateSync::Testing::TrackedValues", "World/Tracked")
    {
    }

    int32_t A = 1;
    float B = 2.0f;
    std::vector<int32_t> C{1, 2};

protected:
    bool SerializeStateInternal(ISerializer& Serializer, int32_t, EStateSaveLevel Level, StateSaveOptions Options) override
    {
        bool Any = SerializeStateValue(Serializer, Level, Options, "A", A);
        Any |= SerializeStateValue(Serializer, Level, Options, "B", B);
        if (Serializer.SupportsVersion(2))
        {
            Any |= SerializeStateValue(Serializer, Level, Options, "C", C);
        }
        return Any;
    }
};

std::vector<uint8_t> Save(TrackedValues& Values, EStateSaveLevel Level, StateSaveOptions Options = EStateSaveOption::None)
{
    std::vector<uint8_t> Bytes;
    BinarySerializer Writer(Bytes);
    Values.SerializeState(Writer, 0, Level, Options);
    return Bytes;
}

bool Load(TrackedValues& Values, const std::vector<uint8_t>& Bytes, EStateSaveLevel Level)
{
    BinarySerializer Reader(std::span<const uint8_t>(Bytes), kCurrentBinaryVersion);
    const bool Any = Values.SerializeState(Reader, 0, Level, EStateSaveOption::None);
    REQUIRE(Reader.AtEnd());
    return Any;
}

// Presence byte plus payload for A and B; the binary version gates C out.
constexpr std::size_t kCompleteSize = 1 + 4 + 1 + 4;
} // namespace

TEST_CASE("Complete saves write every field")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();

    REQUIRE(Save(Values, EStateSaveLevel::Complete).size() == kCompleteSize);
    REQUIRE(Save(Values, EStateSaveLevel::Complete).size() == kCompleteSize);
}

TEST_CASE("Incremental saves carry only changed fields")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();

    SECTION("nothing changed")
    {
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave) == std::vector<uint8_t>{0, 0});
    }

    SECTION("one field changed, then saved")
    {
        Values.A = 42;
        const auto First = Save(Values, EStateSaveLevel::ChangesSincePreviousSave);
        REQUIRE(First.size() == 1 + 4 + 1);
        REQUIRE(First.front() == 1);
        REQUIRE(First.back() == 0);

        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave) == std::vector<uint8_t>{0, 0});
    }

    SECTION("changes since the beginning ignore intermediate saves")
    {
        Values.B = 5.0f;
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave).size() == 1 + 1 + 4);
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSinceBeginning).size() == 1 + 1 + 4);
        Values.B = 2.0f;
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSinceBeginning) == std::vector<uint8_t>{0, 0});
    }

    SECTION("DontCacheChanges leaves the last-save baseline alone")
    {
        Values.A = 9;
        const StateSaveOptions Options = EStateSaveOption::DontCacheChanges;
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave, Options).size() == 6);
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave).size() == 6);
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave).size() == 2);
    }

    SECTION("DontCheckCache forces every field")
    {
        REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave, EStateSaveOption::DontCheckCache).size() == kCompleteSize);
    }

    SECTION("DontSerialize writes nothing but still reports changes")
    {
        Values.A = 3;
        std::vector<uint8_t> Bytes;
        BinarySerializer Writer(Bytes);
        REQUIRE(Values.SerializeState(Writer, 0, EStateSaveLevel::ChangesSincePreviousSave,
            EStateSaveOption::DontSerialize | EStateSaveOption::DontCacheChanges));
        REQUIRE(Bytes.empty());
    }
}

TEST_CASE("Float changes below the precision threshold are ignored")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();

    Values.B += kDefaultPrecisionThreshold / 10.0f;
    REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave) == std::vector<uint8_t>{0, 0});

    Values.B += 1.0f;
    REQUIRE(Save(Values, EStateSaveLevel::ChangesSincePreviousSave).size() == 6);
}

TEST_CASE("Loaded values become the last-save baseline")
{
    TestRuntime Source;
    TestRuntime Target;
    TrackedValues Written(Source.Runtime);
    TrackedValues Read(Target.Runtime);
    REQUIRE(Written.Initialize());
    REQUIRE(Read.Initialize());
    Source.Runtime.EndFrame();
    Target.Runtime.EndFrame();

    Written.A = 77;
    const auto Bytes = Save(Written, EStateSaveLevel::ChangesSincePreviousSave);
    REQUIRE(Load(Read, Bytes, EStateSaveLevel::ChangesSincePreviousSave));
    REQUIRE(Read.A == 77);
    REQUIRE(Read.B == Catch::Approx(2.0f));

    REQUIRE(Save(Read, EStateSaveLevel::ChangesSincePreviousSave) == std::vector<uint8_t>{0, 0});
    REQUIRE(Save(Read, EStateSaveLevel::ChangesSinceBeginning).size() == 6);
}

TEST_CASE("Loading an empty change set transfers nothing")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();

    const int Before = Values.StateImplementer().SerializeCounter();
    REQUIRE_FALSE(Load(Values, {0, 0}, EStateSaveLevel::ChangesSincePreviousSave));
    REQUIRE(Values.StateImplementer().SerializeCounter() == Before);
}

TEST_CASE("Fields gated by a newer binary version are skipped by older streams")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());

    std::vector<uint8_t> Bytes;
    BinarySerializer Writer(Bytes, 2);
    Values.SerializeState(Writer, 0, EStateSaveLevel::Complete, EStateSaveOption::None);
    // Presence byte, count varint and two 4-byte elements follow the version 1 fields.
    REQUIRE(Bytes.size() == kCompleteSize + 1 + 1 + 4 + 4);
}

TEST_CASE("Inspection events report field names and values")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();

    auto& Events = Test.Runtime.StateSaves().Events;
    std::vector<std::string> Names;
    int StatesSerialized = 0;
    bool SawNewValue = false;
    Events.VarSerialized.Add([&](const StateSaveEventArgs& Args) {
        Names.push_back(Args.VarName);
        if (Args.VarName == "A")
        {
            SawNewValue = Args.NewValue.AsConstRef<int32_t>()->get() == 5 && !Args.IsReading;
        }
    });
    Events.StateSerialized.Add([&](const StateSaveEventArgs& Args) {
        REQUIRE(Args.Participant == &Values);
        ++StatesSerialized;
    });

    Values.A = 5;
    Save(Values, EStateSaveLevel::ChangesSincePreviousSave);
    REQUIRE(Names == std::vector<std::string>{"A"});
    REQUIRE(SawNewValue);
    REQUIRE(StatesSerialized == 1);
}

TEST_CASE("Baselines can be reset and cleared")
{
    TestRuntime Test;
    TrackedValues Values(Test.Runtime);
    REQUIRE(Values.Initialize());
    Test.Runtime.EndFrame();
    REQUIRE(Values.StateImplementer().HasBaseline("A"));

    Values.A = 11;
    Values.StoreInitialState();
    REQUIRE(Save(Values, EStateSaveLevel::ChangesSinceBeginning) == std::vector<uint8_t>{0, 0});

    Values.StateImplementer().ClearBaselines();
    REQUIRE_FALSE(Values.StateImplementer().HasBaseline("A"));
}
