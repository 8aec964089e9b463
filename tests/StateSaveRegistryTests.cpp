#include <stdexcept>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestParticipants.h"

using namespace SnAPI::StateSync;
using namespace SnAPI::StateSync::Testing;

TEST_CASE("Participants without state are excluded at registration")
{
    TestRuntime Test;
    auto& Registry = Test.Runtime.StateSaves();
    EmptyComponent Empty(Test.Runtime, "World/Empty");
    REQUIRE(Empty.Initialize());

    REQUIRE(Registry.IsExcluded(Empty));
    REQUIRE_FALSE(Registry.IsRegistered(Empty));
    REQUIRE(Registry.AllParticipants().empty());
    REQUIRE(Test.Runtime.UniqueIds().IsRegistered(Empty));

    SECTION("registering again does not run again")
    {
        Empty.HasField = true;
        REQUIRE(Registry.Register(Empty).value() == false);
    }

    SECTION("reconsidering admits a participant that gained state")
    {
        Empty.HasField = true;
        REQUIRE(Registry.Reconsider(Empty).value());
        REQUIRE_FALSE(Registry.IsExcluded(Empty));
        REQUIRE(Registry.IsEnabled(Empty));
    }
}

TEST_CASE("A throwing dry run excludes the participant")
{
    TestRuntime Test;

    /**
     * @brief Participant whose dry run throws.
     */
    class ThrowingDryRun final : public StateComponent
    {
    public:
        explicit ThrowingDryRun(StateSyncRuntime& InRuntime)
            : StateComponent(InRuntime, "SnAPI::StateSync::Testing::ThrowingDryRun", "World/ThrowingDryRun")
        {
        }

    protected:
        bool SerializeStateInternal(ISerializer&, int32_t, EStateSaveLevel, StateSaveOptions) override
        {
            throw std::runtime_error("dry run failure");
        }
    };

    ThrowingDryRun Participant(Test.Runtime);
    REQUIRE(Participant.Initialize());
    REQUIRE(Test.Runtime.StateSaves().IsExcluded(Participant));
}

TEST_CASE("Views are ordered by tier, then registration")
{
    TestRuntime Test;
    HealthComponent ComponentA(Test.Runtime, "World/A");
    HealthComponent Singleton(Test.Runtime, "Managers/Singleton");
    Singleton.Tier = EStateSaveTier::Singleton;
    HealthComponent ComponentB(Test.Runtime, "World/B");
    HealthComponent Global(Test.Runtime, "Managers/Global");
    Global.Tier = EStateSaveTier::GlobalState;

    REQUIRE(ComponentA.Initialize());
    REQUIRE(Singleton.Initialize());
    REQUIRE(ComponentB.Initialize());
    REQUIRE(Global.Initialize());

    const std::vector<IStateSave*> Expected{&Global, &Singleton, &ComponentA, &ComponentB};
    REQUIRE(Test.Runtime.StateSaves().AllParticipants() == Expected);
    REQUIRE(Test.Runtime.StateSaves().EnabledParticipants() == Expected);
    REQUIRE(Test.Runtime.StateSaves().SaveRequiredParticipants() == Expected);
    REQUIRE(Test.Runtime.StateSaves().GlobalState() == &Global);
}

TEST_CASE("Only one global-state participant is allowed")
{
    TestRuntime Test;
    HealthComponent First(Test.Runtime, "Managers/First");
    HealthComponent Second(Test.Runtime, "Managers/Second");
    First.Tier = EStateSaveTier::GlobalState;
    Second.Tier = EStateSaveTier::GlobalState;

    REQUIRE(First.Initialize());
    const auto Rejected = Second.Initialize();
    REQUIRE_FALSE(Rejected);
    REQUIRE(Rejected.error().Code == EErrorCode::AlreadyExists);
    REQUIRE_FALSE(Second.IsInitialized());
    REQUIRE_FALSE(Test.Runtime.UniqueIds().IsRegistered(Second));
}

TEST_CASE("Enabled state drives the enabled and save-required views")
{
    TestRuntime Test;
    auto& Registry = Test.Runtime.StateSaves();
    HealthComponent Plain(Test.Runtime, "World/Plain");
    HealthComponent Persistent(Test.Runtime, "World/Persistent");
    Persistent.SaveWhenDisabled = true;
    REQUIRE(Plain.Initialize());
    REQUIRE(Persistent.Initialize());

    Plain.SetEnabled(false);
    Persistent.SetEnabled(false);

    REQUIRE(Registry.EnabledParticipants().empty());
    REQUIRE(Registry.SaveRequiredParticipants() == std::vector<IStateSave*>{&Persistent});
    REQUIRE(Registry.AllParticipants().size() == 2);

    Plain.SetEnabled(true);
    REQUIRE(Registry.IsEnabled(Plain));
    REQUIRE(Registry.SaveRequiredParticipants() == std::vector<IStateSave*>{&Plain, &Persistent});
}

TEST_CASE("Re-enabled participants keep their registration position")
{
    TestRuntime Test;
    auto& Registry = Test.Runtime.StateSaves();
    HealthComponent First(Test.Runtime, "World/First");
    HealthComponent Second(Test.Runtime, "World/Second");
    HealthComponent Third(Test.Runtime, "World/Third");
    REQUIRE(First.Initialize());
    REQUIRE(Second.Initialize());
    REQUIRE(Third.Initialize());

    First.SetEnabled(false);
    Second.SetEnabled(false);
    REQUIRE(Registry.EnabledParticipants() == std::vector<IStateSave*>{&Third});

    Second.SetEnabled(true);
    First.SetEnabled(true);
    const std::vector<IStateSave*> Expected{&First, &Second, &Third};
    REQUIRE(Registry.EnabledParticipants() == Expected);
    REQUIRE(Registry.SaveRequiredParticipants() == Expected);
}

TEST_CASE("Unregistering removes a participant everywhere")
{
    TestRuntime Test;
    auto& Registry = Test.Runtime.StateSaves();
    HealthComponent Component(Test.Runtime, "World/Removed");
    REQUIRE(Component.Initialize());
    REQUIRE(Registry.PendingBaselineCount() == 1);

    Component.Shutdown();
    REQUIRE_FALSE(Registry.IsRegistered(Component));
    REQUIRE(Registry.AllParticipants().empty());
    REQUIRE(Registry.PendingBaselineCount() == 0);
    REQUIRE_FALSE(Test.Runtime.UniqueIds().IsRegistered(Component));
}

TEST_CASE("Initial baselines are captured in the end-of-frame batch")
{
    TestRuntime Test;
    auto& Registry = Test.Runtime.StateSaves();
    HealthComponent Component(Test.Runtime, "World/Baseline");
    REQUIRE(Component.Initialize());

    // Changes made during the registration frame belong to the initial state.
    Component.SetHealthUnsynced(55);
    REQUIRE(Registry.PendingBaselineCount() == 1);
    Test.Runtime.EndFrame();
    REQUIRE(Registry.PendingBaselineCount() == 0);

    auto Bytes = Test.Runtime.SaveStateChanges(EStateSaveLevel::ChangesSinceBeginning);
    REQUIRE(Bytes);
    REQUIRE(Bytes->size() == kStateStreamHeaderSize);

    Component.SetHealthUnsynced(56);
    Bytes = Test.Runtime.SaveStateChanges(EStateSaveLevel::ChangesSinceBeginning);
    REQUIRE(Bytes);
    REQUIRE(Bytes->size() > kStateStreamHeaderSize);
}
