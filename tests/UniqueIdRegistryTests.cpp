#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "TestParticipants.h"

using namespace SnAPI::StateSync;
using namespace SnAPI::StateSync::Testing;

namespace
{
/**
 * @brief Minimal addressable object.
 */
class NamedObject final : public IUniqueId
{
public:
    explicit NamedObject(std::string InPath, bool InTypeNameId = false)
        : m_path(std::move(InPath))
        , m_typeNameId(InTypeNameId)
    {
    }

    const Uuid& UniqueId() const override
    {
        return m_id;
    }

    std::string_view UniqueTypeName() const override
    {
        return "SnAPI::StateSync::Testing::NamedObject";
    }

    std::string UniquePath() const override
    {
        return m_path;
    }

    bool UniqueIdIsTypeName() const override
    {
        return m_typeNameId;
    }

protected:
    void AssignUniqueId(const Uuid& Id) override
    {
        m_id = Id;
    }

private:
    std::string m_path;
    bool m_typeNameId = false;
    Uuid m_id{};
};
} // namespace

TEST_CASE("Path ids are deterministic across registries")
{
    UniqueIdRegistry First;
    UniqueIdRegistry Second;
    NamedObject A("Level/Door");
    NamedObject B("Level/Door");

    auto IdA = First.Register(A);
    auto IdB = Second.Register(B);
    REQUIRE(IdA);
    REQUIRE(IdB);
    REQUIRE(*IdA == *IdB);
    REQUIRE(*IdA == UuidFromName("Level/Door"));
}

TEST_CASE("Registration is idempotent")
{
    UniqueIdRegistry Registry;
    NamedObject Object("Level/Lamp");
    int Raised = 0;
    Registry.Registered.Add([&Raised](IUniqueId&) { ++Raised; });

    const auto First = Registry.Register(Object);
    const auto Second = Registry.Register(Object, NewUuid());
    REQUIRE(First);
    REQUIRE(Second);
    REQUIRE(*First == *Second);
    REQUIRE(Registry.Count() == 1);
    REQUIRE(Raised == 1);
}

TEST_CASE("Colliding ids are re-derived in registration order")
{
    UniqueIdRegistry Left;
    UniqueIdRegistry Right;
    std::vector<NamedObject> LeftObjects{NamedObject("Spawned"), NamedObject("Spawned"), NamedObject("Spawned")};
    std::vector<NamedObject> RightObjects{NamedObject("Spawned"), NamedObject("Spawned"), NamedObject("Spawned")};

    for (std::size_t Index = 0; Index < LeftObjects.size(); ++Index)
    {
        REQUIRE(Left.Register(LeftObjects[Index]));
        REQUIRE(Right.Register(RightObjects[Index]));
        REQUIRE(LeftObjects[Index].UniqueId() == RightObjects[Index].UniqueId());
    }

    REQUIRE(LeftObjects[0].UniqueId() == UuidFromName("Spawned"));
    REQUIRE(LeftObjects[1].UniqueId() == DeriveUuid(UuidFromName("Spawned"), "Collision1"));
    REQUIRE(LeftObjects[1].UniqueId() != LeftObjects[2].UniqueId());
    REQUIRE(Left.Count() == 3);
}

TEST_CASE("Id preference order")
{
    UniqueIdRegistry Registry;

    SECTION("preferred id wins over the path")
    {
        NamedObject Object("Level/Preferred");
        const Uuid Preferred = UuidFromName("chosen");
        REQUIRE(Registry.Register(Object, Preferred).value() == Preferred);
    }

    SECTION("type name ids ignore the path")
    {
        NamedObject Object("Level/Ignored", true);
        REQUIRE(Registry.Register(Object).value() == UuidFromName("SnAPI::StateSync::Testing::NamedObject"));
    }

    SECTION("objects without a path get a random id")
    {
        NamedObject First("");
        NamedObject Second("");
        REQUIRE(Registry.Register(First));
        REQUIRE(Registry.Register(Second));
        REQUIRE_FALSE(First.UniqueId().is_nil());
        REQUIRE(First.UniqueId() != Second.UniqueId());
    }
}

TEST_CASE("Resolve reports unknown ids and wrong types")
{
    TestRuntime Test;
    HealthComponent Component(Test.Runtime, "World/Resolvable");
    REQUIRE(Component.Initialize());
    NamedObject Plain("Level/Plain");
    REQUIRE(Test.Runtime.UniqueIds().Register(Plain));

    const auto& Registry = Test.Runtime.UniqueIds();
    REQUIRE(Registry.Resolve<IStateSync>(Component.UniqueId()).GetOrNull() == &Component);
    REQUIRE(Registry.Resolve<IStateSave>(Component.UniqueId()));

    const auto Missing = Registry.Resolve(UuidFromName("nobody"));
    REQUIRE_FALSE(Missing);
    REQUIRE(Missing.error().Code == EErrorCode::UnknownTarget);

    const auto WrongType = Registry.Resolve<IStateSync>(Plain.UniqueId());
    REQUIRE_FALSE(WrongType);
    REQUIRE(WrongType.error().Code == EErrorCode::TypeMismatch);
}

TEST_CASE("Objects stay addressable until unregistered")
{
    UniqueIdRegistry Registry;
    NamedObject Object("Level/Crate");
    const Uuid Id = Registry.Register(Object).value();

    REQUIRE(Registry.IsRegistered(Id));
    REQUIRE(Registry.Unregister(Object));
    REQUIRE_FALSE(Registry.IsRegistered(Object));
    REQUIRE_FALSE(Registry.Resolve(Id));

    const auto Again = Registry.Unregister(Object);
    REQUIRE_FALSE(Again);
    REQUIRE(Again.error().Code == EErrorCode::NotFound);
}

TEST_CASE("Pre-registration covers disabled objects in one batch")
{
    TestRuntime Test;
    HealthComponent Disabled(Test.Runtime, "World/Disabled");
    Disabled.SetEnabled(false);
    NamedObject Plain("Level/Batch");

    std::vector<IUniqueId*> Batch{&Disabled, &Plain, &Plain};
    REQUIRE(Test.Runtime.UniqueIds().PreRegister(Batch) == 2);
    REQUIRE(Test.Runtime.UniqueIds().Resolve<IStateSync>(UuidFromName("World/Disabled")).GetOrNull() == &Disabled);

    // Initialize keeps the id picked by pre-registration.
    REQUIRE(Disabled.Initialize());
    REQUIRE(Disabled.UniqueId() == UuidFromName("World/Disabled"));
    REQUIRE_FALSE(Test.Runtime.StateSaves().IsEnabled(Disabled));
}

TEST_CASE("Re-keying an object")
{
    UniqueIdRegistry Registry;
    NamedObject Object("Level/Moving");
    NamedObject Other("Level/Other");
    const Uuid OldId = Registry.Register(Object).value();
    REQUIRE(Registry.Register(Other));

    std::vector<Uuid> Seen;
    Registry.UniqueIdChanged.Add([&Seen](IUniqueId&, const Uuid& From, const Uuid& To) {
        Seen.push_back(From);
        Seen.push_back(To);
    });

    const Uuid NewId = UuidFromName("Level/Moved");
    REQUIRE(Registry.ChangeUniqueId(Object, NewId));
    REQUIRE(Object.UniqueId() == NewId);
    REQUIRE_FALSE(Registry.IsRegistered(OldId));
    REQUIRE(Seen == std::vector<Uuid>{OldId, NewId});

    const auto Taken = Registry.ChangeUniqueId(Object, Other.UniqueId());
    REQUIRE_FALSE(Taken);
    REQUIRE(Taken.error().Code == EErrorCode::AlreadyExists);

    const auto Nil = Registry.ChangeUniqueId(Object, Uuid{});
    REQUIRE_FALSE(Nil);
    REQUIRE(Nil.error().Code == EErrorCode::InvalidArgument);

    const Uuid Root = UuidFromName("InstanceRoot");
    const auto Combined = Registry.CombineUniqueId(Object, Root);
    REQUIRE(Combined);
    REQUIRE(*Combined == CombineUuid(NewId, Root));
    REQUIRE(Registry.Resolve(*Combined).GetOrNull() == &Object);
}
