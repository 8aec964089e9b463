#include "UniqueIdRegistry.h"

#include <string>

#include "Assert.h"
#include "Log.h"
#include "Serializer.h"

namespace SnAPI::StateSync
{

namespace
{
constexpr int kMaxCollisionAttempts = 4096;
} // namespace

TExpected<Uuid> UniqueIdRegistry::Register(IUniqueId& Object, const Uuid& PreferredId)
{
    if (IsRegistered(Object))
    {
        return Object.UniqueId();
    }

    const Uuid Candidate = ResolveCollision(ChooseId(Object, PreferredId), Object);
    DEBUG_ASSERT(!Candidate.is_nil(), "Registry produced a nil id for {}", Object.UniqueName());

    Object.AssignUniqueId(Candidate);
    m_objects.emplace(Candidate, &Object);
    CoreLogger()->debug("Registered unique id {} for {} ({})", ToString(Candidate), Object.UniqueName(), Object.UniqueTypeName());
    Registered.Broadcast(Object);
    return Candidate;
}

std::size_t UniqueIdRegistry::PreRegister(std::span<IUniqueId* const> Objects)
{
    std::size_t Added = 0;
    for (IUniqueId* Object : Objects)
    {
        if (!Object || IsRegistered(*Object))
        {
            continue;
        }
        auto Id = Register(*Object);
        if (!Id)
        {
            CoreLogger()->warn("Could not pre-register {}: {}", Object->UniqueName(), Id.error().Describe());
            continue;
        }
        ++Added;
    }
    return Added;
}

Result UniqueIdRegistry::Unregister(IUniqueId& Object)
{
    if (!IsRegistered(Object))
    {
        return std::unexpected(MakeError(EErrorCode::NotFound, Object.UniqueName() + " is not registered"));
    }
    m_objects.erase(Object.UniqueId());
    Unregistered.Broadcast(Object);
    return Ok();
}

TExpectedRef<IUniqueId> UniqueIdRegistry::Resolve(const Uuid& Id) const
{
    const auto It = m_objects.find(Id);
    if (It == m_objects.end())
    {
        return std::unexpected(MakeError(EErrorCode::UnknownTarget, "No object registered with id " + ToString(Id)));
    }
    return *It->second;
}

bool UniqueIdRegistry::IsRegistered(const IUniqueId& Object) const
{
    const Uuid& Id = Object.UniqueId();
    if (Id.is_nil())
    {
        return false;
    }
    const auto It = m_objects.find(Id);
    return It != m_objects.end() && It->second == &Object;
}

bool UniqueIdRegistry::IsRegistered(const Uuid& Id) const
{
    return m_objects.contains(Id);
}

Result UniqueIdRegistry::ChangeUniqueId(IUniqueId& Object, const Uuid& NewId)
{
    if (!IsRegistered(Object))
    {
        return std::unexpected(MakeError(EErrorCode::NotFound, Object.UniqueName() + " is not registered"));
    }
    if (NewId.is_nil())
    {
        return std::unexpected(MakeError(EErrorCode::InvalidArgument, "Cannot assign a nil id"));
    }

    const Uuid OldId = Object.UniqueId();
    if (OldId == NewId)
    {
        return Ok();
    }
    if (const auto It = m_objects.find(NewId); It != m_objects.end())
    {
        return std::unexpected(MakeError(EErrorCode::AlreadyExists,
            "Id " + ToString(NewId) + " is already used by " + It->second->UniqueName()));
    }

    UniqueIdChanging.Broadcast(Object, OldId, NewId);
    m_objects.erase(OldId);
    Object.AssignUniqueId(NewId);
    m_objects.emplace(NewId, &Object);
    CoreLogger()->debug("Changed unique id of {} from {} to {}", Object.UniqueName(), ToString(OldId), ToString(NewId));
    UniqueIdChanged.Broadcast(Object, OldId, NewId);
    return Ok();
}

TExpected<Uuid> UniqueIdRegistry::CombineUniqueId(IUniqueId& Object, const Uuid& Other)
{
    const Uuid Combined = CombineUuid(Object.UniqueId(), Other);
    if (auto Changed = ChangeUniqueId(Object, Combined); !Changed)
    {
        return std::unexpected(Changed.error());
    }
    return Combined;
}

Uuid UniqueIdRegistry::ChooseId(const IUniqueId& Object, const Uuid& PreferredId) const
{
    if (!Object.UniqueId().is_nil())
    {
        return Object.UniqueId();
    }
    if (!PreferredId.is_nil())
    {
        return PreferredId;
    }
    if (Object.UniqueIdIsTypeName())
    {
        return UuidFromName(Object.UniqueTypeName());
    }
    if (const std::string Path = Object.UniquePath(); !Path.empty())
    {
        return UuidFromName(Path);
    }
    return NewUuid();
}

Uuid UniqueIdRegistry::ResolveCollision(const Uuid& Candidate, const IUniqueId& Object) const
{
    if (!m_objects.contains(Candidate))
    {
        return Candidate;
    }
    for (int Attempt = 1; Attempt <= kMaxCollisionAttempts; ++Attempt)
    {
        const Uuid Derived = DeriveUuid(Candidate, "Collision" + std::to_string(Attempt));
        if (!m_objects.contains(Derived))
        {
            CoreLogger()->debug("Unique id {} of {} collides; using {}", ToString(Candidate), Object.UniqueName(), ToString(Derived));
            return Derived;
        }
    }
    const Uuid Fallback = NewUuid();
    CoreLogger()->warn("Unique id {} of {} collided {} times; using random id {}", ToString(Candidate), Object.UniqueName(),
        kMaxCollisionAttempts, ToString(Fallback));
    return Fallback;
}

IUniqueId& ISerializer::ResolveUniqueRef(const Uuid& Id) const
{
    if (!m_uniqueIds)
    {
        throw SerializationException(EErrorCode::NotReady, "No unique id registry attached to the serializer");
    }
    auto Found = m_uniqueIds->Resolve(Id);
    if (!Found)
    {
        throw SerializationException(Found.error());
    }
    return Found.Get();
}

} // namespace SnAPI::StateSync
