#pragma once

#include <cstddef>
#include <span>
#include <unordered_map>

#include "Event.h"
#include "Expected.h"
#include "Export.h"
#include "UniqueId.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

/**
 * @brief Maps unique ids to live objects.
 * @remarks
 * Objects are registered once, at creation (or proactively at scene load for
 * objects that start disabled), and stay addressable until unregistered,
 * whatever their enabled state. The registry stores non-owning pointers;
 * owners unregister before destruction.
 *
 * Id assignment on Register, in order of preference:
 * 1. the id the object already carries,
 * 2. the caller's preferred id,
 * 3. UuidFromName(UniqueTypeName()) when UniqueIdIsTypeName(),
 * 4. UuidFromName(UniquePath()) when the path is non-empty,
 * 5. a random id.
 * If the chosen id is taken by another object it is re-derived with
 * DeriveUuid(id, "Collision1"), "Collision2", ... until free, so peers that
 * create the same objects in the same order agree on every id.
 */
class SNAPI_STATESYNC_API UniqueIdRegistry
{
public:
    UniqueIdRegistry() = default;
    UniqueIdRegistry(const UniqueIdRegistry&) = delete;
    UniqueIdRegistry& operator=(const UniqueIdRegistry&) = delete;

    /**
     * @brief Register an object and assign its id.
     * @param Object Object to register.
     * @param PreferredId Id to use when the object has none yet; nil to derive one.
     * @return The object's id. Registering again returns the existing id.
     */
    TExpected<Uuid> Register(IUniqueId& Object, const Uuid& PreferredId = {});

    /**
     * @brief Register several objects up front, including disabled ones.
     * @return Number of objects newly registered.
     * @remarks Failures are logged and do not stop the batch.
     */
    std::size_t PreRegister(std::span<IUniqueId* const> Objects);

    /**
     * @brief Remove an object.
     * @return NotFound when the object was not registered.
     */
    Result Unregister(IUniqueId& Object);

    /**
     * @brief Look up a live object.
     * @return UnknownTarget when the id is not registered.
     */
    TExpectedRef<IUniqueId> Resolve(const Uuid& Id) const;

    /**
     * @brief Look up a live object of a specific type.
     * @return UnknownTarget when missing, TypeMismatch when the object is not a T.
     */
    template<typename T>
    TExpectedRef<T> Resolve(const Uuid& Id) const
    {
        auto Found = Resolve(Id);
        if (!Found)
        {
            return std::unexpected(Found.error());
        }
        T* Typed = dynamic_cast<T*>(&Found.Get());
        if (!Typed)
        {
            return std::unexpected(MakeError(EErrorCode::TypeMismatch, "Object " + ToString(Id) + " has an unexpected type"));
        }
        return *Typed;
    }

    bool IsRegistered(const IUniqueId& Object) const;
    bool IsRegistered(const Uuid& Id) const;

    /**
     * @brief Re-key a registered object.
     * @return NotFound when the object is not registered, AlreadyExists when
     * another object owns NewId, InvalidArgument for a nil id.
     */
    Result ChangeUniqueId(IUniqueId& Object, const Uuid& NewId);

    /**
     * @brief Replace the object's id with CombineUuid(id, Other).
     * @remarks Used for objects instantiated at runtime from a shared source:
     * combining with the id of the instance root keeps ids deterministic.
     */
    TExpected<Uuid> CombineUniqueId(IUniqueId& Object, const Uuid& Other);

    std::size_t Count() const
    {
        return m_objects.size();
    }

    TMulticastEvent<IUniqueId&> Registered; /**< @brief Fired after an object is registered. */
    TMulticastEvent<IUniqueId&> Unregistered; /**< @brief Fired after an object is unregistered. */
    TMulticastEvent<IUniqueId&, const Uuid&, const Uuid&> UniqueIdChanging; /**< @brief (object, old id, new id) before a re-key. */
    TMulticastEvent<IUniqueId&, const Uuid&, const Uuid&> UniqueIdChanged; /**< @brief (object, old id, new id) after a re-key. */

private:
    Uuid ChooseId(const IUniqueId& Object, const Uuid& PreferredId) const;
    Uuid ResolveCollision(const Uuid& Candidate, const IUniqueId& Object) const;

    std::unordered_map<Uuid, IUniqueId*, UuidHash> m_objects{}; /**< @brief Live objects by id. */
};

} // namespace SnAPI::StateSync
