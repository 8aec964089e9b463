#pragma once

#include <string>
#include <string_view>

#include "Export.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

class UniqueIdRegistry;

/**
 * @brief Capability of objects addressable by a unique id.
 * @remarks
 * The id is owned by the object but assigned by UniqueIdRegistry::Register,
 * which picks it deterministically when it can (see UniqueIdRegistry) so that
 * the same logical object gets the same id on every peer and across a
 * save/load cycle.
 */
class SNAPI_STATESYNC_API IUniqueId
{
public:
    virtual ~IUniqueId() = default;

    /**
     * @brief Current id. Nil until the object has been registered.
     */
    virtual const Uuid& UniqueId() const = 0;

    /**
     * @brief Stable type name, used in diagnostics and for type-name ids.
     */
    virtual std::string_view UniqueTypeName() const = 0;

    /**
     * @brief Stable scene path or role of this instance.
     * @remarks A non-empty path yields a name-derived id at registration.
     * Return empty to get a random id.
     */
    virtual std::string UniquePath() const
    {
        return {};
    }

    /**
     * @brief Derive the id from UniqueTypeName() instead of the path.
     * @remarks For objects of which only one instance exists per process.
     */
    virtual bool UniqueIdIsTypeName() const
    {
        return false;
    }

    /**
     * @brief Display name for logs.
     */
    virtual std::string UniqueName() const
    {
        const std::string Path = UniquePath();
        return Path.empty() ? std::string(UniqueTypeName()) : Path;
    }

protected:
    friend class UniqueIdRegistry;

    /**
     * @brief Store the id chosen by the registry.
     */
    virtual void AssignUniqueId(const Uuid& Id) = 0;
};

} // namespace SnAPI::StateSync
