#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "Invoker.h"
#include "SyncEvent.h"

namespace SnAPI::StateSync
{

/**
 * @brief Name-keyed table of the members a sync target can replay.
 * @remarks
 * Replaces lookup of methods by name at runtime: every replayable method and
 * property setter is registered explicitly, usually in the owner's
 * constructor. Arguments are matched against the member signature by exact
 * decayed type.
 */
class SNAPI_STATESYNC_API SyncMethodTable
{
public:
    /**
     * @brief Register a replayable method.
     * @param Owner Object the method is called on; must outlive the table.
     * @remarks Registering the same name again replaces the entry.
     */
    template<typename T, typename R, typename... Args>
    void RegisterMethod(std::string Name, T& Owner, R (T::*Method)(Args...))
    {
        m_methods.insert_or_assign(std::move(Name), Entry{static_cast<void*>(&Owner), MakeSyncInvoker(Method)});
    }

    /**
     * @brief Register the setter replayed for PropertyChanged events.
     */
    template<typename T, typename V>
    void RegisterProperty(std::string Name, T& Owner, void (T::*Setter)(V))
    {
        m_properties.insert_or_assign(std::move(Name), Entry{static_cast<void*>(&Owner), MakeSyncInvoker(Setter)});
    }

    bool HasMethod(const std::string& Name) const
    {
        return m_methods.contains(Name);
    }

    bool HasProperty(const std::string& Name) const
    {
        return m_properties.contains(Name);
    }

    /**
     * @brief Names of registered methods, unordered.
     */
    std::vector<std::string> MethodNames() const;

    /**
     * @brief Call the member named by Args.
     * @return NotFound for unregistered names, InvalidArgument or TypeMismatch
     * for argument mismatches, InvokeFailed when the member throws.
     */
    Result Apply(const SyncEventArgs& Args) const;

private:
    struct Entry
    {
        void* Instance = nullptr; /**< @brief Owner cast to void* from its exact type. */
        SyncInvoker Invoke{}; /**< @brief Type-erased member call. */
    };

    std::unordered_map<std::string, Entry> m_methods{}; /**< @brief Method name -> invoker. */
    std::unordered_map<std::string, Entry> m_properties{}; /**< @brief Property name -> setter invoker. */
};

} // namespace SnAPI::StateSync
