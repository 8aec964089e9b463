#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

#include "Export.h"
#include "IStateSave.h"
#include "Math.h"
#include "Serializer.h"
#include "StateSaveEvents.h"
#include "StateSaveTypes.h"
#include "StateSaveValue.h"

namespace SnAPI::StateSync
{

/**
 * @brief Change tracking helper used by participants inside SerializeState.
 * @remarks
 * Keeps two baselines per tracked field: the value at the end of the frame
 * the participant was registered in (initial) and the value at the last save
 * that wrote it (last). Each SerializeStateValue call writes a presence flag
 * and, when the field is considered changed for the requested level, the
 * value itself.
 *
 * Typical use:
 * @code
 * bool SerializeState(ISerializer& S, int32_t Version, EStateSaveLevel Level, StateSaveOptions Options) override
 * {
 *     m_state.BeginState(S, Level, Options);
 *     m_state.SerializeStateValue(S, Level, Options, "Health", m_health);
 *     return m_state.EndState(S, Level, Options);
 * }
 * @endcode
 */
class SNAPI_STATESYNC_API StateSaveImplementer
{
public:
    explicit StateSaveImplementer(IStateSave& InOwner);

    StateSaveImplementer(const StateSaveImplementer&) = delete;
    StateSaveImplementer& operator=(const StateSaveImplementer&) = delete;

    /**
     * @brief Route inspection events to a registry's event set.
     * @param InEvents Event set, or nullptr to stop raising events.
     */
    void SetEvents(const StateSaveEvents* InEvents)
    {
        m_events = InEvents;
    }

    void SetPrecisionThreshold(float Threshold)
    {
        m_precision = Threshold;
    }

    float PrecisionThreshold() const
    {
        return m_precision;
    }

    /**
     * @brief Number of values transferred so far.
     * @remarks Compare before and after a SerializeStateValue call to learn
     * whether a load changed the field and its side effects must be re-applied.
     */
    int SerializeCounter() const
    {
        return m_serializeCounter;
    }

    /**
     * @brief Raise StateSerializing and remember the counter.
     */
    void BeginState(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options);

    /**
     * @brief Raise StateSerialized.
     * @return True when any value was transferred since BeginState.
     */
    bool EndState(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options);

    /**
     * @brief Transfer a tracked field if it changed for the requested level.
     * @param Name Field name; an empty name disables change tracking and the
     * value is always considered changed.
     * @return True when the value was transferred.
     * @throws SerializationException on malformed input.
     */
    template<typename T>
    bool SerializeStateValue(ISerializer& Serializer, EStateSaveLevel Level, StateSaveOptions Options, std::string_view Name, T& Value)
    {
        const bool Tracked = !Name.empty();
        if (Tracked)
        {
            const bool Reset = Options.Has(EStateSaveOption::ResetChangesCache);
            StoreBaseline(m_initialValues, Name, Value, Reset);
            StoreBaseline(m_lastValues, Name, Value, Reset);
        }

        bool Present = false;
        if (Serializer.IsWriting())
        {
            if (Options.Has(EStateSaveOption::DontCheckCache))
            {
                Present = true;
            }
            else
            {
                switch (Level)
                {
                case EStateSaveLevel::Complete:
                    Present = true;
                    break;
                case EStateSaveLevel::ChangesSinceBeginning:
                    Present = !Tracked || !MatchesBaseline(m_initialValues, Name, Value);
                    break;
                case EStateSaveLevel::ChangesSincePreviousSave:
                    Present = !Tracked || !MatchesBaseline(m_lastValues, Name, Value);
                    break;
                }
            }
        }

        const bool Transfer = !Options.Has(EStateSaveOption::DontSerialize);
        if (Transfer)
        {
            Serializer.Serialize(Present);
        }
        if (!Present)
        {
            return false;
        }

        const bool Inspect = HasVarListeners();
        Variant OldValue;
        if (Inspect)
        {
            OldValue = detail::MakeInspectionValue(Value);
            RaiseVarEvent(true, Serializer, Level, Options, Name, OldValue, OldValue);
        }

        if (Transfer)
        {
            detail::SerializeValue(Serializer, Value);
        }
        if (Tracked && !Options.Has(EStateSaveOption::DontCacheChanges))
        {
            StoreBaseline(m_lastValues, Name, Value, true);
        }
        ++m_serializeCounter;

        if (Inspect)
        {
            RaiseVarEvent(false, Serializer, Level, Options, Name, OldValue, detail::MakeInspectionValue(Value));
        }
        return true;
    }

    bool HasBaseline(std::string_view Name) const;

    /**
     * @brief Forget both baselines; every field counts as new on the next call.
     */
    void ClearBaselines();

private:
    struct IStoredValue
    {
        virtual ~IStoredValue() = default;
    };

    template<typename T>
    struct TStoredValue final : IStoredValue
    {
        explicit TStoredValue(const T& InValue)
            : Value(InValue)
        {
        }

        T Value;
    };

    using BaselineMap = std::unordered_map<std::string, std::unique_ptr<IStoredValue>>;

    template<typename T>
    static void StoreBaseline(BaselineMap& Map, std::string_view Name, const T& Value, bool Overwrite)
    {
        auto It = Map.find(std::string(Name));
        if (It == Map.end())
        {
            Map.emplace(std::string(Name), std::make_unique<TStoredValue<T>>(Value));
            return;
        }
        auto* Stored = dynamic_cast<TStoredValue<T>*>(It->second.get());
        if (!Stored)
        {
            It->second = std::make_unique<TStoredValue<T>>(Value);
        }
        else if (Overwrite)
        {
            Stored->Value = Value;
        }
    }

    template<typename T>
    bool MatchesBaseline(const BaselineMap& Map, std::string_view Name, const T& Value) const
    {
        const auto It = Map.find(std::string(Name));
        if (It == Map.end())
        {
            return false;
        }
        const auto* Stored = dynamic_cast<const TStoredValue<T>*>(It->second.get());
        return Stored && detail::ValuesEqual(Value, Stored->Value, m_precision);
    }

    bool HasVarListeners() const;
    void RaiseVarEvent(bool Before,
                       const ISerializer& Serializer,
                       EStateSaveLevel Level,
                       StateSaveOptions Options,
                       std::string_view Name,
                       const Variant& OldValue,
                       const Variant& NewValue) const;

    IStateSave* m_owner = nullptr; /**< @brief Participant the baselines belong to. */
    const StateSaveEvents* m_events = nullptr; /**< @brief Event set of the owning registry. */
    float m_precision = kDefaultPrecisionThreshold; /**< @brief Change-detection threshold for floating point values. */
    int m_serializeCounter = 0; /**< @brief Values transferred since construction. */
    int m_counterAtBegin = 0; /**< @brief Counter value captured by BeginState. */
    BaselineMap m_initialValues{}; /**< @brief Field name -> value at baseline capture. */
    BaselineMap m_lastValues{}; /**< @brief Field name -> value at last save. */
};

} // namespace SnAPI::StateSync
