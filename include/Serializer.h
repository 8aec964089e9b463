#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Expected.h"
#include "Export.h"
#include "Math.h"
#include "UniqueId.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

class UniqueIdRegistry;
class Variant;

/**
 * @brief Exception thrown by serializers and participant code on malformed data.
 * @remarks
 * Serialization runs deep inside participant callbacks that return plain bool,
 * so failures travel as exceptions and are converted back into Error at the
 * record boundary (orchestrator) or event boundary (dispatcher).
 */
class SNAPI_STATESYNC_API SerializationException : public std::runtime_error
{
public:
    explicit SerializationException(Error InError)
        : std::runtime_error(InError.Describe())
        , m_error(std::move(InError))
    {
    }

    SerializationException(EErrorCode Code, std::string Message)
        : SerializationException(MakeError(Code, std::move(Message)))
    {
    }

    const Error& GetError() const noexcept
    {
        return m_error;
    }

private:
    Error m_error; /**< @brief Typed error carried by the exception. */
};

class ISerializer;

/**
 * @brief Satisfied by types that serialize themselves through a member function.
 * @remarks `void Serialize(ISerializer&)`, called for both directions.
 */
template<typename T>
concept CSelfSerializable = requires(T& Value, ISerializer& Serializer) {
    { Value.Serialize(Serializer) } -> std::same_as<void>;
};

/**
 * @brief Symmetric binary serializer.
 * @remarks
 * Every Serialize call reads into the reference when IsReading() is true and
 * writes from it otherwise, so a participant describes its layout once and
 * the two directions cannot drift apart.
 *
 * Fixed-size primitives are written as-is. Sizes and the SerializeCompressed
 * overloads use LEB128 varints; signed compressed values are zig-zag encoded
 * first so that small negative numbers stay short.
 *
 * Version() is the binary version of the stream being read (or written).
 * Participants gate fields added later with SupportsVersion().
 */
class SNAPI_STATESYNC_API ISerializer
{
public:
    virtual ~ISerializer() = default;

    virtual bool IsReading() const = 0;
    virtual uint16_t Version() const = 0;

    bool IsWriting() const
    {
        return !IsReading();
    }

    /**
     * @brief True for serializers that transfer no bytes (DummySerializer).
     */
    virtual bool IsNoOp() const
    {
        return false;
    }

    /**
     * @brief True when the stream carries fields introduced in MinVersion.
     */
    bool SupportsVersion(uint16_t MinVersion) const
    {
        return Version() >= MinVersion;
    }

    virtual void Serialize(bool& Value) = 0;
    virtual void Serialize(char& Value) = 0;
    virtual void Serialize(int8_t& Value) = 0;
    virtual void Serialize(uint8_t& Value) = 0;
    virtual void Serialize(int16_t& Value) = 0;
    virtual void Serialize(uint16_t& Value) = 0;
    virtual void Serialize(int32_t& Value) = 0;
    virtual void Serialize(uint32_t& Value) = 0;
    virtual void Serialize(int64_t& Value) = 0;
    virtual void Serialize(uint64_t& Value) = 0;
    virtual void Serialize(float& Value) = 0;
    virtual void Serialize(double& Value) = 0;
    /** @brief Compressed byte length followed by the raw characters. */
    virtual void Serialize(std::string& Value) = 0;
    /** @brief 16 raw bytes. */
    virtual void Serialize(Uuid& Value) = 0;
    /** @brief Compressed byte length followed by the raw bytes. */
    virtual void Serialize(std::vector<uint8_t>& Value) = 0;

    virtual void SerializeCompressed(uint64_t& Value) = 0;
    virtual void SerializeCompressed(int64_t& Value) = 0;

    void SerializeCompressed(uint32_t& Value)
    {
        uint64_t Wide = Value;
        SerializeCompressed(Wide);
        if (IsReading())
        {
            if (Wide > UINT32_MAX)
            {
                throw SerializationException(EErrorCode::DeserializationFailed, "Compressed uint32 out of range");
            }
            Value = static_cast<uint32_t>(Wide);
        }
    }

    void SerializeCompressed(int32_t& Value)
    {
        int64_t Wide = Value;
        SerializeCompressed(Wide);
        if (IsReading())
        {
            if (Wide < INT32_MIN || Wide > INT32_MAX)
            {
                throw SerializationException(EErrorCode::DeserializationFailed, "Compressed int32 out of range");
            }
            Value = static_cast<int32_t>(Wide);
        }
    }

    void Serialize(Vec2& Value)
    {
        Serialize(Value.X);
        Serialize(Value.Y);
    }

    void Serialize(Vec3& Value)
    {
        Serialize(Value.X);
        Serialize(Value.Y);
        Serialize(Value.Z);
    }

    void Serialize(Vec4& Value)
    {
        Serialize(Value.X);
        Serialize(Value.Y);
        Serialize(Value.Z);
        Serialize(Value.W);
    }

    void Serialize(Quat& Value)
    {
        Serialize(Value.X);
        Serialize(Value.Y);
        Serialize(Value.Z);
        Serialize(Value.W);
    }

    /**
     * @brief Tagged value. See VariantCodecRegistry for the wire form.
     * @throws SerializationException with UnknownVariant for unregistered types.
     */
    void Serialize(Variant& Value);

    /**
     * @brief Enums (compressed underlying value) and self-serializable types.
     */
    template<typename T>
    void Serialize(T& Value)
    {
        if constexpr (std::is_enum_v<T>)
        {
            using U = std::underlying_type_t<T>;
            if constexpr (std::is_signed_v<U>)
            {
                int64_t Raw = static_cast<int64_t>(Value);
                SerializeCompressed(Raw);
                Value = static_cast<T>(static_cast<U>(Raw));
            }
            else
            {
                uint64_t Raw = static_cast<uint64_t>(Value);
                SerializeCompressed(Raw);
                Value = static_cast<T>(static_cast<U>(Raw));
            }
        }
        else if constexpr (CSelfSerializable<T>)
        {
            Value.Serialize(*this);
        }
        else
        {
            static_assert(sizeof(T) == 0, "Type is not serializable: add a Serialize(ISerializer&) member");
        }
    }

    template<typename T>
    void Serialize(std::vector<T>& Values)
    {
        const std::size_t Count = SerializeCount(Values.size());
        if (ShouldAssign())
        {
            Values.clear();
            Values.resize(Count);
        }
        for (auto& Value : Values)
        {
            Serialize(Value);
        }
    }

    void Serialize(std::vector<bool>& Values)
    {
        const std::size_t Count = SerializeCount(Values.size());
        if (ShouldAssign())
        {
            Values.assign(Count, false);
        }
        for (std::size_t Index = 0; Index < Count; ++Index)
        {
            bool Value = Values[Index];
            Serialize(Value);
            Values[Index] = Value;
        }
    }

    template<typename T, std::size_t N>
    void Serialize(std::array<T, N>& Values)
    {
        for (auto& Value : Values)
        {
            Serialize(Value);
        }
    }

    template<typename K, typename V, typename C, typename A>
    void Serialize(std::map<K, V, C, A>& Values)
    {
        SerializeAssociative(Values);
    }

    template<typename K, typename V, typename H, typename E, typename A>
    void Serialize(std::unordered_map<K, V, H, E, A>& Values)
    {
        SerializeAssociative(Values);
    }

    template<typename T>
    void Serialize(std::optional<T>& Value)
    {
        bool HasValue = Value.has_value();
        Serialize(HasValue);
        if (ShouldAssign())
        {
            if (!HasValue)
            {
                Value.reset();
                return;
            }
            Value.emplace();
        }
        if (HasValue)
        {
            Serialize(*Value);
        }
    }

    template<typename A, typename B>
    void Serialize(std::pair<A, B>& Value)
    {
        Serialize(Value.first);
        Serialize(Value.second);
    }

    /**
     * @brief Reference to a registered object, written as its unique id.
     * @tparam T Referenced type; must derive from IUniqueId.
     * @remarks A null reference is written as the nil id. Reading resolves the
     * id through the registry set with SetUniqueIdRegistry.
     * @throws SerializationException UnknownTarget when the id does not resolve
     * to a T, NotReady when no registry is attached.
     */
    template<typename T>
    void SerializeUniqueRef(T*& Ref)
    {
        static_assert(std::is_base_of_v<IUniqueId, T>, "SerializeUniqueRef requires an IUniqueId type");
        Uuid Id = Ref ? Ref->UniqueId() : Uuid{};
        Serialize(Id);
        if (!ShouldAssign())
        {
            return;
        }
        if (Id.is_nil())
        {
            Ref = nullptr;
            return;
        }
        IUniqueId& Resolved = ResolveUniqueRef(Id);
        T* Typed = dynamic_cast<T*>(&Resolved);
        if (!Typed)
        {
            throw SerializationException(EErrorCode::UnknownTarget, "Object " + ToString(Id) + " is not of the referenced type");
        }
        Ref = Typed;
    }

    /**
     * @brief Registry used to resolve references when reading.
     */
    void SetUniqueIdRegistry(const UniqueIdRegistry* Registry)
    {
        m_uniqueIds = Registry;
    }

    const UniqueIdRegistry* GetUniqueIdRegistry() const
    {
        return m_uniqueIds;
    }

protected:
    /**
     * @brief Check that Count elements can still be read.
     * @remarks Readers bound counts by the remaining input so a corrupt length
     * fails fast instead of allocating. Every element takes at least one byte.
     */
    virtual void CheckReadableCount(uint64_t /*Count*/) const
    {
    }

private:
    bool ShouldAssign() const
    {
        return IsReading() && !IsNoOp();
    }

    std::size_t SerializeCount(std::size_t Count)
    {
        uint64_t Wide = Count;
        SerializeCompressed(Wide);
        if (ShouldAssign())
        {
            CheckReadableCount(Wide);
        }
        return static_cast<std::size_t>(Wide);
    }

    template<typename MapType>
    void SerializeAssociative(MapType& Values)
    {
        const std::size_t Count = SerializeCount(Values.size());
        if (ShouldAssign())
        {
            Values.clear();
            for (std::size_t Index = 0; Index < Count; ++Index)
            {
                typename MapType::key_type Key{};
                typename MapType::mapped_type Value{};
                Serialize(Key);
                Serialize(Value);
                Values.insert_or_assign(std::move(Key), std::move(Value));
            }
            return;
        }
        for (auto& [ConstKey, Value] : Values)
        {
            auto Key = ConstKey;
            Serialize(Key);
            Serialize(Value);
        }
    }

    IUniqueId& ResolveUniqueRef(const Uuid& Id) const;

    const UniqueIdRegistry* m_uniqueIds = nullptr; /**< @brief Non-owning registry for reference resolution. */
};

} // namespace SnAPI::StateSync
