#include "VariantCodec.h"

#include <format>
#include <string>
#include <utility>

namespace SnAPI::StateSync
{

namespace
{
template<typename T>
void WritePlain(ISerializer& Serializer, const Variant& Value)
{
    T Copy = Value.AsConstRef<T>().value().get();
    Serializer.Serialize(Copy);
}

template<typename T>
Variant ReadPlain(ISerializer& Serializer)
{
    T Value{};
    Serializer.Serialize(Value);
    return Variant::FromValue(std::move(Value));
}

template<typename T>
void WriteCompressed(ISerializer& Serializer, const Variant& Value)
{
    T Copy = Value.AsConstRef<T>().value().get();
    Serializer.SerializeCompressed(Copy);
}

template<typename T>
Variant ReadCompressed(ISerializer& Serializer)
{
    T Value{};
    Serializer.SerializeCompressed(Value);
    return Variant::FromValue(Value);
}

struct BuiltinCodec
{
    EVarType Tag = EVarType::Null;
    VariantCodecRegistry::WriteFn Write = nullptr;
    VariantCodecRegistry::ReadFn Read = nullptr;
};

template<typename T>
std::pair<TypeId, BuiltinCodec> MakeBuiltin(EVarType Tag, bool Compressed = false)
{
    BuiltinCodec Codec;
    Codec.Tag = Tag;
    if constexpr (std::is_same_v<T, int32_t> || std::is_same_v<T, uint32_t> || std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>)
    {
        Codec.Write = Compressed ? &WriteCompressed<T> : &WritePlain<T>;
        Codec.Read = Compressed ? &ReadCompressed<T> : &ReadPlain<T>;
    }
    else
    {
        Codec.Write = &WritePlain<T>;
        Codec.Read = &ReadPlain<T>;
    }
    return {Variant::CachedTypeId<T>(), Codec};
}

const std::unordered_map<TypeId, BuiltinCodec, UuidHash>& BuiltinsByType()
{
    static const std::unordered_map<TypeId, BuiltinCodec, UuidHash> Table = {
        MakeBuiltin<bool>(EVarType::Bool),
        MakeBuiltin<char>(EVarType::Char),
        MakeBuiltin<int8_t>(EVarType::Int8),
        MakeBuiltin<uint8_t>(EVarType::UInt8),
        MakeBuiltin<int16_t>(EVarType::Int16),
        MakeBuiltin<uint16_t>(EVarType::UInt16),
        MakeBuiltin<int32_t>(EVarType::Int32, true),
        MakeBuiltin<uint32_t>(EVarType::UInt32, true),
        MakeBuiltin<int64_t>(EVarType::Int64, true),
        MakeBuiltin<uint64_t>(EVarType::UInt64, true),
        MakeBuiltin<float>(EVarType::Float),
        MakeBuiltin<double>(EVarType::Double),
        MakeBuiltin<std::string>(EVarType::String),
        MakeBuiltin<Uuid>(EVarType::Uuid),
        MakeBuiltin<std::vector<uint8_t>>(EVarType::Bytes),
        MakeBuiltin<Vec2>(EVarType::Vec2),
        MakeBuiltin<Vec3>(EVarType::Vec3),
        MakeBuiltin<Vec4>(EVarType::Vec4),
        MakeBuiltin<Quat>(EVarType::Quat),
        MakeBuiltin<std::vector<Variant>>(EVarType::VariantList),
    };
    return Table;
}

const BuiltinCodec* FindBuiltinByTag(EVarType Tag)
{
    static const std::unordered_map<uint8_t, BuiltinCodec> Table = [] {
        std::unordered_map<uint8_t, BuiltinCodec> Result;
        for (const auto& [Type, Codec] : BuiltinsByType())
        {
            Result.emplace(static_cast<uint8_t>(Codec.Tag), Codec);
        }
        return Result;
    }();
    const auto It = Table.find(static_cast<uint8_t>(Tag));
    return It != Table.end() ? &It->second : nullptr;
}

/**
 * @brief Counts nested Read calls on this thread (VariantList inside VariantList).
 */
class ReadDepthScope
{
public:
    ReadDepthScope()
    {
        if (++Depth() > kMaxVariantNesting)
        {
            --Depth();
            throw SerializationException(EErrorCode::DeserializationFailed,
                "Variant lists nested deeper than " + std::to_string(kMaxVariantNesting) + " levels");
        }
    }

    ~ReadDepthScope()
    {
        --Depth();
    }

    ReadDepthScope(const ReadDepthScope&) = delete;
    ReadDepthScope& operator=(const ReadDepthScope&) = delete;

private:
    static int& Depth()
    {
        static thread_local int s_depth = 0;
        return s_depth;
    }
};

template<typename T>
const T* Peek(const Variant& Value)
{
    auto Ref = Value.AsConstRef<T>();
    return Ref ? &Ref->get() : nullptr;
}
} // namespace

VariantCodecRegistry& VariantCodecRegistry::Instance()
{
    static VariantCodecRegistry Registry;
    return Registry;
}

bool VariantCodecRegistry::Has(const TypeId& Type) const
{
    return BuiltinTag(Type).has_value() || m_entries.contains(Type);
}

const VariantCodecRegistry::Entry* VariantCodecRegistry::Find(const TypeId& Type) const
{
    const auto It = m_entries.find(Type);
    return It != m_entries.end() ? &It->second : nullptr;
}

std::optional<EVarType> VariantCodecRegistry::BuiltinTag(const TypeId& Type)
{
    const auto& Table = BuiltinsByType();
    const auto It = Table.find(Type);
    if (It == Table.end())
    {
        return std::nullopt;
    }
    return It->second.Tag;
}

void VariantCodecRegistry::Write(ISerializer& Serializer, const Variant& Value) const
{
    uint8_t Tag = static_cast<uint8_t>(EVarType::Null);
    if (Value.IsEmpty())
    {
        Serializer.Serialize(Tag);
        return;
    }

    const auto& Builtins = BuiltinsByType();
    if (const auto It = Builtins.find(Value.Type()); It != Builtins.end())
    {
        Tag = static_cast<uint8_t>(It->second.Tag);
        Serializer.Serialize(Tag);
        It->second.Write(Serializer, Value);
        return;
    }

    const Entry* Custom = Find(Value.Type());
    if (!Custom)
    {
        throw SerializationException(EErrorCode::UnknownVariant, "No variant codec registered for type " + ToString(Value.Type()));
    }
    Tag = static_cast<uint8_t>(EVarType::Custom);
    Serializer.Serialize(Tag);
    Uuid Type = Value.Type();
    Serializer.Serialize(Type);
    uint32_t Version = Custom->Version;
    Serializer.SerializeCompressed(Version);
    Custom->Write(Serializer, Value);
}

Variant VariantCodecRegistry::Read(ISerializer& Serializer) const
{
    ReadDepthScope Nesting;
    uint8_t RawTag = 0;
    Serializer.Serialize(RawTag);
    const auto Tag = static_cast<EVarType>(RawTag);
    if (Tag == EVarType::Null)
    {
        return {};
    }

    if (Tag != EVarType::Custom)
    {
        const BuiltinCodec* Codec = FindBuiltinByTag(Tag);
        if (!Codec)
        {
            throw SerializationException(EErrorCode::UnknownVariant, "Unknown variant tag " + std::to_string(RawTag));
        }
        return Codec->Read(Serializer);
    }

    Uuid Type;
    Serializer.Serialize(Type);
    uint32_t Version = 0;
    Serializer.SerializeCompressed(Version);
    const Entry* Custom = Find(Type);
    if (!Custom)
    {
        throw SerializationException(EErrorCode::UnknownVariant, "No variant codec registered for type " + ToString(Type));
    }
    if (Version > Custom->Version)
    {
        throw SerializationException(EErrorCode::UnsupportedVersion,
            std::format("{} was written with codec version {}, this build reads up to {}", Custom->Name, Version, Custom->Version));
    }
    return Custom->Read(Serializer);
}

std::string VariantCodecRegistry::Format(const Variant& Value) const
{
    if (Value.IsEmpty())
    {
        return "null";
    }
    if (const auto* V = Peek<bool>(Value)) return *V ? "true" : "false";
    if (const auto* V = Peek<char>(Value)) return std::format("'{}'", *V);
    if (const auto* V = Peek<int8_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<uint8_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<int16_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<uint16_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<int32_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<uint32_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<int64_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<uint64_t>(Value)) return std::to_string(*V);
    if (const auto* V = Peek<float>(Value)) return std::format("{}", *V);
    if (const auto* V = Peek<double>(Value)) return std::format("{}", *V);
    if (const auto* V = Peek<std::string>(Value)) return std::format("\"{}\"", *V);
    if (const auto* V = Peek<Uuid>(Value)) return ToString(*V);
    if (const auto* V = Peek<std::vector<uint8_t>>(Value)) return std::format("<{} bytes>", V->size());
    if (const auto* V = Peek<Vec2>(Value)) return std::format("({}, {})", V->X, V->Y);
    if (const auto* V = Peek<Vec3>(Value)) return std::format("({}, {}, {})", V->X, V->Y, V->Z);
    if (const auto* V = Peek<Vec4>(Value)) return std::format("({}, {}, {}, {})", V->X, V->Y, V->Z, V->W);
    if (const auto* V = Peek<Quat>(Value)) return std::format("({}, {}, {}, {})", V->X, V->Y, V->Z, V->W);
    if (const auto* V = Peek<std::vector<Variant>>(Value))
    {
        std::string Result = "[";
        for (size_t Index = 0; Index < V->size(); ++Index)
        {
            if (Index > 0)
            {
                Result += ", ";
            }
            Result += Format((*V)[Index]);
        }
        return Result + "]";
    }
    if (const Entry* Custom = Find(Value.Type()))
    {
        return "<" + Custom->Name + ">";
    }
    return "<" + ToString(Value.Type()) + ">";
}

std::string ToString(const Variant& Value)
{
    return VariantCodecRegistry::Instance().Format(Value);
}

void ISerializer::Serialize(Variant& Value)
{
    if (IsNoOp())
    {
        return;
    }
    const auto& Registry = VariantCodecRegistry::Instance();
    if (IsReading())
    {
        Value = Registry.Read(*this);
    }
    else
    {
        Registry.Write(*this, Value);
    }
}

} // namespace SnAPI::StateSync
