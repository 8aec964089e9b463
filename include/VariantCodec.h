#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

#include "Export.h"
#include "Serializer.h"
#include "TypeName.h"
#include "Variant.h"

namespace SnAPI::StateSync
{

SNAPI_STATESYNC_TYPE_NAME(std::vector<Variant>, "std::vector<SnAPI::StateSync::Variant>")

/**
 * @brief Wire tag that precedes every serialized Variant.
 * @remarks
 * The built-in tags form a closed set and must never be renumbered. Any other
 * type travels as Custom followed by its TypeId and codec version, and must be
 * registered with VariantCodecRegistry on both ends.
 */
enum class EVarType : uint8_t
{
    Null = 0,
    Bool = 1,
    Char = 2,
    Int8 = 3,
    UInt8 = 4,
    Int16 = 5,
    UInt16 = 6,
    Int32 = 7,   /**< @brief Zig-zag varint. */
    UInt32 = 8,  /**< @brief Varint. */
    Int64 = 9,   /**< @brief Zig-zag varint. */
    UInt64 = 10, /**< @brief Varint. */
    Float = 11,
    Double = 12,
    String = 13,
    Uuid = 14,
    Bytes = 15,
    Vec2 = 16,
    Vec3 = 17,
    Vec4 = 18,
    Quat = 19,
    VariantList = 20, /**< @brief Nested list of tagged values. */
    Custom = 255      /**< @brief Registered type: TypeId and version follow. */
};

/**
 * @brief Deepest VariantList nesting accepted when reading.
 */
inline constexpr int kMaxVariantNesting = 64;

/**
 * @brief Optional per-type codec version, taken from T::kSerializationVersion.
 */
template<typename T>
constexpr uint32_t SerializationVersionOf()
{
    if constexpr (requires { T::kSerializationVersion; })
    {
        return static_cast<uint32_t>(T::kSerializationVersion);
    }
    else
    {
        return 0;
    }
}

/**
 * @brief Table of types that may travel inside a Variant beyond the built-ins.
 * @remarks
 * Replaces lookup of a class by name at runtime: a type is reconstructible
 * only if it was registered at startup. Lookup failures surface as
 * EErrorCode::UnknownVariant.
 *
 * Registered types are enums or types with a `void Serialize(ISerializer&)`
 * member, and must have a TTypeName.
 */
class SNAPI_STATESYNC_API VariantCodecRegistry
{
public:
    using WriteFn = void (*)(ISerializer& Serializer, const Variant& Value);
    using ReadFn = Variant (*)(ISerializer& Serializer);

    struct Entry
    {
        std::string Name{}; /**< @brief Registered type name. */
        uint32_t Version = 0; /**< @brief Codec version written with every value. */
        WriteFn Write = nullptr; /**< @brief Writes the payload of a value of this type. */
        ReadFn Read = nullptr; /**< @brief Constructs a value of this type from the payload. */
    };

    static VariantCodecRegistry& Instance();

    /**
     * @brief Register T for Custom-tagged transport.
     * @remarks Registering again replaces the entry.
     */
    template<typename T>
    void Register()
    {
        static_assert(THasTypeNameV<T>, "Variant codec types need a TTypeName (kTypeName member or SNAPI_STATESYNC_TYPE_NAME)");
        static_assert(std::is_enum_v<T> || CSelfSerializable<T>, "Variant codec types must be enums or provide Serialize(ISerializer&)");
        static_assert(std::is_default_constructible_v<T>, "Variant codec types must be default constructible");

        Entry Item;
        Item.Name = TTypeNameV<T>;
        Item.Version = SerializationVersionOf<T>();
        Item.Write = [](ISerializer& Serializer, const Variant& Value) {
            T Copy = Value.AsConstRef<T>().value().get();
            Serializer.Serialize(Copy);
        };
        Item.Read = [](ISerializer& Serializer) {
            T Value{};
            Serializer.Serialize(Value);
            return Variant::FromValue(std::move(Value));
        };
        m_entries[Variant::CachedTypeId<T>()] = std::move(Item);
    }

    bool Has(const TypeId& Type) const;
    const Entry* Find(const TypeId& Type) const;

    /**
     * @brief Built-in tag for a type id, if the type is one of the closed set.
     */
    static std::optional<EVarType> BuiltinTag(const TypeId& Type);

    /**
     * @brief Write tag and payload of Value.
     * @throws SerializationException UnknownVariant for unregistered types.
     */
    void Write(ISerializer& Serializer, const Variant& Value) const;

    /**
     * @brief Read a tagged value.
     * @throws SerializationException UnknownVariant for unknown tags or type
     * ids, UnsupportedVersion for codec versions newer than the registered one,
     * DeserializationFailed for lists nested deeper than kMaxVariantNesting.
     */
    Variant Read(ISerializer& Serializer) const;

    /**
     * @brief Short display form for logs ("3", "\"abc\"", "(1, 2, 3)", "<TypeName>").
     */
    std::string Format(const Variant& Value) const;

private:
    VariantCodecRegistry() = default;

    std::unordered_map<TypeId, Entry, UuidHash> m_entries{}; /**< @brief Custom codecs by TypeId. */
};

/**
 * @brief Display form of a Variant through the global codec registry.
 */
SNAPI_STATESYNC_API std::string ToString(const Variant& Value);

} // namespace SnAPI::StateSync
