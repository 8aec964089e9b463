#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <string_view>

#include <uuid.h>

namespace SnAPI::StateSync
{

/**
 * @brief 128-bit identifier used for object identity and type tags.
 * @remarks Provided by the stduuid library. Serialized as 16 raw bytes.
 */
using Uuid = uuids::uuid;
/**
 * @brief Type identifier: a UUIDv5 of a stable type name.
 */
using TypeId = Uuid;

/**
 * @brief Namespace UUID for every name-derived id in this library.
 * @note Must never change; saved streams embed ids derived from it.
 */
inline const Uuid& StateSyncNamespace()
{
    static const Uuid Namespace = [] {
        auto Parsed = uuids::uuid::from_string("5a0f3c7e-2b49-4d1e-9c6a-8e41d2f7b903");
        return Parsed.value_or(Uuid{});
    }();
    return Namespace;
}

/**
 * @brief Deterministic UUIDv5 of a name inside the library namespace.
 * @param Name Stable name (type name, scene path, role).
 */
inline Uuid UuidFromName(std::string_view Name)
{
    uuids::uuid_name_generator Generator(StateSyncNamespace());
    return Generator(Name);
}

/**
 * @brief TypeId for a fully qualified type name.
 */
inline TypeId TypeIdFromName(std::string_view Name)
{
    return UuidFromName(Name);
}

/**
 * @brief Deterministic id derived from a base id and a discriminator string.
 * @remarks Used to resolve id collisions ("Collision1", "Collision2", ...).
 */
inline Uuid DeriveUuid(const Uuid& Base, std::string_view Discriminator)
{
    uuids::uuid_name_generator Generator(Base);
    return Generator(Discriminator);
}

/**
 * @brief Deterministic id combining two ids.
 * @param Id Id being combined.
 * @param Other Id that acts as the namespace.
 * @remarks Combining the same pair always yields the same id, so objects
 * instantiated from the same source under the same parent agree across peers.
 */
inline Uuid CombineUuid(const Uuid& Id, const Uuid& Other)
{
    const auto Bytes = Id.as_bytes();
    std::string Name(16, '\0');
    for (std::size_t i = 0; i < Name.size(); ++i)
    {
        Name[i] = static_cast<char>(std::to_integer<uint8_t>(Bytes[i]));
    }
    uuids::uuid_name_generator Generator(Other);
    return Generator(Name);
}

/**
 * @brief Generate a new random UUID (UUIDv4).
 * @remarks Uses a thread-local generator.
 */
inline Uuid NewUuid()
{
    static thread_local std::random_device Device;
    static thread_local std::mt19937 Engine(Device());
    static thread_local uuids::uuid_random_generator Generator(Engine);
    return Generator();
}

inline std::string ToString(const Uuid& Id)
{
    return uuids::to_string(Id);
}

/**
 * @brief Copy a UUID into a plain byte array for wire encoding.
 */
inline std::array<uint8_t, 16> ToBytes(const Uuid& Id)
{
    std::array<uint8_t, 16> Data{};
    const auto Bytes = Id.as_bytes();
    for (std::size_t i = 0; i < Data.size(); ++i)
    {
        Data[i] = std::to_integer<uint8_t>(Bytes[i]);
    }
    return Data;
}

inline Uuid FromBytes(const std::array<uint8_t, 16>& Data)
{
    return Uuid(Data);
}

/**
 * @brief Hash functor for UUID keys in unordered containers.
 */
struct UuidHash
{
    std::size_t operator()(const Uuid& Id) const noexcept
    {
        const auto Data = ToBytes(Id);
        uint64_t High = 0;
        uint64_t Low = 0;
        for (int i = 0; i < 8; ++i)
        {
            High = (High << 8) | Data[i];
            Low = (Low << 8) | Data[i + 8];
        }
        return static_cast<std::size_t>(High ^ (Low + 0x9e3779b97f4a7c15ULL + (High << 6) + (High >> 2)));
    }
};

} // namespace SnAPI::StateSync
