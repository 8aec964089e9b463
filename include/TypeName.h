#pragma once

#include <cstdint>
#include <type_traits>
#include <string>
#include <vector>

#include "Math.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

/**
 * @brief Type trait that provides a stable type name string.
 * @tparam T Type to name.
 * @remarks Types provide a static kTypeName or specialize this trait. The name
 * feeds TypeIdFromName, so it must stay stable once data has been saved.
 */
template<typename T>
struct TTypeName
{
    static constexpr const char* Value = T::kTypeName;
};

template<typename T>
inline constexpr const char* TTypeNameV = TTypeName<T>::Value;

namespace detail
{
template<typename T, typename = void>
struct THasTypeName : std::false_type
{
};

template<typename T>
struct THasTypeName<T, std::void_t<decltype(TTypeName<T>::Value)>> : std::true_type
{
};
} // namespace detail

/**
 * @brief True when TTypeName<T> is usable.
 */
template<typename T>
inline constexpr bool THasTypeNameV = detail::THasTypeName<T>::value;

/**
 * @brief Specialize TTypeName for a type without kTypeName.
 */
#define SNAPI_STATESYNC_TYPE_NAME(Type, Name) \
    template<> \
    struct TTypeName<Type> \
    { \
        static constexpr const char* Value = Name; \
    };

SNAPI_STATESYNC_TYPE_NAME(void, "void")
SNAPI_STATESYNC_TYPE_NAME(bool, "bool")
SNAPI_STATESYNC_TYPE_NAME(char, "char")
SNAPI_STATESYNC_TYPE_NAME(std::int8_t, "int8")
SNAPI_STATESYNC_TYPE_NAME(std::uint8_t, "uint8")
SNAPI_STATESYNC_TYPE_NAME(std::int16_t, "int16")
SNAPI_STATESYNC_TYPE_NAME(std::uint16_t, "uint16")
SNAPI_STATESYNC_TYPE_NAME(std::int32_t, "int32")
SNAPI_STATESYNC_TYPE_NAME(std::uint32_t, "uint32")
SNAPI_STATESYNC_TYPE_NAME(std::int64_t, "int64")
SNAPI_STATESYNC_TYPE_NAME(std::uint64_t, "uint64")
SNAPI_STATESYNC_TYPE_NAME(float, "float")
SNAPI_STATESYNC_TYPE_NAME(double, "double")
SNAPI_STATESYNC_TYPE_NAME(std::string, "std::string")
SNAPI_STATESYNC_TYPE_NAME(std::vector<std::uint8_t>, "std::vector<uint8>")
SNAPI_STATESYNC_TYPE_NAME(Uuid, "SnAPI::StateSync::Uuid")
SNAPI_STATESYNC_TYPE_NAME(Vec2, "SnAPI::StateSync::Vec2")
SNAPI_STATESYNC_TYPE_NAME(Vec3, "SnAPI::StateSync::Vec3")
SNAPI_STATESYNC_TYPE_NAME(Vec4, "SnAPI::StateSync::Vec4")
SNAPI_STATESYNC_TYPE_NAME(Quat, "SnAPI::StateSync::Quat")

} // namespace SnAPI::StateSync
