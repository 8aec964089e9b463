#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <map>
#include <optional>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Math.h"
#include "Serializer.h"
#include "TypeName.h"
#include "UniqueId.h"
#include "Variant.h"

namespace SnAPI::StateSync::detail
{

template<typename T>
struct TIsVector : std::false_type
{
};

template<typename T, typename A>
struct TIsVector<std::vector<T, A>> : std::true_type
{
};

template<typename T>
struct TIsArray : std::false_type
{
};

template<typename T, std::size_t N>
struct TIsArray<std::array<T, N>> : std::true_type
{
};

template<typename T>
struct TIsOptional : std::false_type
{
};

template<typename T>
struct TIsOptional<std::optional<T>> : std::true_type
{
};

template<typename T>
struct TIsPair : std::false_type
{
};

template<typename A, typename B>
struct TIsPair<std::pair<A, B>> : std::true_type
{
};

template<typename T>
struct TIsMap : std::false_type
{
};

template<typename K, typename V, typename C, typename A>
struct TIsMap<std::map<K, V, C, A>> : std::true_type
{
};

template<typename K, typename V, typename H, typename E, typename A>
struct TIsMap<std::unordered_map<K, V, H, E, A>> : std::true_type
{
};

template<typename T>
concept CUniqueRef = std::is_pointer_v<T> && std::is_base_of_v<IUniqueId, std::remove_pointer_t<T>>;

template<typename T>
concept CMathValue = std::same_as<T, Vec2> || std::same_as<T, Vec3> || std::same_as<T, Vec4> || std::same_as<T, Quat>;

/**
 * @brief Change-detection equality for tracked state values.
 * @remarks Floating point values and the components of math types compare
 * within Precision. Containers compare element by element with the same rule.
 * Object references compare by identity.
 */
template<typename T>
bool ValuesEqual(const T& Left, const T& Right, float Precision)
{
    if constexpr (std::is_floating_point_v<T>)
    {
        return NearlyEqual(Left, Right, Precision);
    }
    else if constexpr (CMathValue<T>)
    {
        return NearlyEqual(Left, Right, Precision);
    }
    else if constexpr (TIsVector<T>::value || TIsArray<T>::value)
    {
        if (Left.size() != Right.size())
        {
            return false;
        }
        for (std::size_t Index = 0; Index < Left.size(); ++Index)
        {
            if (!ValuesEqual<typename T::value_type>(Left[Index], Right[Index], Precision))
            {
                return false;
            }
        }
        return true;
    }
    else if constexpr (TIsMap<T>::value)
    {
        if (Left.size() != Right.size())
        {
            return false;
        }
        for (const auto& [Key, Value] : Left)
        {
            const auto It = Right.find(Key);
            if (It == Right.end() || !ValuesEqual<typename T::mapped_type>(Value, It->second, Precision))
            {
                return false;
            }
        }
        return true;
    }
    else if constexpr (TIsOptional<T>::value)
    {
        if (Left.has_value() != Right.has_value())
        {
            return false;
        }
        return !Left.has_value() || ValuesEqual<typename T::value_type>(*Left, *Right, Precision);
    }
    else if constexpr (TIsPair<T>::value)
    {
        return ValuesEqual<typename T::first_type>(Left.first, Right.first, Precision)
            && ValuesEqual<typename T::second_type>(Left.second, Right.second, Precision);
    }
    else
    {
        static_assert(std::equality_comparable<T>, "Tracked state values need operator== or a supported container type");
        return Left == Right;
    }
}

/**
 * @brief Transfer a tracked value, dispatching object references to SerializeUniqueRef.
 */
template<typename T>
void SerializeValue(ISerializer& Serializer, T& Value)
{
    if constexpr (CUniqueRef<T>)
    {
        Serializer.SerializeUniqueRef(Value);
    }
    else
    {
        Serializer.Serialize(Value);
    }
}

/**
 * @brief Snapshot of a tracked value for inspection events.
 * @return An empty Variant for types without a TTypeName.
 */
template<typename T>
Variant MakeInspectionValue(const T& Value)
{
    if constexpr (THasTypeNameV<T> && std::is_copy_constructible_v<T>)
    {
        return Variant::FromValue(Value);
    }
    else
    {
        return {};
    }
}

} // namespace SnAPI::StateSync::detail
