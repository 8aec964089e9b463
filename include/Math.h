#pragma once

#include <cmath>

namespace SnAPI::StateSync
{

/**
 * @brief Default threshold under which two floating point values compare equal.
 * @remarks Used by change detection so that sub-threshold jitter does not
 * produce incremental save records.
 */
inline constexpr float kDefaultPrecisionThreshold = 1e-4f;

/**
 * @brief Compare two scalars with an absolute precision threshold.
 */
template<typename T>
constexpr bool NearlyEqual(T Left, T Right, float Precision = kDefaultPrecisionThreshold)
{
    const T Diff = Left > Right ? Left - Right : Right - Left;
    return Diff <= static_cast<T>(Precision);
}

/**
 * @brief 2D vector.
 */
struct Vec2
{
    float X = 0.0f; /**< @brief X component. */
    float Y = 0.0f; /**< @brief Y component. */

    constexpr Vec2() = default;
    constexpr Vec2(float InX, float InY)
        : X(InX)
        , Y(InY)
    {
    }

    constexpr bool operator==(const Vec2&) const = default;
};

/**
 * @brief 3D vector.
 * @remarks Positions of spatial anchors travel as Vec3.
 */
struct Vec3
{
    float X = 0.0f; /**< @brief X component. */
    float Y = 0.0f; /**< @brief Y component. */
    float Z = 0.0f; /**< @brief Z component. */

    constexpr Vec3() = default;
    constexpr Vec3(float InX, float InY, float InZ)
        : X(InX)
        , Y(InY)
        , Z(InZ)
    {
    }

    Vec3& operator+=(const Vec3& Other)
    {
        X += Other.X;
        Y += Other.Y;
        Z += Other.Z;
        return *this;
    }

    Vec3& operator-=(const Vec3& Other)
    {
        X -= Other.X;
        Y -= Other.Y;
        Z -= Other.Z;
        return *this;
    }

    constexpr bool operator==(const Vec3&) const = default;
};

inline Vec3 operator+(Vec3 Left, const Vec3& Right)
{
    Left += Right;
    return Left;
}

inline Vec3 operator-(Vec3 Left, const Vec3& Right)
{
    Left -= Right;
    return Left;
}

/**
 * @brief 4D vector, also used for colors.
 */
struct Vec4
{
    float X = 0.0f; /**< @brief X component. */
    float Y = 0.0f; /**< @brief Y component. */
    float Z = 0.0f; /**< @brief Z component. */
    float W = 0.0f; /**< @brief W component. */

    constexpr Vec4() = default;
    constexpr Vec4(float InX, float InY, float InZ, float InW)
        : X(InX)
        , Y(InY)
        , Z(InZ)
        , W(InW)
    {
    }

    constexpr bool operator==(const Vec4&) const = default;
};

/**
 * @brief Rotation quaternion (X, Y, Z imaginary, W real).
 */
struct Quat
{
    float X = 0.0f; /**< @brief X component. */
    float Y = 0.0f; /**< @brief Y component. */
    float Z = 0.0f; /**< @brief Z component. */
    float W = 1.0f; /**< @brief W component. Identity by default. */

    constexpr Quat() = default;
    constexpr Quat(float InX, float InY, float InZ, float InW)
        : X(InX)
        , Y(InY)
        , Z(InZ)
        , W(InW)
    {
    }

    constexpr bool operator==(const Quat&) const = default;
};

inline bool NearlyEqual(const Vec2& Left, const Vec2& Right, float Precision = kDefaultPrecisionThreshold)
{
    return NearlyEqual(Left.X, Right.X, Precision) && NearlyEqual(Left.Y, Right.Y, Precision);
}

inline bool NearlyEqual(const Vec3& Left, const Vec3& Right, float Precision = kDefaultPrecisionThreshold)
{
    return NearlyEqual(Left.X, Right.X, Precision) && NearlyEqual(Left.Y, Right.Y, Precision)
        && NearlyEqual(Left.Z, Right.Z, Precision);
}

inline bool NearlyEqual(const Vec4& Left, const Vec4& Right, float Precision = kDefaultPrecisionThreshold)
{
    return NearlyEqual(Left.X, Right.X, Precision) && NearlyEqual(Left.Y, Right.Y, Precision)
        && NearlyEqual(Left.Z, Right.Z, Precision) && NearlyEqual(Left.W, Right.W, Precision);
}

/**
 * @brief Quaternion comparison.
 * @remarks Q and -Q describe the same rotation, so both signs are accepted.
 */
inline bool NearlyEqual(const Quat& Left, const Quat& Right, float Precision = kDefaultPrecisionThreshold)
{
    const bool Same = NearlyEqual(Left.X, Right.X, Precision) && NearlyEqual(Left.Y, Right.Y, Precision)
        && NearlyEqual(Left.Z, Right.Z, Precision) && NearlyEqual(Left.W, Right.W, Precision);
    const bool Negated = NearlyEqual(Left.X, -Right.X, Precision) && NearlyEqual(Left.Y, -Right.Y, Precision)
        && NearlyEqual(Left.Z, -Right.Z, Precision) && NearlyEqual(Left.W, -Right.W, Precision);
    return Same || Negated;
}

} // namespace SnAPI::StateSync
