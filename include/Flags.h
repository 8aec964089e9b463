#pragma once

#include <type_traits>

namespace SnAPI::StateSync
{

/**
 * @brief Bit-flag set over a strongly-typed enum.
 * @tparam Enum Enum whose enumerators are single bits (or named combinations).
 * @remarks Used for state save options and sync options, both of which travel
 * through call chains where individual bits are added and tested.
 */
template<typename Enum>
class TFlags
{
public:
    static_assert(std::is_enum_v<Enum>, "TFlags requires an enum type");
    using Underlying = std::underlying_type_t<Enum>;

    constexpr TFlags() = default;
    constexpr TFlags(Enum Bits)
        : m_value(static_cast<Underlying>(Bits))
    {
    }

    static constexpr TFlags FromRaw(Underlying Value)
    {
        TFlags Result;
        Result.m_value = Value;
        return Result;
    }

    constexpr Underlying Value() const
    {
        return m_value;
    }

    constexpr bool Empty() const
    {
        return m_value == 0;
    }

    /** @brief True when every bit of Bits is set. */
    constexpr bool Has(TFlags Bits) const
    {
        return (m_value & Bits.m_value) == Bits.m_value && !Bits.Empty();
    }

    /** @brief True when at least one bit of Bits is set. */
    constexpr bool HasAny(TFlags Bits) const
    {
        return (m_value & Bits.m_value) != 0;
    }

    constexpr TFlags With(TFlags Bits) const
    {
        return FromRaw(m_value | Bits.m_value);
    }

    constexpr TFlags Without(TFlags Bits) const
    {
        return FromRaw(m_value & static_cast<Underlying>(~Bits.m_value));
    }

    constexpr TFlags operator|(TFlags Other) const
    {
        return FromRaw(m_value | Other.m_value);
    }

    constexpr TFlags operator&(TFlags Other) const
    {
        return FromRaw(m_value & Other.m_value);
    }

    constexpr TFlags& operator|=(TFlags Other)
    {
        m_value |= Other.m_value;
        return *this;
    }

    constexpr bool operator==(const TFlags&) const = default;

private:
    Underlying m_value = 0;
};

/**
 * @brief Opt an enum into `A | B` producing TFlags.
 */
#define SNAPI_STATESYNC_DECLARE_FLAGS(EnumType) \
    constexpr ::SnAPI::StateSync::TFlags<EnumType> operator|(EnumType Left, EnumType Right) \
    { \
        return ::SnAPI::StateSync::TFlags<EnumType>(Left) | Right; \
    }

} // namespace SnAPI::StateSync
