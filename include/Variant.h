#pragma once

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

#include "Expected.h"
#include "TypeName.h"
#include "Uuid.h"

namespace SnAPI::StateSync
{

/**
 * @brief Type-erased value used for sync event arguments and inspection events.
 * @remarks
 * A Variant owns its value through shared storage and tags it with the TypeId
 * of the stored type. Copies share the same storage, so a decoded argument
 * list can be handed to several listeners without deep copies.
 * @note An empty Variant (default constructed) represents a null argument.
 */
class Variant
{
public:
    Variant() = default;

    /**
     * @brief Create a Variant owning a copy of Value.
     * @tparam T Stored type; must have a TTypeName.
     */
    template<typename T>
    static Variant FromValue(T Value)
    {
        using Decayed = std::decay_t<T>;
        Variant Result;
        Result.m_type = CachedTypeId<Decayed>();
        Result.m_storage = std::make_shared<Decayed>(std::move(Value));
        return Result;
    }

    /**
     * @brief Create a Variant from already type-erased storage.
     * @remarks Used by codecs that construct values through a factory.
     */
    static Variant FromStorage(TypeId Type, std::shared_ptr<void> Storage)
    {
        Variant Result;
        Result.m_type = std::move(Type);
        Result.m_storage = std::move(Storage);
        return Result;
    }

    const TypeId& Type() const
    {
        return m_type;
    }

    bool IsEmpty() const
    {
        return !m_storage;
    }

    const void* Borrowed() const
    {
        return m_storage.get();
    }

    template<typename T>
    bool Is() const
    {
        return m_storage && m_type == CachedTypeId<std::decay_t<T>>();
    }

    template<typename T>
    TExpected<std::reference_wrapper<T>> AsRef()
    {
        using Decayed = std::decay_t<T>;
        if (!m_storage)
        {
            return std::unexpected(MakeError(EErrorCode::TypeMismatch, std::string("Variant is empty, expected ") + TTypeNameV<Decayed>));
        }
        if (!Is<Decayed>())
        {
            return std::unexpected(MakeError(EErrorCode::TypeMismatch, std::string("Variant does not hold ") + TTypeNameV<Decayed>));
        }
        return std::ref(*static_cast<Decayed*>(m_storage.get()));
    }

    template<typename T>
    TExpected<std::reference_wrapper<const T>> AsConstRef() const
    {
        using Decayed = std::decay_t<T>;
        if (!m_storage)
        {
            return std::unexpected(MakeError(EErrorCode::TypeMismatch, std::string("Variant is empty, expected ") + TTypeNameV<Decayed>));
        }
        if (!Is<Decayed>())
        {
            return std::unexpected(MakeError(EErrorCode::TypeMismatch, std::string("Variant does not hold ") + TTypeNameV<Decayed>));
        }
        return std::cref(*static_cast<const Decayed*>(m_storage.get()));
    }

    template<typename T>
    static const TypeId& CachedTypeId()
    {
        static const TypeId Type = TypeIdFromName(TTypeNameV<T>);
        return Type;
    }

private:
    TypeId m_type{}; /**< @brief TypeId of the stored value (nil when empty). */
    std::shared_ptr<void> m_storage{}; /**< @brief Owned value storage. */
};

} // namespace SnAPI::StateSync
