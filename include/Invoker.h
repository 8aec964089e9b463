#pragma once

#include <functional>
#include <optional>
#include <span>
#include <tuple>
#include <type_traits>
#include <utility>

#include "Expected.h"
#include "Variant.h"

namespace SnAPI::StateSync
{

/**
 * @brief Type-erased call of a member function with Variant arguments.
 * @remarks Instance is the object the member belongs to. The return value of
 * the member, if any, is discarded: a replayed call only matters for the state
 * transition it performs.
 */
using SyncInvoker = std::function<Result(void* Instance, std::span<const Variant> Args)>;

namespace detail
{

template<typename Arg>
using TSyncArgT = std::remove_cvref_t<Arg>;

template<typename Arg>
inline constexpr bool TIsSupportedSyncArgV =
    !std::is_lvalue_reference_v<Arg> || std::is_const_v<std::remove_reference_t<Arg>>;

template<typename T, typename R, typename... Args, size_t... I>
Result InvokeSyncImpl(T* Instance, R (T::*Method)(Args...), std::span<const Variant> ArgsPack, std::index_sequence<I...>)
{
    std::tuple<std::optional<TSyncArgT<Args>>...> Extracted;
    Error ErrorValue;
    bool AllOk = true;
    (([&] {
        if (!AllOk)
        {
            return;
        }
        auto Value = ArgsPack[I].template AsConstRef<TSyncArgT<Args>>();
        if (!Value)
        {
            AllOk = false;
            ErrorValue = MakeError(Value.error().Code, "Argument " + std::to_string(I) + ": " + Value.error().Message);
            return;
        }
        std::get<I>(Extracted).emplace(Value->get());
    }()), ...);

    if (!AllOk)
    {
        return std::unexpected(std::move(ErrorValue));
    }

    (Instance->*Method)(*std::get<I>(Extracted)...);
    return Ok();
}

} // namespace detail

/**
 * @brief Build a SyncInvoker for a member function.
 * @tparam T Owning class.
 * @remarks Arguments must be taken by value or by const reference; the
 * Variant's stored type must match the decayed parameter type exactly.
 */
template<typename T, typename R, typename... Args>
SyncInvoker MakeSyncInvoker(R (T::*Method)(Args...))
{
    static_assert((detail::TIsSupportedSyncArgV<Args> && ...), "Sync methods must take arguments by value or const reference");
    return [Method](void* Instance, std::span<const Variant> ArgsPack) -> Result {
        if (!Instance)
        {
            return std::unexpected(MakeError(EErrorCode::InvalidArgument, "Null instance"));
        }
        if (ArgsPack.size() != sizeof...(Args))
        {
            return std::unexpected(MakeError(EErrorCode::InvalidArgument,
                "Argument count mismatch: expected " + std::to_string(sizeof...(Args)) + ", got " + std::to_string(ArgsPack.size())));
        }
        return detail::InvokeSyncImpl(static_cast<T*>(Instance), Method, ArgsPack, std::index_sequence_for<Args...>{});
    };
}

} // namespace SnAPI::StateSync
