#pragma once

#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace SnAPI::StateSync
{

/**
 * @brief Error categories reported by the state sync core.
 * @remarks
 * Record-level codes (UnknownTarget, DeserializationFailed, UnknownVariant) are
 * recoverable: the orchestrator skips the affected record and continues.
 * Stream-level codes (UnsupportedFormat, UnsupportedVersion) abort a load.
 * @note EErrorCode::None indicates success.
 */
enum class EErrorCode
{
    None = 0,              /**< @brief No error. */
    NotFound,              /**< @brief Requested item was not found. */
    InvalidArgument,       /**< @brief One or more arguments are invalid. */
    TypeMismatch,          /**< @brief Type mismatch or unsafe conversion. */
    OutOfRange,            /**< @brief Index or value is out of range. */
    AlreadyExists,         /**< @brief Attempted to register something that already exists. */
    NotReady,              /**< @brief Subsystem or object is not ready. */
    InternalError,         /**< @brief Unexpected internal failure. */
    UnknownTarget,         /**< @brief A unique id did not resolve to a live object. */
    UnknownVariant,        /**< @brief A tagged value named a type with no registered codec. */
    DeserializationFailed, /**< @brief Corrupt or truncated input. */
    SerializationFailed,   /**< @brief A participant failed while writing its state. */
    InvokeFailed,          /**< @brief A replayed method or property setter failed. */
    UnsupportedFormat,     /**< @brief Stream header names an unknown format. */
    UnsupportedVersion     /**< @brief Stream was written by a newer binary version. */
};

/**
 * @brief Human-readable name of an error code.
 * @param Code Code to name.
 * @return Static string naming the code.
 */
constexpr std::string_view ToString(EErrorCode Code) noexcept
{
    switch (Code)
    {
    case EErrorCode::None: return "None";
    case EErrorCode::NotFound: return "NotFound";
    case EErrorCode::InvalidArgument: return "InvalidArgument";
    case EErrorCode::TypeMismatch: return "TypeMismatch";
    case EErrorCode::OutOfRange: return "OutOfRange";
    case EErrorCode::AlreadyExists: return "AlreadyExists";
    case EErrorCode::NotReady: return "NotReady";
    case EErrorCode::InternalError: return "InternalError";
    case EErrorCode::UnknownTarget: return "UnknownTarget";
    case EErrorCode::UnknownVariant: return "UnknownVariant";
    case EErrorCode::DeserializationFailed: return "DeserializationFailed";
    case EErrorCode::SerializationFailed: return "SerializationFailed";
    case EErrorCode::InvokeFailed: return "InvokeFailed";
    case EErrorCode::UnsupportedFormat: return "UnsupportedFormat";
    case EErrorCode::UnsupportedVersion: return "UnsupportedVersion";
    }
    return "Unknown";
}

/**
 * @brief Error payload for TExpected results.
 * @remarks Use Code for programmatic checks and Message for diagnostics.
 */
struct Error
{
    EErrorCode Code = EErrorCode::None; /**< @brief Error category. */
    std::string Message; /**< @brief Human-readable diagnostic message. */

    Error() = default;
    Error(EErrorCode InCode, std::string InMessage)
        : Code(InCode)
        , Message(std::move(InMessage))
    {
    }

    /**
     * @brief True when this holds an actual error.
     * @note This inverts the usual "success" meaning of a bool conversion.
     */
    explicit operator bool() const noexcept
    {
        return Code != EErrorCode::None;
    }

    /**
     * @brief Format as "Code: Message" for logging.
     */
    std::string Describe() const
    {
        std::string Result(ToString(Code));
        if (!Message.empty())
        {
            Result += ": ";
            Result += Message;
        }
        return Result;
    }
};

/**
 * @brief Convenience alias for std::expected with Error.
 */
template<typename T>
using TExpected = std::expected<T, Error>;

/**
 * @brief Expected wrapper that stores a non-owning reference.
 * @remarks Returned by registry lookups so callers do not deal with raw pointers.
 * @note The referenced object must outlive this wrapper.
 */
template<typename T>
class TExpectedRef
{
public:
    TExpectedRef() = default;

    TExpectedRef(T& Value)
        : m_expected(std::ref(Value))
    {
    }

    TExpectedRef(std::unexpected<Error> ErrorValue)
        : m_expected(std::unexpected(std::move(ErrorValue.error())))
    {
    }

    explicit operator bool() const
    {
        return m_expected.has_value();
    }

    bool has_value() const
    {
        return m_expected.has_value();
    }

    T& operator*() const
    {
        return m_expected->get();
    }

    T* operator->() const
    {
        return &m_expected->get();
    }

    /**
     * @brief Get the referenced object.
     * @note Undefined when in the error state; check first.
     */
    T& Get() const
    {
        return m_expected->get();
    }

    /**
     * @brief Referenced object as a pointer, or nullptr on error.
     */
    T* GetOrNull() const
    {
        return m_expected ? &m_expected->get() : nullptr;
    }

    const Error& error() const
    {
        return m_expected.error();
    }

private:
    std::expected<std::reference_wrapper<T>, Error> m_expected{std::unexpected(Error{EErrorCode::NotReady, "Empty reference"})}; /**< @brief Stored expected reference. */
};

/**
 * @brief Alias for operations returning only success/failure.
 */
using Result = TExpected<void>;

inline Result Ok()
{
    return {};
}

/**
 * @brief Construct an Error value.
 * @param Code Error category.
 * @param Message Diagnostic message.
 * @return Error instance with the provided data.
 */
inline Error MakeError(EErrorCode Code, std::string Message)
{
    return Error(Code, std::move(Message));
}

} // namespace SnAPI::StateSync
