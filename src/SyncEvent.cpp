#include "SyncEvent.h"

#include <utility>

#include "BinarySerializer.h"
#include "IStateSync.h"
#include "UniqueIdRegistry.h"
#include "VariantCodec.h"

namespace SnAPI::StateSync
{

SyncEventArgs SyncEventArgs::Method(std::string Name, std::vector<Variant> Arguments)
{
    SyncEventArgs Result;
    Result.Kind = ESyncEventKind::MethodInvoked;
    Result.MemberName = std::move(Name);
    Result.Args = std::move(Arguments);
    return Result;
}

SyncEventArgs SyncEventArgs::Property(std::string Name, Variant Value)
{
    SyncEventArgs Result;
    Result.Kind = ESyncEventKind::PropertyChanged;
    Result.MemberName = std::move(Name);
    Result.Args.push_back(std::move(Value));
    return Result;
}

std::string SyncEventArgs::ToString() const
{
    if (Kind == ESyncEventKind::PropertyChanged)
    {
        return MemberName + " = " + (Args.empty() ? std::string("null") : SnAPI::StateSync::ToString(Args.front()));
    }
    std::string Result = MemberName + "(";
    for (std::size_t Index = 0; Index < Args.size(); ++Index)
    {
        if (Index > 0)
        {
            Result += ", ";
        }
        Result += SnAPI::StateSync::ToString(Args[Index]);
    }
    return Result + ")";
}

TExpected<std::vector<uint8_t>> SerializeEventBinary(const IUniqueId& Target, const SyncEventArgs& Args, uint16_t Version)
{
    Uuid TargetId = Target.UniqueId();
    if (TargetId.is_nil())
    {
        return std::unexpected(MakeError(EErrorCode::NotReady, Target.UniqueName() + " has no unique id"));
    }

    std::vector<uint8_t> Bytes;
    try
    {
        BinarySerializer Writer(Bytes, Version);
        Writer.Serialize(TargetId);
        auto Kind = static_cast<uint8_t>(Args.Kind);
        Writer.Serialize(Kind);
        std::string Name = Args.MemberName;
        Writer.Serialize(Name);
        std::vector<Variant> Arguments = Args.Args;
        Writer.Serialize(Arguments);
    }
    catch (const SerializationException& Ex)
    {
        return std::unexpected(Ex.GetError());
    }
    return Bytes;
}

TExpected<EncodedSyncEvent> DecodeEventBinary(std::span<const uint8_t> Bytes, uint16_t Version)
{
    EncodedSyncEvent Event;
    try
    {
        BinarySerializer Reader(Bytes, Version);
        Reader.Serialize(Event.TargetId);
        uint8_t Kind = 0;
        Reader.Serialize(Kind);
        if (Kind > static_cast<uint8_t>(ESyncEventKind::PropertyChanged))
        {
            return std::unexpected(MakeError(EErrorCode::DeserializationFailed, "Unknown sync event kind " + std::to_string(Kind)));
        }
        Event.Args.Kind = static_cast<ESyncEventKind>(Kind);
        Reader.Serialize(Event.Args.MemberName);
        Reader.Serialize(Event.Args.Args);
        if (!Reader.AtEnd())
        {
            return std::unexpected(MakeError(EErrorCode::DeserializationFailed,
                std::to_string(Reader.Remaining()) + " trailing bytes after sync event " + Event.Args.MemberName));
        }
    }
    catch (const SerializationException& Ex)
    {
        return std::unexpected(Ex.GetError());
    }
    if (Event.Args.Kind == ESyncEventKind::PropertyChanged && Event.Args.Args.size() != 1)
    {
        return std::unexpected(MakeError(EErrorCode::DeserializationFailed, "Property event " + Event.Args.MemberName + " must carry one value"));
    }
    return Event;
}

TExpected<DecodedSyncEvent> DeserializeEventBinary(std::span<const uint8_t> Bytes, uint16_t Version, const UniqueIdRegistry& Registry,
                                                   SyncEventArgs* DecodedArgs)
{
    auto Encoded = DecodeEventBinary(Bytes, Version);
    if (!Encoded)
    {
        return std::unexpected(Encoded.error());
    }
    if (DecodedArgs)
    {
        *DecodedArgs = Encoded->Args;
    }
    auto Target = Registry.Resolve<IStateSync>(Encoded->TargetId);
    if (!Target)
    {
        return std::unexpected(MakeError(EErrorCode::UnknownTarget, Target.error().Message));
    }

    DecodedSyncEvent Event;
    Event.Target = &Target.Get();
    Event.Args = std::move(Encoded->Args);
    return Event;
}

} // namespace SnAPI::StateSync
