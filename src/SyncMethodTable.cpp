#include "SyncMethodTable.h"

#include <exception>

namespace SnAPI::StateSync
{

std::vector<std::string> SyncMethodTable::MethodNames() const
{
    std::vector<std::string> Names;
    Names.reserve(m_methods.size());
    for (const auto& [Name, Item] : m_methods)
    {
        Names.push_back(Name);
    }
    return Names;
}

Result SyncMethodTable::Apply(const SyncEventArgs& Args) const
{
    const auto& Table = Args.Kind == ESyncEventKind::PropertyChanged ? m_properties : m_methods;
    const auto It = Table.find(Args.MemberName);
    if (It == Table.end())
    {
        return std::unexpected(MakeError(EErrorCode::NotFound,
            std::string(Args.Kind == ESyncEventKind::PropertyChanged ? "Unknown sync property " : "Unknown sync method ") + Args.MemberName));
    }

    try
    {
        auto Called = It->second.Invoke(It->second.Instance, Args.Args);
        if (!Called)
        {
            return std::unexpected(MakeError(Called.error().Code, Args.MemberName + ": " + Called.error().Message));
        }
    }
    catch (const std::exception& Ex)
    {
        return std::unexpected(MakeError(EErrorCode::InvokeFailed, Args.MemberName + " threw: " + Ex.what()));
    }
    return Ok();
}

} // namespace SnAPI::StateSync
