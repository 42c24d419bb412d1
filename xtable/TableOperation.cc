// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <stdexcept>
#include <sstream>

#include "TableOperation.hh"
#include "TableRequests.hh"
#include "ExecutionEngine.hh"
#include "CloudTableClient.hh"
#include "OperationContext.hh"
#include "TableConst.hh"
#include "Utility.hh"
#include "Trace.hh"

namespace xtable
{

std::ostream&
operator<<(std::ostream& os, TableOperationType type)
{
    switch (type) {
        case TableOperationType::Insert: os << "Insert"; break;
        case TableOperationType::InsertOrMerge: os << "InsertOrMerge"; break;
        case TableOperationType::InsertOrReplace: os << "InsertOrReplace"; break;
        case TableOperationType::Merge: os << "Merge"; break;
        case TableOperationType::Replace: os << "Replace"; break;
        case TableOperationType::Delete: os << "Delete"; break;
        case TableOperationType::Retrieve: os << "Retrieve"; break;
        default: os << "Unknown(" << static_cast<int>(type) << ")"; break;
    }
    return os;
}

std::shared_ptr<TableEntity>
TableOperation::Required(
    std::shared_ptr<TableEntity> entity,
    const char * fn
    )
{
    if (!entity) {
        throw std::invalid_argument(std::string(fn) + ": entity cannot be null");
    }
    return entity;
}

std::shared_ptr<TableEntity>
TableOperation::RequiredWithEtag(
    std::shared_ptr<TableEntity> entity,
    const char * fn
    )
{
    Required(entity, fn);
    if (entity->Etag().empty()) {
        throw std::invalid_argument(std::string(fn) + ": entity must have an entity tag; use \"*\" to match any version");
    }
    return entity;
}

TableOperation
TableOperation::Insert(
    std::shared_ptr<TableEntity> entity,
    bool echoContent
    )
{
    return TableOperation(TableOperationType::Insert, Required(std::move(entity), "TableOperation::Insert"), echoContent);
}

TableOperation
TableOperation::InsertOrMerge(
    std::shared_ptr<TableEntity> entity
    )
{
    return TableOperation(TableOperationType::InsertOrMerge, Required(std::move(entity), "TableOperation::InsertOrMerge"), false);
}

TableOperation
TableOperation::InsertOrReplace(
    std::shared_ptr<TableEntity> entity
    )
{
    return TableOperation(TableOperationType::InsertOrReplace, Required(std::move(entity), "TableOperation::InsertOrReplace"), false);
}

TableOperation
TableOperation::Merge(
    std::shared_ptr<TableEntity> entity
    )
{
    return TableOperation(TableOperationType::Merge, RequiredWithEtag(std::move(entity), "TableOperation::Merge"), false);
}

TableOperation
TableOperation::Replace(
    std::shared_ptr<TableEntity> entity
    )
{
    return TableOperation(TableOperationType::Replace, RequiredWithEtag(std::move(entity), "TableOperation::Replace"), false);
}

TableOperation
TableOperation::Delete(
    std::shared_ptr<TableEntity> entity
    )
{
    return TableOperation(TableOperationType::Delete, RequiredWithEtag(std::move(entity), "TableOperation::Delete"), false);
}

TableOperation
TableOperation::Retrieve(
    const std::string & partitionKey,
    const std::string & rowKey,
    EntityFactory factory
    )
{
    if (!factory) {
        throw std::invalid_argument("TableOperation::Retrieve: entity factory cannot be empty");
    }
    return TableOperation(partitionKey, rowKey, RetrieveTarget(std::move(factory)));
}

TableOperation
TableOperation::Retrieve(
    const std::string & partitionKey,
    const std::string & rowKey,
    EntityResolver resolver
    )
{
    if (!resolver) {
        throw std::invalid_argument("TableOperation::Retrieve: entity resolver cannot be empty");
    }
    return TableOperation(partitionKey, rowKey, RetrieveTarget(std::move(resolver)));
}

std::string
TableOperation::GenerateRequestIdentity(
    bool isTableEntry,
    const std::string & entryName,
    bool encodeKeys
    ) const
{
    if (isTableEntry) {
        return "'" + entryName + "'";
    }
    if (m_type == TableOperationType::Insert) {
        return std::string();
    }

    std::string pk, rk;
    if (m_type == TableOperationType::Retrieve) {
        pk = m_retrievePartitionKey;
        rk = m_retrieveRowKey;
    }
    else {
        pk = m_entity->PartitionKey();
        rk = m_entity->RowKey();
    }
    if (encodeKeys) {
        pk = XTableUtil::SafeEncode(pk);
        rk = XTableUtil::SafeEncode(rk);
    }

    std::ostringstream identity;
    identity << table::c_PartitionKey << "='" << pk << "'," << table::c_RowKey << "='" << rk << "'";
    return identity.str();
}

std::string
TableOperation::GenerateRequestIdentityWithTable(
    const std::string & tableName
    ) const
{
    return tableName + "(" + GenerateRequestIdentity(false, std::string(), false) + ")";
}

TableResult
TableOperation::Execute(
    const CloudTableClient & client,
    const std::string & tableName,
    TableRequestOptions options,
    OperationContext & context
    ) const
{
    context.Initialize();

    Trace trace(Trace::Operation, "TableOperation::Execute", context.ClientRequestId());

    if (tableName.empty()) {
        throw std::invalid_argument("TableOperation::Execute: table name cannot be empty");
    }
    options.ApplyDefaults(client.DefaultRequestOptions());

    TRACEINFO(trace, m_type << " on table " << tableName);

    auto codec = client.PayloadCodecPtr();
    switch (m_type) {
        case TableOperationType::Insert:
        case TableOperationType::InsertOrMerge:
        case TableOperationType::InsertOrReplace:
            return ExecutionEngine::ExecuteWithRetry(client, InsertRequest(*this, tableName, options, codec, context), options, context);
        case TableOperationType::Delete:
            return ExecutionEngine::ExecuteWithRetry(client, DeleteRequest(*this, tableName, options, codec, context), options, context);
        case TableOperationType::Merge:
            return ExecutionEngine::ExecuteWithRetry(client, MergeRequest(*this, tableName, options, codec, context), options, context);
        case TableOperationType::Replace:
            return ExecutionEngine::ExecuteWithRetry(client, ReplaceRequest(*this, tableName, options, codec, context), options, context);
        case TableOperationType::Retrieve:
            return ExecutionEngine::ExecuteWithRetry(client, RetrieveRequest(*this, tableName, options, codec, context), options, context);
    }

    std::ostringstream msg;
    msg << "TableOperation::Execute: unknown operation type " << static_cast<int>(m_type);
    throw std::invalid_argument(msg.str());
}

}
