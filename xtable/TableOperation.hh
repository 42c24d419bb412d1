// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEOPERATION_HH_
#define _TABLEOPERATION_HH_

#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <boost/variant.hpp>
#include <cpprest/asyncrt_utils.h>

#include "TableEntity.hh"
#include "TableResult.hh"
#include "TableRequestOptions.hh"

namespace xtable
{

class CloudTableClient;
class OperationContext;

enum class TableOperationType { Insert, InsertOrMerge, InsertOrReplace, Merge, Replace, Delete, Retrieve };

std::ostream& operator<<(std::ostream& os, TableOperationType type);

/// Makes the empty entity a retrieve fills from the row read back.
typedef std::function<std::shared_ptr<TableEntity>()> EntityFactory;

/// Projects a row read back into whatever entity the caller wants:
/// (partitionKey, rowKey, timestamp, properties, etag) -> entity.
typedef std::function<std::shared_ptr<TableEntity>(const std::string &, const std::string &,
                                                   const utility::datetime &, const PropertyMap &,
                                                   const std::string &)> EntityResolver;

/// How a retrieve interprets the row: exactly one of a factory or a resolver.
typedef boost::variant<EntityFactory, EntityResolver> RetrieveTarget;

/// <summary>
/// A single-entity operation against a table: the kind, the caller's entity (none
/// for a retrieve, which carries its keys and target instead) and whether an insert
/// asks the service to echo the stored row back. Built only by the named factories,
/// which reject what the kind can never execute; immutable afterwards.
///
/// The entity stays owned by the caller. A successful write refreshes its entity
/// tag (and, for an echoing insert, its timestamp and properties).
/// </summary>
class TableOperation
{
public:
    /// Insert a new row. With echoContent the service returns the stored row and
    /// the entity is refreshed from it.
    static TableOperation Insert(std::shared_ptr<TableEntity> entity, bool echoContent = false);

    static TableOperation InsertOrMerge(std::shared_ptr<TableEntity> entity);
    static TableOperation InsertOrReplace(std::shared_ptr<TableEntity> entity);

    /// Merge, Replace and Delete are conditional: the entity must carry an entity
    /// tag ("*" matches any version).
    static TableOperation Merge(std::shared_ptr<TableEntity> entity);
    static TableOperation Replace(std::shared_ptr<TableEntity> entity);
    static TableOperation Delete(std::shared_ptr<TableEntity> entity);

    static TableOperation Retrieve(const std::string & partitionKey, const std::string & rowKey, EntityFactory factory);
    static TableOperation Retrieve(const std::string & partitionKey, const std::string & rowKey, EntityResolver resolver);

    /// Retrieve into a default-constructed TEntity.
    template <typename TEntity>
    static TableOperation Retrieve(const std::string & partitionKey, const std::string & rowKey)
    {
        return Retrieve(partitionKey, rowKey, EntityFactory([]() -> std::shared_ptr<TableEntity> {
            return std::make_shared<TEntity>();
        }));
    }

    TableOperationType OperationType() const { return m_type; }
    const std::shared_ptr<TableEntity> & Entity() const { return m_entity; }
    bool EchoContent() const { return m_echoContent; }

    const std::string & RetrievePartitionKey() const { return m_retrievePartitionKey; }
    const std::string & RetrieveRowKey() const { return m_retrieveRowKey; }
    const RetrieveTarget & GetRetrieveTarget() const { return m_retrieveTarget; }

    /// <summary>
    /// The fragment that addresses the target row inside the request path.
    /// A row of the table-of-tables is addressed as '<entryName>'; a plain insert
    /// addresses the table itself (empty identity); anything else is
    /// PartitionKey='<pk>',RowKey='<rk>' with the keys percent-encoded if encodeKeys.
    /// </summary>
    std::string GenerateRequestIdentity(bool isTableEntry, const std::string & entryName, bool encodeKeys) const;

    /// "<tableName>(<identity>)" with unencoded keys.
    std::string GenerateRequestIdentityWithTable(const std::string & tableName) const;

    /// <summary>
    /// Run the operation against tableName. Options left unset take the client's
    /// defaults. Throws std::invalid_argument for an empty table name or a local
    /// precondition failure, StorageException (or TableServiceException) for a
    /// failure to serialize or a failure reported by the service or the transport.
    /// </summary>
    TableResult Execute(const CloudTableClient & client, const std::string & tableName,
                        TableRequestOptions options, OperationContext & context) const;

private:
    TableOperation(TableOperationType type, std::shared_ptr<TableEntity> entity, bool echoContent)
        : m_type(type), m_entity(std::move(entity)), m_echoContent(echoContent) {}

    TableOperation(std::string partitionKey, std::string rowKey, RetrieveTarget target)
        : m_type(TableOperationType::Retrieve), m_echoContent(false),
          m_retrievePartitionKey(std::move(partitionKey)), m_retrieveRowKey(std::move(rowKey)),
          m_retrieveTarget(std::move(target)) {}

    static std::shared_ptr<TableEntity> Required(std::shared_ptr<TableEntity> entity, const char * fn);
    static std::shared_ptr<TableEntity> RequiredWithEtag(std::shared_ptr<TableEntity> entity, const char * fn);

    TableOperationType m_type;
    std::shared_ptr<TableEntity> m_entity;
    bool m_echoContent;

    std::string m_retrievePartitionKey;
    std::string m_retrieveRowKey;
    RetrieveTarget m_retrieveTarget;
};

}

#endif // _TABLEOPERATION_HH_
