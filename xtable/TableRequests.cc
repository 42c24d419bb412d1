// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <sstream>
#include <stdexcept>
#include <boost/variant/static_visitor.hpp>
#include <boost/variant/apply_visitor.hpp>
#include <cpprest/base_uri.h>

#include "TableRequests.hh"
#include "OperationContext.hh"
#include "TableConst.hh"
#include "XTableException.hh"
#include "Crypto.hh"
#include "Utility.hh"
#include "Logger.hh"
#include "Trace.hh"

using namespace xtable;
using namespace web::http;

namespace
{

// Name of the table a row of the table-of-tables stands for.
std::string
TableEntryName(
    const TableEntity & entity
    )
{
    auto properties = entity.WriteEntity();
    auto iter = properties.find(table::c_TableName);
    if (iter == properties.end() || iter->second.IsNull() || iter->second.Type() != EdmType::String
        || iter->second.AsString().empty()) {
        throw std::invalid_argument("EntityWriteRequest: table entry has no TableName property");
    }
    return iter->second.AsString();
}

class ResolveEntity : public boost::static_visitor<std::shared_ptr<TableEntity>>
{
public:
    ResolveEntity(const ParsedEntity & parsed, const std::string & etag)
        : m_parsed(parsed), m_etag(etag) {}

    std::shared_ptr<TableEntity> operator()(const EntityFactory & factory) const
    {
        auto entity = factory();
        if (!entity) {
            throw XTABLEEXCEPTION("Entity factory returned a null entity");
        }
        entity->SetPartitionKey(m_parsed.partitionKey);
        entity->SetRowKey(m_parsed.rowKey);
        entity->SetTimestamp(m_parsed.timestamp);
        entity->SetEtag(m_etag);
        entity->ReadEntity(m_parsed.properties);
        return entity;
    }

    std::shared_ptr<TableEntity> operator()(const EntityResolver & resolver) const
    {
        return resolver(m_parsed.partitionKey, m_parsed.rowKey, m_parsed.timestamp, m_parsed.properties, m_etag);
    }

private:
    const ParsedEntity & m_parsed;
    const std::string & m_etag;
};

}

//////////////// TableRequestBase

TableRequestBase::TableRequestBase(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    bool tableEntryForm
    ) :
    m_operation(operation),
    m_tableName(tableName),
    m_options(options),
    m_codec(std::move(codec)),
    m_isTableEntry(tableEntryForm && tableName == table::c_TablesServiceTablesName),
    m_identityEncoded(false)
{
    if (!m_codec) {
        throw std::invalid_argument("TableRequest: payload codec cannot be null");
    }
}

TableHttpRequest
TableRequestBase::NewRequest(
    const method & verb,
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    TableHttpRequest request;
    request.method = verb;

    std::string resource = m_tableName;
    if (!m_identity.empty()) {
        resource += "(" + m_identity + ")";
    }
    web::uri_builder builder(baseUri);
    builder.append_path(resource, !m_identityEncoded);

    auto timeout = m_options.ServerTimeout().count();
    if (timeout > 0) {
        builder.append_query("timeout", timeout);
    }
    request.uri = builder.to_uri();

    auto & headers = request.headers;
    headers.add(header::c_Version, table::c_ServiceVersion);
    headers.add(header::c_DataServiceVersion, table::c_DataServiceVersion);
    headers.add(header::c_MaxDataServiceVersion, table::c_DataServiceVersion);
    headers.add(header::c_Accept, AcceptHeaderFor(m_options.PayloadFormat()));
    headers.add(header::c_AcceptCharset, "UTF-8");
    headers.add(header::c_Date, XTableUtil::Rfc1123Now());
    headers.add(header::c_ClientRequestId, context.ClientRequestId());

    return request;
}

TableServiceException
TableRequestBase::ServiceError(
    const TransportResponse & response,
    bool retryable
    ) const
{
    auto error = m_codec->ReadError(response.body);
    return TableServiceException(response.statusCode, response.reasonPhrase, error.code, error.message,
                                 response.Header(header::c_RequestId), retryable);
}

//////////////// EntityWriteRequest

EntityWriteRequest::EntityWriteRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    bool tableEntryForm
    ) :
    TableRequestBase(operation, tableName, options, std::move(codec), tableEntryForm)
{
    if (!m_operation.Entity()) {
        throw std::invalid_argument("EntityWriteRequest: operation has no entity");
    }

    std::string entryName;
    if (m_isTableEntry) {
        entryName = TableEntryName(*m_operation.Entity());
    }
    m_identity = m_operation.GenerateRequestIdentity(m_isTableEntry, entryName, false);
}

void
EntityWriteRequest::RequireKeys(
    const char * fn
    ) const
{
    const auto & entity = *m_operation.Entity();
    if (!entity.HasPartitionKey()) {
        throw std::invalid_argument(std::string(fn) + ": entity has no partition key");
    }
    if (!entity.HasRowKey()) {
        throw std::invalid_argument(std::string(fn) + ": entity has no row key");
    }
}

void
EntityWriteRequest::RequireEtag(
    const char * fn
    ) const
{
    if (m_operation.Entity()->Etag().empty()) {
        throw std::invalid_argument(std::string(fn) + ": entity has no entity tag");
    }
}

void
EntityWriteRequest::EncodePayload(
    OperationContext & context
    )
{
    Trace trace(Trace::Codec, "EntityWriteRequest::EncodePayload", context.ClientRequestId());

    try {
        auto bytes = m_codec->WriteEntity(*m_operation.Entity(), m_options.PayloadFormat(), m_isTableEntry, context);
        if (m_options.UseTransactionalMD5()) {
            m_contentMD5 = Crypto::MD5HashBytes(bytes).to_base64();
        }
        m_payload = std::make_shared<const std::vector<unsigned char>>(std::move(bytes));
    }
    catch (const std::exception & ex) {
        std::ostringstream msg;
        msg << "cannot serialize entity for " << OperationType() << " on table " << m_tableName << ": " << ex.what();
        Logger::LogRequest(Logger::Error, context.ClientRequestId(), msg);
        throw StorageException("Request " + context.ClientRequestId() + ": " + msg.str(), 0, std::string(), false);
    }
    TRACEINFO(trace, "Payload of " << m_payload->size() << " bytes");
}

TableHttpRequest
EntityWriteRequest::NewWriteRequest(
    const method & verb,
    const web::uri & baseUri,
    const std::string & etag,
    OperationContext & context
    ) const
{
    auto request = NewRequest(verb, baseUri, context);

    if (m_payload) {
        request.body = m_payload;
        request.headers.add(header::c_ContentType, table::c_JsonContentType);
        if (!m_contentMD5.empty()) {
            request.headers.add(header::c_ContentMD5, m_contentMD5);
        }
    }
    if (!etag.empty()) {
        request.headers.add(header::c_IfMatch, etag);
    }
    return request;
}

TableResult
EntityWriteRequest::Succeeded(
    const TransportResponse & response,
    bool refreshEtag
    ) const
{
    TableResult result(response.statusCode);
    result.SetEntity(m_operation.Entity());

    auto etag = response.Header(header::c_Etag);
    if (refreshEtag && !etag.empty()) {
        result.SetEtag(etag);
        result.UpdateResultObject(*m_operation.Entity());
    }
    return result;
}

//////////////// InsertRequest

InsertRequest::InsertRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    OperationContext & context
    ) :
    EntityWriteRequest(operation, tableName, options, std::move(codec), true)
{
    if (!m_isTableEntry) {
        RequireKeys("InsertRequest");
    }
    EncodePayload(context);
}

TableHttpRequest
InsertRequest::BuildRequest(
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    switch (OperationType()) {
        case TableOperationType::InsertOrMerge:
            return NewWriteRequest(methods::MERGE, baseUri, m_operation.Entity()->Etag(), context);
        case TableOperationType::InsertOrReplace:
            return NewWriteRequest(methods::PUT, baseUri, m_operation.Entity()->Etag(), context);
        default:
            {
                auto request = NewWriteRequest(methods::POST, baseUri, std::string(), context);
                request.headers.add(header::c_Prefer,
                    m_operation.EchoContent() ? table::c_PreferReturnContent : table::c_PreferReturnNoContent);
                return request;
            }
    }
}

TableResult
InsertRequest::PreProcessResponse(
    const TransportResponse & response,
    OperationContext &
    ) const
{
    int status = response.statusCode;

    if (OperationType() == TableOperationType::Insert) {
        int expected = m_operation.EchoContent() ? status_codes::Created : status_codes::NoContent;
        if (status == expected) {
            return Succeeded(response, true);
        }
        throw ServiceError(response, status != status_codes::Conflict);
    }

    if (status == status_codes::NoContent) {
        return Succeeded(response, true);
    }
    throw ServiceError(response, true);
}

TableResult
InsertRequest::PostProcessResponse(
    const TransportResponse & response,
    const TableResult & result,
    OperationContext & context
    ) const
{
    if (OperationType() != TableOperationType::Insert || !m_operation.EchoContent()
        || result.HttpStatusCode() != status_codes::Created) {
        return result;
    }

    Trace trace(Trace::Response, "InsertRequest::PostProcessResponse", context.ClientRequestId());

    ParsedEntity parsed;
    try {
        parsed = m_codec->ReadEntity(response.body, m_options.PayloadFormat(), context);
    }
    catch (const std::exception & ex) {
        std::ostringstream msg;
        msg << "Request " << context.ClientRequestId() << ": cannot read the entity echoed by insert into "
            << m_tableName << ": " << ex.what();
        throw StorageException(msg.str(), response.statusCode, response.Header(header::c_RequestId), false);
    }

    auto & entity = *m_operation.Entity();
    entity.ReadEntity(parsed.properties);
    entity.SetTimestamp(parsed.timestamp);

    TableResult echoed(result);
    if (echoed.Etag().empty() && !parsed.etag.empty()) {
        echoed.SetEtag(parsed.etag);
    }
    echoed.UpdateResultObject(entity);

    TRACEINFO(trace, "Entity refreshed from echoed row, etag " << entity.Etag());
    return echoed;
}

//////////////// DeleteRequest

DeleteRequest::DeleteRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    OperationContext &
    ) :
    EntityWriteRequest(operation, tableName, options, std::move(codec), true)
{
    RequireEtag("DeleteRequest");
    if (!m_isTableEntry) {
        RequireKeys("DeleteRequest");
    }
}

TableHttpRequest
DeleteRequest::BuildRequest(
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    return NewWriteRequest(methods::DEL, baseUri, m_operation.Entity()->Etag(), context);
}

TableResult
DeleteRequest::PreProcessResponse(
    const TransportResponse & response,
    OperationContext &
    ) const
{
    int status = response.statusCode;

    if (status == status_codes::NotFound || status == status_codes::Conflict) {
        throw ServiceError(response, false);
    }
    if (status != status_codes::NoContent) {
        throw ServiceError(response, true);
    }
    return Succeeded(response, false);
}

//////////////// MergeRequest

// Merge and Replace answer alike.
static bool
IsConditionalUpdateFailure(
    int status
    )
{
    return status == status_codes::NotFound || status == status_codes::Conflict;
}

MergeRequest::MergeRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    OperationContext & context
    ) :
    EntityWriteRequest(operation, tableName, options, std::move(codec), false)
{
    RequireEtag("MergeRequest");
    RequireKeys("MergeRequest");
    EncodePayload(context);
}

TableHttpRequest
MergeRequest::BuildRequest(
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    return NewWriteRequest(methods::MERGE, baseUri, m_operation.Entity()->Etag(), context);
}

TableResult
MergeRequest::PreProcessResponse(
    const TransportResponse & response,
    OperationContext &
    ) const
{
    if (IsConditionalUpdateFailure(response.statusCode)) {
        throw ServiceError(response, false);
    }
    if (response.statusCode != status_codes::NoContent) {
        throw ServiceError(response, true);
    }
    return Succeeded(response, true);
}

//////////////// ReplaceRequest

ReplaceRequest::ReplaceRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    OperationContext & context
    ) :
    EntityWriteRequest(operation, tableName, options, std::move(codec), false)
{
    RequireEtag("ReplaceRequest");
    RequireKeys("ReplaceRequest");
    EncodePayload(context);
}

TableHttpRequest
ReplaceRequest::BuildRequest(
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    return NewWriteRequest(methods::PUT, baseUri, m_operation.Entity()->Etag(), context);
}

TableResult
ReplaceRequest::PreProcessResponse(
    const TransportResponse & response,
    OperationContext &
    ) const
{
    if (IsConditionalUpdateFailure(response.statusCode)) {
        throw ServiceError(response, false);
    }
    if (response.statusCode != status_codes::NoContent) {
        throw ServiceError(response, true);
    }
    return Succeeded(response, true);
}

//////////////// RetrieveRequest

RetrieveRequest::RetrieveRequest(
    const TableOperation & operation,
    const std::string & tableName,
    const TableRequestOptions & options,
    std::shared_ptr<const ITablePayloadCodec> codec,
    OperationContext &
    ) :
    TableRequestBase(operation, tableName, options, std::move(codec))
{
    if (operation.OperationType() != TableOperationType::Retrieve) {
        throw std::invalid_argument("RetrieveRequest: operation is not a retrieve");
    }

    // The keys are percent-encoded here, so the path is appended as is.
    std::string entryName;
    if (m_isTableEntry) {
        entryName = XTableUtil::SafeEncode(m_operation.RetrievePartitionKey());
    }
    m_identity = m_operation.GenerateRequestIdentity(m_isTableEntry, entryName, true);
    m_identityEncoded = true;
}

TableHttpRequest
RetrieveRequest::BuildRequest(
    const web::uri & baseUri,
    OperationContext & context
    ) const
{
    return NewRequest(methods::GET, baseUri, context);
}

TableResult
RetrieveRequest::PreProcessResponse(
    const TransportResponse & response,
    OperationContext &
    ) const
{
    int status = response.statusCode;

    if (status != status_codes::OK && status != status_codes::NotFound) {
        throw ServiceError(response, true);
    }
    return TableResult(status);
}

TableResult
RetrieveRequest::PostProcessResponse(
    const TransportResponse & response,
    const TableResult & result,
    OperationContext & context
    ) const
{
    if (result.HttpStatusCode() == status_codes::NotFound) {
        return result;
    }

    Trace trace(Trace::Response, "RetrieveRequest::PostProcessResponse", context.ClientRequestId());

    ParsedEntity parsed;
    try {
        parsed = m_codec->ReadEntity(response.body, m_options.PayloadFormat(), context);
    }
    catch (const std::exception & ex) {
        std::ostringstream msg;
        msg << "Request " << context.ClientRequestId() << ": cannot read the row retrieved from "
            << m_tableName << ": " << ex.what();
        throw StorageException(msg.str(), response.statusCode, response.Header(header::c_RequestId), false);
    }

    std::string etag = parsed.etag.empty() ? response.Header(header::c_Etag) : parsed.etag;

    TableResult retrieved(result);
    ResolveEntity resolve(parsed, etag);
    retrieved.SetEntity(boost::apply_visitor(resolve, m_operation.GetRetrieveTarget()));
    retrieved.SetEtag(etag);

    TRACEINFO(trace, "Retrieved (" << parsed.partitionKey << "," << parsed.rowKey << ") etag " << etag);
    return retrieved;
}
