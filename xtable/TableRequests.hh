// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEREQUESTS_HH_
#define _TABLEREQUESTS_HH_

#include <memory>
#include <string>

#include "TableOperation.hh"
#include "TableHttpRequest.hh"
#include "TablePayloadCodec.hh"
#include "TableRequestOptions.hh"
#include "TableResult.hh"
#include "StorageException.hh"

namespace xtable
{

class OperationContext;

// The request classes below are what the execution engine drives, one per kind of
// operation. Each is built once per Execute: construction does every local check
// and encodes the body, so nothing it does can fail locally on a later attempt.
// Per attempt the engine calls
//     BuildRequest(baseUri, context)       - a fresh wire request
//     PreProcessResponse(response, context) - status and headers only; success or throw
//     PostProcessResponse(response, result, context) - reads the body where the kind needs it
// Failures are thrown as TableServiceException; IsRetryable() is false for the answers
// that reflect the state of the row (conflict, not found) and true otherwise.

class TableRequestBase
{
public:
    const TableRequestOptions & Options() const { return m_options; }
    const std::string & TableName() const { return m_tableName; }
    bool IsTableEntry() const { return m_isTableEntry; }
    TableOperationType OperationType() const { return m_operation.OperationType(); }

    /// Resource path identity; already percent-encoded if IdentityEncoded().
    const std::string & Identity() const { return m_identity; }
    bool IdentityEncoded() const { return m_identityEncoded; }

protected:
    /// A request against the table named "Tables" addresses a table entry
    /// unless tableEntryForm is false.
    TableRequestBase(const TableOperation & operation,
                     const std::string & tableName,
                     const TableRequestOptions & options,
                     std::shared_ptr<const ITablePayloadCodec> codec,
                     bool tableEntryForm = true);

    /// URI, common headers and client request id; no body.
    TableHttpRequest NewRequest(const web::http::method & method, const web::uri & baseUri, OperationContext & context) const;

    /// The failure to throw for response, with the service's error payload.
    TableServiceException ServiceError(const TransportResponse & response, bool retryable) const;

    TableOperation m_operation;
    std::string m_tableName;
    TableRequestOptions m_options;
    std::shared_ptr<const ITablePayloadCodec> m_codec;
    bool m_isTableEntry;
    std::string m_identity;
    bool m_identityEncoded;
};

// Insert, Delete, Merge and Replace: a caller's entity is sent (or named) and
// refreshed from the response.
class EntityWriteRequest : public TableRequestBase
{
public:
    /// Writes go to the primary location only.
    bool PrimaryOnly() const { return true; }

    /// The encoded body, shared by every attempt (null for Delete).
    const PayloadBuffer & Payload() const { return m_payload; }

protected:
    /// Merge and Replace pass tableEntryForm false: they always address a keyed row.
    /// Throws std::invalid_argument for a table entry without a TableName.
    EntityWriteRequest(const TableOperation & operation,
                       const std::string & tableName,
                       const TableRequestOptions & options,
                       std::shared_ptr<const ITablePayloadCodec> codec,
                       bool tableEntryForm);

    /// Throws std::invalid_argument unless the entity has both keys.
    void RequireKeys(const char * fn) const;
    void RequireEtag(const char * fn) const;

    /// Encode the entity into m_payload. Translates an encoding failure into a
    /// StorageException that is not retried.
    void EncodePayload(OperationContext & context);

    /// NewRequest plus the body and its content headers, and If-Match when etag isn't empty.
    TableHttpRequest NewWriteRequest(const web::http::method & method, const web::uri & baseUri,
                                     const std::string & etag, OperationContext & context) const;

    /// Result referencing the caller's entity, with the entity tag from the response
    /// headers pushed into the entity unless refreshEtag is false.
    TableResult Succeeded(const TransportResponse & response, bool refreshEtag) const;

    PayloadBuffer m_payload;
    std::string m_contentMD5;
};

/// Insert, InsertOrMerge (MERGE) and InsertOrReplace (PUT).
class InsertRequest : public EntityWriteRequest
{
public:
    InsertRequest(const TableOperation & operation,
                  const std::string & tableName,
                  const TableRequestOptions & options,
                  std::shared_ptr<const ITablePayloadCodec> codec,
                  OperationContext & context);

    TableHttpRequest BuildRequest(const web::uri & baseUri, OperationContext & context) const;
    TableResult PreProcessResponse(const TransportResponse & response, OperationContext & context) const;
    TableResult PostProcessResponse(const TransportResponse & response, const TableResult & result, OperationContext & context) const;
};

class DeleteRequest : public EntityWriteRequest
{
public:
    DeleteRequest(const TableOperation & operation,
                  const std::string & tableName,
                  const TableRequestOptions & options,
                  std::shared_ptr<const ITablePayloadCodec> codec,
                  OperationContext & context);

    TableHttpRequest BuildRequest(const web::uri & baseUri, OperationContext & context) const;
    TableResult PreProcessResponse(const TransportResponse & response, OperationContext & context) const;
    TableResult PostProcessResponse(const TransportResponse &, const TableResult & result, OperationContext &) const { return result; }
};

class MergeRequest : public EntityWriteRequest
{
public:
    MergeRequest(const TableOperation & operation,
                 const std::string & tableName,
                 const TableRequestOptions & options,
                 std::shared_ptr<const ITablePayloadCodec> codec,
                 OperationContext & context);

    TableHttpRequest BuildRequest(const web::uri & baseUri, OperationContext & context) const;
    TableResult PreProcessResponse(const TransportResponse & response, OperationContext & context) const;
    TableResult PostProcessResponse(const TransportResponse &, const TableResult & result, OperationContext &) const { return result; }
};

class ReplaceRequest : public EntityWriteRequest
{
public:
    ReplaceRequest(const TableOperation & operation,
                   const std::string & tableName,
                   const TableRequestOptions & options,
                   std::shared_ptr<const ITablePayloadCodec> codec,
                   OperationContext & context);

    TableHttpRequest BuildRequest(const web::uri & baseUri, OperationContext & context) const;
    TableResult PreProcessResponse(const TransportResponse & response, OperationContext & context) const;
    TableResult PostProcessResponse(const TransportResponse &, const TableResult & result, OperationContext &) const { return result; }
};

/// Point lookup of one row. 404 is an answer, not a failure: the result has status
/// 404 and no entity.
class RetrieveRequest : public TableRequestBase
{
public:
    RetrieveRequest(const TableOperation & operation,
                    const std::string & tableName,
                    const TableRequestOptions & options,
                    std::shared_ptr<const ITablePayloadCodec> codec,
                    OperationContext & context);

    bool PrimaryOnly() const { return false; }

    TableHttpRequest BuildRequest(const web::uri & baseUri, OperationContext & context) const;
    TableResult PreProcessResponse(const TransportResponse & response, OperationContext & context) const;
    TableResult PostProcessResponse(const TransportResponse & response, const TableResult & result, OperationContext & context) const;
};

}

#endif // _TABLEREQUESTS_HH_
