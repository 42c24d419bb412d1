// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEPAYLOADCODEC_HH_
#define _TABLEPAYLOADCODEC_HH_

#include <string>
#include <vector>
#include <cpprest/asyncrt_utils.h>
#include <cpprest/json.h>

#include "EntityProperty.hh"
#include "TableConst.hh"

namespace xtable
{

class OperationContext;
class TableEntity;

/// An entity as read back from the service, before it is handed to a factory or resolver.
struct ParsedEntity
{
    std::string partitionKey;
    std::string rowKey;
    utility::datetime timestamp;
    std::string etag;
    PropertyMap properties;
};

/// Error payload of a failed request. Both fields are empty if the body held none.
struct ServiceError
{
    std::string code;
    std::string message;
};

/// <summary>
/// Converts entities to and from the bytes of a request or response body.
/// WriteEntity and ReadEntity throw XTableException for content they cannot
/// represent; ReadError never throws.
/// </summary>
class ITablePayloadCodec
{
public:
    virtual ~ITablePayloadCodec() {}

    /// Serialize entity for a write. Table entries (rows of the table-of-tables)
    /// carry no PartitionKey/RowKey.
    virtual std::vector<unsigned char> WriteEntity(const TableEntity & entity, TablePayloadFormat format,
                                                   bool isTableEntry, OperationContext & context) const = 0;

    virtual ParsedEntity ReadEntity(const std::string & body, TablePayloadFormat format,
                                    OperationContext & context) const = 0;

    virtual ServiceError ReadError(const std::string & body) const = 0;
};

/// <summary>
/// The OData JSON payload (nometadata, minimalmetadata or fullmetadata). Values
/// whose type JSON can't express are annotated with "<name>@odata.type" on write;
/// annotations are honored on read, and types are inferred without them.
/// </summary>
class JsonPayloadCodec : public ITablePayloadCodec
{
public:
    std::vector<unsigned char> WriteEntity(const TableEntity & entity, TablePayloadFormat format,
                                           bool isTableEntry, OperationContext & context) const override;

    ParsedEntity ReadEntity(const std::string & body, TablePayloadFormat format,
                            OperationContext & context) const override;

    ServiceError ReadError(const std::string & body) const override;

private:
    static web::json::value ToJson(const std::string & name, const EntityProperty & prop);
    static EntityProperty FromJson(const std::string & name, const web::json::value & value, const std::string & annotation);
};

}

#endif // _TABLEPAYLOADCODEC_HH_
