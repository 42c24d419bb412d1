// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef __TABLECONST_HH__
#define __TABLECONST_HH__

#include <string>

namespace xtable {

    enum class TablePayloadFormat { JsonNoMetadata, JsonMinimalMetadata, JsonFullMetadata };

    namespace table {
        // Name of the table-of-tables and of the property holding a table's name in it
        const std::string c_TablesServiceTablesName = "Tables";
        const std::string c_TableName = "TableName";

        const std::string c_PartitionKey = "PartitionKey";
        const std::string c_RowKey = "RowKey";
        const std::string c_Timestamp = "Timestamp";

        const std::string c_ODataPrefix = "odata.";
        const std::string c_ODataEtag = "odata.etag";
        const std::string c_ODataError = "odata.error";
        const std::string c_ODataTypeSuffix = "@odata.type";

        const std::string c_ServiceVersion = "2013-08-15";
        const std::string c_DataServiceVersion = "3.0;NetFx";
        const std::string c_JsonContentType = "application/json";
        const std::string c_AcceptNoMetadata = "application/json;odata=nometadata";
        const std::string c_AcceptMinimalMetadata = "application/json;odata=minimalmetadata";
        const std::string c_AcceptFullMetadata = "application/json;odata=fullmetadata";
        const std::string c_PreferReturnContent = "return-content";
        const std::string c_PreferReturnNoContent = "return-no-content";
    }

    namespace header {
        const std::string c_Accept = "Accept";
        const std::string c_AcceptCharset = "Accept-Charset";
        const std::string c_Authorization = "Authorization";
        const std::string c_ContentMD5 = "Content-MD5";
        const std::string c_ContentType = "Content-Type";
        const std::string c_DataServiceVersion = "DataServiceVersion";
        const std::string c_Date = "x-ms-date";
        const std::string c_Etag = "ETag";
        const std::string c_IfMatch = "If-Match";
        const std::string c_MaxDataServiceVersion = "MaxDataServiceVersion";
        const std::string c_Prefer = "Prefer";
        const std::string c_ClientRequestId = "x-ms-client-request-id";
        const std::string c_RequestId = "x-ms-request-id";
        const std::string c_Version = "x-ms-version";
    }

    /// Value of the Accept header for format.
    const std::string & AcceptHeaderFor(TablePayloadFormat format);
}

#endif // __TABLECONST_HH__
