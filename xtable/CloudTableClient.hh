// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _CLOUDTABLECLIENT_HH_
#define _CLOUDTABLECLIENT_HH_

#include <memory>
#include <string>

#include "StorageUri.hh"
#include "TableRequestOptions.hh"
#include "TableResult.hh"

namespace xtable
{

class IRequestSigner;
class ITransport;
class ITablePayloadCodec;
class OperationContext;
class TableOperation;

/// <summary>
/// Handle on the table service of one storage account: its endpoint(s), the
/// credentials used to sign requests, the transport and payload codec, and the
/// request options operations fall back to. Safe to share between threads as long
/// as the defaults aren't changed while operations run.
/// </summary>
class CloudTableClient
{
public:
    /// A null signer means anonymous access; a null transport means an HttpTransport.
    CloudTableClient(StorageUri storageUri,
                     std::shared_ptr<IRequestSigner> signer = nullptr,
                     std::shared_ptr<ITransport> transport = nullptr);

    /// <summary>
    /// Build a client from a storage connection string, e.g.
    ///     DefaultEndpointsProtocol=https;AccountName=acct;AccountKey=base64key
    /// Recognized keys: DefaultEndpointsProtocol, AccountName, AccountKey,
    /// SharedAccessSignature, TableEndpoint, TableSecondaryEndpoint, EndpointSuffix,
    /// UseDevelopmentStorage. A shared access signature wins over an account key;
    /// with neither, access is anonymous.
    /// Throws std::invalid_argument if no table endpoint can be derived.
    /// </summary>
    static CloudTableClient Parse(const std::string & connectionString,
                                  std::shared_ptr<ITransport> transport = nullptr);

    const StorageUri & GetStorageUri() const { return m_storageUri; }

    IRequestSigner & Signer() const { return *m_signer; }
    ITransport & Transport() const { return *m_transport; }

    const ITablePayloadCodec & PayloadCodec() const { return *m_codec; }
    std::shared_ptr<const ITablePayloadCodec> PayloadCodecPtr() const { return m_codec; }
    void SetPayloadCodec(std::shared_ptr<const ITablePayloadCodec> codec);

    const TableRequestOptions & DefaultRequestOptions() const { return m_defaultOptions; }
    TableRequestOptions & DefaultRequestOptions() { return m_defaultOptions; }

    TableResult Execute(const std::string & tableName, const TableOperation & operation) const;
    TableResult Execute(const std::string & tableName, const TableOperation & operation,
                        const TableRequestOptions & options, OperationContext & context) const;

private:
    StorageUri m_storageUri;
    std::shared_ptr<IRequestSigner> m_signer;
    std::shared_ptr<ITransport> m_transport;
    std::shared_ptr<const ITablePayloadCodec> m_codec;
    TableRequestOptions m_defaultOptions;
};

}

#endif // _CLOUDTABLECLIENT_HH_
