// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <map>
#include <stdexcept>

#include "CloudTableClient.hh"
#include "TableOperation.hh"
#include "OperationContext.hh"
#include "RequestSigner.hh"
#include "HttpTransport.hh"
#include "TablePayloadCodec.hh"
#include "Utility.hh"
#include "Trace.hh"

using namespace xtable;

namespace
{

const std::string c_DevStoreAccountName = "devstoreaccount1";
const std::string c_DevStoreAccountKey =
    "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/K1SZFPTOtr/KBHBeksoGMGw==";
const std::string c_DevStoreTableEndpoint = "http://127.0.0.1:10002";

std::string
Lookup(
    const std::map<std::string, std::string> & settings,
    const std::string & key
    )
{
    auto iter = settings.find(key);
    return (iter == settings.end()) ? std::string() : iter->second;
}

}

CloudTableClient::CloudTableClient(
    StorageUri storageUri,
    std::shared_ptr<IRequestSigner> signer,
    std::shared_ptr<ITransport> transport
    ) :
    m_storageUri(std::move(storageUri)),
    m_signer(std::move(signer)),
    m_transport(std::move(transport)),
    m_codec(std::make_shared<JsonPayloadCodec>()),
    m_defaultOptions(TableRequestOptions::FromConstants())
{
    if (m_storageUri.PrimaryUri().is_empty()) {
        throw std::invalid_argument("CloudTableClient: primary endpoint cannot be empty");
    }
    if (!m_signer) {
        m_signer = std::make_shared<AnonymousSigner>();
    }
    if (!m_transport) {
        m_transport = std::make_shared<HttpTransport>();
    }
}

CloudTableClient
CloudTableClient::Parse(
    const std::string & connectionString,
    std::shared_ptr<ITransport> transport
    )
{
    Trace trace(Trace::Config, "CloudTableClient::Parse");

    std::map<std::string, std::string> settings;
    XTableUtil::ParseKeyValueList(connectionString, ";", settings);

    std::string accountName = Lookup(settings, "AccountName");
    std::string accountKey = Lookup(settings, "AccountKey");
    std::string sas = Lookup(settings, "SharedAccessSignature");
    std::string primary = Lookup(settings, "TableEndpoint");
    std::string secondary = Lookup(settings, "TableSecondaryEndpoint");

    if (Lookup(settings, "UseDevelopmentStorage") == "true") {
        accountName = c_DevStoreAccountName;
        accountKey = c_DevStoreAccountKey;
        primary = c_DevStoreTableEndpoint + "/" + c_DevStoreAccountName;
        secondary = c_DevStoreTableEndpoint + "/" + c_DevStoreAccountName + "-secondary";
    }

    if (primary.empty()) {
        if (accountName.empty()) {
            throw std::invalid_argument("CloudTableClient::Parse: connection string names neither TableEndpoint nor AccountName");
        }
        std::string protocol = Lookup(settings, "DefaultEndpointsProtocol");
        if (protocol.empty()) {
            protocol = "https";
        }
        std::string suffix = Lookup(settings, "EndpointSuffix");
        if (suffix.empty()) {
            suffix = "core.windows.net";
        }
        primary = protocol + "://" + accountName + ".table." + suffix;
        if (secondary.empty()) {
            secondary = protocol + "://" + accountName + "-secondary.table." + suffix;
        }
    }

    if (!web::uri::validate(primary) || (!secondary.empty() && !web::uri::validate(secondary))) {
        throw std::invalid_argument("CloudTableClient::Parse: malformed table endpoint");
    }
    StorageUri storageUri = secondary.empty() ? StorageUri(web::uri(primary))
                                              : StorageUri(web::uri(primary), web::uri(secondary));

    std::shared_ptr<IRequestSigner> signer;
    if (!sas.empty()) {
        signer = std::make_shared<SasSigner>(sas);
        trace.NOTE("Using shared access signature");
    }
    else if (!accountKey.empty()) {
        if (accountName.empty()) {
            throw std::invalid_argument("CloudTableClient::Parse: AccountKey requires AccountName");
        }
        signer = std::make_shared<SharedKeyLiteSigner>(accountName, accountKey);
        trace.NOTE("Using shared key for account " + accountName);
    }
    else {
        signer = std::make_shared<AnonymousSigner>();
        trace.NOTE("Using anonymous access");
    }

    TRACEINFO(trace, "Primary " << primary << ", secondary " << (secondary.empty() ? "(none)" : secondary));
    return CloudTableClient(storageUri, signer, std::move(transport));
}

void
CloudTableClient::SetPayloadCodec(
    std::shared_ptr<const ITablePayloadCodec> codec
    )
{
    if (!codec) {
        throw std::invalid_argument("CloudTableClient::SetPayloadCodec: codec cannot be null");
    }
    m_codec = std::move(codec);
}

TableResult
CloudTableClient::Execute(
    const std::string & tableName,
    const TableOperation & operation
    ) const
{
    OperationContext context;
    return operation.Execute(*this, tableName, TableRequestOptions(), context);
}

TableResult
CloudTableClient::Execute(
    const std::string & tableName,
    const TableOperation & operation,
    const TableRequestOptions & options,
    OperationContext & context
    ) const
{
    return operation.Execute(*this, tableName, options, context);
}
