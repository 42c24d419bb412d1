// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "Logger.hh"
#include "Trace.hh"
#include "Utility.hh"
#include "CloudTableClient.hh"
#include "OperationContext.hh"
#include "StorageException.hh"
#include "TableOperation.hh"
#include "XTableConst.hh"
#include "XTableMetrics.hh"

#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

extern "C" {
#include <unistd.h>
}

using std::string;
using std::cout;
using std::cerr;
using std::endl;
using namespace xtable;

void usage();

static const std::map<string, TableOperationType> operationNames = {
    { "insert", TableOperationType::Insert },
    { "insertormerge", TableOperationType::InsertOrMerge },
    { "insertorreplace", TableOperationType::InsertOrReplace },
    { "merge", TableOperationType::Merge },
    { "replace", TableOperationType::Replace },
    { "delete", TableOperationType::Delete },
    { "retrieve", TableOperationType::Retrieve }
};

static TableOperation
MakeOperation(
    TableOperationType type,
    const std::shared_ptr<TableEntity> & entity,
    bool echo
    )
{
    switch (type) {
        case TableOperationType::Insert:
            return TableOperation::Insert(entity, echo);
        case TableOperationType::InsertOrMerge:
            return TableOperation::InsertOrMerge(entity);
        case TableOperationType::InsertOrReplace:
            return TableOperation::InsertOrReplace(entity);
        case TableOperationType::Merge:
            return TableOperation::Merge(entity);
        case TableOperationType::Replace:
            return TableOperation::Replace(entity);
        case TableOperationType::Delete:
            return TableOperation::Delete(entity);
        default:
            return TableOperation::Retrieve<TableEntity>(entity->PartitionKey(), entity->RowKey());
    }
}

int
main(int argc, char **argv)
{
    Logger::Init();
    XTableConstants::LoadFromEnvironment();

    string connectionString = XTableUtil::GetEnvironmentVariableOrEmpty("XTABLE_CONNECTION_STRING");
    string tableName;
    string operationName = "retrieve";
    auto entity = std::make_shared<TableEntity>();
    bool echo = false;
    bool useMD5 = false;
    bool showMetrics = false;

    {
        int opt;
        while ((opt = getopt(argc, argv, "c:Ee:Mmo:P:p:r:T:t:")) != -1) {
            switch (opt) {
            case 'c':
                connectionString = optarg;
                break;
            case 'E':
                echo = true;
                break;
            case 'e':
                entity->SetEtag(optarg);
                break;
            case 'M':
                showMetrics = true;
                break;
            case 'm':
                useMD5 = true;
                break;
            case 'o':
                operationName = optarg;
                if (operationNames.find(operationName) == operationNames.end()) {
                    cerr << "Unknown operation '" << operationName << "'." << endl;
                    usage();
                }
                break;
            case 'P':
                {
                    std::map<string, string> prop;
                    XTableUtil::ParseKeyValueList(optarg, "\n", prop);
                    if (prop.empty()) {
                        cerr << "'-P' requires name=value." << endl;
                        usage();
                    }
                    for (const auto & item : prop) {
                        entity->Properties()[item.first] = EntityProperty(item.second);
                    }
                }
                break;
            case 'p':
                entity->SetPartitionKey(optarg);
                break;
            case 'r':
                entity->SetRowKey(optarg);
                break;
            case 'T':
                try {
                    Trace::AddInterests(Trace::ParseInterests(optarg));
                } catch (std::exception & ex) {
                    cerr << ex.what() << endl;
                    usage();
                }
                break;
            case 't':
                tableName = optarg;
                break;
            default:
                usage();
            }
        }
    }

    if (connectionString.empty() || tableName.empty()) {
        cerr << "A connection string (-c or XTABLE_CONNECTION_STRING) and a table name (-t) are required." << endl;
        usage();
    }

    int status = 0;
    OperationContext context;
    try {
        auto client = CloudTableClient::Parse(connectionString);
        TableRequestOptions options;
        options.SetUseTransactionalMD5(useMD5);

        auto operation = MakeOperation(operationNames.at(operationName), entity, echo);
        auto result = client.Execute(tableName, operation, options, context);

        cout << "Status: " << result.HttpStatusCode() << endl;
        if (!result.Etag().empty()) {
            cout << "ETag: " << result.Etag() << endl;
        }
        if (result.Entity() && operation.OperationType() == TableOperationType::Retrieve) {
            const auto & row = *result.Entity();
            cout << "PartitionKey: " << row.PartitionKey() << endl
                 << "RowKey: " << row.RowKey() << endl
                 << "Timestamp: " << row.Timestamp().to_string(utility::datetime::ISO_8601) << endl;
            for (const auto & item : row.Properties()) {
                cout << item.first << ": " << item.second << endl;
            }
        }
    }
    catch (const TableServiceException & ex) {
        cerr << "Service error " << ex.HttpStatusCode() << " " << ex.ErrorCode() << ": " << ex.ServiceMessage() << endl;
        status = 2;
    }
    catch (const StorageException & ex) {
        cerr << "Storage error: " << ex.what() << endl;
        status = 2;
    }
    catch (const std::invalid_argument & ex) {
        cerr << "Invalid argument: " << ex.what() << endl;
        status = 1;
    }
    catch (const std::exception & ex) {
        cerr << "Error: " << ex.what() << endl;
        status = 1;
    }

    if (!context.ClientRequestId().empty()) {
        cerr << "Client request id " << context.ClientRequestId() << ", " << context.RequestResults().size()
             << " attempt(s)" << endl;
    }
    if (showMetrics) {
        for (const auto & item : XTableMetrics::AggregateAll()) {
            cerr << item.first << " = " << item.second << endl;
        }
    }

    Logger::CloseAllLogs();
    return status;
}

void
usage()
{
    cerr << "Usage:" << endl
    << "xtabletool [-EMm] [-c connection_string] -t table [-o operation] [-p pkey] [-r rkey] [-e etag] [-P name=value]... [-T flags]" << endl << endl
    << "-c  Storage connection string. Defaults to the XTABLE_CONNECTION_STRING environment variable." << endl
    << "-E  Ask an insert to echo the stored row back" << endl
    << "-e  Entity tag for merge, replace and delete (\"*\" matches any version)" << endl
    << "-M  Print operation counters on exit" << endl
    << "-m  Send a Content-MD5 header with the request body" << endl
    << "-o  One of insert, insertormerge, insertorreplace, merge, replace, delete, retrieve (default)" << endl
    << "-P  Add a string property to the entity; may be repeated" << endl
    << "-p  Partition key" << endl
    << "-r  Row key" << endl
    << "-T  Enable tracing for areas named in a comma separated list (operation, request, response," << endl
    << "    retry, codec, transport, config, signing, all) or given as a number" << endl
    << "-t  Table name" << endl;
    exit(1);
}
