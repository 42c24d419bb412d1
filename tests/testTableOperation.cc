// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <gtest/gtest.h>
#include <sstream>
#include <stdexcept>

#include "TableOperation.hh"
#include "OperationContext.hh"
#include "FakeTransport.hh"

using namespace xtable;
using namespace xtable::test;

static std::shared_ptr<TableEntity>
MakeEntity(const std::string & pk, const std::string & rk, const std::string & etag = std::string())
{
    auto entity = std::make_shared<TableEntity>(pk, rk);
    entity->SetEtag(etag);
    return entity;
}

TEST(TableOperationFactory, ConditionalKindsRequireEtag)
{
    auto entity = MakeEntity("a", "1");

    EXPECT_THROW(TableOperation::Merge(entity), std::invalid_argument);
    EXPECT_THROW(TableOperation::Replace(entity), std::invalid_argument);
    EXPECT_THROW(TableOperation::Delete(entity), std::invalid_argument);

    entity->SetEtag("W/\"1\"");
    EXPECT_NO_THROW(TableOperation::Merge(entity));
    EXPECT_NO_THROW(TableOperation::Replace(entity));
    EXPECT_NO_THROW(TableOperation::Delete(entity));
}

TEST(TableOperationFactory, UpsertsAndInsertDoNotRequireEtag)
{
    auto entity = MakeEntity("a", "1");

    EXPECT_NO_THROW(TableOperation::Insert(entity));
    EXPECT_NO_THROW(TableOperation::InsertOrMerge(entity));
    EXPECT_NO_THROW(TableOperation::InsertOrReplace(entity));
}

TEST(TableOperationFactory, NullEntityIsRejected)
{
    std::shared_ptr<TableEntity> none;

    EXPECT_THROW(TableOperation::Insert(none), std::invalid_argument);
    EXPECT_THROW(TableOperation::InsertOrMerge(none), std::invalid_argument);
    EXPECT_THROW(TableOperation::InsertOrReplace(none), std::invalid_argument);
    EXPECT_THROW(TableOperation::Merge(none), std::invalid_argument);
    EXPECT_THROW(TableOperation::Replace(none), std::invalid_argument);
    EXPECT_THROW(TableOperation::Delete(none), std::invalid_argument);
}

TEST(TableOperationFactory, RetrieveRequiresATarget)
{
    EXPECT_THROW(TableOperation::Retrieve("a", "1", EntityFactory()), std::invalid_argument);
    EXPECT_THROW(TableOperation::Retrieve("a", "1", EntityResolver()), std::invalid_argument);

    auto op = TableOperation::Retrieve<TableEntity>("a", "1");
    EXPECT_EQ(TableOperationType::Retrieve, op.OperationType());
    EXPECT_EQ("a", op.RetrievePartitionKey());
    EXPECT_EQ("1", op.RetrieveRowKey());
    EXPECT_FALSE(op.Entity());
    EXPECT_EQ(0, op.GetRetrieveTarget().which());
}

TEST(TableOperationFactory, RetrieveWithResolverHoldsResolver)
{
    EntityResolver resolver = [](const std::string &, const std::string &, const utility::datetime &,
                                 const PropertyMap &, const std::string &) {
        return std::make_shared<TableEntity>();
    };
    auto op = TableOperation::Retrieve("a", "1", resolver);
    EXPECT_EQ(1, op.GetRetrieveTarget().which());
}

TEST(TableOperationFactory, InsertCarriesEchoFlag)
{
    auto entity = MakeEntity("a", "1");
    EXPECT_TRUE(TableOperation::Insert(entity, true).EchoContent());
    EXPECT_FALSE(TableOperation::Insert(entity).EchoContent());
    EXPECT_EQ(entity, TableOperation::Insert(entity).Entity());
}

TEST(RequestIdentity, TableEntryIsQuotedName)
{
    auto op = TableOperation::InsertOrReplace(MakeEntity("a", "1"));
    EXPECT_EQ("'mytable'", op.GenerateRequestIdentity(true, "mytable", false));
    EXPECT_EQ("'mytable'", op.GenerateRequestIdentity(true, "mytable", true));
}

TEST(RequestIdentity, InsertHasEmptyIdentity)
{
    auto op = TableOperation::Insert(MakeEntity("a", "1"));
    EXPECT_EQ("", op.GenerateRequestIdentity(false, "", true));
    EXPECT_EQ("", op.GenerateRequestIdentity(false, "", false));
}

TEST(RequestIdentity, KeysFromEntity)
{
    auto op = TableOperation::Merge(MakeEntity("P1", "R1", "*"));
    EXPECT_EQ("PartitionKey='P1',RowKey='R1'", op.GenerateRequestIdentity(false, "", true));
    EXPECT_EQ("PartitionKey='P1',RowKey='R1'", op.GenerateRequestIdentity(false, "", false));
}

TEST(RequestIdentity, RetrieveKeysAreEncodedOnRequest)
{
    auto plain = TableOperation::Retrieve<TableEntity>("P1", "R1");
    EXPECT_EQ("PartitionKey='P1',RowKey='R1'", plain.GenerateRequestIdentity(false, "", true));

    auto odd = TableOperation::Retrieve<TableEntity>("P 1", "R/1'");
    EXPECT_EQ("PartitionKey='P%201',RowKey='R%2F1%27'", odd.GenerateRequestIdentity(false, "", true));
    EXPECT_EQ("PartitionKey='P 1',RowKey='R/1''", odd.GenerateRequestIdentity(false, "", false));
}

TEST(RequestIdentity, UnreservedCharactersAreKept)
{
    auto op = TableOperation::Retrieve<TableEntity>("Az09-._~", "x");
    EXPECT_EQ("PartitionKey='Az09-._~',RowKey='x'", op.GenerateRequestIdentity(false, "", true));
}

TEST(RequestIdentity, WithTableNeverEncodes)
{
    auto op = TableOperation::Delete(MakeEntity("a b", "1", "*"));
    EXPECT_EQ("T(PartitionKey='a b',RowKey='1')", op.GenerateRequestIdentityWithTable("T"));
}

TEST(TableOperationExecute, EmptyTableNameIsRejected)
{
    auto transport = std::make_shared<FakeTransport>();
    auto client = MakeClient(transport);
    OperationContext context;

    auto op = TableOperation::Insert(MakeEntity("a", "1"));
    EXPECT_THROW(op.Execute(client, "", TableRequestOptions(), context), std::invalid_argument);
    EXPECT_TRUE(transport->requests.empty());
}

TEST(TableOperationExecute, InitializesContext)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->Respond(204).Respond(204);
    auto client = MakeClient(transport);
    OperationContext context;

    auto op = TableOperation::InsertOrMerge(MakeEntity("a", "1"));
    op.Execute(client, "T", NoRetries(), context);
    auto first = context.ClientRequestId();
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(1u, context.RequestResults().size());

    op.Execute(client, "T", NoRetries(), context);
    EXPECT_NE(first, context.ClientRequestId());
    EXPECT_EQ(1u, context.RequestResults().size());
}

TEST(TableOperationExecute, KeepsCallerRequestId)
{
    auto transport = std::make_shared<FakeTransport>();
    transport->Respond(204);
    auto client = MakeClient(transport);
    OperationContext context;
    context.SetClientRequestId("my-id");

    client.Execute("T", TableOperation::InsertOrMerge(MakeEntity("a", "1")), NoRetries(), context);
    EXPECT_EQ("my-id", context.ClientRequestId());
    ASSERT_EQ(1u, transport->requests.size());
    EXPECT_EQ("my-id", HeaderOf(transport->requests[0], "x-ms-client-request-id"));
}

TEST(TableOperationTypeName, Prints)
{
    std::ostringstream strm;
    strm << TableOperationType::InsertOrReplace << " " << TableOperationType::Retrieve;
    EXPECT_EQ("InsertOrReplace Retrieve", strm.str());
}
