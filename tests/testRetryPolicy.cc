// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <gtest/gtest.h>
#include <stdexcept>

#include "RetryPolicy.hh"
#include "OperationContext.hh"
#include "TableRequestOptions.hh"
#include "XTableConst.hh"

using namespace xtable;
using std::chrono::milliseconds;

namespace
{

RetryContext
After(int retryCount, int status, StorageLocation location = StorageLocation::Primary,
      LocationMode mode = LocationMode::PrimaryOnly, bool hasSecondary = false)
{
    return RetryContext { retryCount, status, location, mode, hasSecondary };
}

}

TEST(RetryPolicy, ExponentialIntervals)
{
    ExponentialRetryPolicy policy(milliseconds(1000), 10);
    OperationContext context;

    EXPECT_EQ(milliseconds(1000), policy.Evaluate(After(0, 500), context).interval);
    EXPECT_EQ(milliseconds(3000), policy.Evaluate(After(1, 500), context).interval);
    EXPECT_EQ(milliseconds(7000), policy.Evaluate(After(2, 500), context).interval);
    EXPECT_EQ(ExponentialRetryPolicy::MaxBackoff(), policy.Evaluate(After(9, 500), context).interval);
}

TEST(RetryPolicy, LinearInterval)
{
    LinearRetryPolicy policy(milliseconds(250), 3);
    OperationContext context;

    EXPECT_EQ(milliseconds(250), policy.Evaluate(After(0, 503), context).interval);
    EXPECT_EQ(milliseconds(250), policy.Evaluate(After(2, 503), context).interval);
}

TEST(RetryPolicy, LimitIsRespected)
{
    LinearRetryPolicy policy(milliseconds(0), 2);
    OperationContext context;

    EXPECT_TRUE(policy.Evaluate(After(0, 500), context).shouldRetry);
    EXPECT_TRUE(policy.Evaluate(After(1, 500), context).shouldRetry);
    EXPECT_FALSE(policy.Evaluate(After(2, 500), context).shouldRetry);
}

TEST(RetryPolicy, StatusFilter)
{
    LinearRetryPolicy policy(milliseconds(0), 5);
    OperationContext context;

    EXPECT_TRUE(policy.Evaluate(After(0, 0), context).shouldRetry);
    EXPECT_TRUE(policy.Evaluate(After(0, 408), context).shouldRetry);
    EXPECT_TRUE(policy.Evaluate(After(0, 500), context).shouldRetry);
    EXPECT_TRUE(policy.Evaluate(After(0, 503), context).shouldRetry);
    EXPECT_TRUE(policy.Evaluate(After(0, 200), context).shouldRetry);
    EXPECT_FALSE(policy.Evaluate(After(0, 400), context).shouldRetry);
    EXPECT_FALSE(policy.Evaluate(After(0, 412), context).shouldRetry);
    EXPECT_FALSE(policy.Evaluate(After(0, 501), context).shouldRetry);
    EXPECT_FALSE(policy.Evaluate(After(0, 505), context).shouldRetry);
}

TEST(RetryPolicy, NoRetry)
{
    NoRetryPolicy policy;
    OperationContext context;
    EXPECT_FALSE(policy.Evaluate(After(0, 503), context).shouldRetry);
}

TEST(RetryPolicy, Locations)
{
    EXPECT_EQ(StorageLocation::Primary, NextLocation(StorageLocation::Primary, LocationMode::PrimaryOnly, true));
    EXPECT_EQ(StorageLocation::Secondary, NextLocation(StorageLocation::Secondary, LocationMode::SecondaryOnly, true));
    EXPECT_EQ(StorageLocation::Secondary, NextLocation(StorageLocation::Primary, LocationMode::PrimaryThenSecondary, true));
    EXPECT_EQ(StorageLocation::Primary, NextLocation(StorageLocation::Secondary, LocationMode::SecondaryThenPrimary, true));
    EXPECT_EQ(StorageLocation::Primary, NextLocation(StorageLocation::Primary, LocationMode::PrimaryThenSecondary, false));

    LinearRetryPolicy policy(milliseconds(0), 3);
    OperationContext context;
    auto info = policy.Evaluate(After(0, 503, StorageLocation::Primary, LocationMode::PrimaryThenSecondary, true), context);
    EXPECT_EQ(StorageLocation::Secondary, info.targetLocation);
}

TEST(RetryPolicy, RejectsNegativeArguments)
{
    EXPECT_THROW(LinearRetryPolicy(milliseconds(-1), 3), std::invalid_argument);
    EXPECT_THROW(ExponentialRetryPolicy(milliseconds(10), -1), std::invalid_argument);
}

TEST(TableRequestOptions, UnsetFieldsTakeDefaults)
{
    auto defaults = TableRequestOptions::FromConstants();
    TableRequestOptions options;
    options.SetServerTimeout(std::chrono::seconds(7));
    options.ApplyDefaults(defaults);

    EXPECT_EQ(std::chrono::seconds(7), options.ServerTimeout());
    EXPECT_EQ(std::chrono::seconds(XTableConstants::MaxExecutionTime()), options.MaximumExecutionTime());
    EXPECT_EQ(defaults.RetryPolicy(), options.RetryPolicy());
    EXPECT_EQ(TablePayloadFormat::JsonMinimalMetadata, options.PayloadFormat());
    EXPECT_FALSE(options.UseTransactionalMD5());
}

TEST(TableRequestOptions, EmptyOptionsDoNotRetry)
{
    TableRequestOptions options;
    OperationContext context;
    auto policy = options.RetryPolicy();
    ASSERT_TRUE(policy);
    EXPECT_FALSE(policy->Evaluate(After(0, 503), context).shouldRetry);
}
