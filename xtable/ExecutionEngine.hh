// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _EXECUTIONENGINE_HH_
#define _EXECUTIONENGINE_HH_

#include <chrono>
#include <sstream>
#include <thread>
#include <cpprest/asyncrt_utils.h>

#include "CloudTableClient.hh"
#include "HttpTransport.hh"
#include "RequestSigner.hh"
#include "OperationContext.hh"
#include "RetryPolicy.hh"
#include "StorageException.hh"
#include "TableConst.hh"
#include "TableRequestOptions.hh"
#include "TableResult.hh"
#include "XTableMetrics.hh"
#include "Logger.hh"
#include "Trace.hh"

namespace xtable
{

/// <summary>
/// Runs a request object (InsertRequest, RetrieveRequest, ...) until it succeeds,
/// fails for good, or runs out of retries or time. Each attempt builds a fresh
/// request against the current location, signs it, sends it, and hands the response
/// to the request's pre- and post-processing. Attempts are recorded in the context.
///
/// A StorageException that is not retryable ends the operation at once. Other
/// StorageExceptions go to the retry policy. Any other exception is a local
/// failure and is never retried.
/// </summary>
class ExecutionEngine
{
public:
    template <typename TRequest>
    static TableResult ExecuteWithRetry(const CloudTableClient & client,
                                        const TRequest & request,
                                        const TableRequestOptions & options,
                                        OperationContext & context);

private:
    ExecutionEngine() = delete;
};

template <typename TRequest>
TableResult
ExecutionEngine::ExecuteWithRetry(
    const CloudTableClient & client,
    const TRequest & request,
    const TableRequestOptions & options,
    OperationContext & context
    )
{
    Trace trace(Trace::Operation, "ExecutionEngine::ExecuteWithRetry", context.ClientRequestId());

    XTableMetrics::Count("TableOp_execute");

    const auto & storageUri = client.GetStorageUri();
    auto mode = request.PrimaryOnly() ? LocationMode::PrimaryOnly : options.GetLocationMode();
    auto location = InitialLocation(mode);
    if (location == StorageLocation::Secondary && !storageUri.HasSecondary() && mode != LocationMode::SecondaryOnly) {
        location = StorageLocation::Primary;
    }

    auto policy = options.RetryPolicy();
    auto maxTime = options.MaximumExecutionTime();
    auto started = std::chrono::steady_clock::now();

    for (int retryCount = 0; ; retryCount++) {
        XTableMetrics::Count("TableOp_attempts");
        RequestResult attempt(utility::datetime::utc_now(), location);

        try {
            auto httpRequest = request.BuildRequest(storageUri.GetUri(location), context);
            client.Signer().Sign(httpRequest, context);

            TRACEINFO(trace, "Attempt " << retryCount + 1 << ": " << httpRequest.method << " " << httpRequest.uri.to_string());

            auto response = client.Transport().Send(httpRequest, options);
            attempt.SetResponse(response.statusCode, response.Header(header::c_RequestId), response.Header(header::c_Etag));

            auto result = request.PreProcessResponse(response, context);
            result = request.PostProcessResponse(response, result, context);

            attempt.SetEndTime(utility::datetime::utc_now());
            context.AddRequestResult(attempt);
            XTableMetrics::Count("TableOp_success");
            return result;
        }
        catch (const StorageException & ex) {
            if (attempt.HttpStatusCode() == 0) {
                attempt.SetResponse(ex.HttpStatusCode(), ex.ServiceRequestId(), std::string());
            }
            attempt.SetErrorMessage(ex.what());
            attempt.SetEndTime(utility::datetime::utc_now());
            context.AddRequestResult(attempt);

            std::ostringstream msg;
            msg << "attempt " << retryCount + 1 << " on " << request.TableName() << " against " << location
                << " failed: " << ex.what();
            Logger::LogRequest(Logger::Warn, context.ClientRequestId(), msg);

            if (!ex.IsRetryable()) {
                XTableMetrics::Count("TableOp_failed");
                throw;
            }

            RetryContext retryContext { retryCount, ex.HttpStatusCode(), location, mode, storageUri.HasSecondary() };
            auto info = policy->Evaluate(retryContext, context);
            if (!info.shouldRetry) {
                std::ostringstream err;
                err << "gave up after " << retryCount + 1 << " attempts";
                Logger::LogRequest(Logger::Error, context.ClientRequestId(), err);
                XTableMetrics::Count("TableOp_failed");
                throw;
            }
            if (maxTime.count() > 0
                && std::chrono::steady_clock::now() + info.interval - started >= maxTime) {
                std::ostringstream err;
                err << "gave up after " << retryCount + 1 << " attempts: maximum execution time of "
                    << maxTime.count() << "s reached";
                Logger::LogRequest(Logger::Error, context.ClientRequestId(), err);
                XTableMetrics::Count("TableOp_failed");
                throw;
            }

            XTableMetrics::Count("TableOp_retries");
            TRACEINFO(trace, "Retrying in " << info.interval.count() << " ms against " << info.targetLocation);
            if (info.interval.count() > 0) {
                std::this_thread::sleep_for(info.interval);
            }
            location = info.targetLocation;
        }
        catch (const std::exception & ex) {
            attempt.SetErrorMessage(ex.what());
            attempt.SetEndTime(utility::datetime::utc_now());
            context.AddRequestResult(attempt);
            TRACEERROR(trace, "Failed locally: " << ex.what());
            XTableMetrics::Count("TableOp_failed");
            throw;
        }
    }
}

}

#endif // _EXECUTIONENGINE_HH_
