// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "TableConst.hh"

const std::string &
xtable::AcceptHeaderFor(TablePayloadFormat format)
{
    switch (format) {
        case TablePayloadFormat::JsonNoMetadata:
            return table::c_AcceptNoMetadata;
        case TablePayloadFormat::JsonFullMetadata:
            return table::c_AcceptFullMetadata;
        default:
            return table::c_AcceptMinimalMetadata;
    }
}
