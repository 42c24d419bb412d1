// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <stdexcept>
#include "StorageUri.hh"

namespace xtable
{

std::ostream&
operator<<(std::ostream& os, StorageLocation location)
{
    os << (location == StorageLocation::Primary ? "Primary" : "Secondary");
    return os;
}

const web::uri &
StorageUri::GetUri(
    StorageLocation location
    ) const
{
    const web::uri & uri = (location == StorageLocation::Primary) ? m_primary : m_secondary;
    if (uri.is_empty()) {
        throw std::invalid_argument(location == StorageLocation::Primary
            ? "StorageUri: primary endpoint is not configured"
            : "StorageUri: secondary endpoint is not configured");
    }
    return uri;
}

StorageLocation
InitialLocation(
    LocationMode mode
    )
{
    switch (mode) {
        case LocationMode::SecondaryOnly:
        case LocationMode::SecondaryThenPrimary:
            return StorageLocation::Secondary;
        default:
            return StorageLocation::Primary;
    }
}

}
