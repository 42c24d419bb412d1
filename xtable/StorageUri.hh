// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _STORAGEURI_HH_
#define _STORAGEURI_HH_

#include <iostream>
#include <cpprest/base_uri.h>

namespace xtable
{

enum class StorageLocation { Primary, Secondary };

enum class LocationMode { PrimaryOnly, PrimaryThenSecondary, SecondaryOnly, SecondaryThenPrimary };

std::ostream& operator<<(std::ostream& os, StorageLocation location);

/// Table service endpoint(s) of an account: the primary location and, for a
/// geo-replicated account, an optional secondary.
class StorageUri
{
public:
    StorageUri() {}
    explicit StorageUri(web::uri primary) : m_primary(std::move(primary)) {}
    StorageUri(web::uri primary, web::uri secondary)
        : m_primary(std::move(primary)), m_secondary(std::move(secondary)) {}

    const web::uri & PrimaryUri() const { return m_primary; }
    const web::uri & SecondaryUri() const { return m_secondary; }
    bool HasSecondary() const { return !m_secondary.is_empty(); }

    /// Throws std::invalid_argument if location names an endpoint that isn't configured.
    const web::uri & GetUri(StorageLocation location) const;

private:
    web::uri m_primary;
    web::uri m_secondary;
};

/// First location to try under mode.
StorageLocation InitialLocation(LocationMode mode);

}

#endif // _STORAGEURI_HH_
