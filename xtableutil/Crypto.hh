// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _XTABLE_CRYPTO_HH_
#define _XTABLE_CRYPTO_HH_

#include <string>
#include <vector>

namespace Crypto
{

class MD5Hash
{
public:
        MD5Hash();
        MD5Hash(const MD5Hash& orig) = default;
        MD5Hash& operator=(const MD5Hash& that) = default;

        bool operator==(const MD5Hash& that) const;
        bool operator!=(const MD5Hash& that) const;
        unsigned char * GetBuffer() { return hash; }
        const unsigned char * GetBuffer() const { return hash; }

        // Base64 of the raw digest, as carried by the Content-MD5 header
        std::string to_base64() const;

	static constexpr size_t DIGEST_LENGTH = 16;
private:

        unsigned char hash[DIGEST_LENGTH];
};

MD5Hash
MD5HashBytes(const std::vector<unsigned char>&);

/// <summary>HMAC-SHA256 of message keyed with key. Throws std::runtime_error if
/// OpenSSL fails to compute the digest.</summary>
std::vector<unsigned char>
HmacSha256(const std::vector<unsigned char>& key, const std::string& message);

};

#endif // _XTABLE_CRYPTO_HH_

// vim: se sw=8 :
