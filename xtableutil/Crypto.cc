// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "Crypto.hh"
#include <cstring>
#include <string>
#include <stdexcept>
#include <cpprest/asyncrt_utils.h>
extern "C" {
#include <openssl/evp.h>
#include <openssl/hmac.h>
}

namespace Crypto {

constexpr size_t MD5Hash::DIGEST_LENGTH;

MD5Hash::MD5Hash()
{
    memset((void*)hash, 0, DIGEST_LENGTH);
}

bool
MD5Hash::operator==(const MD5Hash& that) const
{
    return (0 == memcmp((void*)(this->hash), (void*)(that.hash), DIGEST_LENGTH));
}

bool
MD5Hash::operator!=(const MD5Hash& that) const
{
    return (0 != memcmp((void*)(this->hash), (void*)(that.hash), DIGEST_LENGTH));
}

std::string
MD5Hash::to_base64() const
{
    std::vector<unsigned char> digest(hash, hash + DIGEST_LENGTH);
    return utility::conversions::to_base64(digest);
}

MD5Hash
MD5HashBytes(const std::vector<unsigned char>& input)
{
    MD5Hash hash;
    unsigned int length = 0;

    if (1 != EVP_Digest(input.data(), input.size(), hash.GetBuffer(), &length, EVP_md5(), nullptr)
        || length != MD5Hash::DIGEST_LENGTH) {
        throw std::runtime_error("EVP_Digest(md5) failed");
    }
    return hash;
}

std::vector<unsigned char>
HmacSha256(const std::vector<unsigned char>& key, const std::string& message)
{
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int length = 0;

    auto result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                       reinterpret_cast<const unsigned char *>(message.data()), message.size(),
                       digest.data(), &length);
    if (!result) {
        throw std::runtime_error("HMAC(sha256) failed");
    }
    digest.resize(length);
    return digest;
}

};

// vim: se sw=4 expandtab :
