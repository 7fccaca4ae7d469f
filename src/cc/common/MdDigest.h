//---------------------------------------------------------- -*- Mode: C++ -*-
// $Id$
//
// Created 2026/10/18
//
// This file is part of Replicated Block Store (RBS).
//
// Licensed under the Apache License, Version 2.0
// (the "License"); you may not use this file except in compliance with
// the License. You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or
// implied. See the License for the specific language governing
// permissions and limitations under the License.
//
// \brief OpenSSL EVP message digest with hex output, and random hex ids.
//
//----------------------------------------------------------------------------

#ifndef COMMON_MD_DIGEST_H
#define COMMON_MD_DIGEST_H

#include <string>
#include <stddef.h>

#include <openssl/evp.h>

namespace RBS
{
using std::string;

class MdDigest
{
public:
    typedef unsigned char MD[EVP_MAX_MD_SIZE];

    MdDigest(
        const char* inDigestNamePtr = "MD5");
    ~MdDigest();
    bool Update(
        const void* inDataPtr,
        size_t      inLength);
    // Returns digest length, 0 on failure. Resets the state.
    size_t GetMdBin(
        MD& inMd);
    string GetMd();
    bool Reset();
    bool IsGood() const
        { return mGoodFlag; }
    static string Md5Hex(
        const string& inStr);
    static string ToHex(
        const unsigned char* inPtr,
        size_t               inLength);
    // Cryptographically random id rendered as hex, empty on failure.
    static string RandomHexId(
        size_t inByteCount = 16);

private:
    const EVP_MD* mMdPtr;
    EVP_MD_CTX*   mCtxPtr;
    bool          mGoodFlag;

    MdDigest(const MdDigest&);
    MdDigest& operator=(const MdDigest&);
};

}

#endif // COMMON_MD_DIGEST_H
