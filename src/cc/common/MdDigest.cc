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
//
//----------------------------------------------------------------------------

#include "MdDigest.h"

#include <openssl/rand.h>

namespace RBS
{

MdDigest::MdDigest(
    const char* inDigestNamePtr)
    : mMdPtr(EVP_get_digestbyname(inDigestNamePtr ? inDigestNamePtr : "MD5")),
      mCtxPtr(EVP_MD_CTX_new()),
      mGoodFlag(false)
{
    Reset();
}

MdDigest::~MdDigest()
{
    EVP_MD_CTX_free(mCtxPtr);
}

    bool
MdDigest::Reset()
{
    mGoodFlag = mMdPtr && mCtxPtr &&
        EVP_DigestInit_ex(mCtxPtr, mMdPtr, 0) != 0;
    return mGoodFlag;
}

    bool
MdDigest::Update(
    const void* inDataPtr,
    size_t      inLength)
{
    if (! mGoodFlag) {
        return false;
    }
    if (inLength <= 0) {
        return true;
    }
    mGoodFlag = EVP_DigestUpdate(mCtxPtr, inDataPtr, inLength) != 0;
    return mGoodFlag;
}

    size_t
MdDigest::GetMdBin(
    MdDigest::MD& inMd)
{
    unsigned int theLen = 0;
    if (! mGoodFlag || ! EVP_DigestFinal_ex(mCtxPtr, inMd, &theLen)) {
        theLen = 0;
    }
    Reset();
    return theLen;
}

    string
MdDigest::GetMd()
{
    MD           theMd;
    const size_t theLen = GetMdBin(theMd);
    return ToHex(theMd, theLen);
}

    /* static */ string
MdDigest::ToHex(
    const unsigned char* inPtr,
    size_t               inLength)
{
    string theRet;
    theRet.resize(2 * inLength);
    string::iterator theIt = theRet.begin();
    const char* const kHexDigits = "0123456789abcdef";
    for (size_t i = 0; i < inLength; i++) {
        const unsigned int theDigit = inPtr[i] & 0xFF;
        *theIt++ = kHexDigits[(theDigit >> 4) & 0xF];
        *theIt++ = kHexDigits[theDigit & 0xF];
    }
    return theRet;
}

    /* static */ string
MdDigest::Md5Hex(
    const string& inStr)
{
    MdDigest theDigest("MD5");
    theDigest.Update(inStr.data(), inStr.size());
    return theDigest.GetMd();
}

    /* static */ string
MdDigest::RandomHexId(
    size_t inByteCount)
{
    unsigned char theBuf[64];
    const size_t  theLen = inByteCount < sizeof(theBuf) ?
        inByteCount : sizeof(theBuf);
    if (RAND_bytes(theBuf, (int)theLen) != 1) {
        return string();
    }
    return ToHex(theBuf, theLen);
}

}
