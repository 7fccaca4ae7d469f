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

#include "Properties.h"

#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cerrno>
#include <limits>
#include <string.h>

namespace RBS
{

using std::string;
using std::istream;
using std::ifstream;
using std::istringstream;
using std::cerr;
using std::endl;
using std::numeric_limits;

inline static int
AsciiCharToLower(int c)
{
    return ((c >= 'A' && c <= 'Z') ? 'a' + (c - 'A') : c);
}

template<typename T> inline bool
Properties::ParseInt(const Properties::String& str, T& out) const
{
    if (str.empty()) {
        return false;
    }
    const char* const ptr = str.c_str();
    char*             end = 0;
    errno = 0;
    if (numeric_limits<T>::is_signed) {
        const long long val = strtoll(ptr, &end, intbase);
        if (errno != 0 || *end != 0 ||
                val < (long long)numeric_limits<T>::min() ||
                val > (long long)numeric_limits<T>::max()) {
            return false;
        }
        out = (T)val;
    } else {
        if (*ptr == '-') {
            return false;
        }
        const unsigned long long val = strtoull(ptr, &end, intbase);
        if (errno != 0 || *end != 0 ||
                val > (unsigned long long)numeric_limits<T>::max()) {
            return false;
        }
        out = (T)val;
    }
    return true;
}

inline static void
removeLTSpaces(const string& str, string::size_type start,
    string::size_type end, string& outStr, bool asciiToLower = false)
{
    char const* const delims = " \t\r\n";

    if (start >= str.length()) {
        outStr.clear();
        return;
    }
    string::size_type const first = str.find_first_not_of(delims, start);
    if (end <= first || first == string::npos) {
        outStr.clear();
        return;
    }
    string::size_type const last = str.find_last_not_of(
        delims, end == string::npos ? string::npos : end - 1);
    outStr.assign(str, first,
        (last == string::npos ? str.size() : last + 1) - first);
    if (asciiToLower) {
        outStr = Properties::AsciiToLower(outStr);
    }
}

/* static */ string
Properties::AsciiToLower(const string& str)
{
    string s(str);
    for (string::iterator i = s.begin(); i != s.end(); ++i) {
        const int c = AsciiCharToLower(*i & 0xFF);
        if (c != *i) {
            *i = c;
        }
    }
    return s;
}

inline Properties::iterator
Properties::find(const Properties::String& key) const
{
    return propmap.find(key);
}

Properties::Properties(int base)
    : intbase(base),
      propmap()
{
}

Properties::Properties(const Properties &p)
    : intbase(p.intbase),
      propmap(p.propmap)
{
}

Properties::~Properties()
{
}

int
Properties::loadProperties(
    const char* fileName,
    char        delimiter,
    ostream*    verbose          /* = 0 */,
    bool        keysAsciiToLower /* = false */)
{
    ifstream input(fileName);
    if(! input.is_open()) {
        cerr <<  "Properties::loadProperties() failed to open the file:" <<
            fileName << endl;
        return(-1);
    }
    loadProperties(input, delimiter, verbose, keysAsciiToLower);
    input.close();
    return 0;
}

int
Properties::loadProperties(
    istream& ist,
    char     delimiter,
    ostream* verbose,
    bool     keysAsciiToLower /* = false */)
{
    string line;
    String key;
    String val;
    if (ist) {
        line.reserve(512);
    }
    while (ist) {
        getline(ist, line); //read one line at a time
        if (line.empty() || line[0] == '#') {
            continue; // ignore comments
        }
        // find the delimiter
        string::size_type const pos = line.find(delimiter);
        if (pos == string::npos) {
            continue; // ignore if no delimiter is found
        }
        removeLTSpaces(line, 0, pos, key, keysAsciiToLower);
        removeLTSpaces(line, pos + 1, string::npos, val);
        propmap[key] = val;
        if (verbose) {
            (*verbose) << "Loading key " << key  <<
                " with value " << val << endl;
        }
    }
    return 0;
}

int
Properties::loadProperties(
    const char* buf,
    size_t      len,
    char        delimiter,
    ostream*    verbose          /* = 0 */,
    bool        keysAsciiToLower /* = false */)
{
    istringstream is(string(buf ? buf : "", buf ? len : 0));
    return loadProperties(is, delimiter, verbose, keysAsciiToLower);
}

void
Properties::getList(string& outBuf,
    const string& linePrefix, const string& lineSuffix) const
{
    PropMap::const_iterator iter;
    for (iter = propmap.begin(); iter != propmap.end(); iter++) {
        if (iter->first.size() > 0) {
            outBuf += linePrefix;
            outBuf += iter->first;
            outBuf += '=';
            outBuf += iter->second;
            outBuf += lineSuffix;
        }
    }
}

bool
Properties::remove(const Properties::String& key)
{
    return (propmap.erase(key) > 0);
}

size_t
Properties::copyWithPrefix(const string& prefix, Properties& props) const
{
    size_t ret = 0;
    for (PropMap::const_iterator it = propmap.lower_bound(prefix);
            it != propmap.end() &&
                it->first.compare(0, prefix.size(), prefix) == 0;
            ++it) {
        props.propmap[it->first] = it->second;
        ret++;
    }
    return ret;
}

string
Properties::getValueSelf(const Properties::String& key, const string& def) const
{
    PropMap::const_iterator const i = find(key);
    return (i == propmap.end() ? def : i->second);
}

const char*
Properties::getValueSelf(const Properties::String& key, const char* def) const
{
    PropMap::const_iterator const i = find(key);
    return (i == propmap.end() ? def : i->second.c_str());
}

int
Properties::getValueSelf(const Properties::String& key, int def) const
{
    PropMap::const_iterator const i = find(key);
    int ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

unsigned int
Properties::getValueSelf(const Properties::String& key, unsigned int def) const
{
    PropMap::const_iterator const i = find(key);
    unsigned int ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

long
Properties::getValueSelf(const Properties::String& key, long def) const
{
    PropMap::const_iterator const i = find(key);
    long ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

unsigned long
Properties::getValueSelf(const Properties::String& key, unsigned long def) const
{
    PropMap::const_iterator const i = find(key);
    unsigned long ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

long long
Properties::getValueSelf(const Properties::String& key, long long def) const
{
    PropMap::const_iterator const i = find(key);
    long long ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

unsigned long long
Properties::getValueSelf(const Properties::String& key,
    unsigned long long def) const
{
    PropMap::const_iterator const i = find(key);
    unsigned long long ret = def;
    return ((i == propmap.end() || ! ParseInt(i->second, ret)) ? def : ret);
}

double
Properties::getValueSelf(const Properties::String& key, double def) const
{
    PropMap::const_iterator const i = find(key);
    if (i == propmap.end() || i->second.empty()) {
        return def;
    }
    char*        end = 0;
    const double ret = strtod(i->second.c_str(), &end);
    return (*end != 0 ? def : ret);
}

bool
Properties::getValueSelf(const Properties::String& key, bool def) const
{
    PropMap::const_iterator const i = find(key);
    if (i == propmap.end()) {
        return def;
    }
    const string val = AsciiToLower(i->second);
    if (val == "1" || val == "true" || val == "yes" || val == "on") {
        return true;
    }
    if (val == "0" || val == "false" || val == "no" || val == "off") {
        return false;
    }
    return def;
}

} // namespace RBS
