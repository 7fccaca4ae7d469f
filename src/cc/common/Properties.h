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
// \brief Properties file loader: "key <delimiter> value" per line, '#'
// starts a comment line.
//
//----------------------------------------------------------------------------

#ifndef COMMON_PROPERTIES_H
#define COMMON_PROPERTIES_H

#include <iosfwd>
#include <string>
#include <map>

namespace RBS
{

using std::map;
using std::string;
using std::istream;
using std::ostream;

class Properties
{
public:
    typedef string String;
private:
    int intbase;
    //Map that holds the (key,value) pairs
    typedef map<String, String> PropMap;
    PropMap propmap;
    template<typename T> bool ParseInt(const String& str, T& out) const;
    inline PropMap::const_iterator find(const String& key) const;
    string getValueSelf(const String& key, const string& def) const;
    const char* getValueSelf(const String& key, const char* def) const;
    int getValueSelf(const String& key, int def) const;
    unsigned int getValueSelf(const String& key, unsigned int def) const;
    long getValueSelf(const String& key, long def) const;
    unsigned long getValueSelf(const String& key, unsigned long def) const;
    long long getValueSelf(const String& key, long long def) const;
    unsigned long long getValueSelf(const String& key, unsigned long long def)
        const;
    double getValueSelf(const String& key, double def) const;
    bool getValueSelf(const String& key, bool def) const;

public:
    static string AsciiToLower(const string& str);

    typedef PropMap::const_iterator iterator;
    iterator begin() const { return propmap.begin(); }
    iterator end() const { return propmap.end(); }
    // load the properties from a file
    int loadProperties(const char* fileName, char delimiter,
        ostream* verbose = 0, bool keysAsciiToLower = false);
    // load the properties from an in-core buffer
    int loadProperties(istream& ist, char delimiter,
        ostream* verbose = 0, bool keysAsciiToLower = false);
    int loadProperties(const char* buf, size_t len, char delimiter,
        ostream* verbose = 0, bool keysAsciiToLower = false);
    template<typename TValue>
    TValue getValue(const String& key, const TValue& def) const
        { return getValueSelf(key, def); }
    const char* getValue(const String& key, const char* def) const
        { return getValueSelf(key, def); }
    const String* getValue(const String& key) const
    {
        PropMap::const_iterator const it = propmap.find(key);
        return (it != propmap.end() ? &(it->second) : 0);
    }
    void setValue(const String& key, const String& value)
        { propmap[key] = value; }
    void getList(string &outBuf, const string& linePrefix,
        const string& lineSuffix = string("\n")) const;
    bool remove(const String& key);
    void clear() { propmap.clear(); }
    bool empty() const { return propmap.empty(); }
    size_t size() const { return propmap.size(); }
    size_t copyWithPrefix(const string& prefix, Properties& props) const;
    void setIntBase(int base)
        { intbase = base; }
    bool operator==(const Properties& p) const
        { return (intbase == p.intbase && propmap == p.propmap); }
    bool operator!=(const Properties& p) const
        { return (! (*this == p)); }
    Properties(int base = 10);
    Properties(const Properties& p);
    ~Properties();
};

}

#endif // COMMON_PROPERTIES_H
