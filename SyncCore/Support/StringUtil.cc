//
// StringUtil.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "StringUtil.hh"
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <new>

namespace synccore {
    using namespace std;

    std::string format(const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string result = vformat(fmt, args);
        va_end(args);
        return result;
    }

    std::string vformat(const char* fmt, va_list args) {
        char* cstr = nullptr;
        if ( vasprintf(&cstr, fmt, args) < 0 ) throw bad_alloc();
        std::string result(cstr);
        free(cstr);
        return result;
    }

    bool hasPrefix(string_view str, string_view prefix) noexcept {
        return str.size() >= prefix.size() && memcmp(str.data(), prefix.data(), prefix.size()) == 0;
    }

    bool hasSuffix(string_view str, string_view suffix) noexcept {
        return str.size() >= suffix.size()
               && memcmp(&str[str.size() - suffix.size()], suffix.data(), suffix.size()) == 0;
    }

    void toLowercase(std::string& str) {
        for ( char& c : str ) c = (char)tolower((unsigned char)c);
    }

}  // namespace synccore
