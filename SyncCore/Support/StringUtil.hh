//
// StringUtil.hh
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "fleece/PlatformCompat.hh"
#include <stdarg.h>
#include <string>
#include <string_view>

namespace synccore {

    /** Like sprintf(), but returns a std::string */
    std::string format(const char* fmt, ...) __printflike(1, 2);

    /** Like vsprintf(), but returns a std::string */
    std::string vformat(const char* fmt, va_list) __printflike(1, 0);

    /** Returns true if `str` begins with the string `prefix`. */
    bool hasPrefix(std::string_view str, std::string_view prefix) noexcept;

    /** Returns true if `str` ends with the string `suffix`. */
    bool hasSuffix(std::string_view str, std::string_view suffix) noexcept;

    /** Converts ASCII letters to lowercase, in place. */
    void toLowercase(std::string&);

    static inline std::string lowercase(std::string str) {
        toLowercase(str);
        return str;
    }

}  // namespace synccore
