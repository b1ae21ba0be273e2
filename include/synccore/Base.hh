//
// Base.hh
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

#include "fleece/slice.hh"
#include "fleece/PlatformCompat.hh"
#include "fleece/RefCounted.hh"
#include <stddef.h>
#include <stdint.h>
#include <string>
#include <string_view>

#define SYNCCORE_VERSION_STRING "1.0.0"

namespace synccore {
    using fleece::slice;
    using fleece::alloc_slice;
    using fleece::nullslice;
    using fleece::RefCounted;
    using fleece::Retained;
    using fleece::make_retained;

    using std::string;
    using std::string_view;

}  // namespace synccore
