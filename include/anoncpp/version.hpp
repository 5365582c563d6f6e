// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#define ANONCPP_VERSION_MAJOR 1
#define ANONCPP_VERSION_MINOR 0
#define ANONCPP_VERSION_PATCH 0
#define ANONCPP_VERSION_STRING "1.0.0"

namespace anoncpp {

struct Version {
    static constexpr int major = ANONCPP_VERSION_MAJOR;
    static constexpr int minor = ANONCPP_VERSION_MINOR;
    static constexpr int patch = ANONCPP_VERSION_PATCH;
    static constexpr const char* string = ANONCPP_VERSION_STRING;
};

} // namespace anoncpp
