// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <string>

namespace anoncpp::pipeline {

using ToolArgs = ParamSet;

/**
 * Result of applying or verifying a tool.
 * A failed check is reported through `ok`, not thrown.
 */
struct ToolResult {
    bool ok = false;
    ParamSet outputs;
    std::string message;
};

/**
 * Base privacy tool interface
 * apply() performs the operation; verify() checks that it achieved its goal.
 * Both throw for unusable arguments or I/O failures.
 */
class PrivacyTool {
public:
    virtual ~PrivacyTool() = default;

    virtual std::string name() const = 0;

    virtual ToolResult apply(const ToolArgs& args) = 0;

    virtual ToolResult verify(const ToolArgs& args) = 0;
};

/**
 * Fetch a required string argument
 * @throws std::invalid_argument if it is absent or empty
 */
std::string require_string(const ToolArgs& args, const std::string& key);

} // namespace anoncpp::pipeline
