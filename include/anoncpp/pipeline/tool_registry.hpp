// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/pipeline/privacy_tool.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace anoncpp::pipeline {

/**
 * Owns the tools available to a pipeline, keyed by name.
 * Built once by the caller and passed by reference; there is no global instance.
 */
class ToolRegistry {
public:
    ToolRegistry() = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    /**
     * @throws std::invalid_argument for a null tool or a duplicate name
     */
    PrivacyTool& add(std::unique_ptr<PrivacyTool> tool);

    /**
     * @return nullptr if no tool has that name
     */
    PrivacyTool* find(const std::string& name) const;

    /**
     * @throws std::out_of_range if no tool has that name
     */
    PrivacyTool& get(const std::string& name) const;

    bool contains(const std::string& name) const { return tools_.count(name) > 0; }
    size_t size() const { return tools_.size(); }

    // Sorted
    std::vector<std::string> names() const;

private:
    std::map<std::string, std::unique_ptr<PrivacyTool>> tools_;
};

} // namespace anoncpp::pipeline
