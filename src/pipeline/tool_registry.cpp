// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/pipeline/tool_registry.hpp>
#include <stdexcept>
#include <utility>

namespace anoncpp::pipeline {

std::string require_string(const ToolArgs& args, const std::string& key) {
    std::string value = args.get_string(key, "");
    if (value.empty()) {
        throw std::invalid_argument("Missing required argument: " + key);
    }
    return value;
}

PrivacyTool& ToolRegistry::add(std::unique_ptr<PrivacyTool> tool) {
    if (!tool) {
        throw std::invalid_argument("Cannot register a null tool");
    }
    std::string name = tool->name();
    if (tools_.count(name)) {
        throw std::invalid_argument("Tool already registered: " + name);
    }
    PrivacyTool& ref = *tool;
    tools_.emplace(std::move(name), std::move(tool));
    return ref;
}

PrivacyTool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it != tools_.end() ? it->second.get() : nullptr;
}

PrivacyTool& ToolRegistry::get(const std::string& name) const {
    PrivacyTool* tool = find(name);
    if (!tool) {
        throw std::out_of_range("Unknown tool: " + name);
    }
    return *tool;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& entry : tools_) {
        result.push_back(entry.first);
    }
    return result;
}

} // namespace anoncpp::pipeline
