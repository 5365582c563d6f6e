// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/types.hpp>
#include <filesystem>
#include <optional>
#include <string>

namespace anoncpp::utils {

/**
 * Everything known about one pipeline run
 */
struct RunReport {
    std::string video_path;
    std::optional<RunStats> stats;
    std::optional<VerificationVerdict> detection;
    std::optional<BlurVerdict> blur;
    std::string output_path;
};

/**
 * Render the report as a YAML document
 */
std::string report_to_yaml(const RunReport& report);

/**
 * @throws std::runtime_error if the file cannot be written
 */
void write_report(const std::filesystem::path& output_path, const RunReport& report);

} // namespace anoncpp::utils
