// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/types.hpp>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace anoncpp::utils {

/**
 * Detections text format, one line per frame:
 *   frame_index,source,outcome,box_count[,x,y,w,h]...
 * `outcome` is success, failed or '-' when absent. Lines starting with '#'
 * are comments.
 */
std::string format_detection_record(const DetectionRecord& record);

/**
 * @throws std::runtime_error on malformed input
 */
DetectionRecord parse_detection_record(const std::string& line);

void write_detections(std::ostream& os, const std::vector<DetectionRecord>& detections);

/**
 * Overwrites `output_path`, creating parent directories
 */
void write_detections(const std::filesystem::path& output_path,
                      const std::vector<DetectionRecord>& detections);

/**
 * @throws std::runtime_error naming the offending line number
 */
std::vector<DetectionRecord> read_detections(std::istream& is);

/**
 * @throws std::runtime_error if the file does not exist or is malformed
 */
std::vector<DetectionRecord> read_detections(const std::filesystem::path& input_path);

} // namespace anoncpp::utils
