// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/utils/detection_format.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace anoncpp::utils {

namespace {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::istringstream iss(line);
    std::string token;
    while (std::getline(iss, token, ',')) {
        fields.push_back(token);
    }
    return fields;
}

int to_int(const std::string& field, const std::string& what) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(field, &consumed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + what + ": '" + field + "'");
    }
    if (consumed != field.size()) {
        throw std::runtime_error("Invalid " + what + ": '" + field + "'");
    }
    return value;
}

} // namespace

std::string format_detection_record(const DetectionRecord& record) {
    std::ostringstream oss;
    oss << record.frame_index << ","
        << to_string(record.source) << ","
        << (record.outcome ? to_string(*record.outcome) : "-") << ","
        << record.boxes.size();
    for (const auto& box : record.boxes) {
        oss << "," << box.x << "," << box.y << "," << box.w << "," << box.h;
    }
    return oss.str();
}

DetectionRecord parse_detection_record(const std::string& line) {
    std::vector<std::string> fields = split_fields(line);
    if (fields.size() < 4) {
        throw std::runtime_error("Expected at least 4 fields, got " + std::to_string(fields.size()));
    }

    DetectionRecord record;
    record.frame_index = to_int(fields[0], "frame index");
    try {
        record.source = parse_detection_source(fields[1]);
        if (fields[2] != "-") {
            record.outcome = parse_detection_outcome(fields[2]);
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(e.what());
    }

    int count = to_int(fields[3], "box count");
    if (count < 0 || fields.size() != 4 + 4 * static_cast<size_t>(count)) {
        throw std::runtime_error("Box count " + fields[3] + " does not match " +
                                 std::to_string(fields.size() - 4) + " coordinate fields");
    }

    record.boxes.reserve(count);
    for (int i = 0; i < count; ++i) {
        size_t base = 4 + 4 * static_cast<size_t>(i);
        BoundingBox box{to_int(fields[base], "x"), to_int(fields[base + 1], "y"),
                        to_int(fields[base + 2], "width"), to_int(fields[base + 3], "height")};
        if (box.w < 0 || box.h < 0) {
            throw std::runtime_error("Negative box size");
        }
        record.boxes.push_back(box);
    }
    return record;
}

void write_detections(std::ostream& os, const std::vector<DetectionRecord>& detections) {
    os << "# frame_index,source,outcome,box_count[,x,y,w,h]...\n";
    for (const auto& record : detections) {
        os << format_detection_record(record) << "\n";
    }
}

void write_detections(const std::filesystem::path& output_path,
                      const std::vector<DetectionRecord>& detections) {
    if (output_path.has_parent_path()) {
        std::filesystem::create_directories(output_path.parent_path());
    }
    std::ofstream file(output_path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot write detections file: " + output_path.string());
    }
    write_detections(file, detections);
}

std::vector<DetectionRecord> read_detections(std::istream& is) {
    std::vector<DetectionRecord> detections;
    std::string line;
    int line_number = 0;
    while (std::getline(is, line)) {
        line_number++;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }
        try {
            detections.push_back(parse_detection_record(line));
        } catch (const std::runtime_error& e) {
            throw std::runtime_error("Line " + std::to_string(line_number) + ": " + e.what());
        }
    }
    return detections;
}

std::vector<DetectionRecord> read_detections(const std::filesystem::path& input_path) {
    std::ifstream file(input_path);
    if (!file) {
        throw std::runtime_error("Detections file not found: " + input_path.string());
    }
    return read_detections(file);
}

} // namespace anoncpp::utils
