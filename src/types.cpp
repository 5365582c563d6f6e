// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/types.hpp>
#include <stdexcept>

namespace anoncpp {

std::string to_string(DetectionSource source) {
    switch (source) {
        case DetectionSource::Detector: return "detector";
        case DetectionSource::Tracker: return "tracker";
        case DetectionSource::Kalman: return "kalman";
    }
    return "detector";
}

std::string to_string(DetectionOutcome outcome) {
    return outcome == DetectionOutcome::Success ? "success" : "failed";
}

DetectionSource parse_detection_source(const std::string& text) {
    if (text == "detector") return DetectionSource::Detector;
    if (text == "tracker") return DetectionSource::Tracker;
    if (text == "kalman") return DetectionSource::Kalman;
    throw std::invalid_argument("Unknown detection source: " + text);
}

DetectionOutcome parse_detection_outcome(const std::string& text) {
    if (text == "success") return DetectionOutcome::Success;
    if (text == "failed") return DetectionOutcome::Failed;
    throw std::invalid_argument("Unknown detection outcome: " + text);
}

} // namespace anoncpp
