// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

/**
 * @file anoncpp.hpp
 * @brief Main header for anoncpp - face localization and redaction verification
 *
 * @code
 * #include <anoncpp/anoncpp.hpp>
 *
 * anoncpp::FaceLocalizer localizer;
 * auto result = localizer.localize("input.mp4");
 *
 * anoncpp::DetectionVerifier verifier;
 * auto verdict = verifier.verify(result.detections, result.native_fps);
 * @endcode
 */

#include <anoncpp/version.hpp>
#include <anoncpp/types.hpp>
#include <anoncpp/config.hpp>
#include <anoncpp/face_localizer.hpp>
#include <anoncpp/detection_verifier.hpp>
#include <anoncpp/redaction/blur_redactor.hpp>
#include <anoncpp/redaction/blur_verifier.hpp>
#include <anoncpp/pipeline/builtin_tools.hpp>

namespace anoncpp {

constexpr const char* version() noexcept {
    return ANONCPP_VERSION_STRING;
}

} // namespace anoncpp
