// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#pragma once

#include <anoncpp/config.hpp>
#include <anoncpp/types.hpp>
#include <ostream>
#include <vector>

namespace anoncpp {

/**
 * Gaps found in a detection sequence plus the number of missing face-frames
 */
struct GapScan {
    std::vector<GapRecord> gaps;
    int missing_frames = 0;
};

/**
 * Scan per-frame face counts for drops.
 *
 * A gap opens when the count falls below the previous frame's count and
 * closes on the first frame whose count rises again; that frame is not part
 * of the gap. Every drop adds (previous - current) to missing_frames. A gap
 * still open at the end of the sequence is closed at the last frame.
 * Counts are compared only, so any face reappearing closes a gap.
 */
GapScan extract_gaps(const std::vector<int>& face_counts);

GapScan extract_gaps(const std::vector<DetectionRecord>& detections);

/**
 * Judges whether a detection sequence is continuous enough to redact from.
 *
 * Passes when miss_ratio < max_miss_ratio OR short_gap_ratio <
 * max_short_gap_ratio, where short gaps last less than short_gap_seconds.
 * Stateless; safe to share between threads.
 */
class DetectionVerifier {
public:
    explicit DetectionVerifier(const VerifierConfig& config = VerifierConfig());

    VerificationVerdict verify(const std::vector<DetectionRecord>& detections,
                               double native_fps) const;

    /**
     * Same as verify() on a bare face-count sequence
     */
    VerificationVerdict verify_counts(const std::vector<int>& face_counts,
                                      double native_fps) const;

    const VerifierConfig& config() const { return config_; }

private:
    VerifierConfig config_;

    VerificationVerdict judge(const GapScan& scan, int total_frames, double native_fps) const;
};

void print_verdict(std::ostream& os, const VerificationVerdict& verdict);

} // namespace anoncpp
