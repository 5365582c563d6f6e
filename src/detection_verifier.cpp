// SPDX-License-Identifier: AGPL-3.0-or-later
// Copyright (c) 2026 anoncpp contributors

#include <anoncpp/detection_verifier.hpp>
#include <iomanip>

namespace anoncpp {

GapScan extract_gaps(const std::vector<int>& face_counts) {
    GapScan scan;

    int previous_count = 0;
    int gap_size = 0;
    bool in_gap = false;

    const int total_frames = static_cast<int>(face_counts.size());
    for (int i = 0; i < total_frames; ++i) {
        const int current_count = face_counts[i];

        if (current_count < previous_count) {
            gap_size++;
            scan.missing_frames += previous_count - current_count;
            in_gap = true;
        } else if (in_gap && current_count <= previous_count) {
            gap_size++;
        } else if (in_gap) {
            scan.gaps.push_back({i - gap_size, gap_size});
            gap_size = 0;
            in_gap = false;
        }

        previous_count = current_count;
    }

    if (in_gap) {
        scan.gaps.push_back({total_frames - gap_size, gap_size});
    }

    return scan;
}

GapScan extract_gaps(const std::vector<DetectionRecord>& detections) {
    std::vector<int> counts;
    counts.reserve(detections.size());
    for (const auto& record : detections) {
        counts.push_back(static_cast<int>(record.boxes.size()));
    }
    return extract_gaps(counts);
}

DetectionVerifier::DetectionVerifier(const VerifierConfig& config)
    : config_(config)
{
}

VerificationVerdict DetectionVerifier::verify(const std::vector<DetectionRecord>& detections,
                                              double native_fps) const {
    return judge(extract_gaps(detections), static_cast<int>(detections.size()), native_fps);
}

VerificationVerdict DetectionVerifier::verify_counts(const std::vector<int>& face_counts,
                                                     double native_fps) const {
    return judge(extract_gaps(face_counts), static_cast<int>(face_counts.size()), native_fps);
}

VerificationVerdict DetectionVerifier::judge(const GapScan& scan, int total_frames,
                                             double native_fps) const {
    VerificationVerdict verdict;
    verdict.gaps = scan.gaps;

    VerificationSummary& summary = verdict.summary;
    summary.total_frames = total_frames;
    summary.missing_frames = scan.missing_frames;
    summary.miss_ratio = total_frames > 0
        ? static_cast<double>(scan.missing_frames) / total_frames
        : 0.0;
    summary.gap_count = static_cast<int>(scan.gaps.size());
    summary.native_fps = native_fps;
    summary.short_gap_threshold_frames = native_fps * config_.short_gap_seconds;

    for (const auto& gap : scan.gaps) {
        if (gap.gap_size < summary.short_gap_threshold_frames) {
            summary.short_gap_count++;
            summary.total_short_gap_time += gap.gap_size;
        }
    }

    // Several faces can drop at once, so missing can exceed the frame count
    const int successful_frames = total_frames - scan.missing_frames;
    summary.short_gap_ratio = successful_frames > 0
        ? static_cast<double>(summary.total_short_gap_time) / successful_frames
        : 0.0;

    verdict.pass = summary.miss_ratio < config_.max_miss_ratio ||
                   summary.short_gap_ratio < config_.max_short_gap_ratio;
    return verdict;
}

void print_verdict(std::ostream& os, const VerificationVerdict& verdict) {
    const VerificationSummary& s = verdict.summary;
    std::ios::fmtflags flags = os.flags();
    std::streamsize precision = os.precision();

    os << std::fixed << std::setprecision(4);
    os << "Detection verification: " << (verdict.pass ? "PASS" : "FAIL") << "\n";
    os << "  Total frames:       " << s.total_frames << "\n";
    os << "  Missing frames:     " << s.missing_frames << "\n";
    os << "  Miss ratio:         " << s.miss_ratio << "\n";
    os << "  Gaps:               " << s.gap_count << "\n";
    os << "  Short gaps:         " << s.short_gap_count
       << " (< " << s.short_gap_threshold_frames << " frames at " << s.native_fps << " fps)\n";
    os << "  Short gap time:     " << s.total_short_gap_time << " frames\n";
    os << "  Short gap ratio:    " << s.short_gap_ratio << "\n";
    for (const auto& gap : verdict.gaps) {
        os << "    gap at frame " << gap.starting_frame << ", " << gap.gap_size << " frames\n";
    }

    os.flags(flags);
    os.precision(precision);
}

} // namespace anoncpp
