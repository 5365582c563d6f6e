#include <anoncpp/anoncpp.hpp>
#include <opencv2/opencv.hpp>
#include <iostream>
#include <vector>

int main(int argc, char* argv[]) {
    std::cout << "anoncpp - Simple Localization Example\n";
    std::cout << "=====================================\n\n";

    // Verifier on a synthetic face-count sequence: a face is lost for three
    // frames in the middle of a one second clip at 30 fps
    std::vector<int> counts(30, 1);
    counts[12] = counts[13] = counts[14] = 0;

    anoncpp::DetectionVerifier verifier;
    anoncpp::VerificationVerdict verdict = verifier.verify_counts(counts, 30.0);
    anoncpp::print_verdict(std::cout, verdict);

    if (argc < 2) {
        std::cout << "\nPass a video path to run the localizer on it\n";
        return 0;
    }

    anoncpp::LocalizerConfig config;
    if (argc > 2) {
        config.detector_model = argv[2];
    }

    try {
        anoncpp::FaceLocalizer localizer(config);
        anoncpp::LocalizationResult result = localizer.localize(argv[1]);

        std::cout << "\n";
        anoncpp::print_run_stats(std::cout, result.stats);
        for (const auto& record : result.detections) {
            if (record.frame_index >= 10) {
                break;
            }
            std::cout << "  Frame " << record.frame_index << ": "
                      << record.boxes.size() << " face(s) from "
                      << anoncpp::to_string(record.source) << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
