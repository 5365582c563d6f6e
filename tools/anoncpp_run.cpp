#include <anoncpp/anoncpp.hpp>
#include <anoncpp/utils/detection_format.hpp>
#include <anoncpp/utils/report.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <video> <output_dir> [config.yaml] [detect_interval]\n";
        std::cerr << "Example: " << argv[0] << " ../assets/interview.mp4 ./results\n";
        std::cerr << "Example: " << argv[0] << " ../assets/interview.mp4 ./results ../configs/pipeline.yaml 5\n";
        return 1;
    }

    std::string video_path = argv[1];
    std::string output_dir = argv[2];
    std::string config_path = (argc > 3) ? argv[3] : "";
    std::optional<int> detect_interval;

    try {
        if (argc > 4) {
            detect_interval = std::stoi(argv[4]);
        }

        anoncpp::PipelineConfig config;
        if (!config_path.empty()) {
            config = anoncpp::load_pipeline_config(config_path);
        }

        std::cout << "anoncpp - Face Redaction Tool v" << anoncpp::version() << "\n";
        std::cout << "===============================\n\n";
        std::cout << "Video: " << video_path << "\n";
        std::cout << "Output Dir: " << output_dir << "\n";
        std::cout << "Config: " << (config_path.empty() ? "<defaults>" : config_path) << "\n";
        std::cout << "Detector: " << config.localizer.detector_backend
                  << " (" << config.localizer.detector_model << ")\n";
        std::cout << "Detect interval: "
                  << detect_interval.value_or(config.localizer.detect_interval) << "\n\n";

        std::filesystem::create_directories(output_dir);
        std::string stem = std::filesystem::path(video_path).stem().string();
        std::filesystem::path detections_path = std::filesystem::path(output_dir) / (stem + ".detections.txt");
        std::filesystem::path blurred_path = std::filesystem::path(output_dir) / (stem + "_blurred.mp4");
        std::filesystem::path report_path = std::filesystem::path(output_dir) / (stem + ".report.yaml");

        anoncpp::utils::RunReport report;
        report.video_path = video_path;

        // Localize
        anoncpp::FaceLocalizer localizer(config.localizer);
        anoncpp::LocalizationResult result = localizer.localize(video_path, false, detect_interval);
        report.stats = result.stats;
        anoncpp::print_run_stats(std::cout, result.stats);
        anoncpp::utils::write_detections(detections_path, result.detections);
        std::cout << "Detections written to " << detections_path << "\n\n";

        // Verify the detection sequence
        anoncpp::DetectionVerifier verifier(config.verifier);
        anoncpp::VerificationVerdict verdict = verifier.verify(result.detections, result.native_fps);
        report.detection = verdict;
        anoncpp::print_verdict(std::cout, verdict);

        if (!verdict.pass) {
            std::cout << "\nDetection verification failed, video not redacted\n";
            anoncpp::utils::write_report(report_path, report);
            std::cout << "Report written to " << report_path << "\n";
            return 2;
        }

        // Redact and check the result
        anoncpp::redaction::BlurRedactor redactor(config.redaction);
        int written = redactor.redact_video(result, blurred_path.string());
        report.output_path = blurred_path.string();
        std::cout << "\nBlurred " << written << " frames into " << blurred_path << "\n";

        anoncpp::redaction::BlurVerifier blur_verifier(config.redaction);
        anoncpp::BlurVerdict blur = blur_verifier.verify(blurred_path.string(), result.detections);
        report.blur = blur;
        anoncpp::redaction::print_blur_verdict(std::cout, blur);

        anoncpp::utils::write_report(report_path, report);
        std::cout << "Report written to " << report_path << "\n";
        return blur.pass ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
