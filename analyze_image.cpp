#include <iostream>
#include <fstream>
#include <iterator>
#include <opencv2/opencv.hpp>
#include "src/quality/checksum_verifier.hpp"
#include "src/quality/draw.hpp"
#include "src/quality/quality_analyzer.hpp"
#include "src/utils/config.hpp"
#include "src/utils/scan_json.hpp"

//// ./build/analyze_image ./data/front.jpg [--show]

int main(int argc, char** argv) {
    if (argc < 2 || argc > 3) {
        std::cerr << "Usage: " << argv[0] << " <image_path> [--show]" << std::endl;
        return 1;
    }

    std::string image_path = argv[1];
    bool show = argc == 3 && std::string(argv[2]) == "--show";

    std::ifstream file(image_path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Failed to open image: " << image_path << std::endl;
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                               std::istreambuf_iterator<char>());

    // Load configuration
    Config config;
    config.load("config.ini", std::cerr);

    QualityAnalyzer analyzer(config.blur_threshold, config.light_threshold);

    QualityReport report;
    try {
        report = analyzer.analyze(bytes);
    } catch (const ImageDecodeError& e) {
        std::cerr << e.what() << ": " << image_path << std::endl;
        return 1;
    }

    ChecksumResult checksum = ChecksumVerifier::verify(bytes, std::nullopt);

    json out = report;
    out["sha256"] = checksum.raw_digest;
    out["sha256OfBase64"] = checksum.base64_digest;
    out["blurOk"] = report.blur_score >= analyzer.blurThreshold();
    out["lightOk"] = report.light_score >= analyzer.lightThreshold();
    std::cout << out.dump(2) << std::endl;

    if (show) {
        cv::Mat img = cv::imdecode(bytes, cv::IMREAD_COLOR);
        std::string caption = "blur " + std::to_string(report.blur_score).substr(0, 6) +
                              "  light " + std::to_string(report.light_score).substr(0, 5);
        cv::imshow("Scan Image Quality", drawLandmarks(img, report.landmarks, caption));
        std::cout << "Press any key to close the window..." << std::endl;
        cv::waitKey(0);
        cv::destroyAllWindows();
    }

    return 0;
}
