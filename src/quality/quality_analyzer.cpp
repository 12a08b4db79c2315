#include "quality_analyzer.hpp"

QualityAnalyzer::QualityAnalyzer(double blur_threshold, double light_threshold)
    : blur_threshold_(blur_threshold),
      light_threshold_(light_threshold) {
}

double QualityAnalyzer::lightScore(const cv::Mat& gray) {
    if (gray.empty()) {
        return 0.0;
    }
    return cv::mean(gray)[0];
}

double QualityAnalyzer::blurScore(const cv::Mat& gray) {
    // Interior pixels only; too small an image has none.
    if (gray.rows < 3 || gray.cols < 3) {
        return 0.0;
    }

    // ksize 1 is the 4-neighbour kernel [0 1 0; 1 -4 1; 0 1 0]
    cv::Mat laplacian;
    cv::Laplacian(gray, laplacian, CV_64F, 1);
    cv::Mat interior = laplacian(cv::Rect(1, 1, gray.cols - 2, gray.rows - 2));

    cv::Scalar mean, stddev;
    cv::meanStdDev(interior, mean, stddev);

    // meanStdDev divides by N, so this is the population variance
    return stddev.val[0] * stddev.val[0];
}

Landmarks QualityAnalyzer::estimateLandmarks(int width, int height) {
    const float w = static_cast<float>(width);
    const float h = static_cast<float>(height);

    Landmarks landmarks;
    landmarks.estimated = true;
    landmarks.points = {
        {"leftEye", w * 0.35f, h * 0.4f},
        {"rightEye", w * 0.65f, h * 0.4f},
        {"nose", w * 0.5f, h * 0.55f},
        {"mouthLeft", w * 0.42f, h * 0.7f},
        {"mouthRight", w * 0.58f, h * 0.7f}
    };
    return landmarks;
}

QualityReport QualityAnalyzer::analyzeGray(const cv::Mat& gray) const {
    QualityReport report;

    // 1. Illumination
    report.light_score = lightScore(gray);

    // 2. Sharpness
    report.blur_score = blurScore(gray);

    // 3. Pose (threshold placeholder)
    report.pose_ok = report.blur_score >= blur_threshold_ &&
                     report.light_score >= light_threshold_;

    // 4. Landmarks
    report.landmarks = estimateLandmarks(gray.cols, gray.rows);

    return report;
}

QualityReport QualityAnalyzer::analyze(const std::vector<uint8_t>& encoded) const {
    if (encoded.empty()) {
        throw ImageDecodeError("Empty image buffer");
    }

    cv::Mat gray;
    try {
        // Score the pixels as stored; EXIF rotation would swap the landmark axes.
        gray = cv::imdecode(encoded, cv::IMREAD_GRAYSCALE | cv::IMREAD_IGNORE_ORIENTATION);
    } catch (const cv::Exception& e) {
        throw ImageDecodeError(std::string("Failed to decode image: ") + e.what());
    }

    if (gray.empty()) {
        throw ImageDecodeError("Failed to decode image");
    }

    return analyzeGray(gray);
}
