#ifndef QUALITY_ANALYZER_HPP
#define QUALITY_ANALYZER_HPP

#include <opencv2/opencv.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "../utils/scan_types.hpp"

class ImageDecodeError : public std::runtime_error {
public:
    explicit ImageDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// Scores a photograph for sharpness and illumination.
//
// poseOk is the conjunction of the two threshold checks. It carries no facial
// orientation information and the landmark points are fixed fractions of the
// image size, so neither should be read as a detection result.
class QualityAnalyzer {
public:
    QualityAnalyzer(double blur_threshold = 120.0, double light_threshold = 55.0);

    // Throws ImageDecodeError when the bytes are not a decodable image.
    QualityReport analyze(const std::vector<uint8_t>& encoded) const;

    // `gray` must be a single channel 8-bit image.
    QualityReport analyzeGray(const cv::Mat& gray) const;

    double blurThreshold() const { return blur_threshold_; }
    double lightThreshold() const { return light_threshold_; }

    static double lightScore(const cv::Mat& gray);
    static double blurScore(const cv::Mat& gray);
    static Landmarks estimateLandmarks(int width, int height);

private:
    double blur_threshold_;
    double light_threshold_;
};

#endif // QUALITY_ANALYZER_HPP
