#pragma once

#include <opencv2/highgui.hpp>
#include <opencv2/imgproc.hpp>

#include "../utils/scan_types.hpp"

static cv::Mat drawLandmarks(const cv::Mat &img,
                             const Landmarks &landmarks,
                             const std::string &caption) {
  cv::Mat outImg;
  if (img.channels() == 1) {
    cv::cvtColor(img, outImg, cv::COLOR_GRAY2BGR);
  } else {
    img.convertTo(outImg, CV_8UC3);
  }

  cv::Scalar color = landmarks.estimated ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 255, 0);
  for (const auto &pt : landmarks.points) {
    cv::Point p(static_cast<int>(pt.x), static_cast<int>(pt.y));
    cv::circle(outImg, p, 3, color, 1);
    cv::putText(outImg, pt.name, p + cv::Point(5, -5), cv::FONT_HERSHEY_SIMPLEX, 0.4, color, 1);
  }

  cv::putText(outImg, caption, cv::Point(10, 20), cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(0, 0, 255), 2);
  return outImg;
}
