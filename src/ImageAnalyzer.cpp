#include "textseg/ImageAnalyzer.hpp"
#include "textseg/Binarizer.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace textseg {

ImageAnalyzer::ImageAnalyzer(const ImageAnalysisConfig &config)
    : m_config(config) {}

ImageQuality ImageAnalyzer::analyze(const cv::Mat &pixels) const {
  ImageQuality quality;
  quality.blurScore = blurScore(pixels);
  quality.isBlurry = quality.blurScore < m_config.blurThreshold;
  return quality;
}

double ImageAnalyzer::blurScore(const cv::Mat &pixels) {
  cv::Mat gray = Binarizer::toLuminance(pixels);

  // The kernel needs one pixel of context on every side
  if (gray.cols < 3 || gray.rows < 3) {
    return 0.0;
  }

  // ksize 1 is the 4-neighbour kernel [0 1 0; 1 -4 1; 0 1 0]
  cv::Mat laplacian;
  cv::Laplacian(gray, laplacian, CV_32F, 1);

  cv::Mat interior =
      cv::abs(laplacian(cv::Rect(1, 1, gray.cols - 2, gray.rows - 2)));

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(interior, mean, stddev);
  const double variance = stddev[0] * stddev[0];

  return std::round(std::clamp(variance / 5.0, 0.0, 100.0));
}

} // namespace textseg
