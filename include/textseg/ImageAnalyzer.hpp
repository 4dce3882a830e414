#ifndef TEXTSEG_IMAGE_ANALYZER_HPP
#define TEXTSEG_IMAGE_ANALYZER_HPP

#include "textseg/Config.hpp"

#include <opencv2/core.hpp>

namespace textseg {

/**
 * @brief Result of the pre-recognition image check
 */
struct ImageQuality {
  double blurScore = 0.0; ///< 0-100, higher is sharper
  bool isBlurry = false;  ///< blurScore below the configured threshold
};

/**
 * @brief Estimates how sharp a page image is
 *
 * The score is the variance of the absolute 3x3 Laplacian response over
 * the interior pixels, divided by 5 and clamped to 0..100. Sharp scans of
 * text usually score well above 60.
 */
class ImageAnalyzer {
public:
  explicit ImageAnalyzer(
      const ImageAnalysisConfig &config = ImageAnalysisConfig());

  /**
   * @brief Analyze a page image
   * @param pixels RGBA, RGB or gray image
   */
  ImageQuality analyze(const cv::Mat &pixels) const;

  /**
   * @brief Blur score of an image (0-100)
   */
  static double blurScore(const cv::Mat &pixels);

private:
  ImageAnalysisConfig m_config;
};

} // namespace textseg

#endif // TEXTSEG_IMAGE_ANALYZER_HPP
