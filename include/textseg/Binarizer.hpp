#ifndef TEXTSEG_BINARIZER_HPP
#define TEXTSEG_BINARIZER_HPP

#include <opencv2/core.hpp>

#include <array>
#include <cstdint>

namespace textseg {

/**
 * @brief Global foreground/background separation using Otsu's method
 *
 * Text is assumed to be dark on a light background: a pixel is foreground
 * when its luminance is below the computed threshold.
 */
class Binarizer {
public:
  using Histogram = std::array<long long, 256>;

  /// Threshold used when no threshold splits the pixels into two classes
  static constexpr uint8_t kFallbackThreshold = 128;

  /**
   * @brief Convert a pixel buffer to 8-bit luminance
   *
   * Uses gray = 0.299R + 0.587G + 0.114B, rounded half up. Channels are
   * read in R, G, B order.
   *
   * @param pixels RGBA (CV_8UC4), RGB (CV_8UC3) or gray (CV_8UC1) image
   * @return CV_8UC1 luminance image
   * @throws MalformedInputError for empty or unsupported images
   */
  static cv::Mat toLuminance(const cv::Mat &pixels);

  /**
   * @brief Histogram of the luminance values of every pixel
   */
  static Histogram luminanceHistogram(const cv::Mat &pixels);

  /**
   * @brief Between-class variance wB * wF * (mB - mF)^2 at threshold t
   *
   * Class B holds intensities below t, class F intensities at or above t.
   * Returns 0 when either class is empty.
   */
  static double betweenClassVariance(const Histogram &histogram, int t);

  /**
   * @brief Threshold in [0,255] maximizing the between-class variance
   *
   * The first maximum wins on ties. Returns kFallbackThreshold for a
   * degenerate histogram.
   */
  static uint8_t otsuThreshold(const Histogram &histogram);

  /**
   * @brief Otsu threshold of an image
   */
  static uint8_t threshold(const cv::Mat &pixels);

  /**
   * @brief Compute the binary map of an image
   * @param pixels Input image, never modified
   * @return CV_8UC1 map of the same size, 1 = foreground, 0 = background
   */
  static cv::Mat binarize(const cv::Mat &pixels);
};

} // namespace textseg

#endif // TEXTSEG_BINARIZER_HPP
