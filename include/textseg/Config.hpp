#ifndef TEXTSEG_CONFIG_HPP
#define TEXTSEG_CONFIG_HPP

#include <string>

namespace textseg {

/**
 * @brief Thresholds of the word filter and the line/column grouping
 */
struct LayoutConfig {
  float minConfidence = 30.0f;  ///< Words below this confidence are noise
  double maxAspectRatio = 20.0; ///< Wider (width/height) words are rules
  double minAspectRatio = 0.05; ///< Narrower words are vertical rules
  long long minArea = 20;       ///< Smaller words are dust specks (px^2)
  double lineOverlap = 0.5;     ///< Vertical overlap needed to share a line
  double medianGapFactor = 3.0; ///< Soft threshold: medianGap * factor
  double heightGapFactor = 0.7; ///< Soft threshold: avgHeight * factor
  double minGapThreshold = 10.0; ///< Soft threshold lower bound (px)
  double hardGapFactor = 2.0;    ///< Hard threshold: avgHeight * factor
};

/**
 * @brief Image preparation applied before handing an image to a recognizer
 */
struct PreprocessOptions {
  bool grayscale = true;       ///< Convert to 8-bit luminance
  bool enhanceContrast = true; ///< Stretch min..max to 0..255
  bool binarize = true;        ///< Adaptive mean threshold
  bool denoise = false;        ///< 3x3 median filter
  int adaptiveBlockSize = 31;  ///< Adaptive threshold window (odd)
  double adaptiveOffset = 10.0; ///< Subtracted from the local mean
};

/**
 * @brief Parameters of the blur estimate
 */
struct ImageAnalysisConfig {
  double blurThreshold = 60.0; ///< Scores below this are reported blurry
};

/**
 * @brief Top-level pipeline configuration
 */
struct SegmentationConfig {
  std::string language = "chi_tra"; ///< Recognizer language code
  int cropPadding = 10;     ///< White border around each cropped region (px)
  int minRegionSize = 10;   ///< Regions smaller than this are dropped (px)
  int wordPadding = 2;      ///< Growth applied to every recognized box (px)
  bool verbose = false;     ///< Print DEBUG diagnostics to stderr
  LayoutConfig layout;      ///< Grouping thresholds
  ImageAnalysisConfig analysis; ///< Blur estimate parameters
};

} // namespace textseg

#endif // TEXTSEG_CONFIG_HPP
