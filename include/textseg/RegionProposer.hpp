#ifndef TEXTSEG_REGION_PROPOSER_HPP
#define TEXTSEG_REGION_PROPOSER_HPP

#include "textseg/Geometry.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace textseg {

/**
 * @brief Half-widths of the anisotropic dilation kernel
 */
struct DilationKernel {
  int kX; ///< Horizontal half-width in pixels
  int kY; ///< Vertical half-width in pixels
};

/**
 * @brief Vision-only text block proposer
 *
 * Binarizes the page, smears foreground pixels horizontally (wide) and
 * vertically (narrow) so that characters of a line fuse while separate
 * lines stay apart, then reports the bounding box of every connected
 * component. No character recognition is involved.
 *
 * Example usage:
 * @code
 * textseg::RegionProposer proposer;
 * std::vector<textseg::BBox> regions = proposer.detect(rgbaImage);
 * @endcode
 */
class RegionProposer {
public:
  /// Components narrower or shorter than this are discarded as noise
  static constexpr int kMinComponentSize = 5;

  /**
   * @brief Kernel size for an image of the given resolution
   *
   * scale = max(width, height) / 1000,
   * kX = clamp(round(8 * scale), 5, 20), kY = clamp(round(2 * scale), 2, 6).
   */
  static DilationKernel kernelSize(int width, int height);

  /**
   * @brief Separable dilation: horizontal pass with kX, then vertical with kY
   * @param binaryMap CV_8UC1 map with values 0/1
   * @param kernel Half-widths of the structuring element
   * @return Dilated map, same size and type
   */
  static cv::Mat dilate(const cv::Mat &binaryMap, const DilationKernel &kernel);

  /**
   * @brief Bounding boxes of the 4-connected foreground components
   *
   * Uses an explicit stack instead of recursion so large components cannot
   * exhaust the call stack. Boxes are returned in discovery order.
   *
   * @param binaryMap CV_8UC1 map, non-zero = foreground
   */
  static std::vector<BBox> findConnectedComponents(const cv::Mat &binaryMap);

  /**
   * @brief Propose text regions in an image
   * @param pixels RGBA page image
   * @return Region boxes in arbitrary order
   */
  std::vector<BBox> detect(const cv::Mat &pixels) const;
};

} // namespace textseg

#endif // TEXTSEG_REGION_PROPOSER_HPP
