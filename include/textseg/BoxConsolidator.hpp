#ifndef TEXTSEG_BOX_CONSOLIDATOR_HPP
#define TEXTSEG_BOX_CONSOLIDATOR_HPP

#include "textseg/Geometry.hpp"

#include <vector>

namespace textseg {

/**
 * @brief Merging and filtering of raw candidate boxes
 *
 * Both mergeBoxes and filterContainedBoxes are idempotent: applying them to
 * their own output returns the same set.
 */
class BoxConsolidator {
public:
  /// Minimum share of a box that another box must cover to absorb it
  static constexpr double kContainmentRatio = 0.99;

  /**
   * @brief Adaptive merge test for two boxes
   *
   * Two boxes merge when their heights are comparable (ratio >= 0.7), they
   * overlap vertically by more than half of the smaller height, and their
   * horizontal distance is below the average height. Symmetric.
   */
  static bool shouldMerge(const BBox &a, const BBox &b);

  /**
   * @brief Merge overlapping or adjacent boxes until nothing changes
   *
   * Every output box is the union of the input boxes it absorbed. Output is
   * sorted by (y0, x0, y1, x1).
   */
  static std::vector<BBox> mergeBoxes(const std::vector<BBox> &boxes);

  /**
   * @brief Remove boxes covered (>= 99% of their area) by a larger box
   *
   * Every box is tested against every larger box, including larger boxes
   * that are themselves removed. Among equal areas the earlier box counts
   * as the larger one, so of two identical boxes the first is kept. Boxes
   * that only partially overlap are kept. Survivors keep their input order.
   */
  static std::vector<BBox>
  filterContainedBoxes(const std::vector<BBox> &boxes);

  /**
   * @brief Drop boxes narrower or shorter than @p minSize pixels
   */
  static std::vector<BBox> filterSmallBoxes(const std::vector<BBox> &boxes,
                                            int minSize);

  /**
   * @brief Share of @p inner's area lying inside @p outer (0..1)
   *
   * A zero-area box counts as fully covered when @p outer contains it.
   */
  static double coverage(const BBox &inner, const BBox &outer);
};

} // namespace textseg

#endif // TEXTSEG_BOX_CONSOLIDATOR_HPP
