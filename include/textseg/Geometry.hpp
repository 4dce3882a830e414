#ifndef TEXTSEG_GEOMETRY_HPP
#define TEXTSEG_GEOMETRY_HPP

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace textseg {

/**
 * @brief Axis-aligned rectangle in pixel coordinates
 *
 * x1 and y1 are the exclusive right and bottom edges, so the width is
 * x1 - x0. A valid box satisfies x0 <= x1 and y0 <= y1.
 */
struct BBox {
  int x0 = 0; ///< Left edge
  int y0 = 0; ///< Top edge
  int x1 = 0; ///< Right edge (exclusive)
  int y1 = 0; ///< Bottom edge (exclusive)

  BBox() = default;
  BBox(int left, int top, int right, int bottom)
      : x0(left), y0(top), x1(right), y1(bottom) {}

  int width() const { return x1 - x0; }
  int height() const { return y1 - y0; }
  long long area() const {
    return static_cast<long long>(width()) * static_cast<long long>(height());
  }

  /// True when x0 <= x1 and y0 <= y1
  bool isValid() const { return x0 <= x1 && y0 <= y1; }

  /// True when the box is valid and covers at least one pixel
  bool hasArea() const { return x0 < x1 && y0 < y1; }

  /// True when @p other lies completely inside this box
  bool contains(const BBox &other) const {
    return other.x0 >= x0 && other.y0 >= y0 && other.x1 <= x1 &&
           other.y1 <= y1;
  }

  cv::Rect toRect() const { return cv::Rect(x0, y0, width(), height()); }
  static BBox fromRect(const cv::Rect &rect) {
    return BBox(rect.x, rect.y, rect.x + rect.width, rect.y + rect.height);
  }

  bool operator==(const BBox &other) const {
    return x0 == other.x0 && y0 == other.y0 && x1 == other.x1 &&
           y1 == other.y1;
  }
  bool operator!=(const BBox &other) const { return !(*this == other); }
};

/**
 * @brief Atomic recognizer output at word or line granularity
 */
struct RawWord {
  std::string text;         ///< UTF-8 text
  BBox bbox;                ///< Bounding box in the recognized image
  float confidence = 0.0f;  ///< Confidence score (0-100)
};

/**
 * @brief Merged and cleaned output unit of the pipeline
 *
 * The bbox is the union of all contributing RawWord boxes and the
 * confidence is their arithmetic mean.
 */
struct ConsolidatedTextBox {
  std::string text;        ///< Concatenated UTF-8 text
  BBox bbox;               ///< Union of the contributing boxes
  float confidence = 0.0f; ///< Mean confidence (0-100)
};

/// Smallest box containing both inputs
BBox unionOf(const BBox &a, const BBox &b);

/// Smallest box containing every input, or an all-zero box for none
BBox unionOf(const std::vector<BBox> &boxes);

/// Overlap of two boxes; an all-zero box when they do not intersect
BBox intersectionOf(const BBox &a, const BBox &b);

/**
 * @brief Throw MalformedInputError unless the box satisfies x0<=x1, y0<=y1
 * @param box Box to check
 * @param context Name of the calling operation, used in the message
 */
void validateBBox(const BBox &box, const char *context);

/**
 * @brief Map a box found inside a padded crop back to page coordinates
 *
 * The crop's top-left corresponds to (region.x0 - padding, region.y0 -
 * padding). Each resulting coordinate is clamped to be non-negative.
 *
 * @param local Box in crop coordinates
 * @param region Region the crop was taken from
 * @param padding Border added around the region by the crop
 * @return Box in page coordinates
 * @throws MalformedInputError if either box is inverted
 */
BBox remapToPage(const BBox &local, const BBox &region, int padding);

/**
 * @brief Sort boxes top to bottom, then left to right
 *
 * Boxes whose top edges lie within @p yTolerance pixels of each other are
 * treated as one row and ordered by their left edge.
 */
void sortByPosition(std::vector<ConsolidatedTextBox> &boxes,
                    int yTolerance = 5);

} // namespace textseg

#endif // TEXTSEG_GEOMETRY_HPP
