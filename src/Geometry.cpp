#include "textseg/Geometry.hpp"
#include "textseg/Errors.hpp"

#include <algorithm>
#include <sstream>

namespace textseg {

namespace {

std::string describe(const BBox &box) {
  std::ostringstream out;
  out << "{" << box.x0 << "," << box.y0 << "," << box.x1 << "," << box.y1
      << "}";
  return out.str();
}

} // anonymous namespace

BBox unionOf(const BBox &a, const BBox &b) {
  return BBox(std::min(a.x0, b.x0), std::min(a.y0, b.y0),
              std::max(a.x1, b.x1), std::max(a.y1, b.y1));
}

BBox unionOf(const std::vector<BBox> &boxes) {
  if (boxes.empty()) {
    return BBox();
  }

  BBox result = boxes.front();
  for (size_t i = 1; i < boxes.size(); i++) {
    result = unionOf(result, boxes[i]);
  }
  return result;
}

BBox intersectionOf(const BBox &a, const BBox &b) {
  BBox overlap(std::max(a.x0, b.x0), std::max(a.y0, b.y0),
               std::min(a.x1, b.x1), std::min(a.y1, b.y1));
  if (!overlap.isValid()) {
    return BBox();
  }
  return overlap;
}

void validateBBox(const BBox &box, const char *context) {
  if (!box.isValid()) {
    throw MalformedInputError(std::string(context) +
                              ": inverted bounding box " + describe(box));
  }
}

BBox remapToPage(const BBox &local, const BBox &region, int padding) {
  validateBBox(local, "remapToPage");
  validateBBox(region, "remapToPage");

  const int offsetX = region.x0 - padding;
  const int offsetY = region.y0 - padding;

  return BBox(std::max(0, local.x0 + offsetX), std::max(0, local.y0 + offsetY),
              std::max(0, local.x1 + offsetX),
              std::max(0, local.y1 + offsetY));
}

void sortByPosition(std::vector<ConsolidatedTextBox> &boxes, int yTolerance) {
  std::stable_sort(boxes.begin(), boxes.end(),
                   [](const ConsolidatedTextBox &a,
                      const ConsolidatedTextBox &b) {
                     return a.bbox.y0 < b.bbox.y0;
                   });

  // Rows start at the first box whose top edge is more than yTolerance below
  // the top edge of the current row's first box
  auto rowStart = boxes.begin();
  while (rowStart != boxes.end()) {
    const int rowTop = rowStart->bbox.y0;
    auto rowEnd = std::find_if(rowStart, boxes.end(),
                               [rowTop, yTolerance](const ConsolidatedTextBox &box) {
                                 return box.bbox.y0 - rowTop > yTolerance;
                               });
    std::stable_sort(rowStart, rowEnd,
                     [](const ConsolidatedTextBox &a,
                        const ConsolidatedTextBox &b) {
                       return a.bbox.x0 < b.bbox.x0;
                     });
    rowStart = rowEnd;
  }
}

} // namespace textseg
