#include "textseg/BoxConsolidator.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>

namespace textseg {

bool BoxConsolidator::shouldMerge(const BBox &a, const BBox &b) {
  const int h1 = a.height();
  const int h2 = b.height();
  const int minH = std::min(h1, h2);
  const int maxH = std::max(h1, h2);

  if (maxH <= 0) {
    return false;
  }

  // Heights must be comparable
  const double heightRatio = static_cast<double>(minH) / maxH;
  if (heightRatio < 0.7) {
    return false;
  }

  const int yOverlap =
      std::max(0, std::min(a.y1, b.y1) - std::max(a.y0, b.y0));
  const bool hasGoodOverlap = yOverlap > 0.5 * minH;

  const double avgH = (h1 + h2) / 2.0;
  const int xDist = std::max(0, std::max(a.x0, b.x0) - std::min(a.x1, b.x1));
  const bool isClose = xDist < 1.0 * avgH;

  return hasGoodOverlap && isClose;
}

std::vector<BBox> BoxConsolidator::mergeBoxes(const std::vector<BBox> &boxes) {
  std::vector<BBox> current = boxes;
  std::stable_sort(current.begin(), current.end(),
                   [](const BBox &a, const BBox &b) {
                     if (a.y0 != b.y0) {
                       return a.y0 < b.y0;
                     }
                     return a.x0 < b.x0;
                   });

  bool merged = true;
  while (merged) {
    merged = false;
    std::vector<BBox> next;
    std::vector<bool> absorbed(current.size(), false);

    for (size_t i = 0; i < current.size(); i++) {
      if (absorbed[i]) {
        continue;
      }

      BBox box = current[i];
      for (size_t j = i + 1; j < current.size(); j++) {
        if (absorbed[j]) {
          continue;
        }
        if (shouldMerge(box, current[j])) {
          box = unionOf(box, current[j]);
          absorbed[j] = true;
          merged = true;
        }
      }
      next.push_back(box);
    }
    current.swap(next);
  }

  std::sort(current.begin(), current.end(), [](const BBox &a, const BBox &b) {
    if (a.y0 != b.y0)
      return a.y0 < b.y0;
    if (a.x0 != b.x0)
      return a.x0 < b.x0;
    if (a.y1 != b.y1)
      return a.y1 < b.y1;
    return a.x1 < b.x1;
  });
  return current;
}

double BoxConsolidator::coverage(const BBox &inner, const BBox &outer) {
  const long long innerArea = inner.area();
  if (innerArea <= 0) {
    return outer.contains(inner) ? 1.0 : 0.0;
  }
  return static_cast<double>(intersectionOf(inner, outer).area()) / innerArea;
}

std::vector<BBox>
BoxConsolidator::filterContainedBoxes(const std::vector<BBox> &boxes) {
  // Largest first; equal areas keep input order, so of two duplicates the
  // later one is the covered one
  std::vector<size_t> order(boxes.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(), [&boxes](size_t a, size_t b) {
    return boxes[a].area() > boxes[b].area();
  });

  // A box is covered by any box ahead of it in that order, dropped or not
  std::vector<bool> keep(boxes.size(), true);
  for (size_t i = 1; i < order.size(); i++) {
    const BBox &inner = boxes[order[i]];
    for (size_t j = 0; j < i; j++) {
      if (coverage(inner, boxes[order[j]]) >= kContainmentRatio) {
        keep[order[i]] = false;
        break;
      }
    }
  }

  std::vector<BBox> result;
  for (size_t i = 0; i < boxes.size(); i++) {
    if (keep[i]) {
      result.push_back(boxes[i]);
    }
  }
  return result;
}

std::vector<BBox>
BoxConsolidator::filterSmallBoxes(const std::vector<BBox> &boxes,
                                  int minSize) {
  std::vector<BBox> result;
  std::copy_if(boxes.begin(), boxes.end(), std::back_inserter(result),
               [minSize](const BBox &box) {
                 return box.width() >= minSize && box.height() >= minSize;
               });
  return result;
}

} // namespace textseg
