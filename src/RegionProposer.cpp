#include "textseg/RegionProposer.hpp"
#include "textseg/Binarizer.hpp"
#include "textseg/Errors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>

namespace textseg {

DilationKernel RegionProposer::kernelSize(int width, int height) {
  const double scaleFactor = std::max(width, height) / 1000.0;

  DilationKernel kernel;
  kernel.kX = std::clamp(static_cast<int>(std::lround(8.0 * scaleFactor)), 5,
                         20);
  kernel.kY = std::clamp(static_cast<int>(std::lround(2.0 * scaleFactor)), 2,
                         6);
  return kernel;
}

cv::Mat RegionProposer::dilate(const cv::Mat &binaryMap,
                               const DilationKernel &kernel) {
  if (binaryMap.empty() || binaryMap.type() != CV_8UC1) {
    throw MalformedInputError("Binary map must be a non-empty CV_8UC1 image");
  }

  cv::Mat horizontal = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(2 * kernel.kX + 1, 1));
  cv::Mat vertical = cv::getStructuringElement(
      cv::MORPH_RECT, cv::Size(1, 2 * kernel.kY + 1));

  cv::Mat widened;
  cv::Mat dilated;
  cv::dilate(binaryMap, widened, horizontal);
  cv::dilate(widened, dilated, vertical);
  return dilated;
}

std::vector<BBox>
RegionProposer::findConnectedComponents(const cv::Mat &binaryMap) {
  std::vector<BBox> boxes;

  if (binaryMap.empty() || binaryMap.type() != CV_8UC1) {
    throw MalformedInputError("Binary map must be a non-empty CV_8UC1 image");
  }

  const int width = binaryMap.cols;
  const int height = binaryMap.rows;
  cv::Mat visited = cv::Mat::zeros(binaryMap.size(), CV_8UC1);
  std::vector<cv::Point> stack;

  for (int y = 0; y < height; y++) {
    const uchar *row = binaryMap.ptr<uchar>(y);
    uchar *visitedRow = visited.ptr<uchar>(y);

    for (int x = 0; x < width; x++) {
      if (row[x] == 0 || visitedRow[x] != 0) {
        continue;
      }

      // Found a new component
      int minX = x, maxX = x, minY = y, maxY = y;
      visitedRow[x] = 1;
      stack.push_back(cv::Point(x, y));

      while (!stack.empty()) {
        cv::Point p = stack.back();
        stack.pop_back();

        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);

        const cv::Point neighbors[4] = {cv::Point(p.x - 1, p.y),
                                        cv::Point(p.x + 1, p.y),
                                        cv::Point(p.x, p.y - 1),
                                        cv::Point(p.x, p.y + 1)};
        for (const cv::Point &n : neighbors) {
          if (n.x < 0 || n.x >= width || n.y < 0 || n.y >= height) {
            continue;
          }
          if (binaryMap.at<uchar>(n.y, n.x) == 0 ||
              visited.at<uchar>(n.y, n.x) != 0) {
            continue;
          }
          visited.at<uchar>(n.y, n.x) = 1;
          stack.push_back(n);
        }
      }

      BBox box(minX, minY, maxX + 1, maxY + 1);
      if (box.width() < kMinComponentSize ||
          box.height() < kMinComponentSize) {
        continue;
      }
      boxes.push_back(box);
    }
  }

  return boxes;
}

std::vector<BBox> RegionProposer::detect(const cv::Mat &pixels) const {
  cv::Mat binaryMap = Binarizer::binarize(pixels);
  DilationKernel kernel = kernelSize(pixels.cols, pixels.rows);
  cv::Mat dilated = dilate(binaryMap, kernel);
  return findConnectedComponents(dilated);
}

} // namespace textseg
