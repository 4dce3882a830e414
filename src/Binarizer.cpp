#include "textseg/Binarizer.hpp"
#include "textseg/Errors.hpp"

#include <opencv2/imgproc.hpp>

namespace textseg {

cv::Mat Binarizer::toLuminance(const cv::Mat &pixels) {
  if (pixels.empty()) {
    throw MalformedInputError("Input image is empty");
  }
  if (pixels.depth() != CV_8U) {
    throw MalformedInputError("Input image must have 8-bit channels");
  }

  const int channels = pixels.channels();
  if (channels == 1) {
    return pixels;
  }
  if (channels != 3 && channels != 4) {
    throw MalformedInputError("Unsupported channel count: " +
                              std::to_string(channels));
  }

  // round(0.299R + 0.587G + 0.114B) in integers, halves rounded up
  cv::Mat gray(pixels.rows, pixels.cols, CV_8UC1);
  for (int y = 0; y < pixels.rows; y++) {
    const uchar *src = pixels.ptr<uchar>(y);
    uchar *dst = gray.ptr<uchar>(y);
    for (int x = 0; x < pixels.cols; x++) {
      const uchar *px = src + x * channels;
      dst[x] = static_cast<uchar>((299 * px[0] + 587 * px[1] + 114 * px[2] +
                                   500) /
                                  1000);
    }
  }
  return gray;
}

Binarizer::Histogram Binarizer::luminanceHistogram(const cv::Mat &pixels) {
  cv::Mat gray = toLuminance(pixels);

  Histogram histogram{};
  for (int y = 0; y < gray.rows; y++) {
    const uchar *row = gray.ptr<uchar>(y);
    for (int x = 0; x < gray.cols; x++) {
      histogram[row[x]]++;
    }
  }
  return histogram;
}

double Binarizer::betweenClassVariance(const Histogram &histogram, int t) {
  long long total = 0;
  double totalSum = 0.0;
  long long countB = 0;
  double sumB = 0.0;

  for (int i = 0; i < 256; i++) {
    total += histogram[i];
    totalSum += static_cast<double>(i) * histogram[i];
    if (i < t) {
      countB += histogram[i];
      sumB += static_cast<double>(i) * histogram[i];
    }
  }

  const long long countF = total - countB;
  if (countB == 0 || countF == 0) {
    return 0.0;
  }

  const double wB = static_cast<double>(countB) / total;
  const double wF = static_cast<double>(countF) / total;
  const double mB = sumB / countB;
  const double mF = (totalSum - sumB) / countF;
  return wB * wF * (mB - mF) * (mB - mF);
}

uint8_t Binarizer::otsuThreshold(const Histogram &histogram) {
  double bestVariance = 0.0;
  int bestThreshold = -1;

  for (int t = 0; t < 256; t++) {
    const double variance = betweenClassVariance(histogram, t);
    if (variance > bestVariance) {
      bestVariance = variance;
      bestThreshold = t;
    }
  }

  // No threshold produced two non-empty classes
  if (bestThreshold < 0) {
    return kFallbackThreshold;
  }
  return static_cast<uint8_t>(bestThreshold);
}

uint8_t Binarizer::threshold(const cv::Mat &pixels) {
  return otsuThreshold(luminanceHistogram(pixels));
}

cv::Mat Binarizer::binarize(const cv::Mat &pixels) {
  cv::Mat gray = toLuminance(pixels);
  const int t = otsuThreshold(luminanceHistogram(gray));

  // gray < t  <=>  !(gray > t - 1)
  cv::Mat binary;
  cv::threshold(gray, binary, t - 1, 1, cv::THRESH_BINARY_INV);
  return binary;
}

} // namespace textseg
