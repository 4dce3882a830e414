#include "textseg/ImageOps.hpp"
#include "textseg/Binarizer.hpp"
#include "textseg/Errors.hpp"

#include <opencv2/imgproc.hpp>

namespace textseg {

cv::Mat toPixelBuffer(const cv::Mat &decoded) {
  if (decoded.empty()) {
    throw MalformedInputError("Input image is empty");
  }

  cv::Mat rgba;
  if (decoded.channels() == 3) {
    cv::cvtColor(decoded, rgba, cv::COLOR_BGR2RGBA);
  } else if (decoded.channels() == 4) {
    cv::cvtColor(decoded, rgba, cv::COLOR_BGRA2RGBA);
  } else if (decoded.channels() == 1) {
    cv::cvtColor(decoded, rgba, cv::COLOR_GRAY2RGBA);
  } else {
    throw MalformedInputError("Unsupported channel count: " +
                              std::to_string(decoded.channels()));
  }

  if (rgba.depth() == CV_16U) {
    rgba.convertTo(rgba, CV_8U, 1.0 / 257.0);
  } else if (rgba.depth() != CV_8U) {
    rgba.convertTo(rgba, CV_8U);
  }
  return rgba;
}

cv::Mat cropWithPadding(const cv::Mat &pixels, const BBox &bbox, int padding) {
  if (pixels.empty()) {
    throw MalformedInputError("cropWithPadding: input image is empty");
  }
  validateBBox(bbox, "cropWithPadding");
  if (!bbox.hasArea()) {
    throw MalformedInputError("cropWithPadding: zero-area bounding box");
  }
  if (padding < 0) {
    throw MalformedInputError("cropWithPadding: negative padding");
  }

  // Clamp the region to the image bounds
  cv::Rect validRect = bbox.toRect() & cv::Rect(0, 0, pixels.cols, pixels.rows);
  if (validRect.empty()) {
    throw MalformedInputError(
        "cropWithPadding: bounding box lies outside the image");
  }

  // Parts of the box outside the image become white as well, so the crop
  // origin stays at bbox.origin - padding
  const int top = padding + (validRect.y - bbox.y0);
  const int left = padding + (validRect.x - bbox.x0);
  const int bottom = padding + (bbox.y1 - (validRect.y + validRect.height));
  const int right = padding + (bbox.x1 - (validRect.x + validRect.width));

  cv::Scalar white = pixels.channels() == 1 ? cv::Scalar(255)
                                            : cv::Scalar(255, 255, 255, 255);

  cv::Mat cropped;
  cv::copyMakeBorder(pixels(validRect), cropped, top, bottom, left, right,
                     cv::BORDER_CONSTANT, white);
  return cropped;
}

cv::Mat preprocessForRecognition(const cv::Mat &pixels,
                                 const PreprocessOptions &options) {
  if (!options.grayscale) {
    return pixels.clone();
  }

  cv::Mat processed = Binarizer::toLuminance(pixels).clone();

  if (options.enhanceContrast) {
    double minValue = 0.0;
    double maxValue = 0.0;
    cv::minMaxLoc(processed, &minValue, &maxValue);
    // A flat image has nothing to stretch
    if (maxValue > minValue) {
      cv::normalize(processed, processed, 0, 255, cv::NORM_MINMAX);
    }
  }

  if (options.binarize) {
    cv::adaptiveThreshold(processed, processed, 255,
                          cv::ADAPTIVE_THRESH_MEAN_C, cv::THRESH_BINARY,
                          options.adaptiveBlockSize, options.adaptiveOffset);
  }

  if (options.denoise) {
    cv::medianBlur(processed, processed, 3);
  }

  return processed;
}

} // namespace textseg
