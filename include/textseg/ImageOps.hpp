#ifndef TEXTSEG_IMAGE_OPS_HPP
#define TEXTSEG_IMAGE_OPS_HPP

#include "textseg/Config.hpp"
#include "textseg/Geometry.hpp"

#include <opencv2/core.hpp>

namespace textseg {

/**
 * @brief Convert an image decoded by OpenCV (BGR, BGRA or gray) to RGBA
 * @throws MalformedInputError for empty or unsupported images
 */
cv::Mat toPixelBuffer(const cv::Mat &decoded);

/**
 * @brief Copy a region of an image surrounded by a white border
 *
 * The region is clamped to the image bounds. The result's top-left pixel
 * corresponds to (bbox.x0 - padding, bbox.y0 - padding) in the source.
 *
 * @param pixels Source image (RGBA, RGB or gray)
 * @param bbox Region to copy
 * @param padding Border width in pixels
 * @return New image of size (w + 2 * padding) x (h + 2 * padding)
 * @throws MalformedInputError for inverted, zero-area or out-of-image boxes
 */
cv::Mat cropWithPadding(const cv::Mat &pixels, const BBox &bbox, int padding);

/**
 * @brief Prepare an image for a recognizer
 *
 * Optionally converts to gray, stretches the contrast to the full 0..255
 * range, applies an adaptive mean threshold and a median filter.
 *
 * @return CV_8UC1 image when grayscale is enabled, otherwise a copy of the
 * input
 */
cv::Mat preprocessForRecognition(const cv::Mat &pixels,
                                 const PreprocessOptions &options);

} // namespace textseg

#endif // TEXTSEG_IMAGE_OPS_HPP
