#ifndef TEXTSEG_ERRORS_HPP
#define TEXTSEG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace textseg {

/**
 * @brief Base class of every error raised by the segmentation library
 */
class SegmentationError : public std::runtime_error {
public:
  explicit SegmentationError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Invalid geometry or pixel data reached a library boundary
 *
 * Raised for empty or unsupported pixel buffers and for zero-area or
 * inverted bounding boxes handed to crop or remap.
 */
class MalformedInputError : public SegmentationError {
public:
  explicit MalformedInputError(const std::string &message)
      : SegmentationError(message) {}
};

/**
 * @brief The recognizer session is corrupted or unusable
 *
 * Recoverable: the pipeline tears the session down, re-initializes it and
 * retries the failed call once.
 */
class RecognitionSessionError : public SegmentationError {
public:
  explicit RecognitionSessionError(const std::string &message)
      : SegmentationError(message) {}
};

/**
 * @brief Recognition failed again after the session was restarted
 *
 * Fatal. The error that caused it is attached as a nested exception
 * (see std::rethrow_if_nested).
 */
class RecognitionFailedError : public SegmentationError {
public:
  explicit RecognitionFailedError(const std::string &message)
      : SegmentationError(message) {}
};

} // namespace textseg

#endif // TEXTSEG_ERRORS_HPP
