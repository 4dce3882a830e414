#ifndef TEXTSEG_RECOGNIZER_HPP
#define TEXTSEG_RECOGNIZER_HPP

#include "textseg/Geometry.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace textseg {

/**
 * @brief What kind of image a recognition call works on
 *
 * A SubRegion is a padded crop produced by pre-segmentation and is never
 * segmented again.
 */
enum class RecognitionPhase {
  WholePage, ///< A complete page
  SubRegion  ///< A crop around one proposed region
};

/**
 * @brief Output of one recognition call
 */
struct RecognitionResult {
  std::string text;           ///< Complete recognized text
  float confidence = 0.0f;    ///< Mean confidence of the text (0-100)
  std::vector<RawWord> words; ///< Word-level results
  std::vector<RawWord> lines; ///< Line-level results, may be empty
};

/**
 * @brief Character recognition engine with a single stateful session
 *
 * A session holds one loaded language model at a time. Calls must not
 * overlap; switching languages requires dispose() followed by
 * initialize().
 */
class Recognizer {
public:
  virtual ~Recognizer() = default;

  /**
   * @brief Load a language model and open the session
   * @param language Language code (e.g., "eng", "chi_tra")
   * @return true if the session is ready
   */
  virtual bool initialize(const std::string &language) = 0;

  /**
   * @brief Close the session and release the language model
   */
  virtual void dispose() = 0;

  /**
   * @brief Check if the session is open
   */
  virtual bool isInitialized() const = 0;

  /**
   * @brief Language of the open session, empty when closed
   */
  virtual std::string language() const = 0;

  /**
   * @brief Recognize the text of an image
   * @param pixels RGBA image
   * @param phase Whole page or sub-region crop
   * @return Words, lines and full text in image coordinates
   * @throws RecognitionSessionError if the session is unusable
   */
  virtual RecognitionResult recognize(const cv::Mat &pixels,
                                      RecognitionPhase phase) = 0;
};

} // namespace textseg

#endif // TEXTSEG_RECOGNIZER_HPP
