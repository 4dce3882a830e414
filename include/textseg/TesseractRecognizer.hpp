#ifndef TEXTSEG_TESSERACT_RECOGNIZER_HPP
#define TEXTSEG_TESSERACT_RECOGNIZER_HPP

#include "textseg/Config.hpp"
#include "textseg/Recognizer.hpp"

#include <opencv2/core.hpp>
#include <tesseract/baseapi.h>

#include <memory>
#include <string>
#include <vector>

namespace textseg {

/**
 * @brief Configuration options for the Tesseract session
 */
struct RecognizerConfig {
  std::string tessDataPath =
      ""; ///< Path to tessdata directory (empty = TESSDATA_PREFIX or default)
  tesseract::PageSegMode pageSegMode =
      tesseract::PSM_SINGLE_BLOCK; ///< Page segmentation mode
  bool preprocessImage = true;     ///< Apply preprocessing before recognition
  PreprocessOptions wholePage;     ///< Preprocessing of complete pages
  PreprocessOptions subRegion;     ///< Preprocessing of region crops
  bool verbose = false;            ///< Print DEBUG diagnostics to stderr

  RecognizerConfig() {
    // Crops are small; binarizing them again costs time and loses strokes
    subRegion.binarize = false;
  }
};

/**
 * @brief Recognizer backed by the Tesseract C++ API
 *
 * Example usage:
 * @code
 * textseg::TesseractRecognizer recognizer;
 * if (recognizer.initialize("eng")) {
 *     auto result = recognizer.recognize(rgbaImage,
 *                                        textseg::RecognitionPhase::WholePage);
 * }
 * @endcode
 */
class TesseractRecognizer : public Recognizer {
public:
  TesseractRecognizer();
  explicit TesseractRecognizer(const RecognizerConfig &config);
  ~TesseractRecognizer() override;

  // Disable copy operations (Tesseract API is not copyable)
  TesseractRecognizer(const TesseractRecognizer &) = delete;
  TesseractRecognizer &operator=(const TesseractRecognizer &) = delete;

  // Enable move operations
  TesseractRecognizer(TesseractRecognizer &&other) noexcept;
  TesseractRecognizer &operator=(TesseractRecognizer &&other) noexcept;

  bool initialize(const std::string &language) override;
  void dispose() override;
  bool isInitialized() const override;
  std::string language() const override;

  RecognitionResult recognize(const cv::Mat &pixels,
                              RecognitionPhase phase) override;

  /**
   * @brief Get the current configuration
   */
  const RecognizerConfig &getConfig() const;

  /**
   * @brief Get the Tesseract version string
   */
  static std::string getTesseractVersion();

  /**
   * @brief Get the languages installed in the tessdata directory
   * @return Language codes, empty when the session is closed
   */
  std::vector<std::string> getAvailableLanguages() const;

private:
  /**
   * @brief Hand an image to Tesseract as 8-bit RGB or gray
   */
  void setImage(const cv::Mat &image);

  /**
   * @brief Collect the results of one iterator level
   */
  std::vector<RawWord> collectResults(tesseract::PageIteratorLevel level);

  std::unique_ptr<tesseract::TessBaseAPI>
      m_tesseract;          ///< Tesseract API instance
  RecognizerConfig m_config; ///< Current configuration
  std::string m_language;    ///< Language of the open session
  bool m_initialized;        ///< Initialization state
};

} // namespace textseg

#endif // TEXTSEG_TESSERACT_RECOGNIZER_HPP
