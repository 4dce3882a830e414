#ifndef TEXTSEG_SEGMENTATION_PIPELINE_HPP
#define TEXTSEG_SEGMENTATION_PIPELINE_HPP

#include "textseg/Config.hpp"
#include "textseg/Geometry.hpp"
#include "textseg/ImageAnalyzer.hpp"
#include "textseg/Recognizer.hpp"
#include "textseg/RegionProposer.hpp"
#include "textseg/TextLayoutGrouper.hpp"

#include <opencv2/core.hpp>

#include <vector>

namespace textseg {

/**
 * @brief How a page is fed to the recognizer
 */
enum class SegmentationMode {
  Direct,         ///< Recognize the whole page at once
  PreSegmentation ///< Propose regions first, recognize each crop
};

/**
 * @brief Result of processing one page
 */
struct SegmentationResult {
  std::vector<ConsolidatedTextBox> boxes; ///< Text boxes, accumulation order
  std::vector<BBox> regions;   ///< Consolidated regions (PreSegmentation only)
  ImageQuality quality;        ///< Sharpness estimate of the input page
  SegmentationMode mode = SegmentationMode::Direct; ///< Mode that was run
  double processingTimeMs = 0; ///< Processing time in milliseconds
};

/**
 * @brief Top-level driver of the segmentation pipeline
 *
 * The pipeline borrows the recognizer for its whole lifetime and is the
 * only caller of it while it exists. Regions are recognized one after
 * another; there is no internal parallelism.
 *
 * Example usage:
 * @code
 * textseg::TesseractRecognizer recognizer;
 * textseg::SegmentationConfig config;
 * config.language = "eng";
 * textseg::SegmentationPipeline pipeline(recognizer, config);
 * auto result = pipeline.run(rgbaImage,
 *                            textseg::SegmentationMode::PreSegmentation);
 * @endcode
 */
class SegmentationPipeline {
public:
  SegmentationPipeline(Recognizer &recognizer,
                       const SegmentationConfig &config = SegmentationConfig());

  SegmentationPipeline(const SegmentationPipeline &) = delete;
  SegmentationPipeline &operator=(const SegmentationPipeline &) = delete;

  /**
   * @brief Process one page
   * @param pixels RGBA page image
   * @param mode Direct or PreSegmentation
   * @return Text boxes in page coordinates plus diagnostics
   * @throws MalformedInputError for an empty or unsupported image
   * @throws RecognitionFailedError when recognition fails after a restart
   */
  SegmentationResult run(const cv::Mat &pixels, SegmentationMode mode);

  /**
   * @brief Recognize a complete page and group the result
   */
  std::vector<ConsolidatedTextBox> recognizeDirect(const cv::Mat &pixels);

  /**
   * @brief Propose regions, then recognize every region crop in turn
   * @param pixels RGBA page image
   * @param regions Receives the consolidated regions, may be nullptr
   */
  std::vector<ConsolidatedTextBox>
  recognizeWithPreSegmentation(const cv::Mat &pixels,
                               std::vector<BBox> *regions = nullptr);

  /**
   * @brief Vision-only macro regions of a page
   *
   * Region Proposer, then regions below the minimum size are dropped and
   * the rest are merged and filtered for containment.
   */
  std::vector<BBox> proposeRegions(const cv::Mat &pixels) const;

  /**
   * @brief Turn one recognition result into grouped text boxes
   *
   * Cleans every text, rejects inverted boxes, pads the remaining ones and
   * groups them. When no words came back but the text is not blank, one
   * word covering {0,0,100,100} carries the text.
   */
  std::vector<ConsolidatedTextBox>
  processOutput(const RecognitionResult &result) const;

  /**
   * @brief Make sure the session is open with the configured language
   * @throws RecognitionFailedError if the recognizer cannot be initialized
   */
  void ensureSession();

  const SegmentationConfig &getConfig() const;

private:
  /**
   * @brief Recognize, restarting the session once on RecognitionSessionError
   */
  RecognitionResult recognizeWithRetry(const cv::Mat &pixels,
                                       RecognitionPhase phase);

  /**
   * @brief Clean, validate and pad recognizer boxes
   */
  std::vector<RawWord> normalizeWords(const std::vector<RawWord> &words) const;

  Recognizer &m_recognizer;
  SegmentationConfig m_config;
  RegionProposer m_proposer;
  TextLayoutGrouper m_grouper;
  ImageAnalyzer m_analyzer;
};

} // namespace textseg

#endif // TEXTSEG_SEGMENTATION_PIPELINE_HPP
