#include "textseg/SegmentationPipeline.hpp"
#include "textseg/BoxConsolidator.hpp"
#include "textseg/Errors.hpp"
#include "textseg/ImageOps.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>

namespace textseg {

namespace {

const char *modeName(SegmentationMode mode) {
  return mode == SegmentationMode::Direct ? "direct" : "pre-segmentation";
}

} // anonymous namespace

SegmentationPipeline::SegmentationPipeline(Recognizer &recognizer,
                                           const SegmentationConfig &config)
    : m_recognizer(recognizer), m_config(config), m_proposer(),
      m_grouper(config.layout), m_analyzer(config.analysis) {}

const SegmentationConfig &SegmentationPipeline::getConfig() const {
  return m_config;
}

SegmentationResult SegmentationPipeline::run(const cv::Mat &pixels,
                                             SegmentationMode mode) {
  SegmentationResult result;
  result.mode = mode;

  if (pixels.empty()) {
    throw MalformedInputError("Input image is empty");
  }

  auto startTime = std::chrono::high_resolution_clock::now();

  result.quality = m_analyzer.analyze(pixels);
  if (m_config.verbose) {
    std::cerr << "DEBUG: Page " << pixels.cols << "x" << pixels.rows
              << ", blur score " << result.quality.blurScore
              << (result.quality.isBlurry ? " (blurry)" : "") << ", mode "
              << modeName(mode) << std::endl;
  }

  if (mode == SegmentationMode::PreSegmentation) {
    result.boxes = recognizeWithPreSegmentation(pixels, &result.regions);
  } else {
    result.boxes = recognizeDirect(pixels);
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << result.boxes.size() << " text boxes in "
              << result.processingTimeMs << " ms" << std::endl;
  }

  return result;
}

std::vector<ConsolidatedTextBox>
SegmentationPipeline::recognizeDirect(const cv::Mat &pixels) {
  RecognitionResult recognized =
      recognizeWithRetry(pixels, RecognitionPhase::WholePage);
  return processOutput(recognized);
}

std::vector<ConsolidatedTextBox>
SegmentationPipeline::recognizeWithPreSegmentation(const cv::Mat &pixels,
                                                   std::vector<BBox> *regions) {
  std::vector<BBox> boxes = proposeRegions(pixels);
  if (regions != nullptr) {
    *regions = boxes;
  }

  const int padding = m_config.cropPadding;
  std::vector<ConsolidatedTextBox> allBoxes;

  // Strictly one region at a time: the recognizer holds a single session
  for (size_t i = 0; i < boxes.size(); i++) {
    const BBox &region = boxes[i];

    cv::Mat cropped = cropWithPadding(pixels, region, padding);
    RecognitionResult recognized =
        recognizeWithRetry(cropped, RecognitionPhase::SubRegion);

    std::vector<ConsolidatedTextBox> regionBoxes = processOutput(recognized);
    for (auto &box : regionBoxes) {
      box.bbox = remapToPage(box.bbox, region, padding);
      allBoxes.push_back(box);
    }

    if (m_config.verbose) {
      std::cerr << "DEBUG: Region " << (i + 1) << "/" << boxes.size() << " ("
                << region.x0 << "," << region.y0 << " " << region.width()
                << "x" << region.height() << "): " << regionBoxes.size()
                << " text boxes" << std::endl;
    }
  }

  return allBoxes;
}

std::vector<BBox> SegmentationPipeline::proposeRegions(const cv::Mat &pixels) const {
  std::vector<BBox> boxes = m_proposer.detect(pixels);
  const size_t detected = boxes.size();

  boxes = BoxConsolidator::filterSmallBoxes(boxes, m_config.minRegionSize);
  boxes = BoxConsolidator::mergeBoxes(boxes);
  boxes = BoxConsolidator::filterContainedBoxes(boxes);

  if (m_config.verbose) {
    std::cerr << "DEBUG: " << detected << " components, " << boxes.size()
              << " regions after consolidation" << std::endl;
  }

  return boxes;
}

std::vector<ConsolidatedTextBox>
SegmentationPipeline::processOutput(const RecognitionResult &result) const {
  std::vector<RawWord> words = result.words;

  // Keep recognized text even when the engine reported no word boxes
  if (words.empty()) {
    std::string text = TextLayoutGrouper::cleanText(result.text);
    if (!text.empty()) {
      RawWord word;
      word.text = text;
      word.bbox = BBox(0, 0, 100, 100);
      word.confidence = result.confidence;
      words.push_back(word);
    }
  }

  return m_grouper.group(normalizeWords(words), normalizeWords(result.lines));
}

std::vector<RawWord>
SegmentationPipeline::normalizeWords(const std::vector<RawWord> &words) const {
  std::vector<RawWord> normalized;
  normalized.reserve(words.size());

  const int padding = m_config.wordPadding;
  for (const auto &word : words) {
    if (!word.bbox.isValid()) {
      if (m_config.verbose) {
        std::cerr << "DEBUG: Dropping \"" << word.text
                  << "\" with inverted bounding box" << std::endl;
      }
      continue;
    }

    RawWord cleaned;
    cleaned.text = TextLayoutGrouper::cleanText(word.text);
    cleaned.confidence = word.confidence;
    cleaned.bbox = BBox(std::max(0, word.bbox.x0 - padding),
                        std::max(0, word.bbox.y0 - padding),
                        word.bbox.x1 + padding, word.bbox.y1 + padding);
    normalized.push_back(cleaned);
  }

  return normalized;
}

void SegmentationPipeline::ensureSession() {
  if (m_recognizer.isInitialized() &&
      m_recognizer.language() == m_config.language) {
    return;
  }

  // Switching languages requires an explicit teardown
  if (m_recognizer.isInitialized()) {
    if (m_config.verbose) {
      std::cerr << "DEBUG: Switching recognizer language from "
                << m_recognizer.language() << " to " << m_config.language
                << std::endl;
    }
    m_recognizer.dispose();
  }

  if (!m_recognizer.initialize(m_config.language)) {
    throw RecognitionFailedError(
        "Failed to initialize recognizer with language: " + m_config.language);
  }
}

RecognitionResult
SegmentationPipeline::recognizeWithRetry(const cv::Mat &pixels,
                                         RecognitionPhase phase) {
  ensureSession();

  std::string firstFailure;
  try {
    return m_recognizer.recognize(pixels, phase);
  } catch (const RecognitionSessionError &e) {
    firstFailure = e.what();
    std::cerr << "Recognition session failed, restarting: " << firstFailure
              << std::endl;
  }

  m_recognizer.dispose();

  try {
    if (!m_recognizer.initialize(m_config.language)) {
      throw RecognitionSessionError(
          "Failed to re-initialize recognizer with language: " +
          m_config.language);
    }
    return m_recognizer.recognize(pixels, phase);
  } catch (const RecognitionSessionError &) {
    std::throw_with_nested(RecognitionFailedError(
        "Recognition failed after restarting the session (first failure: " +
        firstFailure + ")"));
  }
}

} // namespace textseg
