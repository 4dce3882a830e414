#include "textseg/TesseractRecognizer.hpp"
#include "textseg/Errors.hpp"
#include "textseg/ImageOps.hpp"

#include <opencv2/imgproc.hpp>

#include <cstdlib>
#include <iostream>

namespace textseg {

TesseractRecognizer::TesseractRecognizer()
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(),
      m_initialized(false) {}

TesseractRecognizer::TesseractRecognizer(const RecognizerConfig &config)
    : m_tesseract(std::make_unique<tesseract::TessBaseAPI>()), m_config(config),
      m_initialized(false) {}

TesseractRecognizer::~TesseractRecognizer() {
  if (m_tesseract) {
    m_tesseract->End();
  }
}

TesseractRecognizer::TesseractRecognizer(TesseractRecognizer &&other) noexcept
    : m_tesseract(std::move(other.m_tesseract)),
      m_config(std::move(other.m_config)),
      m_language(std::move(other.m_language)),
      m_initialized(other.m_initialized) {
  other.m_initialized = false;
}

TesseractRecognizer &
TesseractRecognizer::operator=(TesseractRecognizer &&other) noexcept {
  if (this != &other) {
    if (m_tesseract) {
      m_tesseract->End();
    }
    m_tesseract = std::move(other.m_tesseract);
    m_config = std::move(other.m_config);
    m_language = std::move(other.m_language);
    m_initialized = other.m_initialized;
    other.m_initialized = false;
  }
  return *this;
}

bool TesseractRecognizer::initialize(const std::string &language) {
  if (m_initialized && m_language == language) {
    return true;
  }

  // One loaded language at a time
  if (m_initialized) {
    dispose();
  }

  if (!m_tesseract) {
    m_tesseract = std::make_unique<tesseract::TessBaseAPI>();
  }

  const char *tessDataPath = nullptr;

  // Priority 1: Use config path if provided
  if (!m_config.tessDataPath.empty()) {
    tessDataPath = m_config.tessDataPath.c_str();
  }
  // Priority 2: Check TESSDATA_PREFIX environment variable
  else {
    const char *envPath = std::getenv("TESSDATA_PREFIX");
    if (envPath != nullptr) {
      tessDataPath = envPath;
    } else if (m_config.verbose) {
      // Priority 3: Tesseract's compiled-in default
      std::cerr << "DEBUG: TESSDATA_PREFIX not set, using Tesseract default"
                << std::endl;
    }
  }

  int result = m_tesseract->Init(tessDataPath, language.c_str());

  if (result != 0) {
    std::cerr << "Failed to initialize Tesseract with language: " << language
              << std::endl;
    return false;
  }

  m_tesseract->SetPageSegMode(m_config.pageSegMode);
  m_tesseract->SetVariable("preserve_interword_spaces", "1");
  m_language = language;
  m_initialized = true;
  return true;
}

void TesseractRecognizer::dispose() {
  if (m_tesseract) {
    m_tesseract->End();
  }
  m_language.clear();
  m_initialized = false;
}

bool TesseractRecognizer::isInitialized() const { return m_initialized; }

std::string TesseractRecognizer::language() const { return m_language; }

RecognitionResult TesseractRecognizer::recognize(const cv::Mat &pixels,
                                                 RecognitionPhase phase) {
  if (!m_initialized || !m_tesseract) {
    throw RecognitionSessionError(
        "Tesseract session not initialized. Call initialize() first.");
  }

  if (pixels.empty()) {
    throw MalformedInputError("Input image is empty");
  }

  cv::Mat image = pixels;
  if (m_config.preprocessImage) {
    const PreprocessOptions &options = phase == RecognitionPhase::WholePage
                                           ? m_config.wholePage
                                           : m_config.subRegion;
    image = preprocessForRecognition(pixels, options);
  }

  setImage(image);

  if (m_tesseract->Recognize(nullptr) != 0) {
    throw RecognitionSessionError("Tesseract failed to recognize the image");
  }

  RecognitionResult result;

  char *outText = m_tesseract->GetUTF8Text();
  if (outText) {
    result.text = outText;
    delete[] outText;
  }
  result.confidence = static_cast<float>(m_tesseract->MeanTextConf());

  result.words = collectResults(tesseract::RIL_WORD);
  result.lines = collectResults(tesseract::RIL_TEXTLINE);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Tesseract found " << result.words.size()
              << " words and " << result.lines.size() << " lines in a "
              << pixels.cols << "x" << pixels.rows << " image" << std::endl;
  }

  return result;
}

std::vector<RawWord>
TesseractRecognizer::collectResults(tesseract::PageIteratorLevel level) {
  std::vector<RawWord> results;

  tesseract::ResultIterator *ri = m_tesseract->GetIterator();
  if (ri == nullptr) {
    return results;
  }

  do {
    const char *text = ri->GetUTF8Text(level);

    if (text != nullptr && *text != '\0') {
      RawWord word;
      word.text = text;
      word.confidence = ri->Confidence(level);

      int x1, y1, x2, y2;
      if (ri->BoundingBox(level, &x1, &y1, &x2, &y2)) {
        word.bbox = BBox(x1, y1, x2, y2);
        results.push_back(word);
      }
    }

    delete[] text;
  } while (ri->Next(level));

  delete ri;
  return results;
}

const RecognizerConfig &TesseractRecognizer::getConfig() const {
  return m_config;
}

std::string TesseractRecognizer::getTesseractVersion() {
  return tesseract::TessBaseAPI::Version();
}

std::vector<std::string> TesseractRecognizer::getAvailableLanguages() const {
  std::vector<std::string> languages;

  if (m_initialized) {
    m_tesseract->GetAvailableLanguagesAsVector(&languages);
  }

  return languages;
}

void TesseractRecognizer::setImage(const cv::Mat &image) {
  if (image.channels() == 1) {
    m_tesseract->SetImage(image.data, image.cols, image.rows, 1,
                          static_cast<int>(image.step));
    return;
  }

  // Tesseract expects RGB; pixel buffers are RGBA
  cv::Mat rgbImage;
  if (image.channels() == 4) {
    cv::cvtColor(image, rgbImage, cv::COLOR_RGBA2RGB);
  } else {
    rgbImage = image;
  }

  m_tesseract->SetImage(rgbImage.data, rgbImage.cols, rgbImage.rows, 3,
                        static_cast<int>(rgbImage.step));
}

} // namespace textseg
