#include "textseg/Errors.hpp"
#include "textseg/ImageOps.hpp"
#include "textseg/SegmentationPipeline.hpp"
#include "textseg/TesseractRecognizer.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

void printUsage(const char *programName) {
  std::cout
      << "Usage: " << programName << " <image_path> [options]\n"
      << "\nOptions:\n"
      << "  -l, --language <lang>   Set OCR language (default: chi_tra)\n"
      << "  -m, --mode <mode>       direct | preseg (default: preseg)\n"
      << "  -c, --confidence <val>  Minimum word confidence (default: 30)\n"
      << "  -t, --tessdata <path>   Path to the tessdata directory\n"
      << "  -o, --output <path>     Write the image with text boxes drawn\n"
      << "  -s, --sort              Print boxes in reading order\n"
      << "  -v, --verbose           Print diagnostics to stderr\n"
      << "  -h, --help              Show this help message\n"
      << "\nExamples:\n"
      << "  " << programName << " slide.png\n"
      << "  " << programName << " slide.png -l eng -m direct\n"
      << "  " << programName << " slide.png -o boxes.png --sort\n";
}

/**
 * @brief Print an exception and every exception nested inside it
 */
void printError(const std::exception &e, int depth = 0) {
  std::cerr << std::string(depth * 2, ' ') << e.what() << "\n";
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception &nested) {
    printError(nested, depth + 1);
  }
}

/**
 * @brief Draw every text box onto the page in red with its index
 */
void drawTextBoxes(cv::Mat &image,
                   const std::vector<textseg::ConsolidatedTextBox> &boxes) {
  for (size_t i = 0; i < boxes.size(); i++) {
    const cv::Rect rect = boxes[i].bbox.toRect();
    cv::rectangle(image, rect, cv::Scalar(0, 0, 255), 2);

    int labelY = rect.y - 4;
    if (labelY < 12) {
      labelY = rect.y + rect.height + 14;
    }
    cv::putText(image, std::to_string(i + 1), cv::Point(rect.x, labelY),
                cv::FONT_HERSHEY_SIMPLEX, 0.45, cv::Scalar(0, 0, 255), 1);
  }
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    printUsage(argv[0]);
    return 1;
  }

  std::string imagePath;
  std::string outputPath;
  textseg::SegmentationConfig config;
  textseg::RecognizerConfig recognizerConfig;
  textseg::SegmentationMode mode = textseg::SegmentationMode::PreSegmentation;
  bool sortBoxes = false;

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if (arg == "-l" || arg == "--language") {
      if (i + 1 < argc) {
        config.language = argv[++i];
      } else {
        std::cerr << "Error: --language requires an argument\n";
        return 1;
      }
    } else if (arg == "-m" || arg == "--mode") {
      if (i + 1 < argc) {
        std::string value = argv[++i];
        if (value == "direct") {
          mode = textseg::SegmentationMode::Direct;
        } else if (value == "preseg") {
          mode = textseg::SegmentationMode::PreSegmentation;
        } else {
          std::cerr << "Error: unknown mode: " << value << "\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --mode requires an argument\n";
        return 1;
      }
    } else if (arg == "-c" || arg == "--confidence") {
      if (i + 1 < argc) {
        try {
          config.layout.minConfidence = std::stof(argv[++i]);
        } catch (const std::exception &) {
          std::cerr << "Error: --confidence requires a number\n";
          return 1;
        }
      } else {
        std::cerr << "Error: --confidence requires an argument\n";
        return 1;
      }
    } else if (arg == "-t" || arg == "--tessdata") {
      if (i + 1 < argc) {
        recognizerConfig.tessDataPath = argv[++i];
      } else {
        std::cerr << "Error: --tessdata requires an argument\n";
        return 1;
      }
    } else if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        outputPath = argv[++i];
      } else {
        std::cerr << "Error: --output requires an argument\n";
        return 1;
      }
    } else if (arg == "-s" || arg == "--sort") {
      sortBoxes = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
      recognizerConfig.verbose = true;
    } else if (arg[0] != '-') {
      imagePath = arg;
    } else {
      std::cerr << "Unknown option: " << arg << "\n";
      printUsage(argv[0]);
      return 1;
    }
  }

  if (imagePath.empty()) {
    std::cerr << "Error: No image path provided\n";
    printUsage(argv[0]);
    return 1;
  }

  // Display version info
  std::cout << "=== Text Segmentation Demo ===\n"
            << "Tesseract version: "
            << textseg::TesseractRecognizer::getTesseractVersion() << "\n"
            << "OpenCV version: " << CV_VERSION << "\n"
            << "Language: " << config.language << "\n"
            << "Mode: "
            << (mode == textseg::SegmentationMode::Direct ? "direct"
                                                          : "pre-segmentation")
            << "\n"
            << "==============================\n\n";

  cv::Mat decoded = cv::imread(imagePath, cv::IMREAD_UNCHANGED);
  if (decoded.empty()) {
    std::cerr << "Failed to load image: " << imagePath << "\n";
    return 1;
  }

  textseg::TesseractRecognizer recognizer(recognizerConfig);
  textseg::SegmentationResult result;

  try {
    cv::Mat pixels = textseg::toPixelBuffer(decoded);
    textseg::SegmentationPipeline pipeline(recognizer, config);
    result = pipeline.run(pixels, mode);
  } catch (const textseg::SegmentationError &e) {
    std::cerr << "Segmentation failed:\n";
    printError(e, 1);
    return 1;
  } catch (const cv::Exception &e) {
    std::cerr << "OpenCV error: " << e.what() << "\n";
    return 1;
  }

  if (sortBoxes) {
    textseg::sortByPosition(result.boxes);
  }

  if (result.quality.isBlurry) {
    std::cout << "Warning: image looks blurry (score "
              << result.quality.blurScore << "), results may be poor\n\n";
  }

  if (mode == textseg::SegmentationMode::PreSegmentation) {
    std::cout << "Regions proposed: " << result.regions.size() << "\n\n";
  }

  std::cout << "[Text Boxes]\n";
  std::cout << std::setw(6) << "No." << std::setw(10) << "Conf%"
            << std::setw(30) << "Bounding Box"
            << "  Text\n";
  std::cout << std::string(80, '-') << "\n";

  for (size_t i = 0; i < result.boxes.size(); ++i) {
    const auto &box = result.boxes[i];
    std::ostringstream bbox;
    bbox << "(" << box.bbox.x0 << "," << box.bbox.y0 << "," << box.bbox.x1
         << "," << box.bbox.y1 << ")";

    std::cout << std::setw(6) << (i + 1) << std::setw(10) << std::fixed
              << std::setprecision(1) << box.confidence << std::setw(30)
              << bbox.str() << "  " << box.text << "\n";
  }

  if (!outputPath.empty()) {
    cv::Mat annotated = decoded.clone();
    if (annotated.channels() == 1) {
      cv::cvtColor(annotated, annotated, cv::COLOR_GRAY2BGR);
    } else if (annotated.channels() == 4) {
      cv::cvtColor(annotated, annotated, cv::COLOR_BGRA2BGR);
    }
    drawTextBoxes(annotated, result.boxes);
    if (!cv::imwrite(outputPath, annotated)) {
      std::cerr << "Failed to write image: " << outputPath << "\n";
      return 1;
    }
    std::cout << "\nAnnotated image saved to: " << outputPath << "\n";
  }

  std::cout << "\nProcessing time: " << std::fixed << std::setprecision(2)
            << result.processingTimeMs << " ms\n";
  std::cout << "Total text boxes: " << result.boxes.size() << "\n";

  return 0;
}
