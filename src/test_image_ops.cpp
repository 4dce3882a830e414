#include "textseg/Errors.hpp"
#include "textseg/ImageAnalyzer.hpp"
#include "textseg/ImageOps.hpp"

#include <iostream>
#include <opencv2/opencv.hpp>

static int failures = 0;

static void check(bool condition, const std::string &name) {
  if (condition) {
    std::cout << "  [PASS] " << name << "\n";
  } else {
    std::cout << "  [FAIL] " << name << "\n";
    failures++;
  }
}

int main() {
  std::cout << "=== Image Operations ===\n\n";

  std::cout << "[Pixel buffers]\n";
  {
    cv::Mat bgr(10, 10, CV_8UC3, cv::Scalar(255, 0, 0)); // blue
    cv::Mat rgba = textseg::toPixelBuffer(bgr);
    check(rgba.type() == CV_8UC4, "BGR decodes to RGBA");
    cv::Vec4b pixel = rgba.at<cv::Vec4b>(0, 0);
    check(pixel[0] == 0 && pixel[2] == 255 && pixel[3] == 255,
          "channels are reordered with opaque alpha");

    cv::Mat gray(10, 10, CV_8UC1, cv::Scalar(90));
    check(textseg::toPixelBuffer(gray).at<cv::Vec4b>(0, 0)[1] == 90,
          "gray expands to RGBA");

    cv::Mat deep(10, 10, CV_16UC3, cv::Scalar(65535, 65535, 65535));
    cv::Mat scaled = textseg::toPixelBuffer(deep);
    check(scaled.depth() == CV_8U && scaled.at<cv::Vec4b>(0, 0)[0] == 255,
          "16-bit images are scaled to 8 bits");
  }

  std::cout << "\n[Cropping]\n";
  {
    cv::Mat page(200, 200, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    cv::rectangle(page, cv::Rect(60, 60, 20, 20), cv::Scalar(0, 0, 0, 255),
                  cv::FILLED);

    textseg::BBox region(60, 60, 80, 80);
    cv::Mat crop = textseg::cropWithPadding(page, region, 10);
    check(crop.cols == 40 && crop.rows == 40, "crop is padded on every side");
    check(crop.at<cv::Vec4b>(10, 10)[0] == 0,
          "region starts at the padding offset");
    check(crop.at<cv::Vec4b>(5, 5)[0] == 255, "padding is white");

    // Region touching the page corner: missing pixels are white too
    cv::rectangle(page, cv::Rect(0, 0, 10, 10), cv::Scalar(0, 0, 0, 255),
                  cv::FILLED);
    cv::Mat corner = textseg::cropWithPadding(page, textseg::BBox(0, 0, 10, 10), 10);
    check(corner.cols == 30 && corner.rows == 30,
          "crop size does not depend on the page edge");
    check(corner.at<cv::Vec4b>(10, 10)[0] == 0 &&
              corner.at<cv::Vec4b>(9, 9)[0] == 255,
          "crop origin stays at region minus padding");
  }

  {
    cv::Mat page(50, 50, CV_8UC4, cv::Scalar(255, 255, 255, 255));

    bool threw = false;
    try {
      textseg::cropWithPadding(page, textseg::BBox(10, 10, 10, 20), 5);
    } catch (const textseg::MalformedInputError &) {
      threw = true;
    }
    check(threw, "zero-area region is rejected");

    threw = false;
    try {
      textseg::cropWithPadding(page, textseg::BBox(100, 100, 120, 120), 5);
    } catch (const textseg::MalformedInputError &) {
      threw = true;
    }
    check(threw, "region outside the page is rejected");

    threw = false;
    try {
      textseg::cropWithPadding(page, textseg::BBox(20, 20, 10, 10), 5);
    } catch (const textseg::MalformedInputError &) {
      threw = true;
    }
    check(threw, "inverted region is rejected");
  }

  std::cout << "\n[Preprocessing]\n";
  {
    cv::Mat page(100, 100, CV_8UC4, cv::Scalar(200, 200, 200, 255));
    cv::rectangle(page, cv::Rect(30, 30, 40, 10), cv::Scalar(60, 60, 60, 255),
                  cv::FILLED);

    textseg::PreprocessOptions options;
    cv::Mat processed = textseg::preprocessForRecognition(page, options);
    check(processed.type() == CV_8UC1, "preprocessed image is gray");
    check(processed.at<uchar>(35, 50) == 0 && processed.at<uchar>(5, 5) == 255,
          "text is black on white after thresholding");

    options.binarize = false;
    processed = textseg::preprocessForRecognition(page, options);
    check(processed.at<uchar>(35, 50) == 0 && processed.at<uchar>(5, 5) == 255,
          "contrast is stretched to the full range");

    cv::Mat flat(20, 20, CV_8UC4, cv::Scalar(128, 128, 128, 255));
    options.binarize = false;
    processed = textseg::preprocessForRecognition(flat, options);
    check(processed.at<uchar>(0, 0) == 128, "flat image is left unstretched");
  }

  std::cout << "\n[Blur analysis]\n";
  {
    cv::Mat sharp(200, 200, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    for (int y = 20; y < 180; y += 20) {
      cv::rectangle(sharp, cv::Rect(20, y, 160, 8), cv::Scalar(0, 0, 0, 255),
                    cv::FILLED);
    }

    cv::Mat blurred;
    cv::GaussianBlur(sharp, blurred, cv::Size(31, 31), 12.0);

    const double sharpScore = textseg::ImageAnalyzer::blurScore(sharp);
    const double blurredScore = textseg::ImageAnalyzer::blurScore(blurred);
    check(sharpScore > blurredScore, "blurring lowers the score");
    check(sharpScore >= 0.0 && sharpScore <= 100.0, "score stays in 0..100");

    textseg::ImageAnalyzer analyzer;
    check(!analyzer.analyze(sharp).isBlurry, "sharp text is not blurry");

    cv::Mat blank(50, 50, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    check(textseg::ImageAnalyzer::blurScore(blank) == 0.0 &&
              analyzer.analyze(blank).isBlurry,
          "featureless page scores zero");

    cv::Mat tiny(2, 2, CV_8UC4, cv::Scalar(0, 0, 0, 255));
    check(textseg::ImageAnalyzer::blurScore(tiny) == 0.0,
          "images too small for the kernel score zero");
  }

  std::cout << "\n" << (failures == 0 ? "All tests passed" : "Tests failed")
            << "\n";
  return failures == 0 ? 0 : 1;
}
