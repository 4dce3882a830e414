#include "textseg/TextLayoutGrouper.hpp"
#include "textseg/Utf8.hpp"

#include <algorithm>

namespace textseg {

namespace {

bool isControl(char32_t c) {
  return c <= 0x08 || c == 0x0B || c == 0x0C || (c >= 0x0E && c <= 0x1F) ||
         c == 0x7F;
}

// Symbols whose long runs are recognizer noise: anything but letters,
// digits, CJK, CJK punctuation and full-width forms
bool isCollapsible(char32_t c) {
  if (utf8::isContent(c)) {
    return false;
  }
  if ((c >= 0x3000 && c <= 0x303F) || (c >= 0xFF00 && c <= 0xFFEF)) {
    return false;
  }
  return true;
}

bool isBlank(const std::string &text) {
  for (char32_t c : utf8::decode(text)) {
    if (!utf8::isSpace(c)) {
      return false;
    }
  }
  return true;
}

std::u32string trim(const std::u32string &text) {
  size_t start = 0;
  while (start < text.size() && utf8::isSpace(text[start])) {
    start++;
  }
  size_t end = text.size();
  while (end > start && utf8::isSpace(text[end - 1])) {
    end--;
  }
  return text.substr(start, end - start);
}

} // anonymous namespace

TextLayoutGrouper::TextLayoutGrouper(const LayoutConfig &config)
    : m_config(config) {}

const LayoutConfig &TextLayoutGrouper::getConfig() const { return m_config; }

std::vector<ConsolidatedTextBox>
TextLayoutGrouper::group(const std::vector<RawWord> &words,
                         const std::vector<RawWord> &lines) const {
  // Prefer the recognizer's own line boundaries for CJK text
  bool useLines = false;
  if (!lines.empty()) {
    std::string allText;
    for (const auto &line : lines) {
      allText += line.text;
    }
    useLines = utf8::containsCJK(allText);
  }

  std::vector<ConsolidatedTextBox> boxes;

  if (useLines) {
    for (const auto &line : prefilter(lines)) {
      ConsolidatedTextBox box;
      box.text = line.text;
      box.bbox = line.bbox;
      box.confidence = line.confidence;
      boxes.push_back(box);
    }
    return resolveOverlaps(boxes);
  }

  std::vector<RawWord> filtered = prefilter(words);
  for (const auto &line : groupIntoLines(filtered)) {
    for (const auto &column : splitLineIntoColumns(line)) {
      boxes.push_back(mergeColumn(column));
    }
  }

  return resolveOverlaps(boxes);
}

std::vector<RawWord>
TextLayoutGrouper::prefilter(const std::vector<RawWord> &words) const {
  std::vector<RawWord> result;

  for (const auto &word : words) {
    if (word.text.empty() || isBlank(word.text)) {
      continue;
    }

    if (word.confidence < m_config.minConfidence) {
      continue;
    }

    const int width = word.bbox.width();
    const int height = word.bbox.height();
    if (width <= 0 || height <= 0) {
      continue;
    }

    // Thin horizontal or vertical rules
    const double aspectRatio = static_cast<double>(width) / height;
    if (aspectRatio > m_config.maxAspectRatio ||
        aspectRatio < m_config.minAspectRatio) {
      continue;
    }

    // Dust specks
    if (word.bbox.area() < m_config.minArea) {
      continue;
    }

    result.push_back(word);
  }

  return result;
}

std::vector<std::vector<RawWord>>
TextLayoutGrouper::groupIntoLines(const std::vector<RawWord> &words) const {
  std::vector<std::vector<RawWord>> lines;
  if (words.empty()) {
    return lines;
  }

  std::vector<RawWord> sorted = words;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RawWord &a, const RawWord &b) {
                     return a.bbox.y0 < b.bbox.y0;
                   });

  auto byX = [](const RawWord &a, const RawWord &b) {
    return a.bbox.x0 < b.bbox.x0;
  };

  std::vector<RawWord> currentLine{sorted.front()};
  for (size_t i = 1; i < sorted.size(); i++) {
    const RawWord &word = sorted[i];
    const RawWord &previous = currentLine.back();

    if (verticalOverlap(previous.bbox, word.bbox) > m_config.lineOverlap) {
      currentLine.push_back(word);
    } else {
      std::stable_sort(currentLine.begin(), currentLine.end(), byX);
      lines.push_back(currentLine);
      currentLine = {word};
    }
  }

  std::stable_sort(currentLine.begin(), currentLine.end(), byX);
  lines.push_back(currentLine);

  return lines;
}

std::vector<std::vector<RawWord>>
TextLayoutGrouper::splitLineIntoColumns(const std::vector<RawWord> &line) const {
  if (line.size() <= 1) {
    return {line};
  }

  std::vector<int> gaps;
  double totalHeight = 0.0;
  for (size_t i = 0; i < line.size(); i++) {
    totalHeight += line[i].bbox.height();
    if (i > 0) {
      gaps.push_back(line[i].bbox.x0 - line[i - 1].bbox.x1);
    }
  }
  const double avgHeight = totalHeight / line.size();

  std::vector<int> sortedGaps = gaps;
  std::sort(sortedGaps.begin(), sortedGaps.end());
  const double medianGap = sortedGaps[sortedGaps.size() / 2];

  const double softThreshold =
      std::max({medianGap * m_config.medianGapFactor,
                avgHeight * m_config.heightGapFactor,
                m_config.minGapThreshold});
  const double hardThreshold = avgHeight * m_config.hardGapFactor;

  std::vector<std::vector<RawWord>> columns;
  std::vector<RawWord> currentColumn{line.front()};

  for (size_t i = 1; i < line.size(); i++) {
    const double gap = gaps[i - 1];

    if (gap > softThreshold) {
      // A gap beyond the hard threshold is a stronger phrase break, but both
      // cases currently split the same way
      if (gap > hardThreshold) {
        columns.push_back(currentColumn);
        currentColumn = {line[i]};
      } else {
        columns.push_back(currentColumn);
        currentColumn = {line[i]};
      }
    } else {
      currentColumn.push_back(line[i]);
    }
  }
  columns.push_back(currentColumn);

  return columns;
}

ConsolidatedTextBox
TextLayoutGrouper::mergeColumn(const std::vector<RawWord> &column) {
  ConsolidatedTextBox box;
  if (column.empty()) {
    return box;
  }

  std::vector<BBox> bboxes;
  double confidenceSum = 0.0;
  for (const auto &word : column) {
    // No separator: correct for scripts without inter-word spacing
    box.text += word.text;
    bboxes.push_back(word.bbox);
    confidenceSum += word.confidence;
  }

  box.bbox = unionOf(bboxes);
  box.confidence = static_cast<float>(confidenceSum / column.size());
  return box;
}

std::vector<ConsolidatedTextBox> TextLayoutGrouper::resolveOverlaps(
    const std::vector<ConsolidatedTextBox> &boxes) {
  return boxes;
}

double TextLayoutGrouper::verticalOverlap(const BBox &a, const BBox &b) {
  const int minHeight = std::min(a.height(), b.height());
  if (minHeight <= 0) {
    return 0.0;
  }

  const int intersection =
      std::max(0, std::min(a.y1, b.y1) - std::max(a.y0, b.y0));
  return static_cast<double>(intersection) / minHeight;
}

std::string TextLayoutGrouper::cleanText(const std::string &text) {
  if (text.empty()) {
    return "";
  }

  std::u32string stripped;
  for (char32_t c : utf8::decode(text)) {
    if (!isControl(c)) {
      stripped.push_back(c);
    }
  }

  // Runs of 3+ identical symbols are usually background texture
  std::u32string collapsed;
  size_t i = 0;
  while (i < stripped.size()) {
    size_t j = i;
    while (j < stripped.size() && stripped[j] == stripped[i]) {
      j++;
    }
    const size_t run = j - i;
    if (run >= 3 && isCollapsible(stripped[i])) {
      collapsed.push_back(stripped[i]);
    } else {
      collapsed.append(stripped, i, run);
    }
    i = j;
  }

  const std::u32string trimmed = trim(collapsed);
  const bool hasContent =
      std::any_of(trimmed.begin(), trimmed.end(), utf8::isContent);
  if (!hasContent && !trimmed.empty() && trimmed.size() < 3) {
    return "";
  }

  std::u32string normalized;
  bool previousSpace = false;
  for (char32_t c : trimmed) {
    if (utf8::isSpace(c)) {
      if (!previousSpace) {
        normalized.push_back(U' ');
      }
      previousSpace = true;
    } else {
      normalized.push_back(c);
      previousSpace = false;
    }
  }

  return utf8::encode(normalized);
}

} // namespace textseg
