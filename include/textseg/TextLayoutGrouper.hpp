#ifndef TEXTSEG_TEXT_LAYOUT_GROUPER_HPP
#define TEXTSEG_TEXT_LAYOUT_GROUPER_HPP

#include "textseg/Config.hpp"
#include "textseg/Geometry.hpp"

#include <string>
#include <vector>

namespace textseg {

/**
 * @brief Groups recognizer words into one text box per logical phrase
 *
 * Words are filtered, grouped into lines by vertical overlap, and each line
 * is split into columns at unusually wide horizontal gaps. Every column
 * becomes one ConsolidatedTextBox.
 *
 * When line-level results are available and contain CJK text, the lines
 * are used as they are: recognizers segment CJK words unreliably.
 */
class TextLayoutGrouper {
public:
  explicit TextLayoutGrouper(const LayoutConfig &config = LayoutConfig());

  /**
   * @brief Consolidate recognizer output into text boxes
   * @param words Word-level results
   * @param lines Line-level results, empty if the recognizer has none
   * @return One box per column of every line, in line order
   */
  std::vector<ConsolidatedTextBox>
  group(const std::vector<RawWord> &words,
        const std::vector<RawWord> &lines = std::vector<RawWord>()) const;

  /**
   * @brief Drop empty, low-confidence, rule-shaped and speck-sized words
   */
  std::vector<RawWord> prefilter(const std::vector<RawWord> &words) const;

  /**
   * @brief Group words into lines
   *
   * Words are visited by increasing y0. A word joins the current line when
   * its vertical overlap with the line's most recent word is strictly
   * greater than the configured ratio. Each line is sorted by x0.
   */
  std::vector<std::vector<RawWord>>
  groupIntoLines(const std::vector<RawWord> &words) const;

  /**
   * @brief Split a line (sorted by x0) into columns at wide gaps
   */
  std::vector<std::vector<RawWord>>
  splitLineIntoColumns(const std::vector<RawWord> &line) const;

  /**
   * @brief Merge the words of one column
   *
   * Texts are concatenated without a separator, boxes are united and
   * confidences averaged.
   */
  static ConsolidatedTextBox mergeColumn(const std::vector<RawWord> &column);

  /**
   * @brief Resolve overlaps between final boxes
   *
   * Currently returns its input unchanged.
   */
  static std::vector<ConsolidatedTextBox>
  resolveOverlaps(const std::vector<ConsolidatedTextBox> &boxes);

  /**
   * @brief Intersection height divided by the smaller of the two heights
   */
  static double verticalOverlap(const BBox &a, const BBox &b);

  /**
   * @brief Remove recognizer noise from a text
   *
   * Strips control characters, collapses runs of three or more identical
   * symbols into one, returns an empty string for one or two symbols
   * without any letter, digit or CJK character, and normalizes whitespace.
   */
  static std::string cleanText(const std::string &text);

  const LayoutConfig &getConfig() const;

private:
  LayoutConfig m_config;
};

} // namespace textseg

#endif // TEXTSEG_TEXT_LAYOUT_GROUPER_HPP
