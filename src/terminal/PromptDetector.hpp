#ifndef __FT_PROMPT_DETECTOR_HPP__
#define __FT_PROMPT_DETECTOR_HPP__

#include "Headers.hpp"

namespace ft {
enum class PromptResponse {
  NONE,
  /** @brief Press return on the already selected option. */
  ACKNOWLEDGE,
  /** @brief Type y and press return. */
  AFFIRM
};

enum class PromptConfidence { NONE, LOW, MEDIUM, HIGH };

/**
 * @brief Whether recent terminal output looks like a confirmation prompt.
 */
struct PromptDetection {
  bool waiting;
  PromptResponse responseType;
  PromptConfidence confidence;

  PromptDetection()
      : waiting(false),
        responseType(PromptResponse::NONE),
        confidence(PromptConfidence::NONE) {}
  PromptDetection(bool _waiting, PromptResponse _responseType,
                  PromptConfidence _confidence)
      : waiting(_waiting),
        responseType(_responseType),
        confidence(_confidence) {}

  /** @brief Only medium and high confidence detections are acted on. */
  bool shouldAutoRespond() const {
    return waiting && (confidence == PromptConfidence::MEDIUM ||
                       confidence == PromptConfidence::HIGH);
  }

  /** @brief "\r" to acknowledge, "y\r" to affirm, "" otherwise. */
  string responseKeys() const;
};

/**
 * @brief Classifies a rolling window of terminal output.
 *
 * Stateless.  Two passes run over the ANSI-stripped text: a yes/no pass over
 * the last few non-blank lines, which wins outright when it matches, and a
 * menu-selection pass that looks for an already highlighted "Yes" option and
 * grades it by corroborating text:
 *
 *   marker + (instructions or frame) [+ question] -> HIGH
 *   marker + question                              -> MEDIUM
 *   marker alone                                   -> LOW
 */
class PromptDetector {
 public:
  /** @brief Texts shorter than this many characters are never prompts. */
  static const size_t MIN_TEXT_LENGTH = 10;
  /** @brief How many trailing non-blank lines the yes/no pass examines. */
  static const size_t YES_NO_LINES = 5;

  static PromptDetection detect(const string& buffer);

  /** @brief Removes CSI, OSC and two-byte escape sequences. */
  static string stripAnsi(const string& text);

  static PromptDetection detectYesNo(const string& text);
  static PromptDetection detectMenu(const string& text);

  /** @brief Number of UTF-8 code points in text. */
  static size_t countCharacters(const string& text);
};
}  // namespace ft

#endif  // __FT_PROMPT_DETECTOR_HPP__
