#include "PromptDetector.hpp"

#include <regex>

namespace ft {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';

vector<string> nonBlankLines(const string& text) {
  vector<string> lines;
  for (const auto& line : split(text, '\n')) {
    string trimmed = trim(line);
    if (!trimmed.empty()) {
      lines.push_back(trimmed);
    }
  }
  return lines;
}

const std::regex& yesNoSuffix() {
  static const std::regex pattern(
      "[\\(\\[]\\s*y(es)?\\s*/\\s*n(o)?\\s*[\\)\\]]\\s*[:?]?$");
  return pattern;
}

const std::regex& areYouSure() {
  static const std::regex pattern("are you sure.*\\?$");
  return pattern;
}

const std::regex& bareYesNo() {
  static const std::regex pattern("(^|[^a-z])y/n\\s*[:?]?$");
  return pattern;
}

const std::regex& selectedYes() {
  static const std::regex pattern(
      "(❯|›|▶|→|>|●|◉|\\(•\\)|\\(\\*\\))\\s*(\\d+[.)]?\\s*)?yes([^a-z]|$)");
  return pattern;
}

const std::regex& instructions() {
  static const std::regex pattern(
      "arrow keys|enter to (select|confirm)|number keys|esc to cancel|↑/↓");
  return pattern;
}

const std::regex& frame() {
  static const std::regex pattern(
      "╭|╮|╰|╯|│|─|┌|┐|└|┘|║|═|remaining requests");
  return pattern;
}
}  // namespace

string PromptDetection::responseKeys() const {
  switch (responseType) {
    case PromptResponse::ACKNOWLEDGE:
      return "\r";
    case PromptResponse::AFFIRM:
      return "y\r";
    default:
      return "";
  }
}

PromptDetection PromptDetector::detect(const string& buffer) {
  string text = stripAnsi(buffer);
  if (countCharacters(text) < MIN_TEXT_LENGTH) {
    return PromptDetection();
  }
  text = asciiToLower(text);

  PromptDetection yesNo = detectYesNo(text);
  if (yesNo.waiting) {
    return yesNo;
  }
  return detectMenu(text);
}

string PromptDetector::stripAnsi(const string& text) {
  string result;
  result.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != ESC) {
      result.push_back(text[i]);
      i++;
      continue;
    }
    if (i + 1 >= text.size()) {
      break;
    }
    char kind = text[i + 1];
    if (kind == '[') {
      // CSI: parameter and intermediate bytes, then one final byte.
      i += 2;
      while (i < text.size() && (text[i] < 0x40 || text[i] > 0x7e)) {
        i++;
      }
      i++;
    } else if (kind == ']') {
      // OSC: runs to BEL or ST (ESC \).
      i += 2;
      while (i < text.size()) {
        if (text[i] == BEL) {
          i++;
          break;
        }
        if (text[i] == ESC && i + 1 < text.size() && text[i + 1] == '\\') {
          i += 2;
          break;
        }
        i++;
      }
    } else if (kind == '(' || kind == ')') {
      // Character set designation takes one more byte.
      i += 3;
    } else {
      i += 2;
    }
  }
  return result;
}

PromptDetection PromptDetector::detectYesNo(const string& text) {
  auto lines = nonBlankLines(text);
  size_t first = lines.size() > YES_NO_LINES ? lines.size() - YES_NO_LINES : 0;
  for (size_t a = first; a < lines.size(); a++) {
    const string& line = lines[a];
    if (std::regex_search(line, yesNoSuffix()) ||
        std::regex_search(line, areYouSure()) ||
        std::regex_search(line, bareYesNo())) {
      VLOG(2) << "Yes/no prompt: " << line;
      return PromptDetection(true, PromptResponse::AFFIRM,
                             PromptConfidence::HIGH);
    }
  }
  return PromptDetection();
}

PromptDetection PromptDetector::detectMenu(const string& text) {
  if (!std::regex_search(text, selectedYes())) {
    return PromptDetection();
  }
  bool instructional = std::regex_search(text, instructions());
  bool framed = std::regex_search(text, frame());
  bool question = false;
  for (const auto& line : nonBlankLines(text)) {
    if (line.back() == '?') {
      question = true;
      break;
    }
  }

  PromptConfidence confidence = PromptConfidence::LOW;
  if (instructional || framed) {
    confidence = PromptConfidence::HIGH;
  } else if (question) {
    confidence = PromptConfidence::MEDIUM;
  }
  VLOG(2) << "Menu prompt: instructional=" << instructional
          << " framed=" << framed << " question=" << question;
  return PromptDetection(true, PromptResponse::ACKNOWLEDGE, confidence);
}

size_t PromptDetector::countCharacters(const string& text) {
  size_t count = 0;
  for (auto c : text) {
    // Skip UTF-8 continuation bytes.
    if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      count++;
    }
  }
  return count;
}
}  // namespace ft
