#ifndef __FT_CONTROL_FRAME_HPP__
#define __FT_CONTROL_FRAME_HPP__

#include "FTerminal.pb.h"
#include "Headers.hpp"

namespace ft {
/**
 * @brief A decoded client->server frame on the terminal endpoint.
 */
struct ControlFrame {
  enum class Kind {
    /** @brief {"type":"input"}: data is written to the shell. */
    INPUT,
    /** @brief {"type":"resize"}: size carries the new dimensions. */
    RESIZE,
    /** @brief {"type":"prompt_watcher"}: enabled carries the new state. */
    PROMPT_WATCHER,
    /** @brief Anything else: the whole frame is keystrokes. */
    RAW
  };

  Kind kind;
  string data;
  TerminalInfo size;
  /** @brief False for a resize with missing or zero dimensions. */
  bool sizeValid;
  bool enabled;

  ControlFrame() : kind(Kind::RAW), sizeValid(false), enabled(false) {}
};

/**
 * @brief Decodes a frame.  Never fails: frames that are not a well-formed
 * control object come back as RAW carrying the original bytes.
 */
ControlFrame parseControlFrame(const string& frame);

/** @brief {"type":"input","data":...} */
string encodeInputFrame(const string& data);

/** @brief {"type":"resize","rows":...,"cols":...} */
string encodeResizeFrame(const TerminalInfo& size);

/** @brief {"type":"prompt_watcher","data":"enable"|"disable"} */
string encodePromptWatcherFrame(bool enabled);
}  // namespace ft

#endif  // __FT_CONTROL_FRAME_HPP__
