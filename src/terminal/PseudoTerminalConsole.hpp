#ifndef __FT_PSEUDO_TERMINAL_CONSOLE_HPP__
#define __FT_PSEUDO_TERMINAL_CONSOLE_HPP__

#include "Console.hpp"

namespace ft {
/**
 * @brief Console backed by the controlling tty.  setup() switches it to raw
 * mode so keystrokes (ctrl-c included) reach the remote shell untouched.
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : rawMode(false) {
    tcgetattr(STDIN_FILENO, &terminalBackup);
  }

  virtual ~PseudoTerminalConsole() {
    if (rawMode) {
      teardown();
    }
  }

  virtual void setup() {
    termios terminalLocal;
    tcgetattr(STDIN_FILENO, &terminalLocal);
    memcpy(&terminalBackup, &terminalLocal, sizeof(struct termios));
    cfmakeraw(&terminalLocal);
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalLocal);
    rawMode = true;
  }

  virtual void teardown() {
    tcsetattr(STDIN_FILENO, TCSANOW, &terminalBackup);
    rawMode = false;
  }

  virtual TerminalInfo getTerminalInfo() {
    winsize win;
    TerminalInfo ti;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == -1) {
      // Not a tty (e.g. piped); report nothing so no resize is sent.
      ti.set_row(0);
      ti.set_column(0);
      return ti;
    }
    ti.set_row(win.ws_row);
    ti.set_column(win.ws_col);
    return ti;
  }

  virtual int getInputFd() { return STDIN_FILENO; }
  virtual int getOutputFd() { return STDOUT_FILENO; }

 protected:
  termios terminalBackup;
  bool rawMode;
};
}  // namespace ft

#endif  // __FT_PSEUDO_TERMINAL_CONSOLE_HPP__
