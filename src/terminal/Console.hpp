#ifndef __FT_CONSOLE_HPP__
#define __FT_CONSOLE_HPP__

#include "FTerminal.pb.h"
#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace ft {
/**
 * @brief The local terminal that ftclient draws into.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current rows/columns of the local terminal. */
  virtual TerminalInfo getTerminalInfo() = 0;
  /** @brief Puts the terminal into the mode the client needs. */
  virtual void setup() = 0;
  /** @brief Restores whatever setup() changed. */
  virtual void teardown() = 0;
  virtual int getInputFd() = 0;
  virtual int getOutputFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getOutputFd(), s.data(), s.length());
  }
};
}  // namespace ft

#endif  // __FT_CONSOLE_HPP__
