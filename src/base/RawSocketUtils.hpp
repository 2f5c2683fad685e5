#ifndef __FT_RAW_SOCKET_UTILS__
#define __FT_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Blocking helpers for raw descriptors (pty masters, the local tty).
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer, retrying on EAGAIN/EINTR.
   * @throws std::runtime_error when the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Waits up to timeoutMs for the descriptor to become readable.
   * @return true when a read will not block (data, EOF or an error is
   * pending), false on timeout.
   */
  static bool waitOnData(int fd, int timeoutMs);
};
}  // namespace ft
#endif  // __FT_RAW_SOCKET_UTILS__
