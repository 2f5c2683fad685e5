#include "RawSocketUtils.hpp"

namespace ft {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EINTR) {
        continue;
      }
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      VLOG(1) << "Cannot write to fd " << fd << ": " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to descriptor: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to descriptor: closed");
    }
    bytesWritten += rc;
  }
}

bool RawSocketUtils::waitOnData(int fd, int timeoutMs) {
#ifdef WIN32
  WSAPOLLFD pfd;
  pfd.fd = SOCKET(fd);
  pfd.events = POLLRDNORM;
  pfd.revents = 0;
  int rc = ::WSAPoll(&pfd, 1, timeoutMs);
#else
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int rc = ::poll(&pfd, 1, timeoutMs);
#endif
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw std::runtime_error(string("poll failed: ") + strerror(GetErrno()));
  }
  return rc > 0;
}
}  // namespace ft
