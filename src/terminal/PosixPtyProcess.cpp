#include "PosixPtyProcess.hpp"

#include "RawSocketUtils.hpp"

namespace ft {
namespace {
const int READ_WAIT_MS = 100;
const int BUF_SIZE = 16 * 1024;

winsize toWinsize(const TerminalInfo& size) {
  winsize win;
  win.ws_row = size.row() > 0 ? size.row() : 24;
  win.ws_col = size.column() > 0 ? size.column() : 80;
  win.ws_xpixel = 0;
  win.ws_ypixel = 0;
  return win;
}
}  // namespace

shared_ptr<ProcessAdapter> createProcessAdapter() {
  return shared_ptr<ProcessAdapter>(new PosixPtyProcess());
}

PosixPtyProcess::PosixPtyProcess() : pid(-1), masterFd(-1), reaped(false) {}

PosixPtyProcess::~PosixPtyProcess() { close(); }

void PosixPtyProcess::spawn(const ShellLaunch& launch,
                            const TerminalInfo& size) {
  if (pid > 0) {
    STFATAL << "Tried to spawn a process twice on the same adapter";
  }
  if (launch.program().empty()) {
    throw std::runtime_error("No shell program to launch");
  }

  // Everything the child needs is prepared before forking.
  vector<string> args;
  args.push_back(launch.program());
  for (const auto& it : launch.arguments()) {
    args.push_back(it);
  }
  vector<char*> argv;
  for (auto& it : args) {
    argv.push_back(&it[0]);
  }
  argv.push_back(NULL);
  winsize win = toWinsize(size);

  // The child reports a failed chdir/exec through this pipe.  A successful
  // exec closes it (O_CLOEXEC) and the parent reads EOF.
  int errorPipe[2];
  FATAL_FAIL(::pipe(errorPipe));
  FATAL_FAIL(::fcntl(errorPipe[0], F_SETFD, FD_CLOEXEC));
  FATAL_FAIL(::fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  int fd = -1;
  pid_t child = forkpty(&fd, NULL, NULL, &win);
  if (child == -1) {
    auto localErrno = GetErrno();
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw std::runtime_error(string("forkpty failed: ") +
                             strerror(localErrno));
  }
  if (child == 0) {
    ::close(errorPipe[0]);
    if (!launch.working_directory().empty() &&
        ::chdir(launch.working_directory().c_str()) == -1) {
      int localErrno = errno;
      ssize_t ignored = ::write(errorPipe[1], &localErrno, sizeof(localErrno));
      (void)ignored;
      _exit(127);
    }
    for (int a = 0; a < launch.environment_names_size() &&
                    a < launch.environment_values_size();
         a++) {
      ::setenv(launch.environment_names(a).c_str(),
               launch.environment_values(a).c_str(), 1);
    }
    ::setenv("FT_VERSION", FT_VERSION, 1);
    // Shells remember the inherited SIGCHLD disposition as the original one,
    // so it has to be the default before exec.
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    // The signal mask survives exec.  ftserver blocks SIGINT/SIGTERM for its
    // signal watcher, and the shell must not inherit that.
    sigset_t emptyMask;
    sigemptyset(&emptyMask);
    sigprocmask(SIG_SETMASK, &emptyMask, NULL);
    ::execvp(argv[0], &argv[0]);
    int localErrno = errno;
    ssize_t ignored = ::write(errorPipe[1], &localErrno, sizeof(localErrno));
    (void)ignored;
    _exit(127);
  }

  ::close(errorPipe[1]);
  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  {
    lock_guard<recursive_mutex> guard(stateMutex);
    masterFd = fd;
    reaped = false;
    pid = child;
  }
  if (bytesRead == sizeof(childErrno)) {
    close();
    throw std::runtime_error("Could not start " + launch.program() + ": " +
                             strerror(childErrno));
  }
  VLOG(1) << "Spawned " << launch.program() << " as pid " << child
          << " on pty fd " << fd;
}

ProcessAdapter::ReadStatus PosixPtyProcess::read(string* data) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    fd = masterFd;
  }
  if (fd < 0) {
    return ReadStatus::END;
  }
  if (!RawSocketUtils::waitOnData(fd, READ_WAIT_MS)) {
    return ReadStatus::TIMEOUT;
  }
  char buf[BUF_SIZE];
  ssize_t rc = ::read(fd, buf, BUF_SIZE);
  if (rc > 0) {
    data->assign(buf, rc);
    return ReadStatus::DATA;
  }
  if (rc == 0) {
    return ReadStatus::END;
  }
  auto localErrno = GetErrno();
  if (localErrno == EINTR || localErrno == EAGAIN) {
    return ReadStatus::TIMEOUT;
  }
  if (localErrno == EIO) {
    // Linux reports a hung-up pty master as EIO once the child is gone.
    return ReadStatus::END;
  }
  throw std::runtime_error(string("Error reading from pty: ") +
                           strerror(localErrno));
}

void PosixPtyProcess::write(const string& data) {
  int fd;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    fd = masterFd;
  }
  if (fd < 0) {
    throw std::runtime_error("Process is not running");
  }
  RawSocketUtils::writeAll(fd, data.c_str(), data.length());
}

void PosixPtyProcess::resize(const TerminalInfo& size) {
  if (pid <= 0) {
    STFATAL << "Tried to resize a process that was never spawned";
  }
  lock_guard<recursive_mutex> guard(stateMutex);
  if (masterFd < 0) {
    return;
  }
  winsize win = toWinsize(size);
  if (::ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw std::runtime_error(string("Could not resize pty: ") +
                             strerror(GetErrno()));
  }
}

void PosixPtyProcess::terminate() {
  if (pid <= 0) {
    return;
  }
  lock_guard<recursive_mutex> guard(stateMutex);
  if (!reaped) {
    ::kill(pid, SIGKILL);
  }
}

void PosixPtyProcess::close() {
  pid_t child = pid;
  if (child > 0) {
    lock_guard<recursive_mutex> guard(stateMutex);
    if (!reaped) {
      // Killing first makes any writer blocked on the pty fail fast.
      ::kill(child, SIGKILL);
    }
  }
  lock_guard<recursive_mutex> guard(stateMutex);
  if (masterFd >= 0) {
    ::close(masterFd);
    masterFd = -1;
  }
  if (child > 0) {
    reap(true);
  }
}

bool PosixPtyProcess::isAlive() {
  if (pid <= 0) {
    return false;
  }
  lock_guard<recursive_mutex> guard(stateMutex);
  reap(false);
  return !reaped;
}

void PosixPtyProcess::reap(bool block) {
  if (reaped) {
    return;
  }
  int status;
  while (true) {
    pid_t rc = ::waitpid(pid, &status, block ? 0 : WNOHANG);
    if (rc == -1 && GetErrno() == EINTR) {
      continue;
    }
    if (rc == pid || (rc == -1 && GetErrno() == ECHILD)) {
      VLOG(1) << "Reaped pid " << pid;
      reaped = true;
    }
    return;
  }
}
}  // namespace ft
