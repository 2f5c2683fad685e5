#ifndef __FT_FAKE_PROCESS_ADAPTER_HPP__
#define __FT_FAKE_PROCESS_ADAPTER_HPP__

#include "ProcessAdapter.hpp"

namespace ft {
/**
 * @brief ProcessAdapter with a scripted shell: tests push the output it
 * produces and read back the input it received.
 */
class FakeProcessAdapter : public ProcessAdapter {
 public:
  FakeProcessAdapter()
      : spawned(false),
        ended(false),
        closeCount(0),
        terminateCount(0),
        lateWriteCount(0),
        failSpawn(false) {}

  virtual void spawn(const ShellLaunch& launch, const TerminalInfo& size) {
    lock_guard<mutex> guard(adapterMutex);
    if (failSpawn) {
      throw std::runtime_error("No such file or directory");
    }
    spawned = true;
    lastLaunch = launch;
    spawnSize = size;
  }

  virtual ReadStatus read(string* data) {
    unique_lock<mutex> lock(adapterMutex);
    adapterCondition.wait_for(lock, std::chrono::milliseconds(20), [this] {
      return !output.empty() || ended || closeCount > 0;
    });
    if (!output.empty()) {
      *data = output.front();
      output.pop_front();
      return ReadStatus::DATA;
    }
    if (ended || closeCount > 0) {
      return ReadStatus::END;
    }
    return ReadStatus::TIMEOUT;
  }

  virtual void write(const string& data) {
    lock_guard<mutex> guard(adapterMutex);
    if (closeCount > 0) {
      lateWriteCount++;
      throw std::runtime_error("Process handles are released");
    }
    if (ended) {
      throw std::runtime_error("Process is not running");
    }
    input += data;
  }

  virtual void resize(const TerminalInfo& size) {
    lock_guard<mutex> guard(adapterMutex);
    resizes.push_back(size);
  }

  virtual void terminate() {
    lock_guard<mutex> guard(adapterMutex);
    terminateCount++;
    ended = true;
    adapterCondition.notify_all();
  }

  virtual void close() {
    lock_guard<mutex> guard(adapterMutex);
    closeCount++;
    adapterCondition.notify_all();
  }

  virtual bool isAlive() {
    lock_guard<mutex> guard(adapterMutex);
    return spawned && !ended && closeCount == 0;
  }

  virtual int64_t getPid() {
    lock_guard<mutex> guard(adapterMutex);
    return spawned ? 4242 : -1;
  }

  void pushOutput(const string& data) {
    lock_guard<mutex> guard(adapterMutex);
    output.push_back(data);
    adapterCondition.notify_all();
  }

  /** @brief The shell exits once its pending output has been read. */
  void endProcess() {
    lock_guard<mutex> guard(adapterMutex);
    ended = true;
    adapterCondition.notify_all();
  }

  void setFailSpawn(bool fail) {
    lock_guard<mutex> guard(adapterMutex);
    failSpawn = fail;
  }

  string getInput() {
    lock_guard<mutex> guard(adapterMutex);
    return input;
  }

  vector<TerminalInfo> getResizes() {
    lock_guard<mutex> guard(adapterMutex);
    return resizes;
  }

  int getCloseCount() {
    lock_guard<mutex> guard(adapterMutex);
    return closeCount;
  }

  int getTerminateCount() {
    lock_guard<mutex> guard(adapterMutex);
    return terminateCount;
  }

  /** @brief Writes that reached the adapter after close(). */
  int getLateWriteCount() {
    lock_guard<mutex> guard(adapterMutex);
    return lateWriteCount;
  }

  bool isSpawned() {
    lock_guard<mutex> guard(adapterMutex);
    return spawned;
  }

  ShellLaunch getLastLaunch() {
    lock_guard<mutex> guard(adapterMutex);
    return lastLaunch;
  }

  TerminalInfo getSpawnSize() {
    lock_guard<mutex> guard(adapterMutex);
    return spawnSize;
  }

 protected:
  mutex adapterMutex;
  std::condition_variable adapterCondition;
  bool spawned;
  bool ended;
  int closeCount;
  int terminateCount;
  int lateWriteCount;
  bool failSpawn;
  deque<string> output;
  string input;
  vector<TerminalInfo> resizes;
  ShellLaunch lastLaunch;
  TerminalInfo spawnSize;
};
}  // namespace ft

#endif  // __FT_FAKE_PROCESS_ADAPTER_HPP__
