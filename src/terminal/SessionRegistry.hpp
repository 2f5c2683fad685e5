#ifndef __FT_SESSION_REGISTRY_HPP__
#define __FT_SESSION_REGISTRY_HPP__

#include "Headers.hpp"
#include "ProcessAdapter.hpp"
#include "TerminalSession.hpp"

namespace ft {
enum class InjectStatus { INJECTED, SESSION_NOT_FOUND, WRITE_FAILED };

/**
 * @brief Thread-safe map from session id to the live terminal sessions.
 *
 * Only the registry touches the map.  A session stays registered until run()
 * has released its process, so a registered id never points at a closed
 * adapter.
 */
class SessionRegistry {
 public:
  typedef std::function<shared_ptr<ProcessAdapter>()> AdapterFactory;

  explicit SessionRegistry(const ShellSettings& _shellSettings,
                           AdapterFactory _adapterFactory = AdapterFactory());

  /**
   * @brief Spawns the configured shell and registers a session for it.
   * @throws std::runtime_error when the shell cannot be started.  Nothing is
   * registered in that case.
   */
  shared_ptr<TerminalSession> createSession(shared_ptr<FrameSocket> socket,
                                            const TerminalInfo& initialSize);

  /**
   * @brief Runs the session to completion on the calling thread, then
   * removes it.
   */
  void runSession(shared_ptr<TerminalSession> session, const string& banner);

  /** @brief nullptr when the id is unknown or the session already ended. */
  shared_ptr<TerminalSession> getSession(const string& id);

  /** @brief Asks the session to end.  Returns false for an unknown id. */
  bool closeSession(const string& id);

  void closeAll();

  /** @brief Types command + newline into a session's shell. */
  InjectStatus injectCommand(const string& id, const string& command);

  size_t getSessionCount();

  const ShellSettings& getShellSettings() { return shellSettings; }

 protected:
  void removeSession(const string& id);

  ShellSettings shellSettings;
  AdapterFactory adapterFactory;
  mutex registryMutex;
  unordered_map<string, shared_ptr<TerminalSession>> sessions;
};
}  // namespace ft

#endif  // __FT_SESSION_REGISTRY_HPP__
