#include "SessionRegistry.hpp"

#include "ShellResolver.hpp"

namespace ft {
SessionRegistry::SessionRegistry(const ShellSettings& _shellSettings,
                                 AdapterFactory _adapterFactory)
    : shellSettings(_shellSettings), adapterFactory(_adapterFactory) {
  if (!adapterFactory) {
    adapterFactory = createProcessAdapter;
  }
}

shared_ptr<TerminalSession> SessionRegistry::createSession(
    shared_ptr<FrameSocket> socket, const TerminalInfo& initialSize) {
  string id = sole::uuid4().str();
  ShellLaunch launch = ShellResolver::resolve(shellSettings);
  LOG(INFO) << "Creating session " << id << " with " << launch.program();

  auto adapter = adapterFactory();
  try {
    adapter->spawn(launch, initialSize);
  } catch (const std::runtime_error& re) {
    adapter->close();
    LOG(WARNING) << "Failed to start " << launch.program() << " for session "
                 << id << ": " << re.what();
    throw;
  }

  auto session =
      make_shared<TerminalSession>(id, adapter, socket, initialSize);
  lock_guard<mutex> guard(registryMutex);
  sessions[id] = session;
  return session;
}

void SessionRegistry::runSession(shared_ptr<TerminalSession> session,
                                 const string& banner) {
  session->run(banner);
  removeSession(session->getId());
}

shared_ptr<TerminalSession> SessionRegistry::getSession(const string& id) {
  lock_guard<mutex> guard(registryMutex);
  auto it = sessions.find(id);
  if (it == sessions.end() || it->second->isFinished()) {
    return nullptr;
  }
  return it->second;
}

bool SessionRegistry::closeSession(const string& id) {
  auto session = getSession(id);
  if (!session) {
    return false;
  }
  session->shutdown();
  return true;
}

void SessionRegistry::closeAll() {
  vector<shared_ptr<TerminalSession>> toClose;
  {
    lock_guard<mutex> guard(registryMutex);
    for (auto& it : sessions) {
      toClose.push_back(it.second);
    }
  }
  for (auto& it : toClose) {
    it->shutdown();
  }
}

InjectStatus SessionRegistry::injectCommand(const string& id,
                                            const string& command) {
  auto session = getSession(id);
  if (!session) {
    VLOG(1) << "Command for unknown session " << id;
    return InjectStatus::SESSION_NOT_FOUND;
  }
  try {
    session->writeCommand(command);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Command injection into " << id << " failed: " << re.what();
    return InjectStatus::WRITE_FAILED;
  }
  return InjectStatus::INJECTED;
}

size_t SessionRegistry::getSessionCount() {
  lock_guard<mutex> guard(registryMutex);
  return sessions.size();
}

void SessionRegistry::removeSession(const string& id) {
  lock_guard<mutex> guard(registryMutex);
  sessions.erase(id);
  LOG(INFO) << "Session " << id << " removed, " << sessions.size()
            << " remaining";
}
}  // namespace ft
