#include "ConPtyProcess.hpp"

namespace ft {
namespace {
const int READ_WAIT_MS = 100;
const int POLL_STEP_MS = 10;
const DWORD BUF_SIZE = 16 * 1024;

COORD toCoord(const TerminalInfo& size) {
  COORD c;
  c.X = SHORT(size.column() > 0 ? size.column() : 80);
  c.Y = SHORT(size.row() > 0 ? size.row() : 24);
  return c;
}

std::wstring widen(const string& s) {
  std::wstring_convert<std::codecvt_utf8_utf16<wchar_t>> converter;
  return converter.from_bytes(s);
}

// Quotes one argument the way CommandLineToArgvW splits it back apart.
std::wstring quoteArgument(const std::wstring& arg) {
  if (!arg.empty() && arg.find_first_of(L" \t\"") == std::wstring::npos) {
    return arg;
  }
  std::wstring quoted = L"\"";
  int backslashes = 0;
  for (auto c : arg) {
    if (c == L'\\') {
      backslashes++;
      continue;
    }
    if (c == L'"') {
      quoted.append(backslashes * 2 + 1, L'\\');
    } else {
      quoted.append(backslashes, L'\\');
    }
    backslashes = 0;
    quoted.push_back(c);
  }
  quoted.append(backslashes * 2, L'\\');
  quoted.push_back(L'"');
  return quoted;
}

// Current environment plus the launch overrides, as a double-null-terminated
// UTF-16 block.
std::wstring buildEnvironmentBlock(const ShellLaunch& launch) {
  map<std::wstring, std::wstring> overrides;
  for (int a = 0; a < launch.environment_names_size() &&
                  a < launch.environment_values_size();
       a++) {
    overrides[widen(launch.environment_names(a))] =
        widen(launch.environment_values(a));
  }
  std::wstring block;
  LPWCH current = GetEnvironmentStringsW();
  if (current) {
    for (LPWCH entry = current; *entry; entry += wcslen(entry) + 1) {
      std::wstring line(entry);
      auto equals = line.find(L'=', 1);
      if (equals != std::wstring::npos &&
          overrides.find(line.substr(0, equals)) != overrides.end()) {
        continue;
      }
      block.append(line);
      block.push_back(L'\0');
    }
    FreeEnvironmentStringsW(current);
  }
  for (const auto& it : overrides) {
    block.append(it.first + L"=" + it.second);
    block.push_back(L'\0');
  }
  block.push_back(L'\0');
  return block;
}
}  // namespace

shared_ptr<ProcessAdapter> createProcessAdapter() {
  return shared_ptr<ProcessAdapter>(new ConPtyProcess());
}

ConPtyProcess::ConPtyProcess()
    : hPC(NULL),
      inputWriteSide(INVALID_HANDLE_VALUE),
      outputReadSide(INVALID_HANDLE_VALUE),
      processHandle(INVALID_HANDLE_VALUE),
      processId(-1),
      spawned(false) {}

ConPtyProcess::~ConPtyProcess() { close(); }

void ConPtyProcess::spawn(const ShellLaunch& launch, const TerminalInfo& size) {
  lock_guard<recursive_mutex> guard(stateMutex);
  if (spawned) {
    STFATAL << "Tried to spawn a process twice on the same adapter";
  }
  if (launch.program().empty()) {
    throw std::runtime_error("No shell program to launch");
  }

  HANDLE inputReadSide = INVALID_HANDLE_VALUE;
  HANDLE outputWriteSide = INVALID_HANDLE_VALUE;
  if (!CreatePipe(&inputReadSide, &inputWriteSide, NULL, 0) ||
      !CreatePipe(&outputReadSide, &outputWriteSide, NULL, 0)) {
    auto error = WinErrnoToString();
    closeHandle(&inputReadSide);
    closeHandle(&outputWriteSide);
    close();
    throw std::runtime_error("Could not create pseudo console pipes: " +
                             error);
  }

  HRESULT hr = CreatePseudoConsole(toCoord(size), inputReadSide,
                                   outputWriteSide, 0, &hPC);
  // The pseudo console owns duplicates of these now.
  closeHandle(&inputReadSide);
  closeHandle(&outputWriteSide);
  if (FAILED(hr)) {
    hPC = NULL;
    close();
    throw std::runtime_error("CreatePseudoConsole failed");
  }

  STARTUPINFOEXW si;
  ZeroMemory(&si, sizeof(si));
  si.StartupInfo.cb = sizeof(STARTUPINFOEXW);
  SIZE_T bytesRequired = 0;
  InitializeProcThreadAttributeList(NULL, 1, 0, &bytesRequired);
  vector<char> attributeBuffer(bytesRequired);
  si.lpAttributeList = (PPROC_THREAD_ATTRIBUTE_LIST)&attributeBuffer[0];
  if (!InitializeProcThreadAttributeList(si.lpAttributeList, 1, 0,
                                         &bytesRequired) ||
      !UpdateProcThreadAttribute(si.lpAttributeList, 0,
                                 PROC_THREAD_ATTRIBUTE_PSEUDOCONSOLE, hPC,
                                 sizeof(hPC), NULL, NULL)) {
    auto error = WinErrnoToString();
    close();
    throw std::runtime_error("Could not attach pseudo console: " + error);
  }

  std::wstring commandLine = quoteArgument(widen(launch.program()));
  for (const auto& it : launch.arguments()) {
    commandLine += L" " + quoteArgument(widen(it));
  }
  std::wstring environment = buildEnvironmentBlock(launch);
  std::wstring workingDirectory = widen(launch.working_directory());

  PROCESS_INFORMATION pi;
  ZeroMemory(&pi, sizeof(pi));
  BOOL created = CreateProcessW(
      NULL, &commandLine[0], NULL, NULL, FALSE,
      EXTENDED_STARTUPINFO_PRESENT | CREATE_UNICODE_ENVIRONMENT,
      &environment[0],
      workingDirectory.empty() ? NULL : workingDirectory.c_str(),
      &si.StartupInfo, &pi);
  DeleteProcThreadAttributeList(si.lpAttributeList);
  if (!created) {
    auto error = WinErrnoToString();
    close();
    throw std::runtime_error("Could not start " + launch.program() + ": " +
                             error);
  }
  CloseHandle(pi.hThread);
  processHandle = pi.hProcess;
  processId = pi.dwProcessId;
  spawned = true;
  VLOG(1) << "Spawned " << launch.program() << " as pid " << processId;
}

ProcessAdapter::ReadStatus ConPtyProcess::read(string* data) {
  HANDLE output;
  HANDLE process;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    output = outputReadSide;
    process = processHandle;
  }
  if (output == INVALID_HANDLE_VALUE) {
    return ReadStatus::END;
  }
  // Anonymous pipes have no overlapped reads, so peek until data shows up.
  for (int waited = 0; waited < READ_WAIT_MS; waited += POLL_STEP_MS) {
    DWORD available = 0;
    if (!PeekNamedPipe(output, NULL, 0, NULL, &available, NULL)) {
      if (GetLastError() == ERROR_BROKEN_PIPE) {
        return ReadStatus::END;
      }
      throw std::runtime_error("Error reading from pseudo console: " +
                               WinErrnoToString());
    }
    if (available > 0) {
      char buf[BUF_SIZE];
      DWORD bytesRead = 0;
      if (!ReadFile(output, buf, std::min(available, BUF_SIZE), &bytesRead,
                    NULL)) {
        if (GetLastError() == ERROR_BROKEN_PIPE) {
          return ReadStatus::END;
        }
        throw std::runtime_error("Error reading from pseudo console: " +
                                 WinErrnoToString());
      }
      data->assign(buf, bytesRead);
      return ReadStatus::DATA;
    }
    // The pseudo console keeps the pipe open after the shell exits.
    if (process != INVALID_HANDLE_VALUE &&
        WaitForSingleObject(process, 0) == WAIT_OBJECT_0) {
      return ReadStatus::END;
    }
    Sleep(POLL_STEP_MS);
  }
  return ReadStatus::TIMEOUT;
}

void ConPtyProcess::write(const string& data) {
  HANDLE input;
  {
    lock_guard<recursive_mutex> guard(stateMutex);
    input = inputWriteSide;
  }
  if (input == INVALID_HANDLE_VALUE) {
    throw std::runtime_error("Process is not running");
  }
  size_t bytesWritten = 0;
  while (bytesWritten < data.length()) {
    DWORD chunk = 0;
    if (!WriteFile(input, data.c_str() + bytesWritten,
                   DWORD(data.length() - bytesWritten), &chunk, NULL)) {
      throw std::runtime_error("Error writing to pseudo console: " +
                               WinErrnoToString());
    }
    bytesWritten += chunk;
  }
}

void ConPtyProcess::resize(const TerminalInfo& size) {
  lock_guard<recursive_mutex> guard(stateMutex);
  if (!spawned) {
    STFATAL << "Tried to resize a process that was never spawned";
  }
  if (hPC == NULL) {
    return;
  }
  if (FAILED(ResizePseudoConsole(hPC, toCoord(size)))) {
    throw std::runtime_error("Could not resize pseudo console");
  }
}

void ConPtyProcess::terminate() {
  lock_guard<recursive_mutex> guard(stateMutex);
  if (processHandle != INVALID_HANDLE_VALUE &&
      WaitForSingleObject(processHandle, 0) != WAIT_OBJECT_0) {
    TerminateProcess(processHandle, 1);
  }
}

void ConPtyProcess::close() {
  lock_guard<recursive_mutex> guard(stateMutex);
  if (processHandle != INVALID_HANDLE_VALUE) {
    if (WaitForSingleObject(processHandle, 0) != WAIT_OBJECT_0) {
      TerminateProcess(processHandle, 1);
      WaitForSingleObject(processHandle, INFINITE);
    }
  }
  if (hPC != NULL) {
    ClosePseudoConsole(hPC);
    hPC = NULL;
  }
  closeHandle(&inputWriteSide);
  closeHandle(&outputReadSide);
  closeHandle(&processHandle);
}

bool ConPtyProcess::isAlive() {
  lock_guard<recursive_mutex> guard(stateMutex);
  return processHandle != INVALID_HANDLE_VALUE &&
         WaitForSingleObject(processHandle, 0) == WAIT_TIMEOUT;
}

void ConPtyProcess::closeHandle(HANDLE* handle) {
  if (*handle != INVALID_HANDLE_VALUE && *handle != NULL) {
    CloseHandle(*handle);
  }
  *handle = INVALID_HANDLE_VALUE;
}
}  // namespace ft
