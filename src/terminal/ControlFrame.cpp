#include "ControlFrame.hpp"

namespace ft {
namespace {
const int64_t MAX_DIMENSION = 65535;

ControlFrame rawFrame(const string& frame) {
  ControlFrame result;
  result.kind = ControlFrame::Kind::RAW;
  result.data = frame;
  return result;
}

// Returns false when the field is present but not a usable dimension.
bool readDimension(const json& object, const char* name, int64_t* value) {
  *value = 0;
  auto it = object.find(name);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_number_integer()) {
    return false;
  }
  *value = it->get<int64_t>();
  return *value >= 0 && *value <= MAX_DIMENSION;
}
}  // namespace

ControlFrame parseControlFrame(const string& frame) {
  json object = json::parse(frame, nullptr, false);
  if (object.is_discarded() || !object.is_object()) {
    return rawFrame(frame);
  }
  auto typeIt = object.find("type");
  if (typeIt == object.end() || !typeIt->is_string()) {
    return rawFrame(frame);
  }
  string data;
  auto dataIt = object.find("data");
  if (dataIt != object.end() && !dataIt->is_null()) {
    if (!dataIt->is_string()) {
      return rawFrame(frame);
    }
    data = dataIt->get<string>();
  }
  int64_t rows, cols;
  if (!readDimension(object, "rows", &rows) ||
      !readDimension(object, "cols", &cols)) {
    return rawFrame(frame);
  }

  const string type = typeIt->get<string>();
  ControlFrame result;
  if (type == "input") {
    result.kind = ControlFrame::Kind::INPUT;
    result.data = data;
  } else if (type == "resize") {
    result.kind = ControlFrame::Kind::RESIZE;
    result.size.set_row(int32_t(rows));
    result.size.set_column(int32_t(cols));
    result.sizeValid = rows > 0 && cols > 0;
  } else if (type == "prompt_watcher") {
    result.kind = ControlFrame::Kind::PROMPT_WATCHER;
    result.enabled = (data == "enable");
  } else {
    return rawFrame(frame);
  }
  return result;
}

string encodeInputFrame(const string& data) {
  json j;
  j["type"] = "input";
  j["data"] = data;
  // Keystrokes are not guaranteed to be valid UTF-8.
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

string encodeResizeFrame(const TerminalInfo& size) {
  json j;
  j["type"] = "resize";
  j["rows"] = size.row();
  j["cols"] = size.column();
  return j.dump();
}

string encodePromptWatcherFrame(bool enabled) {
  json j;
  j["type"] = "prompt_watcher";
  j["data"] = enabled ? "enable" : "disable";
  return j.dump();
}
}  // namespace ft
