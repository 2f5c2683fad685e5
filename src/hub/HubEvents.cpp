#include "HubEvents.hpp"

namespace ft {
namespace {
string now() { return formatRfc3339(std::chrono::system_clock::now()); }
}  // namespace

string hubEventTypeName(HubEventType type) {
  switch (type) {
    case HubEventType::FLOW_STARTED:
      return "FLOW_STARTED";
    case HubEventType::NODE_STARTED:
      return "NODE_STARTED";
    case HubEventType::NODE_COMPLETED:
      return "NODE_COMPLETED";
    case HubEventType::FLOW_COMPLETED:
      return "FLOW_COMPLETED";
    case HubEventType::FLOW_FAILED:
      return "FLOW_FAILED";
    case HubEventType::LEDGER_UPDATE:
      return "LEDGER_UPDATE";
    case HubEventType::OPTIMIZATION_AVAILABLE:
      return "OPTIMIZATION_AVAILABLE";
  }
  STFATAL << "Unknown hub event type " << int(type);
  return "";
}

string HubEvent::toJson() const {
  json j;
  j["type"] = hubEventTypeName(type);
  j["payload"] = payload;
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

HubEvent HubEvent::flowStarted(int64_t flowId) {
  HubEvent event;
  event.type = HubEventType::FLOW_STARTED;
  event.payload["flowId"] = flowId;
  event.payload["timestamp"] = now();
  return event;
}

HubEvent HubEvent::nodeStarted(int64_t flowId, const string& nodeId,
                               const string& label) {
  HubEvent event;
  event.type = HubEventType::NODE_STARTED;
  event.payload["flowId"] = flowId;
  event.payload["nodeId"] = nodeId;
  event.payload["label"] = label;
  event.payload["timestamp"] = now();
  return event;
}

HubEvent HubEvent::nodeCompleted(int64_t flowId, const string& nodeId,
                                 int64_t inputTokens, int64_t outputTokens,
                                 double cost) {
  HubEvent event;
  event.type = HubEventType::NODE_COMPLETED;
  event.payload["flowId"] = flowId;
  event.payload["nodeId"] = nodeId;
  event.payload["inputTokens"] = inputTokens;
  event.payload["outputTokens"] = outputTokens;
  event.payload["cost"] = cost;
  event.payload["timestamp"] = now();
  return event;
}

HubEvent HubEvent::flowCompleted(int64_t flowId, int64_t executionTimeMs) {
  HubEvent event;
  event.type = HubEventType::FLOW_COMPLETED;
  event.payload["flowId"] = flowId;
  event.payload["executionTimeMs"] = executionTimeMs;
  event.payload["timestamp"] = now();
  return event;
}

HubEvent HubEvent::flowFailed(int64_t flowId, const string& error) {
  HubEvent event;
  event.type = HubEventType::FLOW_FAILED;
  event.payload["flowId"] = flowId;
  event.payload["error"] = error;
  event.payload["timestamp"] = now();
  return event;
}

HubEvent HubEvent::ledgerUpdate(int64_t entryId) {
  HubEvent event;
  event.type = HubEventType::LEDGER_UPDATE;
  event.payload["entryId"] = entryId;
  return event;
}

HubEvent HubEvent::optimizationAvailable(int64_t optimizationId) {
  HubEvent event;
  event.type = HubEventType::OPTIMIZATION_AVAILABLE;
  event.payload["optimizationId"] = optimizationId;
  return event;
}

string formatRfc3339(std::chrono::system_clock::time_point when) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                    when.time_since_epoch())
                    .count() %
                1000;
  time_t seconds = std::chrono::system_clock::to_time_t(when);
  tm utc;
#ifdef WIN32
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  char buf[64];
  strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc);
  char result[80];
  snprintf(result, sizeof(result), "%s.%03dZ", buf, int(millis));
  return string(result);
}
}  // namespace ft
