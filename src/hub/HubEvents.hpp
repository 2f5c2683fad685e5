#ifndef __FT_HUB_EVENTS_HPP__
#define __FT_HUB_EVENTS_HPP__

#include "Headers.hpp"

namespace ft {
enum class HubEventType {
  FLOW_STARTED,
  NODE_STARTED,
  NODE_COMPLETED,
  FLOW_COMPLETED,
  FLOW_FAILED,
  LEDGER_UPDATE,
  OPTIMIZATION_AVAILABLE
};

/** @brief The wire name, e.g. "FLOW_STARTED". */
string hubEventTypeName(HubEventType type);

/**
 * @brief One broadcast notification: {"type": ..., "payload": {...}}.
 *
 * Ledger and optimization events only name the changed row; subscribers
 * re-fetch the details themselves.
 */
struct HubEvent {
  HubEventType type;
  json payload;

  string toJson() const;

  static HubEvent flowStarted(int64_t flowId);
  static HubEvent nodeStarted(int64_t flowId, const string& nodeId,
                              const string& label);
  static HubEvent nodeCompleted(int64_t flowId, const string& nodeId,
                                int64_t inputTokens, int64_t outputTokens,
                                double cost);
  static HubEvent flowCompleted(int64_t flowId, int64_t executionTimeMs);
  static HubEvent flowFailed(int64_t flowId, const string& error);
  static HubEvent ledgerUpdate(int64_t entryId);
  static HubEvent optimizationAvailable(int64_t optimizationId);
};

/** @brief RFC 3339 UTC with milliseconds, e.g. 2024-01-02T03:04:05.678Z */
string formatRfc3339(std::chrono::system_clock::time_point when);
}  // namespace ft

#endif  // __FT_HUB_EVENTS_HPP__
