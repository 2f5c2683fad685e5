#ifndef __FT_CLOSE_CODES__
#define __FT_CLOSE_CODES__

#include <stdint.h>

#include <string>

namespace ft {
// WebSocket close codes used by both endpoints.  The 4xxx range is private to
// ForgeTerm.
const uint16_t CLOSE_NORMAL = 1000;
const uint16_t CLOSE_GOING_AWAY = 1001;
const uint16_t CLOSE_ABNORMAL = 1006;
const uint16_t CLOSE_POLICY_VIOLATION = 1008;
const uint16_t CLOSE_INTERNAL_ERROR = 1011;
const uint16_t CLOSE_SERVICE_RESTART = 1012;
const uint16_t CLOSE_TRY_AGAIN_LATER = 1013;
const uint16_t CLOSE_PROCESS_EXITED = 4000;
const uint16_t CLOSE_SPAWN_FAILED = 4001;

struct CloseReason {
  uint16_t code;
  std::string reason;
};
}  // namespace ft

#endif  // __FT_CLOSE_CODES__
