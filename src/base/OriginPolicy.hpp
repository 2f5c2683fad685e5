#ifndef __FT_ORIGIN_POLICY__
#define __FT_ORIGIN_POLICY__

#include "Headers.hpp"

namespace ft {
/**
 * @brief Allow-list for the Origin header of upgrades and API calls.
 * Requests without an Origin (same-origin) are always allowed.
 */
class OriginPolicy {
 public:
  explicit OriginPolicy(const vector<string>& origins);

  bool isAllowed(const string& origin) const;

  const set<string>& getAllowedOrigins() const { return allowedOrigins; }

  /** @brief http(s)://localhost and 127.0.0.1 on 8080, 8081 and 5173. */
  static vector<string> defaultOrigins();

  /** @brief Splits "a, b,c" into trimmed, non-empty entries. */
  static vector<string> parseOriginList(const string& commaSeparated);

 protected:
  set<string> allowedOrigins;
};
}  // namespace ft

#endif  // __FT_ORIGIN_POLICY__
