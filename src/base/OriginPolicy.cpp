#include "OriginPolicy.hpp"

namespace ft {
OriginPolicy::OriginPolicy(const vector<string>& origins)
    : allowedOrigins(origins.begin(), origins.end()) {}

bool OriginPolicy::isAllowed(const string& origin) const {
  if (origin.empty()) {
    return true;
  }
  if (allowedOrigins.find(origin) != allowedOrigins.end()) {
    return true;
  }
  LOG(WARNING) << "Blocked request from origin: " << origin;
  return false;
}

vector<string> OriginPolicy::defaultOrigins() {
  vector<string> origins;
  for (const string scheme : {"http", "https"}) {
    for (const string host : {"localhost", "127.0.0.1"}) {
      for (const string port : {"8080", "8081", "5173"}) {
        origins.push_back(scheme + "://" + host + ":" + port);
      }
    }
  }
  return origins;
}

vector<string> OriginPolicy::parseOriginList(const string& commaSeparated) {
  vector<string> origins;
  for (const auto& it : split(commaSeparated, ',')) {
    string origin = trim(it);
    if (!origin.empty()) {
      origins.push_back(origin);
    }
  }
  return origins;
}
}  // namespace ft
