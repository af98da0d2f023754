#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace tams::events {

struct WebhookRequest {
  std::string url;
  std::string body;  // JSON

  std::vector<std::pair<std::string, std::string>> headers;

  std::chrono::milliseconds timeout{30000};
};

struct SendResult {
  bool        ok     = false;
  long        status = 0;  // HTTP status, 0 when no response arrived
  std::string error;
};

/*
  Outbound webhook transport. One call is one delivery attempt; a timeout
  is reported as a failed attempt.
*/
class WebhookSender {
 public:
  virtual ~WebhookSender() = default;

  virtual SendResult Send(const WebhookRequest& request) = 0;
};

} // namespace tams::events
