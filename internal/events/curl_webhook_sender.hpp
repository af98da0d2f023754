#pragma once

#include <string>

#include "webhook_sender.hpp"

namespace tams::events {

/*
  libcurl POST transport. Any 2xx response is a successful delivery.

  Each Send() uses its own easy handle, so one sender may be shared by
  all delivery lanes.
*/
class CurlWebhookSender final : public WebhookSender {
 public:
  explicit CurlWebhookSender(std::string user_agent);
  ~CurlWebhookSender() override;

  SendResult Send(const WebhookRequest& request) override;

 private:
  std::string user_agent_;
};

} // namespace tams::events
