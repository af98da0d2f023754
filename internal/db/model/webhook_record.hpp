#pragma once

#include <string>
#include <vector>

namespace tams::db::model {

struct WebhookRecord {
  std::string url;  // identity

  std::string api_key_name;
  std::string api_key_value;

  std::vector<std::string> events;
};

} // namespace tams::db::model
