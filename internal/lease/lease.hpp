#pragma once

#include <chrono>
#include <string>

namespace tams::lease {

// Time-bounded exclusive claim on one resource (a deletion request id).
struct Lease {
  std::string lease_id;
  std::string resource_id;
  std::string holder;

  std::chrono::steady_clock::time_point expires_at;
};

}
