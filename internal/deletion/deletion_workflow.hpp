#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/index/segment_index.hpp"
#include "internal/lease/lease_table.hpp"

namespace tams::deletion {

struct DeletionOptions {
  std::size_t               batch_size = 100;
  std::chrono::milliseconds lease_ttl{60000};
  // Lease holder name for this process.
  std::string               holder = "tams-deletion";
};

struct DeletionHooks {
  // A new request was committed and should be scheduled.
  std::function<void(const std::string& request_id)> on_created;
  // Outbox events were committed.
  std::function<void()> on_events;
};

enum class BatchOutcome {
  kContinue,  // more of the range remains
  kFinished,  // request reached a terminal status
};

/*
  Long-running deletion of a flow's coverage, processed in batches.

  pending --> processing --> completed | error

  Each batch clears at most batch_size segments from the start of the
  remaining range in its own transaction and persists the new remaining
  range together with the segment mutations, so a restart resumes from
  the last committed batch. Cancellation is honoured at batch boundaries.

  Run() holds a lease on the request for its whole duration, so two
  workers never process batches of the same request concurrently.
*/
class DeletionWorkflow {
 public:
  DeletionWorkflow(std::shared_ptr<db::Repository> repository, std::shared_ptr<index::SegmentIndex> index,
                   std::shared_ptr<lease::LeaseTable> leases, DeletionOptions options, DeletionHooks hooks = {});

  // Flow must exist and be writable. The request starts pending.
  db::model::DeletionRequestRecord Create(const std::string& flow_id, const tams::model::TimeRange& timerange);

  db::model::DeletionRequestRecord              Get(const std::string& id);
  std::vector<db::model::DeletionRequestRecord> List();

  /*
    pending    -> error ("cancelled") immediately
    processing -> cancel flag, honoured before the next batch
    terminal   -> InvalidState
  */
  db::model::DeletionRequestRecord Cancel(const std::string& id);

  // Requests left pending or processing, e.g. by a previous process.
  std::vector<std::string> ListResumable();

  BatchOutcome ProcessBatch(const std::string& id);

  // Drives the request to a terminal status. False when another holder owns it.
  bool Run(const std::string& id);

 private:
  static void Transition(db::model::DeletionRequestRecord& request, tams::model::DeletionStatus to, const std::string& error = {});
  void MarkFailed(const std::string& id, const std::string& error);

  std::shared_ptr<db::Repository>      repository_;
  std::shared_ptr<index::SegmentIndex> index_;
  std::shared_ptr<lease::LeaseTable>   leases_;
  DeletionOptions                      options_;
  DeletionHooks                        hooks_;
};

} // namespace tams::deletion
