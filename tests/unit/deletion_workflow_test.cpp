#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/core/catalog_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deletion/deletion_workflow.hpp"
#include "internal/model/event_type.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using namespace std::chrono_literals;
using tams::deletion::BatchOutcome;
using tams::deletion::DeletionWorkflow;
using tams::model::DeletionStatus;
using tams::model::TimeRange;

struct Harness {
  std::shared_ptr<tams::db::memory::MemoryRepository> repository = std::make_shared<tams::db::memory::MemoryRepository>();
  std::shared_ptr<tams::index::SegmentIndex>          index      = std::make_shared<tams::index::SegmentIndex>(repository);
  std::shared_ptr<tams::lease::LeaseTable>            leases     = std::make_shared<tams::lease::LeaseTable>();
  tams::core::CatalogManager catalog{repository, index, std::make_shared<tams::storage::RamObjectStore>(), tams::core::CatalogOptions{}};

  std::vector<std::string> created;
  int                      event_nudges = 0;

  std::unique_ptr<DeletionWorkflow> Workflow(std::size_t batch_size) {
    tams::deletion::DeletionOptions options;
    options.batch_size = batch_size;
    options.lease_ttl  = 5s;

    tams::deletion::DeletionHooks hooks;
    hooks.on_created = [this](const std::string& id) { created.push_back(id); };
    hooks.on_events  = [this] { ++event_nudges; };
    return std::make_unique<DeletionWorkflow>(repository, index, leases, options, hooks);
  }

  // Ten back-to-back ten second segments: [0:0_100:0).
  std::string FlowWithSegments(bool read_only = false) {
    tams::db::model::FlowRecord flow;
    flow.label = "deletion fixture";
    const auto id = catalog.CreateFlow(flow).id;

    std::vector<tams::db::model::SegmentRecord> segments;
    for (int i = 0; i < 10; ++i) {
      tams::db::model::SegmentRecord segment;
      segment.object_id = "obj-" + std::to_string(i);
      segment.timerange = TimeRange::Parse("[" + std::to_string(i * 10) + ":0_" + std::to_string(i * 10 + 10) + ":0)");
      segments.push_back(segment);
    }
    catalog.AddSegments(id, segments, false);

    if (read_only) {
      auto update      = catalog.GetFlow(id);
      update.read_only = true;
      catalog.UpdateFlow(update);
    }
    return id;
  }

  std::vector<std::string> SegmentRanges(const std::string& flow_id) {
    std::vector<std::string> out;
    for (const auto& segment : catalog.ListSegments(flow_id, TimeRange::Eternity(), 1000, "").items) {
      out.push_back(segment.timerange.ToString());
    }
    return out;
  }

  std::size_t CountEvents(std::string_view type) {
    auto        tx    = repository->Begin();
    std::size_t count = 0;
    for (const auto& event : repository->ListUndispatchedEvents(*tx, 1000)) {
      if (event.event_type == type) ++count;
    }
    return count;
  }
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestBatchedMatchesUnbounded() {
  const auto range = TimeRange::Parse("[5:0_95:0)");

  Harness    batched;
  const auto batched_flow = batched.FlowWithSegments();
  auto       small        = batched.Workflow(3);
  const auto small_request = small->Create(batched_flow, range);
  assert(small_request.status == DeletionStatus::kPending);
  assert(batched.created == std::vector<std::string>{small_request.id});
  assert(small->Run(small_request.id));

  Harness    unbounded;
  const auto unbounded_flow = unbounded.FlowWithSegments();
  auto       large          = unbounded.Workflow(1000);
  const auto large_request  = large->Create(unbounded_flow, range);
  assert(large->Run(large_request.id));

  const auto small_done = small->Get(small_request.id);
  const auto large_done = large->Get(large_request.id);
  assert(small_done.status == DeletionStatus::kCompleted);
  assert(large_done.status == DeletionStatus::kCompleted);
  assert(!small_done.remaining && !large_done.remaining);
  assert(small_done.segments_processed == 10);
  assert(large_done.segments_processed == 10);

  const std::vector<std::string> expected = {"[0:0_5:0)", "[95:0_100:0)"};
  assert(batched.SegmentRanges(batched_flow) == expected);
  assert(unbounded.SegmentRanges(unbounded_flow) == expected);
  assert(batched.catalog.GetFlow(batched_flow).available.ToStrings() == expected);
  assert(unbounded.catalog.GetFlow(unbounded_flow).available.ToStrings() == expected);

  // one segments.deleted per batch, one flow.updated on completion
  assert(batched.CountEvents(tams::model::kSegmentsDeleted) == 4);
  assert(unbounded.CountEvents(tams::model::kSegmentsDeleted) == 1);
  assert(batched.CountEvents(tams::model::kFlowUpdated) == 1);
  assert(batched.event_nudges == 4);

  // inner objects are now orphans; the edge objects keep one reference
  assert(batched.catalog.GetMediaObject("obj-5").flow_references.empty());
  assert(batched.catalog.GetMediaObject("obj-0").flow_references.at(batched_flow) == 1);
}

void TestResumeAfterRestart() {
  Harness    h;
  const auto flow    = h.FlowWithSegments();
  auto       first   = h.Workflow(3);
  const auto request = first->Create(flow, TimeRange::Parse("[0:0_100:0)"));

  assert(first->ProcessBatch(request.id) == BatchOutcome::kContinue);
  auto partial = first->Get(request.id);
  assert(partial.status == DeletionStatus::kProcessing);
  assert(partial.segments_processed == 3);
  assert(partial.remaining && partial.remaining->ToString() == "[30:0_100:0)");
  assert(h.SegmentRanges(flow).size() == 7);
  first.reset();

  // a fresh workflow over the same store picks the request up
  auto second = h.Workflow(3);
  assert(second->ListResumable() == std::vector<std::string>{request.id});
  assert(second->Run(request.id));
  assert(second->Get(request.id).status == DeletionStatus::kCompleted);
  assert(second->Get(request.id).segments_processed == 10);
  assert(h.SegmentRanges(flow).empty());
  assert(second->ListResumable().empty());
}

void TestEmptyRangeCompletesWithoutEvents() {
  Harness    h;
  const auto flow     = h.FlowWithSegments();
  auto       workflow = h.Workflow(3);
  const auto request  = workflow->Create(flow, TimeRange::Parse("[500:0_600:0)"));

  assert(workflow->Run(request.id));
  const auto done = workflow->Get(request.id);
  assert(done.status == DeletionStatus::kCompleted);
  assert(done.segments_processed == 0);
  assert(h.CountEvents(tams::model::kSegmentsDeleted) == 0);
  assert(h.SegmentRanges(flow).size() == 10);
}

void TestCancel() {
  Harness    h;
  const auto flow     = h.FlowWithSegments();
  auto       workflow = h.Workflow(3);

  // pending: cancelled at once
  const auto pending   = workflow->Create(flow, TimeRange::Parse("[0:0_50:0)"));
  const auto cancelled = workflow->Cancel(pending.id);
  assert(cancelled.status == DeletionStatus::kError);
  assert(cancelled.error == "cancelled");
  assert(workflow->ProcessBatch(pending.id) == BatchOutcome::kFinished);
  assert(h.SegmentRanges(flow).size() == 10);

  // processing: honoured at the next batch boundary
  const auto running = workflow->Create(flow, TimeRange::Parse("[0:0_100:0)"));
  assert(workflow->ProcessBatch(running.id) == BatchOutcome::kContinue);
  const auto flagged = workflow->Cancel(running.id);
  assert(flagged.status == DeletionStatus::kProcessing);
  assert(flagged.cancel_requested);

  assert(workflow->ProcessBatch(running.id) == BatchOutcome::kFinished);
  const auto stopped = workflow->Get(running.id);
  assert(stopped.status == DeletionStatus::kError);
  assert(stopped.error == "cancelled");
  assert(stopped.segments_processed == 3);
  assert(h.SegmentRanges(flow).size() == 7);

  // terminal: rejected
  assert(Throws<tams::util::InvalidState>([&] { workflow->Cancel(running.id); }));
  assert(Throws<tams::util::NotFound>([&] { workflow->Cancel(tams::util::NewId()); }));
}

void TestLeaseHeldElsewhere() {
  Harness    h;
  const auto flow     = h.FlowWithSegments();
  auto       workflow = h.Workflow(3);
  const auto request  = workflow->Create(flow, TimeRange::Eternity());

  auto other = h.leases->TryAcquire(request.id, "other-process", 30s);
  assert(other);
  assert(!workflow->Run(request.id));
  assert(workflow->Get(request.id).status == DeletionStatus::kPending);

  h.leases->Release(*other);
  assert(workflow->Run(request.id));
  assert(workflow->Get(request.id).status == DeletionStatus::kCompleted);
  assert(!h.leases->HasActive(request.id));
}

void TestCreateValidation() {
  Harness    h;
  auto       workflow  = h.Workflow(3);
  const auto read_only = h.FlowWithSegments(true);

  assert(Throws<tams::util::ReadOnlyFlow>([&] { workflow->Create(read_only, TimeRange::Eternity()); }));
  assert(Throws<tams::util::NotFound>([&] { workflow->Create(tams::util::NewId(), TimeRange::Eternity()); }));
  assert(Throws<tams::util::ParseError>([&] { workflow->Create("flow-1", TimeRange::Eternity()); }));
  assert(workflow->List().empty());
  assert(h.created.empty());
}

void TestFlowRemovedMidRequestFails() {
  Harness    h;
  const auto flow     = h.FlowWithSegments();
  auto       workflow = h.Workflow(3);
  const auto request  = workflow->Create(flow, TimeRange::Eternity());

  assert(workflow->ProcessBatch(request.id) == BatchOutcome::kContinue);
  h.catalog.DeleteFlow(flow);

  assert(workflow->Run(request.id));
  const auto failed = workflow->Get(request.id);
  assert(failed.status == DeletionStatus::kError);
  assert(failed.error.find("flow not found") != std::string::npos);
}

} // namespace

int main() {
  TestBatchedMatchesUnbounded();
  TestResumeAfterRestart();
  TestEmptyRangeCompletesWithoutEvents();
  TestCancel();
  TestLeaseHeldElsewhere();
  TestCreateValidation();
  TestFlowRemovedMidRequestFails();

  std::cout << "deletion_workflow_test: pass\n";
  return 0;
}
