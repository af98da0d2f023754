#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/index/segment_index.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using tams::db::Repository;
using tams::db::memory::MemoryRepository;
using tams::db::model::DeletionRequestRecord;
using tams::db::model::DeliveryRecord;
using tams::db::model::EventRecord;
using tams::db::model::FlowRecord;
using tams::db::model::MediaObjectRecord;
using tams::db::model::SegmentQuery;
using tams::db::model::SegmentRecord;
using tams::db::model::SourceRecord;
using tams::db::model::WebhookRecord;
using tams::model::TimePoint;
using tams::model::TimeRange;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

std::string Iso(tams::util::WallTime tp) {
  return tams::util::FormatIso8601(tp);
}

// Unique per run so a persistent database can be reused.
std::string Unique(const std::string& prefix) {
  return prefix + "-" + tams::util::NewId();
}

FlowRecord SeedFlow(Repository& repo, bool with_source) {
  auto tx = repo.Begin();

  FlowRecord flow;
  flow.id         = tams::util::NewId();
  flow.created_at = tams::util::Now();
  flow.updated_at = flow.created_at;

  if (with_source) {
    SourceRecord source;
    source.id         = tams::util::NewId();
    source.label      = "parity source";
    source.created_at = flow.created_at;
    source.updated_at = flow.created_at;
    const auto inserted = repo.InsertSource(*tx, source);
    assert(inserted);
    flow.source_id = source.id;
  }

  const auto inserted = repo.InsertFlow(*tx, flow);
  assert(inserted);
  tx->Commit();
  return flow;
}

void VerifySourceAndFlowFields(Repository& repo) {
  const auto now = tams::util::Now();

  SourceRecord source;
  source.id          = tams::util::NewId();
  source.format      = tams::model::Format::kAudio;
  source.label       = Unique("mic");
  source.description = "stage left";
  source.tags        = {{"room", "a"}, {"lang", "en"}};
  source.created_at  = now;
  source.updated_at  = now;

  FlowRecord flow;
  flow.id              = tams::util::NewId();
  flow.source_id       = source.id;
  flow.format          = tams::model::Format::kAudio;
  flow.label           = "mic 48k";
  flow.tags            = {{"quality", "master"}};
  flow.read_only       = true;
  flow.avg_bit_rate    = 1536000;
  flow.codec           = "audio/pcm";
  flow.sample_rate     = 48000;
  flow.channels        = 2;
  flow.flow_collection = {{tams::util::NewId(), "left"}};
  flow.available       = tams::model::TimeRangeSet::Of({TimeRange::Parse("[0:0_5:0)"), TimeRange::Parse("[7:0_9:0]")});
  flow.created_at      = now;
  flow.updated_at      = now;

  {
    auto tx = repo.Begin();
    assert(repo.InsertSource(*tx, source));
    assert(repo.InsertFlow(*tx, flow));
    tx->Commit();
  }
  {
    // a failed statement may poison the transaction, so it gets its own
    auto tx = repo.Begin();
    assert(repo.InsertSource(*tx, source).code == tams::db::ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    auto s  = repo.GetSource(*tx, source.id);
    assert(s.has_value());
    assert(s->format == tams::model::Format::kAudio);
    assert(s->tags == source.tags);
    assert(Iso(s->created_at) == Iso(now));

    tams::db::model::SourceFilter filter;
    filter.label = source.label;
    assert(repo.ListSources(*tx, filter, {}).size() == 1);

    auto f = repo.GetFlow(*tx, flow.id);
    assert(f.has_value());
    assert(f->source_id == source.id);
    assert(f->read_only);
    assert(f->avg_bit_rate == flow.avg_bit_rate);
    assert(!f->max_bit_rate);
    assert(f->sample_rate == 48000u);
    assert(!f->frame_width);
    assert(f->flow_collection == flow.flow_collection);
    assert(f->available == flow.available);
    assert(f->tags == flow.tags);

    tams::db::model::FlowFilter by_source;
    by_source.source_id = source.id;
    assert(repo.ListFlows(*tx, by_source, {}).size() == 1);
  }

  {
    // deleting the source leaves the flow, unlinked
    auto tx = repo.Begin();
    assert(repo.DeleteSource(*tx, source.id));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetSource(*tx, source.id));
    auto f = repo.GetFlow(*tx, flow.id);
    assert(f.has_value() && !f->source_id);
  }
}

void VerifyRollbackDiscardsWrites(Repository& repo) {
  SourceRecord source;
  source.id         = tams::util::NewId();
  source.created_at = tams::util::Now();
  source.updated_at = source.created_at;

  {
    auto tx = repo.Begin();
    assert(repo.InsertSource(*tx, source));
    // reads inside the transaction see its writes
    assert(repo.GetSource(*tx, source.id).has_value());
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetSource(*tx, source.id).has_value());
  }
  {
    // destructor rolls back
    auto tx = repo.Begin();
    assert(repo.InsertSource(*tx, source));
  }
  auto tx = repo.Begin();
  assert(!repo.GetSource(*tx, source.id).has_value());
}

void VerifySegmentOrdering(Repository& repo) {
  const auto flow = SeedFlow(repo, false);

  const std::vector<std::string> ranges = {"[10:0_20:0)", "(-5:0_0:0)", "[0:0_10:0)", "[20:0_20:500000000]", "(20:500000000_30:0)"};
  {
    auto tx = repo.Begin();
    for (std::size_t i = 0; i < ranges.size(); ++i) {
      SegmentRecord segment;
      segment.flow_id       = flow.id;
      segment.object_id     = "obj-" + std::to_string(i);
      segment.timerange     = TimeRange::Parse(ranges[i]);
      segment.ts_offset     = TimePoint::Parse("3:250");
      segment.sample_offset = i;
      segment.get_urls      = {{"http://a/" + segment.object_id, "a"}, {"http://b/" + segment.object_id, "b"}};
      segment.created_at    = tams::util::Now();
      assert(repo.InsertSegment(*tx, segment));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  SegmentQuery all;
  all.flow_id = flow.id;
  const auto ordered = repo.FindSegments(*tx, all);
  assert(ordered.size() == 5);
  const std::vector<std::string> expected = {"(-5:0_0:0)", "[0:0_10:0)", "[10:0_20:0)", "[20:0_20:500000000]", "(20:500000000_30:0)"};
  for (std::size_t i = 0; i < expected.size(); ++i) {
    assert(ordered[i].timerange.ToString() == expected[i]);
  }
  assert(ordered[1].ts_offset.ToString() == "3:250");
  assert(ordered[1].get_urls.size() == 2);
  assert(ordered[1].get_urls[1].label == "b");
  assert(ordered[1].sample_offset == 2u);
  assert(!ordered[1].sample_count);

  SegmentQuery overlap;
  overlap.flow_id = flow.id;
  overlap.range   = TimeRange::Parse("[20:0_20:500000000)");
  const auto hit  = repo.FindSegments(*tx, overlap);
  assert(hit.size() == 1 && hit[0].object_id == "obj-3");

  SegmentQuery page;
  page.flow_id = flow.id;
  page.after   = ordered[1].timerange;
  page.limit   = 2;
  const auto next = repo.FindSegments(*tx, page);
  assert(next.size() == 2);
  assert(next[0].object_id == "obj-0");
  assert(next[1].object_id == "obj-3");

  assert(repo.DeleteSegment(*tx, flow.id, "obj-0", TimeRange::Parse("[10:0_20:0)")));
  assert(repo.DeleteSegment(*tx, flow.id, "obj-0", TimeRange::Parse("[10:0_20:0)")).code == tams::db::ErrorCode::NotFound);
  assert(repo.FindSegments(*tx, all).size() == 4);
}

void VerifyMediaObjects(Repository& repo) {
  const auto flow      = SeedFlow(repo, false);
  const auto now       = tams::util::Now();
  const auto orphan_id = Unique("orphan");
  const auto live_id   = Unique("live");

  {
    auto              tx = repo.Begin();
    MediaObjectRecord orphan;
    orphan.object_id          = orphan_id;
    orphan.size_bytes         = 77;
    orphan.mime_type          = "video/mp2t";
    orphan.created_at         = now;
    orphan.unreferenced_since = now - std::chrono::hours(2);
    assert(repo.UpsertMediaObject(*tx, orphan));

    MediaObjectRecord live;
    live.object_id       = live_id;
    live.flow_references = {{flow.id, 3}};
    live.created_at      = now;
    assert(repo.UpsertMediaObject(*tx, live));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto live = repo.GetMediaObject(*tx, live_id);
  assert(live.has_value());
  assert(live->flow_references.at(flow.id) == 3);
  assert(!live->unreferenced_since);

  auto has = [](const std::vector<MediaObjectRecord>& rows, const std::string& id) {
    for (const auto& row : rows) {
      if (row.object_id == id) return true;
    }
    return false;
  };

  const auto old_enough = repo.ListOrphanedMediaObjects(*tx, now - std::chrono::hours(1), 10000);
  assert(has(old_enough, orphan_id));
  assert(!has(old_enough, live_id));
  assert(!has(repo.ListOrphanedMediaObjects(*tx, now - std::chrono::hours(3), 10000), orphan_id));

  assert(repo.DeleteMediaObject(*tx, orphan_id));
  assert(!repo.GetMediaObject(*tx, orphan_id));
  tx->Commit();
}

void VerifyOutbox(Repository& repo) {
  const auto url  = Unique("http://hooks.example/parity");
  uint64_t   first = 0;
  uint64_t   second = 0;

  {
    auto tx = repo.Begin();

    WebhookRecord webhook;
    webhook.url           = url;
    webhook.api_key_name  = "X-Key";
    webhook.api_key_value = "v";
    webhook.events        = {"flow.created", "segments.deleted"};
    assert(repo.UpsertWebhook(*tx, webhook));

    EventRecord a;
    a.event_type = "flow.created";
    a.payload    = R"({"id":"x"})";
    a.created_at = tams::util::Now();
    assert(repo.AppendEvent(*tx, a));
    EventRecord b = a;
    b.event_type  = "segments.deleted";
    assert(repo.AppendEvent(*tx, b));
    first  = a.id;
    second = b.id;
    assert(first > 0 && second > first);
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto webhook = repo.GetWebhook(*tx, url);
    assert(webhook.has_value());
    assert(webhook->api_key_value == "v");
    assert(webhook->events.size() == 2);

    const auto undispatched = repo.ListUndispatchedEvents(*tx, 100000);
    std::vector<uint64_t> ours;
    for (const auto& event : undispatched) {
      if (event.id == first || event.id == second) ours.push_back(event.id);
    }
    assert((ours == std::vector<uint64_t>{first, second}));
    assert(repo.GetEvent(*tx, first)->payload == R"({"id":"x"})");

    for (auto id : {first, second}) {
      DeliveryRecord delivery;
      delivery.event_id    = id;
      delivery.webhook_url = url;
      delivery.updated_at  = tams::util::Now();
      assert(repo.InsertDelivery(*tx, delivery));
      assert(repo.MarkEventDispatched(*tx, id));
    }
    tx->Commit();
  }

  auto count_pending = [&](Repository& r) {
    auto        tx    = r.Begin();
    std::size_t count = 0;
    for (const auto& delivery : r.ListPendingDeliveries(*tx)) {
      if (delivery.webhook_url == url) ++count;
    }
    return count;
  };
  assert(count_pending(repo) == 2);

  {
    auto tx = repo.Begin();
    assert(repo.GetEvent(*tx, first)->dispatched);

    DeliveryRecord done;
    done.event_id    = first;
    done.webhook_url = url;
    done.status      = std::string(tams::db::model::kDeliveryDelivered);
    done.attempts    = 2;
    done.updated_at  = tams::util::Now();
    assert(repo.UpdateDelivery(*tx, done));
    tx->Commit();
  }
  assert(count_pending(repo) == 1);

  auto tx = repo.Begin();
  assert(repo.DeleteWebhook(*tx, url));
  tx->Commit();
}

void VerifyDeletionRequests(Repository& repo) {
  const auto flow = SeedFlow(repo, false);

  DeletionRequestRecord request;
  request.id         = tams::util::NewId();
  request.flow_id    = flow.id;
  request.timerange  = TimeRange::Parse("[0:0_100:0)");
  request.remaining  = request.timerange;
  request.created_at = tams::util::Now();
  request.updated_at = request.created_at;

  {
    auto tx = repo.Begin();
    assert(repo.InsertDeletionRequest(*tx, request));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    request.status             = tams::model::DeletionStatus::kProcessing;
    request.remaining.reset();
    request.segments_processed = 12;
    request.cancel_requested   = true;
    request.error              = "cancelled";
    assert(repo.UpdateDeletionRequest(*tx, request));
    tx->Commit();
  }

  auto tx   = repo.Begin();
  auto read = repo.GetDeletionRequest(*tx, request.id);
  assert(read.has_value());
  assert(read->status == tams::model::DeletionStatus::kProcessing);
  assert(!read->remaining);
  assert(read->segments_processed == 12);
  assert(read->cancel_requested);
  assert(read->error == "cancelled");
  assert(read->timerange.ToString() == "[0:0_100:0)");

  bool listed = false;
  for (const auto& row : repo.ListDeletionRequests(*tx)) {
    listed = listed || row.id == request.id;
  }
  assert(listed);
}

void VerifySegmentIndexScenario(const std::shared_ptr<Repository>& repo) {
  tams::index::SegmentIndex index(repo);
  const auto                flow = SeedFlow(*repo, true);

  const auto object_a = Unique("a");
  const auto object_b = Unique("b");
  {
    auto tx = repo->Begin();
    for (const auto& id : {object_a, object_b}) {
      MediaObjectRecord object;
      object.object_id  = id;
      object.created_at = tams::util::Now();
      assert(repo->UpsertMediaObject(*tx, object));
    }

    SegmentRecord a;
    a.flow_id   = flow.id;
    a.object_id = object_a;
    a.timerange = TimeRange::Parse("[0:0_10:0)");
    index.Insert(*tx, a, false);

    SegmentRecord b = a;
    b.object_id     = object_b;
    b.timerange     = TimeRange::Parse("[10:0_20:0)");
    index.Insert(*tx, b, false);
    tx->Commit();
  }
  {
    auto tx     = repo->Begin();
    auto result = index.DeleteRange(*tx, flow.id, TimeRange::Parse("[5:0_15:0)"));
    assert(result.truncated == 2);
    tx->Commit();
  }

  auto       tx   = repo->Begin();
  const auto page = index.Query(*tx, flow.id, TimeRange::Eternity(), std::nullopt, 10);
  assert(page.segments.size() == 2);
  assert(page.segments[0].timerange.ToString() == "[0:0_5:0)");
  assert(page.segments[1].timerange.ToString() == "[15:0_20:0)");
  assert(page.segments[1].ts_offset.ToString() == "5:0");
  assert((repo->GetFlow(*tx, flow.id)->available.ToStrings() == std::vector<std::string>{"[0:0_5:0)", "[15:0_20:0)"}));
  assert(repo->GetMediaObject(*tx, object_b)->flow_references.at(flow.id) == 1);
}

void VerifyConcurrentWritersKeepSegmentsDisjoint(const std::shared_ptr<Repository>& repo) {
  tams::index::SegmentIndex index(repo);
  const auto                flow = SeedFlow(*repo, false);

  constexpr int            kThreads = 4;
  constexpr int            kOps     = 25;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      std::mt19937                    rng(99 + t);
      std::uniform_int_distribution<> start(0, 29);
      std::uniform_int_distribution<> length(1, 6);
      std::uniform_int_distribution<> coin(0, 1);

      for (int i = 0; i < kOps; ++i) {
        const int  begin = start(rng);
        const auto range = TimeRange::Parse("[" + std::to_string(begin) + ":0_" + std::to_string(begin + length(rng)) + ":0)");
        try {
          auto tx = repo->Begin();
          if (coin(rng)) {
            SegmentRecord segment;
            segment.flow_id    = flow.id;
            segment.object_id  = Unique("race");
            segment.timerange  = range;
            segment.created_at = tams::util::Now();
            index.Insert(*tx, segment, coin(rng) == 1);
          } else {
            index.DeleteRange(*tx, flow.id, range);
          }
          tx->Commit();
        } catch (const tams::util::OverlapConflict&) {
        } catch (const tams::util::StorageFailure&) {
          // serialization failures roll back like a lost race
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto         tx = repo->Begin();
  SegmentQuery all;
  all.flow_id         = flow.id;
  const auto segments = repo->FindSegments(*tx, all);

  std::vector<TimeRange> ranges;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    for (std::size_t j = i + 1; j < segments.size(); ++j) {
      assert(!Overlaps(segments[i].timerange, segments[j].timerange));
    }
    ranges.push_back(segments[i].timerange);
  }
  assert(repo->GetFlow(*tx, flow.id)->available == tams::model::TimeRangeSet::Of(ranges));
}

void VerifyFlowDeleteCascadesSegments(Repository& repo) {
  const auto flow = SeedFlow(repo, false);
  {
    auto          tx = repo.Begin();
    SegmentRecord segment;
    segment.flow_id    = flow.id;
    segment.object_id  = "cascade";
    segment.timerange  = TimeRange::Parse("[0:0_1:0)");
    segment.created_at = tams::util::Now();
    assert(repo.InsertSegment(*tx, segment));
    assert(repo.DeleteFlow(*tx, flow.id));
    tx->Commit();
  }

  auto         tx = repo.Begin();
  SegmentQuery query;
  query.flow_id = flow.id;
  assert(repo.FindSegments(*tx, query).empty());
  assert(repo.DeleteFlow(*tx, flow.id).code == tams::db::ErrorCode::NotFound);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo = backend.make_repository();
  const auto flow = SeedFlow(*repo, true);

  backend.restart(repo);
  auto tx   = repo->Begin();
  auto read = repo->GetFlow(*tx, flow.id);
  assert(read.has_value());
  assert(read->source_id == flow.source_id);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if TAMS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto db_path = (std::filesystem::temp_directory_path() / ("tams_integration_sqlite_" + std::to_string(stamp) + ".db")).string();

  auto make_repo = [db_path]() {
    tams::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    return tams::factory::BuildRepository(config);
  };
  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if TAMS_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("TAMS_TEST_PG_DSN");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("TAMS_TEST_PG_DSN is not set");
  }
  auto make_repo = [conninfo = std::string(uri)]() {
    tams::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return tams::factory::BuildRepository(config);
  };
  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running " << backend.name << " suite\n";

  auto repo = backend.make_repository();
  VerifySourceAndFlowFields(*repo);
  VerifyRollbackDiscardsWrites(*repo);
  VerifySegmentOrdering(*repo);
  VerifyMediaObjects(*repo);
  VerifyOutbox(*repo);
  VerifyDeletionRequests(*repo);
  VerifySegmentIndexScenario(repo);
  VerifyConcurrentWritersKeepSegmentsDisjoint(repo);
  VerifyFlowDeleteCascadesSegments(*repo);
  repo.reset();

  VerifyRestartDurability(backend);
  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if TAMS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if TAMS_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
