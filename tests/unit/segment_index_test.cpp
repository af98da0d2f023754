#include <cassert>
#include <iostream>
#include <memory>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/index/segment_index.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace {

using tams::db::memory::MemoryRepository;
using tams::db::model::FlowRecord;
using tams::db::model::MediaObjectRecord;
using tams::db::model::SegmentRecord;
using tams::index::SegmentIndex;
using tams::model::TimePoint;
using tams::model::TimeRange;

TimeRange R(const char* text) {
  return TimeRange::Parse(text);
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  SegmentIndex                      index{repository};
  std::string                       flow_id    = tams::util::NewId();

  explicit Fixture(bool read_only = false) {
    FlowRecord flow;
    flow.id         = flow_id;
    flow.read_only  = read_only;
    flow.created_at = tams::util::Now();
    flow.updated_at = flow.created_at;

    auto tx = repository->Begin();
    const auto inserted = repository->InsertFlow(*tx, flow);
    assert(inserted);
    tx->Commit();
  }

  void EnsureObject(const std::string& object_id) {
    auto tx = repository->Begin();
    if (!repository->GetMediaObject(*tx, object_id)) {
      MediaObjectRecord object;
      object.object_id  = object_id;
      object.size_bytes = 1024;
      object.created_at = tams::util::Now();
      const auto stored = repository->UpsertMediaObject(*tx, object);
      assert(stored);
      tx->Commit();
    }
  }

  void Insert(const std::string& object_id, const char* range, bool replace = false, const char* ts_offset = "0:0") {
    EnsureObject(object_id);

    SegmentRecord segment;
    segment.flow_id         = flow_id;
    segment.object_id       = object_id;
    segment.timerange       = R(range);
    segment.ts_offset       = TimePoint::Parse(ts_offset);
    segment.sample_offset   = 0;
    segment.sample_count    = 250;
    segment.key_frame_count = 10;
    segment.get_urls.push_back({"http://media.example/" + object_id, "default"});
    segment.created_at = tams::util::Now();

    auto tx = repository->Begin();
    index.Insert(*tx, segment, replace);
    tx->Commit();
  }

  tams::index::DeleteRangeResult DeleteRange(const char* range) {
    auto tx     = repository->Begin();
    auto result = index.DeleteRange(*tx, flow_id, R(range));
    tx->Commit();
    return result;
  }

  std::vector<SegmentRecord> Segments() {
    auto tx = repository->Begin();
    return index.Query(*tx, flow_id, TimeRange::Eternity(), std::nullopt, 1000).segments;
  }

  std::vector<std::string> Available() {
    auto tx = repository->Begin();
    return repository->GetFlow(*tx, flow_id)->available.ToStrings();
  }

  MediaObjectRecord Object(const std::string& object_id) {
    auto tx = repository->Begin();
    return *repository->GetMediaObject(*tx, object_id);
  }
};

// Stored segments never overlap and the cached coverage is their exact union.
void AssertInvariant(Fixture& f) {
  const auto segments = f.Segments();
  std::vector<TimeRange> ranges;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    for (std::size_t j = i + 1; j < segments.size(); ++j) {
      assert(!Overlaps(segments[i].timerange, segments[j].timerange));
    }
    ranges.push_back(segments[i].timerange);
  }
  assert(tams::model::TimeRangeSet::Of(ranges).ToStrings() == f.Available());
}

void TestInsertConflictAndSplitScenario() {
  Fixture f;
  f.Insert("obj-a", "[0:0_10:0)");
  f.Insert("obj-b", "[10:0_20:0)", false, "100:0");
  assert(f.Available() == std::vector<std::string>{"[0:0_20:0)"});

  bool conflict = false;
  try {
    f.Insert("obj-c", "[5:0_15:0)");
  } catch (const tams::util::OverlapConflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(f.Segments().size() == 2);
  // the rejected insert left no reference behind
  assert(f.Object("obj-c").flow_references.empty());

  const auto result = f.DeleteRange("[5:0_15:0)");
  assert(result.deleted == 0);
  assert(result.truncated == 2);

  const auto segments = f.Segments();
  assert(segments.size() == 2);
  assert(segments[0].object_id == "obj-a");
  assert(segments[0].timerange.ToString() == "[0:0_5:0)");
  assert(segments[1].object_id == "obj-b");
  assert(segments[1].timerange.ToString() == "[15:0_20:0)");
  assert(f.Available() == (std::vector<std::string>{"[0:0_5:0)", "[15:0_20:0)"}));
  AssertInvariant(f);
}

void TestTruncationAdjustsOffsets() {
  Fixture f;
  f.Insert("obj-a", "[0:0_10:0)", false, "2:0");
  f.DeleteRange("[4:0_6:0)");

  const auto segments = f.Segments();
  assert(segments.size() == 2);

  const auto& head = segments[0];
  assert(head.timerange.ToString() == "[0:0_4:0)");
  assert(head.ts_offset.ToString() == "2:0");
  assert(head.sample_offset && *head.sample_offset == 0);
  assert(!head.sample_count);
  assert(!head.key_frame_count);

  const auto& tail = segments[1];
  assert(tail.timerange.ToString() == "[6:0_10:0)");
  assert(tail.ts_offset.ToString() == "8:0");
  assert(!tail.sample_offset);
  assert(!tail.sample_count);
  assert(tail.get_urls == head.get_urls);

  // both pieces hold a reference to the shared object
  assert(f.Object("obj-a").flow_references.at(f.flow_id) == 2);
  AssertInvariant(f);
}

void TestDeleteRangeIsIdempotent() {
  Fixture f;
  f.Insert("obj-a", "[0:0_10:0)");
  f.Insert("obj-b", "[10:0_20:0)");

  const auto first = f.DeleteRange("[0:0_10:0)");
  assert(first.deleted == 1);
  const auto before = f.Segments();

  const auto second = f.DeleteRange("[0:0_10:0)");
  assert(second.Affected() == 0);
  assert(f.Segments().size() == before.size());
  assert(f.Available() == std::vector<std::string>{"[10:0_20:0)"});
}

void TestReplaceClearsOverlap() {
  Fixture f;
  f.Insert("obj-a", "[0:0_10:0)");
  f.Insert("obj-b", "[10:0_20:0)");
  f.Insert("obj-c", "[5:0_15:0)", true);

  const auto segments = f.Segments();
  assert(segments.size() == 3);
  assert(segments[0].timerange.ToString() == "[0:0_5:0)");
  assert(segments[1].object_id == "obj-c");
  assert(segments[2].timerange.ToString() == "[15:0_20:0)");
  assert(f.Available() == std::vector<std::string>{"[0:0_20:0)"});
  AssertInvariant(f);
}

void TestReferencesDropWithLastSegment() {
  Fixture f;
  f.Insert("obj-a", "[0:0_10:0)");
  assert(f.Object("obj-a").flow_references.at(f.flow_id) == 1);
  assert(!f.Object("obj-a").unreferenced_since);

  f.DeleteRange("_");
  const auto object = f.Object("obj-a");
  assert(object.flow_references.empty());
  assert(object.unreferenced_since.has_value());
  assert(f.Available().empty());

  // re-referencing clears the orphan mark
  f.Insert("obj-a", "[30:0_40:0)");
  assert(!f.Object("obj-a").unreferenced_since);
}

void TestQueryPaginatesByStart() {
  Fixture f;
  for (int i = 0; i < 5; ++i) {
    const auto range = "[" + std::to_string(i * 10) + ":0_" + std::to_string(i * 10 + 10) + ":0)";
    f.Insert("obj-" + std::to_string(i), range.c_str());
  }

  std::vector<std::string> seen;
  std::optional<TimeRange> after;
  int                      pages = 0;
  do {
    auto tx   = f.repository->Begin();
    auto page = f.index.Query(*tx, f.flow_id, R("[5:0_45:0)"), after, 2);
    for (const auto& segment : page.segments) seen.push_back(segment.object_id);
    after = page.next;
    ++pages;
  } while (after);

  assert(pages == 3);
  assert(seen == (std::vector<std::string>{"obj-0", "obj-1", "obj-2", "obj-3", "obj-4"}));

  auto tx    = f.repository->Begin();
  auto empty = f.index.Query(*tx, f.flow_id, R("[100:0_200:0)"), std::nullopt, 10);
  assert(empty.segments.empty());
  assert(!empty.next);
}

void TestReadOnlyFlowRejectsMutation() {
  Fixture f(true);
  f.EnsureObject("obj-a");

  SegmentRecord segment;
  segment.flow_id   = f.flow_id;
  segment.object_id = "obj-a";
  segment.timerange = R("[0:0_1:0)");

  bool rejected = false;
  try {
    auto tx = f.repository->Begin();
    f.index.Insert(*tx, segment, false);
  } catch (const tams::util::ReadOnlyFlow&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    f.DeleteRange("_");
  } catch (const tams::util::ReadOnlyFlow&) {
    rejected = true;
  }
  assert(rejected);
}

void TestUnknownFlowIsNotFound() {
  Fixture f;
  bool    missing = false;
  try {
    auto tx = f.repository->Begin();
    f.index.Query(*tx, tams::util::NewId(), TimeRange::Eternity(), std::nullopt, 10);
  } catch (const tams::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestRandomizedSequenceKeepsInvariant() {
  Fixture f;
  const char* inserts[] = {"[0:0_3:0)", "[3:0_7:0)", "[2:0_4:0)", "[10:0_12:0]", "(12:0_15:0)", "[1:0_11:0)"};
  const char* deletes[] = {"[1:0_2:0)", "(6:0_10:0]", "[14:0_)", "[_0:500000000)"};

  int n = 0;
  for (const auto* range : inserts) {
    f.Insert("obj-r" + std::to_string(n++), range, true);
    AssertInvariant(f);
  }
  for (const auto* range : deletes) {
    f.DeleteRange(range);
    AssertInvariant(f);
  }
}

void TestOffsetOverflowRejected() {
  Fixture f;
  f.Insert("obj-far", "[0:0_10:0)", false, "9223372036854775807:0");

  bool rejected = false;
  try {
    // the tail piece would need ts_offset + 5:0
    f.DeleteRange("[0:0_5:0)");
  } catch (const tams::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);

  const auto segments = f.Segments();
  assert(segments.size() == 1);
  assert(segments[0].timerange.ToString() == "[0:0_10:0)");
  assert(segments[0].ts_offset.ToString() == "9223372036854775807:0");
  AssertInvariant(f);
}

void TestConcurrentMutationsKeepInvariant() {
  Fixture f;

  constexpr int kThreads = 4;
  constexpr int kOps     = 60;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&f, t] {
      std::mt19937                    rng(1234 + t);
      std::uniform_int_distribution<> start(0, 39);
      std::uniform_int_distribution<> length(1, 8);
      std::uniform_int_distribution<> coin(0, 1);

      for (int i = 0; i < kOps; ++i) {
        const int  begin = start(rng);
        const int  end   = begin + length(rng);
        const auto range = std::string(coin(rng) ? "[" : "(") + std::to_string(begin) + ":0_" + std::to_string(end) + ":0" +
                           (coin(rng) ? "]" : ")");
        try {
          if (coin(rng)) {
            f.Insert("obj-t" + std::to_string(t) + "-" + std::to_string(i), range.c_str(), coin(rng) == 1);
          } else {
            f.DeleteRange(range.c_str());
          }
        } catch (const tams::util::OverlapConflict&) {
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  AssertInvariant(f);

  // reference counts agree with the surviving segments
  std::map<std::string, uint64_t> expected;
  for (const auto& segment : f.Segments()) ++expected[segment.object_id];
  for (int t = 0; t < kThreads; ++t) {
    for (int i = 0; i < kOps; ++i) {
      const auto id     = "obj-t" + std::to_string(t) + "-" + std::to_string(i);
      auto       tx     = f.repository->Begin();
      const auto object = f.repository->GetMediaObject(*tx, id);
      if (!object) continue;
      const auto it = object->flow_references.find(f.flow_id);
      assert((it == object->flow_references.end() ? 0 : it->second) == expected[id]);
    }
  }
}

} // namespace

int main() {
  TestInsertConflictAndSplitScenario();
  TestTruncationAdjustsOffsets();
  TestDeleteRangeIsIdempotent();
  TestReplaceClearsOverlap();
  TestReferencesDropWithLastSegment();
  TestQueryPaginatesByStart();
  TestReadOnlyFlowRejectsMutation();
  TestUnknownFlowIsNotFound();
  TestRandomizedSequenceKeepsInvariant();
  TestOffsetOverflowRejected();
  TestConcurrentMutationsKeepInvariant();
  std::cout << "segment_index_test: pass" << std::endl;
  return 0;
}
