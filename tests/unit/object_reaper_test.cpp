#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/catalog_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/gc/object_reaper.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using tams::model::TimeRange;

// Store whose deletes fail until told otherwise.
class FlakyStore final : public tams::storage::ObjectStore {
 public:
  explicit FlakyStore(std::shared_ptr<tams::storage::RamObjectStore> inner) : inner_(std::move(inner)) {
  }

  bool Exists(const std::string& object_id) override {
    return inner_->Exists(object_id);
  }
  std::optional<tams::storage::ObjectStat> Stat(const std::string& object_id) override {
    return inner_->Stat(object_id);
  }
  tams::storage::UploadLocator IssueUploadLocator(const std::string& object_id) override {
    return inner_->IssueUploadLocator(object_id);
  }
  void Delete(const std::string& object_id) override {
    if (failing) throw tams::util::StorageFailure("bucket unavailable");
    inner_->Delete(object_id);
  }

  bool failing = false;

 private:
  std::shared_ptr<tams::storage::RamObjectStore> inner_;
};

struct Harness {
  std::shared_ptr<tams::db::memory::MemoryRepository> repository = std::make_shared<tams::db::memory::MemoryRepository>();
  std::shared_ptr<tams::storage::RamObjectStore>      ram        = std::make_shared<tams::storage::RamObjectStore>();
  std::shared_ptr<FlakyStore>                         store      = std::make_shared<FlakyStore>(ram);
  tams::core::CatalogManager catalog{repository, std::make_shared<tams::index::SegmentIndex>(repository), store, tams::core::CatalogOptions{}};
  tams::gc::ObjectReaper     reaper{repository, store, 3600s, 1h};

  std::string flow_id;

  Harness() {
    flow_id = catalog.CreateFlow({}).id;
    ram->Put("obj-kept", 10, "video/mp2t");
    ram->Put("obj-orphan", 20, "video/mp2t");

    tams::db::model::SegmentRecord kept;
    kept.object_id = "obj-kept";
    kept.timerange = TimeRange::Parse("[0:0_10:0)");
    tams::db::model::SegmentRecord orphan;
    orphan.object_id = "obj-orphan";
    orphan.timerange = TimeRange::Parse("[10:0_20:0)");
    catalog.AddSegments(flow_id, {kept, orphan}, false);

    catalog.DeleteSegments(flow_id, TimeRange::Parse("[10:0_20:0)"));
  }

  bool Catalogued(const std::string& object_id) {
    try {
      catalog.GetMediaObject(object_id);
      return true;
    } catch (const tams::util::NotFound&) {
      return false;
    }
  }
};

void TestRetentionIsHonoured() {
  Harness h;
  assert(h.reaper.RunOnce(tams::util::Now()) == 0);
  assert(h.Catalogued("obj-orphan"));
  assert(h.ram->Exists("obj-orphan"));

  assert(h.reaper.RunOnce(tams::util::Now() + 2h) == 1);
  assert(!h.Catalogued("obj-orphan"));
  assert(!h.ram->Exists("obj-orphan"));

  // referenced objects are never touched
  assert(h.Catalogued("obj-kept"));
  assert(h.ram->Exists("obj-kept"));
  assert(h.reaper.RunOnce(tams::util::Now() + 2h) == 0);
}

void TestStoreFailureKeepsRowForRetry() {
  Harness h;
  h.store->failing = true;
  assert(h.reaper.RunOnce(tams::util::Now() + 2h) == 0);
  assert(h.Catalogued("obj-orphan"));

  h.store->failing = false;
  assert(h.reaper.RunOnce(tams::util::Now() + 2h) == 1);
  assert(!h.Catalogued("obj-orphan"));
}

void TestReReferencedObjectSurvives() {
  Harness h;

  tams::db::model::SegmentRecord again;
  again.object_id = "obj-orphan";
  again.timerange = TimeRange::Parse("[30:0_40:0)");
  h.catalog.AddSegments(h.flow_id, {again}, false);

  assert(h.reaper.RunOnce(tams::util::Now() + 2h) == 0);
  assert(h.Catalogued("obj-orphan"));
  assert(!h.catalog.GetMediaObject("obj-orphan").unreferenced_since);
}

void TestBackgroundLoopStops() {
  Harness h;
  h.reaper.Start();
  h.reaper.Stop();
  // still within retention
  assert(h.Catalogued("obj-orphan"));
}

} // namespace

int main() {
  TestRetentionIsHonoured();
  TestStoreFailureKeepsRowForRetry();
  TestReReferencedObjectSurvives();
  TestBackgroundLoopStops();

  std::cout << "object_reaper_test: pass\n";
  return 0;
}
