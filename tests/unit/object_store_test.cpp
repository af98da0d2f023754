#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using tams::storage::RamObjectStore;

bool RejectsId(const std::string& object_id) {
  try {
    tams::storage::common::ValidateObjectId(object_id);
  } catch (const tams::util::ParseError&) {
    return true;
  }
  return false;
}

void TestObjectIdValidation() {
  assert(!RejectsId("clip-0001.ts"));
  assert(RejectsId(""));
  assert(RejectsId("a/b"));
  assert(RejectsId("..hidden"));
  assert(RejectsId("back\\slash"));
  assert(RejectsId(std::string(256, 'x')));
  assert(!RejectsId(std::string(255, 'x')));
}

void TestGeneratedIdsAreUniqueAndValid() {
  const auto a = tams::storage::common::GenerateObjectId();
  const auto b = tams::storage::common::GenerateObjectId();
  assert(a != b);
  assert(!RejectsId(a));
  // "<hex seconds>-<32 hex digits>"
  const auto dash = a.find('-');
  assert(dash != std::string::npos);
  assert(a.size() - dash - 1 == 32);
}

void TestJoinPath() {
  using tams::storage::common::JoinPath;
  assert(JoinPath("http://h/objects", "o1") == "http://h/objects/o1");
  assert(JoinPath("http://h/objects/", "o1") == "http://h/objects/o1");
  assert(JoinPath("", "o1") == "o1");
}

void TestRamStore() {
  RamObjectStore store("http://upload.example/", 60s);

  assert(!store.Exists("obj-1"));
  assert(!store.Stat("obj-1"));

  store.Put("obj-1", 2048, "video/mp2t");
  assert(store.Exists("obj-1"));
  const auto stat = store.Stat("obj-1");
  assert(stat && stat->size_bytes == 2048 && stat->mime_type == "video/mp2t");
  assert(store.Size() == 1);

  const auto before  = tams::util::Now();
  const auto locator = store.IssueUploadLocator("obj-2");
  assert(locator.object_id == "obj-2");
  assert(locator.put_url == "http://upload.example/obj-2");
  assert(locator.expires_at >= before + 60s);

  store.Delete("obj-1");
  store.Delete("obj-1");
  assert(store.Size() == 0);

  bool rejected = false;
  try {
    store.Put("../etc", 1, "");
  } catch (const tams::util::ParseError&) {
    rejected = true;
  }
  assert(rejected);
}

void TestFactoryDefaultsToRam() {
  tams::runtime::config::ObjectStoreConfig cfg;
  cfg.set_upload_expiry_seconds(10);
  auto store = tams::storage::StorageFactory::Build(cfg);
  assert(dynamic_cast<RamObjectStore*>(store.get()) != nullptr);
  assert(store->IssueUploadLocator("o").put_url == "mem://objects/o");
}

void TestFilesystemStore() {
  const auto root = std::filesystem::temp_directory_path() / "tams_object_store_test";
  std::filesystem::remove_all(root);

  tams::runtime::config::ObjectStoreConfig cfg;
  cfg.set_uri(root.string());
  cfg.set_upload_url_base("http://upload.example");
  cfg.set_upload_expiry_seconds(10);

  auto store = tams::storage::StorageFactory::Build(cfg);
  assert(std::filesystem::is_directory(root));
  assert(!store->Exists("obj-1"));
  assert(!store->Stat("obj-1"));

  {
    std::ofstream out(root / "obj-1", std::ios::binary);
    out << std::string(1000, 'm');
  }
  assert(store->Exists("obj-1"));
  const auto stat = store->Stat("obj-1");
  assert(stat && stat->size_bytes == 1000);

  assert(store->IssueUploadLocator("obj-9").put_url == "http://upload.example/obj-9");

  store->Delete("obj-1");
  assert(!std::filesystem::exists(root / "obj-1"));
  // already gone
  store->Delete("obj-1");

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestObjectIdValidation();
  TestGeneratedIdsAreUniqueAndValid();
  TestJoinPath();
  TestRamStore();
  TestFactoryDefaultsToRam();
  TestFilesystemStore();

  std::cout << "object_store_test: pass\n";
  return 0;
}
