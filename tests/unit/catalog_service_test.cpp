#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/catalog_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/deletion/deletion_workflow.hpp"
#include "internal/service/catalog_service.hpp"
#include "internal/storage/ram/ram_object_store.hpp"
#include "internal/util/errors.hpp"
#include "tams/v1.hpp"

namespace {

struct Fixture {
  std::shared_ptr<tams::db::memory::MemoryRepository> repository = std::make_shared<tams::db::memory::MemoryRepository>();
  std::shared_ptr<tams::storage::RamObjectStore>      store      = std::make_shared<tams::storage::RamObjectStore>("http://upload.example");
  std::unique_ptr<tams::service::CatalogService>      service;

  Fixture() {
    auto index = std::make_shared<tams::index::SegmentIndex>(repository);

    tams::core::CatalogOptions options;
    options.public_url_base = "http://media.example";

    tams::service::ServiceContext ctx;
    ctx.catalog  = std::make_shared<tams::core::CatalogManager>(repository, index, store, options);
    ctx.deletion = std::make_shared<tams::deletion::DeletionWorkflow>(repository, index, std::make_shared<tams::lease::LeaseTable>(),
                                                                      tams::deletion::DeletionOptions{});
    ctx.identity = {"tams", "catalog under test", "1.2.3"};
    service      = std::make_unique<tams::service::CatalogService>(ctx);
  }

  tams::v1::Flow CreateFlow() {
    tams::v1::CreateSourceRequest source_req;
    source_req.mutable_source()->set_format(tams::v1::FORMAT_VIDEO);
    source_req.mutable_source()->set_label("camera 1");
    const auto source = service->CreateSource(source_req);

    tams::v1::CreateFlowRequest flow_req;
    auto*                       flow = flow_req.mutable_flow();
    flow->set_source_id(source.id());
    flow->set_format(tams::v1::FORMAT_VIDEO);
    flow->set_codec("video/h264");
    flow->set_frame_width(1920);
    flow->set_frame_height(1080);
    return service->CreateFlow(flow_req);
  }

  void AddSegment(const std::string& flow_id, const std::string& object_id, const std::string& range) {
    tams::v1::AddSegmentsRequest req;
    req.set_flow_id(flow_id);
    auto* segment = req.add_segments();
    segment->set_object_id(object_id);
    segment->set_timerange(range);
    segment->set_sample_count(250);
    service->AddSegments(req);
  }
};

void TestServiceInfoListsEventTypes() {
  Fixture    f;
  const auto info = f.service->GetServiceInfo({});
  assert(info.name() == "tams");
  assert(info.version() == "1.2.3");
  assert(info.event_types_size() == 8);
  assert(info.event_types(0) == "source.created");
}

void TestFlowRoundTripsThroughWire() {
  Fixture    f;
  const auto flow = f.CreateFlow();
  assert(!flow.id().empty());
  assert(flow.frame_width() == 1920);
  assert(flow.available_timerange_size() == 0);
  assert(flow.timerange().empty());

  tams::v1::GetFlowRequest get;
  get.set_flow_id(flow.id());
  const auto fetched = f.service->GetFlow(get);
  assert(fetched.codec() == "video/h264");
  assert(fetched.source_id() == flow.source_id());

  tams::v1::ListFlowsRequest by_source;
  by_source.set_source_id(flow.source_id());
  assert(f.service->ListFlows(by_source).flows_size() == 1);

  tams::v1::ListFlowsRequest by_format;
  by_format.set_format(tams::v1::FORMAT_AUDIO);
  assert(f.service->ListFlows(by_format).flows_size() == 0);
}

void TestSegmentsAndCoverage() {
  Fixture    f;
  const auto flow = f.CreateFlow();
  f.AddSegment(flow.id(), "obj-a", "[0:0_10:0)");
  f.AddSegment(flow.id(), "obj-b", "[10:0_20:0)");

  tams::v1::GetFlowRequest get;
  get.set_flow_id(flow.id());
  auto fetched = f.service->GetFlow(get);
  assert(fetched.available_timerange_size() == 1);
  assert(fetched.timerange() == "[0:0_20:0)");

  tams::v1::ListSegmentsRequest list;
  list.set_flow_id(flow.id());
  list.set_timerange("[5:0_12:0)");
  auto listed = f.service->ListSegments(list);
  assert(listed.segments_size() == 2);
  assert(listed.segments(0).get_urls(0).url() == "http://media.example/obj-a");
  assert(listed.segments(0).sample_count() == 250);
  assert(listed.next_key().empty());

  tams::v1::DeleteSegmentsRequest del;
  del.set_flow_id(flow.id());
  del.set_timerange("[5:0_15:0)");
  assert(f.service->DeleteSegments(del).segments_affected() == 2);

  fetched = f.service->GetFlow(get);
  assert(fetched.available_timerange_size() == 2);
  assert(fetched.available_timerange(0) == "[0:0_5:0)");
  assert(fetched.available_timerange(1) == "[15:0_20:0)");
  assert(fetched.timerange() == "[0:0_20:0)");

  list.clear_timerange();
  listed = f.service->ListSegments(list);
  assert(listed.segments(1).ts_offset() == "5:0");
  assert(!listed.segments(1).has_sample_count());

  tams::v1::GetMediaObjectRequest object_req;
  object_req.set_object_id("obj-b");
  const auto object = f.service->GetMediaObject(object_req);
  assert(object.flow_references_size() == 1);
  assert(object.flow_references(0).segment_count() == 1);
}

void TestAllocateStorage() {
  Fixture    f;
  const auto flow = f.CreateFlow();

  tams::v1::AllocateStorageRequest req;
  req.set_flow_id(flow.id());
  req.set_limit(3);
  const auto resp = f.service->AllocateStorage(req);
  assert(resp.media_objects_size() == 3);
  for (const auto& location : resp.media_objects()) {
    assert(location.put_url() == "http://upload.example/" + location.object_id());
    assert(location.has_expires_at());
  }
}

void TestDeletionRequestLifecycle() {
  Fixture    f;
  const auto flow = f.CreateFlow();
  f.AddSegment(flow.id(), "obj-a", "[0:0_10:0)");

  tams::v1::CreateDeletionRequestRequest create;
  create.set_flow_id(flow.id());
  create.set_timerange("[0:0_5:0)");
  const auto created = f.service->CreateDeletionRequest(create);
  assert(created.status() == tams::v1::DELETION_STATUS_PENDING);
  assert(created.remaining() == "[0:0_5:0)");

  assert(f.service->ListDeletionRequests({}).requests_size() == 1);

  tams::v1::CancelDeletionRequestRequest cancel;
  cancel.set_request_id(created.id());
  const auto cancelled = f.service->CancelDeletionRequest(cancel);
  assert(cancelled.status() == tams::v1::DELETION_STATUS_ERROR);
  assert(cancelled.error() == "cancelled");

  tams::v1::GetDeletionRequestRequest get;
  get.set_request_id(created.id());
  assert(f.service->GetDeletionRequest(get).status() == tams::v1::DELETION_STATUS_ERROR);
}

void TestWebhookKeyNeverReturned() {
  Fixture f;

  tams::v1::RegisterWebhookRequest req;
  req.mutable_webhook()->set_url("http://hooks.example/a");
  req.mutable_webhook()->set_api_key_name("Authorization");
  req.mutable_webhook()->set_api_key_value("Bearer abc");
  req.mutable_webhook()->add_events("*");
  const auto registered = f.service->RegisterWebhook(req);
  assert(registered.api_key_value().empty());
  assert(registered.api_key_name() == "Authorization");

  const auto listed = f.service->ListWebhooks({});
  assert(listed.webhooks_size() == 1);
  assert(listed.webhooks(0).api_key_value().empty());

  tams::v1::DeleteWebhookRequest del;
  del.set_url("http://hooks.example/a");
  f.service->DeleteWebhook(del);
  assert(f.service->ListWebhooks({}).webhooks_size() == 0);
}

void TestUnspecifiedFormatRejected() {
  Fixture f;

  tams::v1::CreateSourceRequest req;
  bool                          rejected = false;
  try {
    f.service->CreateSource(req);
  } catch (const tams::util::InvalidArgument&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestServiceInfoListsEventTypes();
  TestFlowRoundTripsThroughWire();
  TestSegmentsAndCoverage();
  TestAllocateStorage();
  TestDeletionRequestLifecycle();
  TestWebhookKeyNeverReturned();
  TestUnspecifiedFormatRejected();

  std::cout << "catalog_service_test: pass\n";
  return 0;
}
