#include "catalog_service.hpp"

#include <chrono>
#include <type_traits>

#include "internal/core/catalog_manager.hpp"
#include "internal/core/proto_codec.hpp"
#include "internal/deletion/deletion_workflow.hpp"
#include "internal/model/event_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace tams::service {

using namespace tams::v1;
using tams::model::TimeRange;

namespace {

// Errors caused by the request itself rather than by the service.
bool IsCallerError(const std::exception& ex) {
  return dynamic_cast<const util::ParseError*>(&ex) || dynamic_cast<const util::InvalidArgument*>(&ex) ||
         dynamic_cast<const util::NotFound*>(&ex) || dynamic_cast<const util::AlreadyExists*>(&ex) ||
         dynamic_cast<const util::OverlapConflict*>(&ex) || dynamic_cast<const util::ReadOnlyFlow*>(&ex) ||
         dynamic_cast<const util::InvalidState*>(&ex);
}

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&] {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      TAMS_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      TAMS_LOG_DEBUG("RPC ok", {observability::StringField("route", route), observability::IntField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    if (IsCallerError(ex)) {
      TAMS_LOG_WARN("RPC rejected", {observability::StringField("route", route), observability::StringField("subject", subject),
                                     observability::StringField("error", ex.what())});
    } else {
      TAMS_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("subject", subject),
                                    observability::StringField("error", ex.what()), observability::IntField("latency_ms", elapsed_ms())});
    }
    throw;
  }
}

// An empty range means every instant.
TimeRange ParseRange(const std::string& text) {
  return text.empty() ? TimeRange::Eternity() : TimeRange::Parse(text);
}

} // namespace

CatalogService::CatalogService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ServiceInfo CatalogService::GetServiceInfo(const GetServiceInfoRequest&) {
  ServiceInfo info;
  info.set_name(ctx_.identity.name);
  info.set_description(ctx_.identity.description);
  info.set_version(ctx_.identity.version);
  for (auto type : tams::model::kEventTypes) {
    info.add_event_types(std::string(type));
  }
  return info;
}

// ------------------------------------------------------------------
// Sources
// ------------------------------------------------------------------

Source CatalogService::CreateSource(const CreateSourceRequest& req) {
  return ObserveRpc("CreateSource", req.source().id(), [&] {
    if (req.source().format() == FORMAT_UNSPECIFIED) {
      throw util::InvalidArgument("source format is required");
    }
    return core::ToProto(ctx_.catalog->CreateSource(core::FromProto(req.source())));
  });
}

Source CatalogService::GetSource(const GetSourceRequest& req) {
  return ObserveRpc("GetSource", req.source_id(), [&] { return core::ToProto(ctx_.catalog->GetSource(req.source_id())); });
}

ListSourcesResponse CatalogService::ListSources(const ListSourcesRequest& req) {
  return ObserveRpc("ListSources", "", [&] {
    db::model::SourceFilter filter;
    if (!req.label().empty()) filter.label = req.label();
    if (req.format() != FORMAT_UNSPECIFIED) filter.format = core::FromProto(req.format());

    auto page = ctx_.catalog->ListSources(filter, req.page().limit(), req.page().page_key());

    ListSourcesResponse resp;
    for (const auto& source : page.items) {
      *resp.add_sources() = core::ToProto(source);
    }
    if (page.next_key) resp.set_next_key(*page.next_key);
    return resp;
  });
}

Source CatalogService::UpdateSource(const UpdateSourceRequest& req) {
  return ObserveRpc("UpdateSource", req.source().id(), [&] {
    if (req.source().format() == FORMAT_UNSPECIFIED) {
      throw util::InvalidArgument("source format is required");
    }
    return core::ToProto(ctx_.catalog->UpdateSource(core::FromProto(req.source())));
  });
}

void CatalogService::DeleteSource(const DeleteSourceRequest& req) {
  ObserveRpc("DeleteSource", req.source_id(), [&] { ctx_.catalog->DeleteSource(req.source_id()); });
}

// ------------------------------------------------------------------
// Flows
// ------------------------------------------------------------------

Flow CatalogService::CreateFlow(const CreateFlowRequest& req) {
  return ObserveRpc("CreateFlow", req.flow().id(), [&] {
    if (req.flow().format() == FORMAT_UNSPECIFIED) {
      throw util::InvalidArgument("flow format is required");
    }
    return core::ToProto(ctx_.catalog->CreateFlow(core::FromProto(req.flow())));
  });
}

Flow CatalogService::GetFlow(const GetFlowRequest& req) {
  return ObserveRpc("GetFlow", req.flow_id(), [&] { return core::ToProto(ctx_.catalog->GetFlow(req.flow_id())); });
}

ListFlowsResponse CatalogService::ListFlows(const ListFlowsRequest& req) {
  return ObserveRpc("ListFlows", "", [&] {
    db::model::FlowFilter filter;
    if (!req.source_id().empty()) filter.source_id = req.source_id();
    if (!req.label().empty()) filter.label = req.label();
    if (req.format() != FORMAT_UNSPECIFIED) filter.format = core::FromProto(req.format());

    auto page = ctx_.catalog->ListFlows(filter, req.page().limit(), req.page().page_key());

    ListFlowsResponse resp;
    for (const auto& flow : page.items) {
      *resp.add_flows() = core::ToProto(flow);
    }
    if (page.next_key) resp.set_next_key(*page.next_key);
    return resp;
  });
}

Flow CatalogService::UpdateFlow(const UpdateFlowRequest& req) {
  return ObserveRpc("UpdateFlow", req.flow().id(), [&] {
    if (req.flow().format() == FORMAT_UNSPECIFIED) {
      throw util::InvalidArgument("flow format is required");
    }
    return core::ToProto(ctx_.catalog->UpdateFlow(core::FromProto(req.flow())));
  });
}

void CatalogService::DeleteFlow(const DeleteFlowRequest& req) {
  ObserveRpc("DeleteFlow", req.flow_id(), [&] { ctx_.catalog->DeleteFlow(req.flow_id()); });
}

// ------------------------------------------------------------------
// Segments
// ------------------------------------------------------------------

AddSegmentsResponse CatalogService::AddSegments(const AddSegmentsRequest& req) {
  return ObserveRpc("AddSegments", req.flow_id(), [&] {
    std::vector<db::model::SegmentRecord> segments;
    segments.reserve(req.segments_size());
    for (const auto& segment : req.segments()) {
      segments.push_back(core::FromProto(segment));
    }

    AddSegmentsResponse resp;
    for (const auto& segment : ctx_.catalog->AddSegments(req.flow_id(), std::move(segments), req.replace())) {
      *resp.add_segments() = core::ToProto(segment);
    }
    return resp;
  });
}

ListSegmentsResponse CatalogService::ListSegments(const ListSegmentsRequest& req) {
  return ObserveRpc("ListSegments", req.flow_id(), [&] {
    auto page = ctx_.catalog->ListSegments(req.flow_id(), ParseRange(req.timerange()), req.page().limit(), req.page().page_key());

    ListSegmentsResponse resp;
    for (const auto& segment : page.items) {
      *resp.add_segments() = core::ToProto(segment);
    }
    if (page.next_key) resp.set_next_key(*page.next_key);
    return resp;
  });
}

DeleteSegmentsResponse CatalogService::DeleteSegments(const DeleteSegmentsRequest& req) {
  return ObserveRpc("DeleteSegments", req.flow_id(), [&] {
    DeleteSegmentsResponse resp;
    resp.set_segments_affected(ctx_.catalog->DeleteSegments(req.flow_id(), ParseRange(req.timerange())));
    return resp;
  });
}

// ------------------------------------------------------------------
// Media objects
// ------------------------------------------------------------------

AllocateStorageResponse CatalogService::AllocateStorage(const AllocateStorageRequest& req) {
  return ObserveRpc("AllocateStorage", req.flow_id(), [&] {
    std::vector<std::string> ids(req.object_ids().begin(), req.object_ids().end());

    AllocateStorageResponse resp;
    for (const auto& locator : ctx_.catalog->AllocateStorage(req.flow_id(), req.limit(), ids)) {
      *resp.add_media_objects() = core::ToProto(locator);
    }
    return resp;
  });
}

MediaObject CatalogService::GetMediaObject(const GetMediaObjectRequest& req) {
  return ObserveRpc("GetMediaObject", req.object_id(), [&] { return core::ToProto(ctx_.catalog->GetMediaObject(req.object_id())); });
}

// ------------------------------------------------------------------
// Deletion requests
// ------------------------------------------------------------------

DeletionRequest CatalogService::CreateDeletionRequest(const CreateDeletionRequestRequest& req) {
  return ObserveRpc("CreateDeletionRequest", req.flow_id(),
                    [&] { return core::ToProto(ctx_.deletion->Create(req.flow_id(), ParseRange(req.timerange()))); });
}

DeletionRequest CatalogService::GetDeletionRequest(const GetDeletionRequestRequest& req) {
  return ObserveRpc("GetDeletionRequest", req.request_id(), [&] { return core::ToProto(ctx_.deletion->Get(req.request_id())); });
}

ListDeletionRequestsResponse CatalogService::ListDeletionRequests(const ListDeletionRequestsRequest&) {
  return ObserveRpc("ListDeletionRequests", "", [&] {
    ListDeletionRequestsResponse resp;
    for (const auto& request : ctx_.deletion->List()) {
      *resp.add_requests() = core::ToProto(request);
    }
    return resp;
  });
}

DeletionRequest CatalogService::CancelDeletionRequest(const CancelDeletionRequestRequest& req) {
  return ObserveRpc("CancelDeletionRequest", req.request_id(), [&] { return core::ToProto(ctx_.deletion->Cancel(req.request_id())); });
}

// ------------------------------------------------------------------
// Webhooks
// ------------------------------------------------------------------

Webhook CatalogService::RegisterWebhook(const RegisterWebhookRequest& req) {
  return ObserveRpc("RegisterWebhook", req.webhook().url(),
                    [&] { return core::ToProto(ctx_.catalog->RegisterWebhook(core::FromProto(req.webhook()))); });
}

ListWebhooksResponse CatalogService::ListWebhooks(const ListWebhooksRequest&) {
  return ObserveRpc("ListWebhooks", "", [&] {
    ListWebhooksResponse resp;
    for (const auto& webhook : ctx_.catalog->ListWebhooks()) {
      *resp.add_webhooks() = core::ToProto(webhook);
    }
    return resp;
  });
}

void CatalogService::DeleteWebhook(const DeleteWebhookRequest& req) {
  ObserveRpc("DeleteWebhook", req.url(), [&] { ctx_.catalog->DeleteWebhook(req.url()); });
}

} // namespace tams::service
