#pragma once

#include "service_context.hpp"
#include "tams/v1.hpp"

namespace tams::service {

/*
  Wire-level catalog API. Converts messages to records, calls the core and
  converts back; domain errors propagate as exceptions for the transport
  to map.
*/
class CatalogService {
public:
  explicit CatalogService(ServiceContext ctx);

  tams::v1::ServiceInfo GetServiceInfo(const tams::v1::GetServiceInfoRequest& req);

  tams::v1::Source              CreateSource(const tams::v1::CreateSourceRequest& req);
  tams::v1::Source              GetSource(const tams::v1::GetSourceRequest& req);
  tams::v1::ListSourcesResponse ListSources(const tams::v1::ListSourcesRequest& req);
  tams::v1::Source              UpdateSource(const tams::v1::UpdateSourceRequest& req);
  void                          DeleteSource(const tams::v1::DeleteSourceRequest& req);

  tams::v1::Flow              CreateFlow(const tams::v1::CreateFlowRequest& req);
  tams::v1::Flow              GetFlow(const tams::v1::GetFlowRequest& req);
  tams::v1::ListFlowsResponse ListFlows(const tams::v1::ListFlowsRequest& req);
  tams::v1::Flow              UpdateFlow(const tams::v1::UpdateFlowRequest& req);
  void                        DeleteFlow(const tams::v1::DeleteFlowRequest& req);

  tams::v1::AddSegmentsResponse    AddSegments(const tams::v1::AddSegmentsRequest& req);
  tams::v1::ListSegmentsResponse   ListSegments(const tams::v1::ListSegmentsRequest& req);
  tams::v1::DeleteSegmentsResponse DeleteSegments(const tams::v1::DeleteSegmentsRequest& req);

  tams::v1::AllocateStorageResponse AllocateStorage(const tams::v1::AllocateStorageRequest& req);
  tams::v1::MediaObject             GetMediaObject(const tams::v1::GetMediaObjectRequest& req);

  tams::v1::DeletionRequest              CreateDeletionRequest(const tams::v1::CreateDeletionRequestRequest& req);
  tams::v1::DeletionRequest              GetDeletionRequest(const tams::v1::GetDeletionRequestRequest& req);
  tams::v1::ListDeletionRequestsResponse ListDeletionRequests(const tams::v1::ListDeletionRequestsRequest& req);
  tams::v1::DeletionRequest              CancelDeletionRequest(const tams::v1::CancelDeletionRequestRequest& req);

  tams::v1::Webhook              RegisterWebhook(const tams::v1::RegisterWebhookRequest& req);
  tams::v1::ListWebhooksResponse ListWebhooks(const tams::v1::ListWebhooksRequest& req);
  void                           DeleteWebhook(const tams::v1::DeleteWebhookRequest& req);

private:
  ServiceContext ctx_;
};

}
