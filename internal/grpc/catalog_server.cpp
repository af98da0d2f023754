#include "catalog_server.hpp"
#include "grpc_error.hpp"

namespace tams::grpc {

namespace {

template <typename Fn>
::grpc::Status Invoke(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

CatalogServer::CatalogServer(std::shared_ptr<tams::service::CatalogService> svc)
    : service_(std::move(svc)) {}

::grpc::Status CatalogServer::GetServiceInfo(::grpc::ServerContext*,
                                             const tams::v1::GetServiceInfoRequest* req,
                                             tams::v1::ServiceInfo* resp) {
  return Invoke([&] { *resp = service_->GetServiceInfo(*req); });
}

::grpc::Status CatalogServer::CreateSource(::grpc::ServerContext*,
                                           const tams::v1::CreateSourceRequest* req,
                                           tams::v1::Source* resp) {
  return Invoke([&] { *resp = service_->CreateSource(*req); });
}

::grpc::Status CatalogServer::GetSource(::grpc::ServerContext*,
                                        const tams::v1::GetSourceRequest* req,
                                        tams::v1::Source* resp) {
  return Invoke([&] { *resp = service_->GetSource(*req); });
}

::grpc::Status CatalogServer::ListSources(::grpc::ServerContext*,
                                          const tams::v1::ListSourcesRequest* req,
                                          tams::v1::ListSourcesResponse* resp) {
  return Invoke([&] { *resp = service_->ListSources(*req); });
}

::grpc::Status CatalogServer::UpdateSource(::grpc::ServerContext*,
                                           const tams::v1::UpdateSourceRequest* req,
                                           tams::v1::Source* resp) {
  return Invoke([&] { *resp = service_->UpdateSource(*req); });
}

::grpc::Status CatalogServer::DeleteSource(::grpc::ServerContext*,
                                           const tams::v1::DeleteSourceRequest* req,
                                           google::protobuf::Empty*) {
  return Invoke([&] { service_->DeleteSource(*req); });
}

::grpc::Status CatalogServer::CreateFlow(::grpc::ServerContext*,
                                         const tams::v1::CreateFlowRequest* req,
                                         tams::v1::Flow* resp) {
  return Invoke([&] { *resp = service_->CreateFlow(*req); });
}

::grpc::Status CatalogServer::GetFlow(::grpc::ServerContext*,
                                      const tams::v1::GetFlowRequest* req,
                                      tams::v1::Flow* resp) {
  return Invoke([&] { *resp = service_->GetFlow(*req); });
}

::grpc::Status CatalogServer::ListFlows(::grpc::ServerContext*,
                                        const tams::v1::ListFlowsRequest* req,
                                        tams::v1::ListFlowsResponse* resp) {
  return Invoke([&] { *resp = service_->ListFlows(*req); });
}

::grpc::Status CatalogServer::UpdateFlow(::grpc::ServerContext*,
                                         const tams::v1::UpdateFlowRequest* req,
                                         tams::v1::Flow* resp) {
  return Invoke([&] { *resp = service_->UpdateFlow(*req); });
}

::grpc::Status CatalogServer::DeleteFlow(::grpc::ServerContext*,
                                         const tams::v1::DeleteFlowRequest* req,
                                         google::protobuf::Empty*) {
  return Invoke([&] { service_->DeleteFlow(*req); });
}

::grpc::Status CatalogServer::AddSegments(::grpc::ServerContext*,
                                          const tams::v1::AddSegmentsRequest* req,
                                          tams::v1::AddSegmentsResponse* resp) {
  return Invoke([&] { *resp = service_->AddSegments(*req); });
}

::grpc::Status CatalogServer::ListSegments(::grpc::ServerContext*,
                                           const tams::v1::ListSegmentsRequest* req,
                                           tams::v1::ListSegmentsResponse* resp) {
  return Invoke([&] { *resp = service_->ListSegments(*req); });
}

::grpc::Status CatalogServer::DeleteSegments(::grpc::ServerContext*,
                                             const tams::v1::DeleteSegmentsRequest* req,
                                             tams::v1::DeleteSegmentsResponse* resp) {
  return Invoke([&] { *resp = service_->DeleteSegments(*req); });
}

::grpc::Status CatalogServer::AllocateStorage(::grpc::ServerContext*,
                                              const tams::v1::AllocateStorageRequest* req,
                                              tams::v1::AllocateStorageResponse* resp) {
  return Invoke([&] { *resp = service_->AllocateStorage(*req); });
}

::grpc::Status CatalogServer::GetMediaObject(::grpc::ServerContext*,
                                             const tams::v1::GetMediaObjectRequest* req,
                                             tams::v1::MediaObject* resp) {
  return Invoke([&] { *resp = service_->GetMediaObject(*req); });
}

::grpc::Status CatalogServer::CreateDeletionRequest(::grpc::ServerContext*,
                                                    const tams::v1::CreateDeletionRequestRequest* req,
                                                    tams::v1::DeletionRequest* resp) {
  return Invoke([&] { *resp = service_->CreateDeletionRequest(*req); });
}

::grpc::Status CatalogServer::GetDeletionRequest(::grpc::ServerContext*,
                                                 const tams::v1::GetDeletionRequestRequest* req,
                                                 tams::v1::DeletionRequest* resp) {
  return Invoke([&] { *resp = service_->GetDeletionRequest(*req); });
}

::grpc::Status CatalogServer::ListDeletionRequests(::grpc::ServerContext*,
                                                   const tams::v1::ListDeletionRequestsRequest* req,
                                                   tams::v1::ListDeletionRequestsResponse* resp) {
  return Invoke([&] { *resp = service_->ListDeletionRequests(*req); });
}

::grpc::Status CatalogServer::CancelDeletionRequest(::grpc::ServerContext*,
                                                    const tams::v1::CancelDeletionRequestRequest* req,
                                                    tams::v1::DeletionRequest* resp) {
  return Invoke([&] { *resp = service_->CancelDeletionRequest(*req); });
}

::grpc::Status CatalogServer::RegisterWebhook(::grpc::ServerContext*,
                                              const tams::v1::RegisterWebhookRequest* req,
                                              tams::v1::Webhook* resp) {
  return Invoke([&] { *resp = service_->RegisterWebhook(*req); });
}

::grpc::Status CatalogServer::ListWebhooks(::grpc::ServerContext*,
                                           const tams::v1::ListWebhooksRequest* req,
                                           tams::v1::ListWebhooksResponse* resp) {
  return Invoke([&] { *resp = service_->ListWebhooks(*req); });
}

::grpc::Status CatalogServer::DeleteWebhook(::grpc::ServerContext*,
                                            const tams::v1::DeleteWebhookRequest* req,
                                            google::protobuf::Empty*) {
  return Invoke([&] { service_->DeleteWebhook(*req); });
}

}
