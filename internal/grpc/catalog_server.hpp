#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/catalog_service.hpp"
#include "tams/v1.hpp"

namespace tams::grpc {

class CatalogServer final : public tams::v1::CatalogService::Service {
public:
  explicit CatalogServer(std::shared_ptr<tams::service::CatalogService> svc);

  ::grpc::Status GetServiceInfo(::grpc::ServerContext*,
                                const tams::v1::GetServiceInfoRequest*,
                                tams::v1::ServiceInfo*) override;

  ::grpc::Status CreateSource(::grpc::ServerContext*,
                              const tams::v1::CreateSourceRequest*,
                              tams::v1::Source*) override;

  ::grpc::Status GetSource(::grpc::ServerContext*,
                           const tams::v1::GetSourceRequest*,
                           tams::v1::Source*) override;

  ::grpc::Status ListSources(::grpc::ServerContext*,
                             const tams::v1::ListSourcesRequest*,
                             tams::v1::ListSourcesResponse*) override;

  ::grpc::Status UpdateSource(::grpc::ServerContext*,
                              const tams::v1::UpdateSourceRequest*,
                              tams::v1::Source*) override;

  ::grpc::Status DeleteSource(::grpc::ServerContext*,
                              const tams::v1::DeleteSourceRequest*,
                              google::protobuf::Empty*) override;

  ::grpc::Status CreateFlow(::grpc::ServerContext*,
                            const tams::v1::CreateFlowRequest*,
                            tams::v1::Flow*) override;

  ::grpc::Status GetFlow(::grpc::ServerContext*,
                         const tams::v1::GetFlowRequest*,
                         tams::v1::Flow*) override;

  ::grpc::Status ListFlows(::grpc::ServerContext*,
                           const tams::v1::ListFlowsRequest*,
                           tams::v1::ListFlowsResponse*) override;

  ::grpc::Status UpdateFlow(::grpc::ServerContext*,
                            const tams::v1::UpdateFlowRequest*,
                            tams::v1::Flow*) override;

  ::grpc::Status DeleteFlow(::grpc::ServerContext*,
                            const tams::v1::DeleteFlowRequest*,
                            google::protobuf::Empty*) override;

  ::grpc::Status AddSegments(::grpc::ServerContext*,
                             const tams::v1::AddSegmentsRequest*,
                             tams::v1::AddSegmentsResponse*) override;

  ::grpc::Status ListSegments(::grpc::ServerContext*,
                              const tams::v1::ListSegmentsRequest*,
                              tams::v1::ListSegmentsResponse*) override;

  ::grpc::Status DeleteSegments(::grpc::ServerContext*,
                                const tams::v1::DeleteSegmentsRequest*,
                                tams::v1::DeleteSegmentsResponse*) override;

  ::grpc::Status AllocateStorage(::grpc::ServerContext*,
                                 const tams::v1::AllocateStorageRequest*,
                                 tams::v1::AllocateStorageResponse*) override;

  ::grpc::Status GetMediaObject(::grpc::ServerContext*,
                                const tams::v1::GetMediaObjectRequest*,
                                tams::v1::MediaObject*) override;

  ::grpc::Status CreateDeletionRequest(::grpc::ServerContext*,
                                       const tams::v1::CreateDeletionRequestRequest*,
                                       tams::v1::DeletionRequest*) override;

  ::grpc::Status GetDeletionRequest(::grpc::ServerContext*,
                                    const tams::v1::GetDeletionRequestRequest*,
                                    tams::v1::DeletionRequest*) override;

  ::grpc::Status ListDeletionRequests(::grpc::ServerContext*,
                                      const tams::v1::ListDeletionRequestsRequest*,
                                      tams::v1::ListDeletionRequestsResponse*) override;

  ::grpc::Status CancelDeletionRequest(::grpc::ServerContext*,
                                       const tams::v1::CancelDeletionRequestRequest*,
                                       tams::v1::DeletionRequest*) override;

  ::grpc::Status RegisterWebhook(::grpc::ServerContext*,
                                 const tams::v1::RegisterWebhookRequest*,
                                 tams::v1::Webhook*) override;

  ::grpc::Status ListWebhooks(::grpc::ServerContext*,
                              const tams::v1::ListWebhooksRequest*,
                              tams::v1::ListWebhooksResponse*) override;

  ::grpc::Status DeleteWebhook(::grpc::ServerContext*,
                               const tams::v1::DeleteWebhookRequest*,
                               google::protobuf::Empty*) override;

private:
  std::shared_ptr<tams::service::CatalogService> service_;
};

}
