#pragma once

#include "tams/catalog/v1/types.pb.h"

#include "tams/services/v1/catalog_service.pb.h"
#include "tams/services/v1/catalog_service.grpc.pb.h"

namespace tams::v1 {
using namespace ::tams::catalog::v1;
using namespace ::tams::services::v1;
}
