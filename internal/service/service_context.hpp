#pragma once

#include <memory>
#include <string>

namespace tams::core { class CatalogManager; }
namespace tams::deletion { class DeletionWorkflow; }

namespace tams::service {

struct ServiceIdentity {
  std::string name;
  std::string description;
  std::string version;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tams::core::CatalogManager>       catalog;
  std::shared_ptr<tams::deletion::DeletionWorkflow> deletion;
  ServiceIdentity                                   identity;
};

}
