#pragma once
#include <string>

#define F1UC_VERSION_MAJOR 1
#define F1UC_VERSION_MINOR 2
#define F1UC_VERSION_PATCH 0
#define F1UC_VERSION_STRING "1.2.0"

namespace f1uc {

struct ServiceStatus {
  std::string service;
  std::string version;
  bool healthy = false;
};

ServiceStatus service_status();

} // namespace f1uc
