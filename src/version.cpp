#include <f1uc/version.hpp>

namespace f1uc {

ServiceStatus service_status() {
  return ServiceStatus{"f1uc", F1UC_VERSION_STRING, true};
}

} // namespace f1uc
