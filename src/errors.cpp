#include <f1uc/errors.hpp>

namespace f1uc {

int report_current_exception(std::ostream& err) {
  try {
    throw;
  } catch (const ValidationError& e) {
    err << e.what() << "\n";
    return kExitValidation;
  } catch (const UpstreamDataError& e) {
    err << e.what() << "\n";
    return kExitUpstream;
  } catch (const std::exception& e) {
    err << "error: " << e.what() << "\n";
    return kExitFailure;
  }
}

} // namespace f1uc
