#include "pod-validator/Logger.hpp"

namespace podval {

// DLL-safe singleton implementation
ValidatorLogger &ValidatorLogger::instance() {
  static ValidatorLogger logger;
  return logger;
}

} // namespace podval
