#include <remex/backend.h>

#include "local_backend.h"
#include "sandbox_backend.h"

BackendTable DefaultBackendTable() {
  BackendTable ret;
  ret[(size_t)BackendKind::LOCAL_PROCESS] = std::make_shared<LocalProcessBackend>();
  ret[(size_t)BackendKind::TEMPLATE_SANDBOX] = std::make_shared<SandboxBackend>(BackendKind::TEMPLATE_SANDBOX);
  ret[(size_t)BackendKind::SNAPSHOT_SANDBOX] = std::make_shared<SandboxBackend>(BackendKind::SNAPSHOT_SANDBOX);
  return ret;
}
