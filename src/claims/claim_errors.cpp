#include "claims/claim_errors.h"

namespace merkleclaim {

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::InvalidProof:
    return "InvalidProof";
  case ErrorKind::AlreadyClaimed:
    return "AlreadyClaimed";
  case ErrorKind::ClaimsPaused:
    return "ClaimsPaused";
  case ErrorKind::Unauthorized:
    return "Unauthorized";
  case ErrorKind::TransferFailed:
    return "TransferFailed";
  case ErrorKind::ProtectedAsset:
    return "ProtectedAsset";
  case ErrorKind::NotPending:
    return "NotPending";
  case ErrorKind::StorageFailed:
    return "StorageFailed";
  }
  return "Unknown";
}

} // namespace merkleclaim
