#include "mbt/transfer/types.h"
#include "mbt/common/ids.h"

namespace mbt::transfer {

bool FileMetadata::same_file(const FileMetadata& other) const {
  return file_name == other.file_name &&
         file_size == other.file_size &&
         hex_equal(checksum_md5, other.checksum_md5) &&
         hex_equal(checksum_sha256, other.checksum_sha256);
}

const char* to_string(TransferState s) {
  switch (s) {
    case TransferState::Initiating: return "Initiating";
    case TransferState::Chunking:   return "Chunking";
    case TransferState::Resuming:   return "Resuming";
    case TransferState::Uploading:  return "Uploading";
    case TransferState::Finalizing: return "Finalizing";
    case TransferState::Completed:  return "Completed";
    case TransferState::Failed:     return "Failed";
    case TransferState::Cancelled:  return "Cancelled";
  }
  return "Unknown";
}

bool is_terminal(TransferState s) {
  return s == TransferState::Completed || s == TransferState::Failed || s == TransferState::Cancelled;
}

bool can_transition(TransferState from, TransferState to) {
  if (is_terminal(from)) return false;
  if (to == TransferState::Failed || to == TransferState::Cancelled) return true;
  switch (from) {
    case TransferState::Initiating:
      return to == TransferState::Chunking || to == TransferState::Resuming;
    case TransferState::Chunking:
      return to == TransferState::Uploading;
    case TransferState::Resuming:
      // an empty missing set skips straight to finalizing
      return to == TransferState::Uploading || to == TransferState::Finalizing;
    case TransferState::Uploading:
      return to == TransferState::Finalizing;
    case TransferState::Finalizing:
      return to == TransferState::Completed;
    default:
      return false;
  }
}

} // namespace mbt::transfer
