#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "mbt/common/error.h"
#include "mbt/crypto/encryption_metadata.h"

namespace mbt::transfer {

using Clock = std::chrono::system_clock;

// Identifies the logical file independent of any transfer attempt.
struct FileMetadata {
  std::string file_name;
  uint64_t file_size = 0;
  std::string checksum_md5;
  std::string checksum_sha256;
  Clock::time_point created_at{};

  // Name, size and both checksums; creation time is not part of identity.
  bool same_file(const FileMetadata& other) const;
};

struct ChunkingStrategy {
  uint32_t chunk_size = 1024 * 1024;
  int max_concurrent_chunks = 2;
  bool enable_compression = false;
};

enum class TransferState {
  Initiating,
  Chunking,
  Resuming,
  Uploading,
  Finalizing,
  Completed,
  Failed,
  Cancelled
};

const char* to_string(TransferState s);
bool is_terminal(TransferState s);
bool can_transition(TransferState from, TransferState to);

struct TransferRequest {
  std::string transfer_id;
  FileMetadata metadata;
  ChunkingStrategy strategy;
  bool resume_transfer = false;
  std::optional<std::string> resume_token;
  std::string authentication_token;
  std::string client_id;
  std::string target_path;  // relative to the receiver's storage dir; empty = <transfer_id>/<file_name>
  std::optional<crypto::EncryptionMetadata> encryption;
};

// Handshake answer to a TransferRequest.
struct TransferResponse {
  bool success = false;
  std::optional<std::string> error_message;
  std::optional<ErrorKind> error_kind;
  std::vector<uint32_t> received_chunks;  // already held by the receiver
};

struct ChunkData {
  std::string transfer_id;
  uint32_t chunk_index = 0;
  std::vector<uint8_t> data;
  std::string chunk_checksum;  // MD5 hex
  bool is_last_chunk = false;
};

struct ChunkResult {
  bool success = false;
  std::optional<std::string> error_message;
  std::optional<ErrorKind> error_kind;
  uint32_t chunk_index = 0;
  bool is_complete = false;  // whole file reassembled and verified
};

struct FinalizeRequest {
  std::string transfer_id;
  std::string authentication_token;
  std::string client_id;
};

struct ReceiveRequest {
  std::string transfer_id;
  FileMetadata metadata;
  std::string target_path;
  std::string authentication_token;
  std::string client_id;
};

struct ReceiveResult {
  bool success = false;
  std::optional<std::string> error_message;
  std::optional<ErrorKind> error_kind;
  std::optional<std::string> file_path;
  uint64_t bytes_received = 0;
  std::chrono::milliseconds duration{0};
};

struct ResumeInfo {
  std::string transfer_id;
  FileMetadata metadata;
  int64_t last_completed_chunk = -1;  // -1 when nothing completed yet
  std::vector<uint32_t> completed_chunks;
  uint32_t chunk_count = 0;
  Clock::time_point created_at{};
};

struct TransferResult {
  bool success = false;
  std::string transfer_id;
  uint64_t bytes_transferred = 0;
  std::chrono::milliseconds duration{0};
  std::optional<std::string> resume_token;
  std::optional<std::string> checksum_hash;
  std::optional<std::string> error_message;
  std::optional<Error> error;
  TransferState final_state = TransferState::Initiating;
};

} // namespace mbt::transfer
