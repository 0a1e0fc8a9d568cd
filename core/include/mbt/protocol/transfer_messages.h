#pragma once

#include <cstdint>
#include <vector>
#include "mbt/transfer/types.h"

namespace mbt::protocol {

// All integers big-endian; str = u16 len + bytes; blob = u32 len + bytes.
// status bytes: 0=OK, 1=FAIL. error_kind: 0=none, else mbt::ErrorKind.

// TRANSFER_REQ payload format:
// str transfer_id
// str file_name, u64 file_size, str md5, str sha256, i64 created_at_ms
// u32 chunk_size, u8 max_concurrent_chunks, u8 enable_compression
// u8 resume_transfer, u8 has_resume_token, [str resume_token]
// str authentication_token, str client_id, str target_path
// u8 has_encryption, [str algorithm, str key_derivation, u32 iterations,
//   str salt, str iv, i64 encrypted_at_s, u64 original_size,
//   str original_checksum, u32 version]
std::vector<uint8_t> serialize(const transfer::TransferRequest& m);
transfer::TransferRequest deserialize_transfer_request(const std::vector<uint8_t>& payload);

// TRANSFER_RESP payload format:
// u8 status, u8 error_kind, str error_message
// u32 count, count * u32 received chunk index
std::vector<uint8_t> serialize(const transfer::TransferResponse& m);
transfer::TransferResponse deserialize_transfer_response(const std::vector<uint8_t>& payload);

// CHUNK_DATA payload format:
// str transfer_id, u32 chunk_index, str chunk_checksum, u8 is_last_chunk, blob data
std::vector<uint8_t> serialize(const transfer::ChunkData& m);
transfer::ChunkData deserialize_chunk_data(const std::vector<uint8_t>& payload);

// CHUNK_RESULT payload format:
// u8 status, u8 error_kind, u32 chunk_index, u8 is_complete, str error_message
std::vector<uint8_t> serialize(const transfer::ChunkResult& m);
transfer::ChunkResult deserialize_chunk_result(const std::vector<uint8_t>& payload);

// FINALIZE_REQ payload format:
// str transfer_id, str authentication_token, str client_id
std::vector<uint8_t> serialize(const transfer::FinalizeRequest& m);
transfer::FinalizeRequest deserialize_finalize_request(const std::vector<uint8_t>& payload);

// RECEIVE_RESULT payload format:
// u8 status, u8 error_kind, str error_message
// u8 has_path, [str file_path], u64 bytes_received, u64 duration_ms
std::vector<uint8_t> serialize(const transfer::ReceiveResult& m);
transfer::ReceiveResult deserialize_receive_result(const std::vector<uint8_t>& payload);

} // namespace mbt::protocol
