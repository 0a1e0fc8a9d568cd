#include "mbt/transfer/chunk_receiver.h"
#include "mbt/common/ids.h"
#include "mbt/integrity/checksum.h"
#include "mbt/log/logger.h"
#include <cstdio>
#include <filesystem>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace mbt::transfer {

using integrity::ChecksumValidator;

static constexpr const char* kEncPrefix = "enc.";

ReceiverConfig ReceiverConfig::from(const Config& c) {
  ReceiverConfig r;
  r.storage_dir = c.storage_dir;
  r.temp_dir = c.temp_dir;
  r.max_chunk_bytes = c.max_chunk_bytes;
  return r;
}

static std::chrono::milliseconds since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

static TransferResponse reject_transfer(ErrorKind kind, const std::string& msg) {
  Logger::instance().warn("transfer rejected: " + msg);
  TransferResponse r;
  r.success = false;
  r.error_kind = kind;
  r.error_message = msg;
  return r;
}

static ChunkResult reject_chunk(uint32_t index, ErrorKind kind, const std::string& msg) {
  Logger::instance().warn("chunk " + std::to_string(index) + " rejected: " + msg);
  ChunkResult r;
  r.success = false;
  r.chunk_index = index;
  r.error_kind = kind;
  r.error_message = msg;
  return r;
}

static ReceiveResult receive_failure(ErrorKind kind, const std::string& msg) {
  ReceiveResult r;
  r.success = false;
  r.error_kind = kind;
  r.error_message = msg;
  return r;
}

ChunkReceiver::ChunkReceiver(ReceiverConfig cfg, auth::Authorizer& authorizer)
  : cfg_(std::move(cfg)), authorizer_(authorizer), chunks_(cfg_.temp_dir) {}

bool ChunkReceiver::initialize() {
  std::error_code ec;
  fs::create_directories(cfg_.storage_dir, ec);
  if (ec) {
    Logger::instance().error("cannot create storage dir " + cfg_.storage_dir + ": " + ec.message());
    return false;
  }
  return chunks_.initialize();
}

Result<std::string> ChunkReceiver::resolve_target(const std::string& transfer_id, const FileMetadata& meta,
                                                  const std::string& target_path) const {
  const std::string& name = meta.file_name;
  if (name.empty() || name == "." || name == ".." ||
      name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
    return Error::configuration("invalid file name '" + name + "'");
  }
  if (target_path.empty()) {
    return (fs::path(cfg_.storage_dir) / transfer_id / name).string();
  }
  fs::path p(target_path);
  if (p.is_absolute()) return Error::configuration("target path must be relative: " + target_path);
  for (const auto& part : p) {
    if (part == "..") return Error::configuration("target path must not contain '..': " + target_path);
  }
  if (!p.has_filename()) return Error::configuration("target path names no file: " + target_path);
  return (fs::path(cfg_.storage_dir) / p).string();
}

std::string ChunkReceiver::manifest_text(const ReceiveSession& s) const {
  using namespace std::chrono;
  std::ostringstream os;
  os << "transfer_id=" << s.transfer_id << "\n"
     << "file_name=" << s.metadata.file_name << "\n"
     << "file_size=" << s.metadata.file_size << "\n"
     << "checksum_md5=" << s.metadata.checksum_md5 << "\n"
     << "checksum_sha256=" << s.metadata.checksum_sha256 << "\n"
     << "created_at=" << duration_cast<milliseconds>(s.metadata.created_at.time_since_epoch()).count() << "\n"
     << "chunk_size=" << s.plan.strategy.chunk_size << "\n"
     << "max_concurrent_chunks=" << s.plan.strategy.max_concurrent_chunks << "\n"
     << "final_path=" << s.final_path << "\n";
  if (s.encryption) {
    std::istringstream enc(s.encryption->to_text());
    std::string line;
    while (std::getline(enc, line)) {
      if (!line.empty()) os << kEncPrefix << line << "\n";
    }
  }
  return os.str();
}

std::shared_ptr<ReceiveSession> ChunkReceiver::restore(const std::string& transfer_id) {
  auto text = chunks_.load_manifest(transfer_id);
  if (!text) return nullptr;

  std::map<std::string, std::string> kv;
  std::string enc_text;
  std::istringstream is(*text);
  std::string line;
  while (std::getline(is, line)) {
    if (line.rfind(kEncPrefix, 0) == 0) {
      enc_text += line.substr(4) + "\n";
      continue;
    }
    auto eq = line.find('=');
    if (eq != std::string::npos) kv[line.substr(0, eq)] = line.substr(eq + 1);
  }

  auto s = std::make_shared<ReceiveSession>();
  try {
    s->transfer_id = kv.at("transfer_id");
    s->metadata.file_name = kv.at("file_name");
    s->metadata.file_size = std::stoull(kv.at("file_size"));
    s->metadata.checksum_md5 = kv.at("checksum_md5");
    s->metadata.checksum_sha256 = kv.at("checksum_sha256");
    s->metadata.created_at = Clock::time_point(std::chrono::milliseconds(std::stoll(kv.at("created_at"))));
    ChunkingStrategy strategy;
    strategy.chunk_size = static_cast<uint32_t>(std::stoul(kv.at("chunk_size")));
    strategy.max_concurrent_chunks = std::stoi(kv.at("max_concurrent_chunks"));
    s->final_path = kv.at("final_path");
    if (!enc_text.empty()) s->encryption = crypto::EncryptionMetadata::from_text(enc_text);

    auto plan = ChunkPlanner::plan(s->metadata.file_size, strategy);
    if (!plan) throw std::runtime_error(plan.error().message);
    s->plan = *plan;
  } catch (const std::exception& e) {
    Logger::instance().warn("ignoring unreadable manifest for " + transfer_id + ": " + e.what());
    return nullptr;
  }
  if (s->transfer_id != transfer_id) {
    Logger::instance().warn("manifest in " + chunks_.transfer_dir(transfer_id) + " names another transfer");
    return nullptr;
  }

  for (uint32_t i : chunks_.list_chunks(transfer_id)) {
    if (i >= s->plan.chunk_count) continue;
    auto n = chunks_.chunk_size(transfer_id, i);
    if (!n || *n != s->plan.span(i).length) continue;  // short file from a crash; will be resent
    s->received.insert(i);
    s->bytes_received += *n;
  }
  s->started_at = Clock::now();
  s->last_activity = s->started_at;
  sessions_[transfer_id] = s;
  Logger::instance().info("restored transfer " + transfer_id + " from disk with " +
                          std::to_string(s->received.size()) + "/" + std::to_string(s->plan.chunk_count) + " chunks");
  return s;
}

std::shared_ptr<ReceiveSession> ChunkReceiver::find(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(transfer_id);
  if (it != sessions_.end()) return it->second;
  return nullptr;
}

TransferResponse ChunkReceiver::begin(const TransferRequest& req) {
  if (!authorizer_.authorize(req.authentication_token, req.client_id)) {
    return reject_transfer(ErrorKind::Fatal, "authentication failed for client '" + req.client_id + "'");
  }
  if (!is_valid_id(req.transfer_id)) {
    return reject_transfer(ErrorKind::Configuration, "invalid transfer id");
  }
  if (req.strategy.chunk_size > cfg_.max_chunk_bytes) {
    return reject_transfer(ErrorKind::Configuration, "chunk size " + std::to_string(req.strategy.chunk_size) +
                           " exceeds receiver limit " + std::to_string(cfg_.max_chunk_bytes));
  }
  auto plan = ChunkPlanner::plan(req.metadata.file_size, req.strategy);
  if (!plan) return reject_transfer(plan.error().kind, plan.error().message);
  auto target = resolve_target(req.transfer_id, req.metadata, req.target_path);
  if (!target) return reject_transfer(target.error().kind, target.error().message);

  std::shared_ptr<ReceiveSession> s;
  bool created = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(req.transfer_id);
    if (it != sessions_.end()) {
      s = it->second;
    } else {
      s = restore(req.transfer_id);
    }
    if (!s) {
      s = std::make_shared<ReceiveSession>();
      s->transfer_id = req.transfer_id;
      s->metadata = req.metadata;
      s->plan = *plan;
      s->final_path = *target;
      s->encryption = req.encryption;
      s->started_at = Clock::now();
      s->last_activity = s->started_at;
      auto st = chunks_.save_manifest(req.transfer_id, manifest_text(*s));
      if (!st) return reject_transfer(st.error().kind, st.error().message);
      sessions_[req.transfer_id] = s;
      created = true;
    }
  }

  std::lock_guard<std::mutex> lk(s->mu);
  if (!s->metadata.same_file(req.metadata) || s->plan.strategy.chunk_size != req.strategy.chunk_size) {
    return reject_transfer(ErrorKind::StaleResume,
                           "transfer " + req.transfer_id + " is already registered for a different file");
  }
  if (s->result && !s->result->success) {
    return reject_transfer(s->result->error_kind.value_or(ErrorKind::Fatal),
                           s->result->error_message.value_or("transfer failed"));
  }
  s->last_activity = Clock::now();

  TransferResponse resp;
  resp.success = true;
  resp.received_chunks.assign(s->received.begin(), s->received.end());
  if (created) {
    Logger::instance().info("transfer " + req.transfer_id + " started: " + req.metadata.file_name + " (" +
                            std::to_string(req.metadata.file_size) + " bytes, " +
                            std::to_string(s->plan.chunk_count) + " chunks) from client '" + req.client_id + "'");
  } else {
    Logger::instance().debug("transfer " + req.transfer_id + " re-attached with " +
                             std::to_string(s->received.size()) + " chunks already received");
  }
  return resp;
}

ReceiveResult ChunkReceiver::receive(const ReceiveRequest& req) {
  const auto start = Clock::now();
  if (!authorizer_.authorize(req.authentication_token, req.client_id)) {
    return receive_failure(ErrorKind::Fatal, "authentication failed for client '" + req.client_id + "'");
  }
  if (!is_valid_id(req.transfer_id)) return receive_failure(ErrorKind::Configuration, "invalid transfer id");
  auto target = resolve_target(req.transfer_id, req.metadata, req.target_path);
  if (!target) return receive_failure(target.error().kind, target.error().message);

  std::error_code ec;
  fs::create_directories(fs::path(*target).parent_path(), ec);
  if (ec) return receive_failure(ErrorKind::Fatal, "cannot create target directory: " + ec.message());

  ReceiveResult res;
  res.success = true;
  res.file_path = *target;
  if (auto s = find(req.transfer_id)) {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->result) return *s->result;
    res.bytes_received = s->bytes_received;
  }
  res.duration = since(start);
  return res;
}

ChunkResult ChunkReceiver::receive_chunk(const ChunkData& c) {
  auto s = find(c.transfer_id);
  if (!s) return reject_chunk(c.chunk_index, ErrorKind::Fatal, "unknown transfer " + c.transfer_id);

  if (c.chunk_index >= s->plan.chunk_count) {
    return reject_chunk(c.chunk_index, ErrorKind::Fatal,
                        "chunk index out of range (count " + std::to_string(s->plan.chunk_count) + ")");
  }
  const auto span = s->plan.span(c.chunk_index);
  if (c.data.size() != span.length) {
    return reject_chunk(c.chunk_index, ErrorKind::Integrity,
                        "size " + std::to_string(c.data.size()) + ", expected " + std::to_string(span.length));
  }
  if (!ChecksumValidator::verify_chunk(c.data, c.chunk_checksum)) {
    return reject_chunk(c.chunk_index, ErrorKind::Integrity, "checksum mismatch");
  }

  ChunkResult r;
  r.chunk_index = c.chunk_index;
  {
    std::lock_guard<std::mutex> lk(s->mu);
    s->last_activity = Clock::now();
    if (s->result) {
      if (!s->result->success) {
        return reject_chunk(c.chunk_index, s->result->error_kind.value_or(ErrorKind::Fatal),
                            s->result->error_message.value_or("transfer failed"));
      }
      r.success = true;
      r.is_complete = true;
      return r;
    }
    if (s->received.count(c.chunk_index)) {
      r.success = true;
      return r;
    }
  }

  auto st = chunks_.write_chunk(c.transfer_id, c.chunk_index, c.data);
  if (!st) return reject_chunk(c.chunk_index, st.error().kind, st.error().message);

  bool run_reassembly = false;
  {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->received.insert(c.chunk_index).second) s->bytes_received += c.data.size();
    if (s->received.size() == s->plan.chunk_count && !s->finalizing && !s->result) {
      s->finalizing = true;
      run_reassembly = true;
    }
  }

  r.success = true;
  if (run_reassembly) {
    auto res = reassemble(*s);
    r.success = res.success;
    r.is_complete = res.success;
    r.error_kind = res.error_kind;
    r.error_message = res.error_message;
  }
  return r;
}

ReceiveResult ChunkReceiver::finalize(const FinalizeRequest& req) {
  if (!authorizer_.authorize(req.authentication_token, req.client_id)) {
    return receive_failure(ErrorKind::Fatal, "authentication failed for client '" + req.client_id + "'");
  }
  auto s = find(req.transfer_id);
  if (!s) return receive_failure(ErrorKind::Fatal, "unknown transfer " + req.transfer_id);

  std::unique_lock<std::mutex> lk(s->mu);
  s->cv.wait(lk, [&] { return !s->finalizing; });
  if (s->result) return *s->result;
  if (s->received.size() < s->plan.chunk_count) {
    return receive_failure(ErrorKind::Fatal,
                           std::to_string(s->plan.chunk_count - s->received.size()) + " of " +
                           std::to_string(s->plan.chunk_count) + " chunks missing");
  }
  s->finalizing = true;
  lk.unlock();
  return reassemble(*s);
}

ReceiveResult ChunkReceiver::reassemble(ReceiveSession& s) {
  auto& log = Logger::instance();
  log.info("reassembling transfer " + s.transfer_id + " (" + std::to_string(s.plan.chunk_count) + " chunks)");

  ReceiveResult res;
  const std::string part = s.final_path + ".part";
  auto bytes = chunks_.assemble(s.transfer_id, s.plan.chunk_count, s.final_path);
  if (!bytes) {
    res = receive_failure(bytes.error().kind, "reassembly failed: " + bytes.error().message);
  } else if (*bytes != s.metadata.file_size) {
    std::remove(part.c_str());
    res = receive_failure(ErrorKind::Integrity, "reassembly failed: size " + std::to_string(*bytes) +
                          ", expected " + std::to_string(s.metadata.file_size));
  } else if (auto v = ChecksumValidator::verify_file(part, s.metadata.checksum_md5, s.metadata.checksum_sha256); !v) {
    std::remove(part.c_str());
    res = receive_failure(ErrorKind::Integrity, "reassembly failed: " + v.error().message);
  } else if (std::rename(part.c_str(), s.final_path.c_str()) != 0) {
    std::remove(part.c_str());
    res = receive_failure(ErrorKind::Fatal, "cannot move reassembled file to " + s.final_path);
  } else {
    res.success = true;
    res.file_path = s.final_path;
    res.bytes_received = *bytes;
    if (s.encryption) {
      try {
        s.encryption->save(s.final_path + ".meta");
      } catch (const std::exception& e) {
        res = receive_failure(ErrorKind::Fatal, std::string("cannot write encryption metadata: ") + e.what());
      }
    }
  }
  res.duration = since(s.started_at);

  if (res.success) {
    chunks_.cleanup_transfer(s.transfer_id);
    log.info("transfer " + s.transfer_id + " completed: " + s.final_path + " (" +
             std::to_string(res.bytes_received) + " bytes in " + std::to_string(res.duration.count()) + "ms)");
  } else {
    log.error("transfer " + s.transfer_id + " " + res.error_message.value_or("failed") +
              "; chunks kept in " + chunks_.transfer_dir(s.transfer_id));
  }

  {
    std::lock_guard<std::mutex> lk(s.mu);
    s.result = res;
    s.finalizing = false;
  }
  s.cv.notify_all();
  return res;
}

int ChunkReceiver::cleanup_stale(std::chrono::seconds max_age) {
  const auto cutoff = Clock::now() - max_age;
  std::set<std::string> keep;
  int dropped = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      auto s = it->second;
      std::lock_guard<std::mutex> lk(s->mu);
      if (!s->finalizing && s->last_activity < cutoff) {
        it = sessions_.erase(it);
        dropped++;
      } else {
        keep.insert(it->first);
        ++it;
      }
    }
  }
  int removed = chunks_.cleanup_stale(max_age, keep);
  Logger::instance().info("receiver cleanup: dropped " + std::to_string(dropped) + " sessions, removed " +
                          std::to_string(removed) + " temp dirs");
  return removed;
}

size_t ChunkReceiver::session_count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

} // namespace mbt::transfer
