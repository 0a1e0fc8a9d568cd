#include "mbt/transfer/transfer_coordinator.h"
#include "mbt/common/ids.h"
#include "mbt/integrity/checksum.h"
#include "mbt/log/logger.h"
#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <algorithm>
#include <deque>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace mbt::transfer {

using integrity::ChecksumValidator;
using std::chrono::duration_cast;
using std::chrono::milliseconds;

struct TransferCoordinator::Upload {
  TransferSession session;
  storage::ResumeToken token;
  TransferRequest request;
  std::string source_path;  // the bytes on the wire (ciphertext when encrypted)
  std::string staging;      // empty when unencrypted
  std::optional<std::chrono::steady_clock::time_point> deadline;

  std::mutex mu;
  std::deque<uint32_t> queue;
  uint64_t bytes_acknowledged = 0;  // includes chunks completed by earlier attempts
  bool receiver_complete = false;
  std::optional<Error> failure;
  std::stop_source abort;

  void record(Error e) {
    std::lock_guard<std::mutex> lk(mu);
    if (!failure) failure = std::move(e);
    abort.request_stop();
  }
};

namespace {

class ActiveGuard {
public:
  ActiveGuard(std::mutex& mu, std::set<std::string>& active, std::string id)
    : mu_(mu), active_(active), id_(std::move(id)) {}
  ~ActiveGuard() {
    std::lock_guard<std::mutex> lk(mu_);
    active_.erase(id_);
  }
  ActiveGuard(const ActiveGuard&) = delete;
  ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
  std::mutex& mu_;
  std::set<std::string>& active_;
  std::string id_;
};

template <typename R>
Error receiver_error(const R& r, const std::string& what) {
  Error e;
  e.kind = r.error_kind.value_or(ErrorKind::Fatal);
  e.message = what + ": " + r.error_message.value_or("rejected by receiver");
  return e;
}

} // namespace

CoordinatorConfig CoordinatorConfig::from(const Config& c) {
  CoordinatorConfig r;
  r.retry = net::RetryConfig::from(c);
  r.chunk_timeout = c.chunk_timeout;
  r.transfer_timeout = c.transfer_timeout;
  r.work_dir = c.work_dir;
  return r;
}

Status CoordinatorConfig::validate() const {
  if (auto st = retry.validate(); !st) return st;
  if (chunk_timeout.count() <= 0) return Error::configuration("chunk timeout must be positive");
  if (transfer_timeout.count() < 0) return Error::configuration("transfer timeout must not be negative");
  return {};
}

void TransferSession::transition(TransferState to) {
  if (!can_transition(state, to)) {
    throw std::logic_error(std::string("invalid transfer state transition ") +
                           to_string(state) + " -> " + to_string(to));
  }
  state = to;
}

std::chrono::milliseconds TransferSession::elapsed() const {
  return duration_cast<milliseconds>(Clock::now() - started_at);
}

TransferCoordinator::TransferCoordinator(CoordinatorConfig cfg, storage::ResumeStore& store,
                                         ChannelFactory& channels, ProgressChannel* progress)
  : cfg_(std::move(cfg)), store_(store), channels_(channels), progress_(progress), retry_(cfg_.retry) {}

Status TransferCoordinator::validate(const TransferOptions& opts) const {
  if (auto st = cfg_.validate(); !st) return st;
  if (opts.authentication_token.empty()) return Error::configuration("authentication token is required");
  if (opts.client_id.empty()) return Error::configuration("client id is required");
  if (opts.chunk_size || opts.max_concurrent_chunks) {
    auto s = ChunkPlanner::default_strategy(0, opts.chunk_size, opts.max_concurrent_chunks);
    if (auto st = ChunkPlanner::validate(s); !st) return st;
  }
  if (opts.password) {
    if (opts.password->empty()) return Error::configuration("encryption password is empty");
    if (auto st = opts.encryption.validate(); !st) return st;
  }
  return {};
}

bool TransferCoordinator::activate(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(active_mu_);
  return active_.insert(transfer_id).second;
}

bool TransferCoordinator::is_active(const std::string& transfer_id) {
  std::lock_guard<std::mutex> lk(active_mu_);
  return active_.count(transfer_id) > 0;
}

std::string TransferCoordinator::staging_dir(const std::string& transfer_id) const {
  return (fs::path(cfg_.work_dir) / transfer_id).string();
}

void TransferCoordinator::remove_staging(const std::string& dir) {
  if (dir.empty()) return;
  std::error_code ec;
  fs::remove_all(dir, ec);
  if (ec) Logger::instance().warn("cannot remove staging dir " + dir + ": " + ec.message());
}

TransferResult TransferCoordinator::fail(TransferSession& session, Error error,
                                         std::optional<std::string> resume_token) {
  // A cancelled upload stays resumable and ends Failed; Cancelled means
  // nothing durable was left behind.
  if (!is_terminal(session.state)) {
    session.transition(error.kind == ErrorKind::Cancelled && !resume_token ? TransferState::Cancelled
                                                                           : TransferState::Failed);
  }
  Logger::instance().error("transfer " + (session.transfer_id.empty() ? std::string("<none>") : session.transfer_id) +
                           " " + to_string(session.state) + ": " + error.describe() +
                           (resume_token ? " (resumable)" : ""));
  TransferResult r;
  r.success = false;
  r.transfer_id = session.transfer_id;
  r.bytes_transferred = session.bytes_transferred;
  r.duration = session.elapsed();
  r.resume_token = std::move(resume_token);
  r.error_message = error.message;
  r.error = std::move(error);
  r.final_state = session.state;
  return r;
}

void TransferCoordinator::publish_progress(Upload& up) {
  if (!progress_) return;
  ProgressEvent e;
  {
    std::lock_guard<std::mutex> lk(up.mu);
    e.transfer_id = up.session.transfer_id;
    e.chunks_done = static_cast<uint32_t>(up.session.acknowledged.size());
    e.chunk_count = up.session.plan.chunk_count;
    e.bytes_done = up.bytes_acknowledged;
    e.bytes_total = up.session.metadata.file_size;
  }
  e.percent = e.bytes_total > 0 ? 100.0 * static_cast<double>(e.bytes_done) / static_cast<double>(e.bytes_total)
                                : 100.0 * e.chunks_done / std::max<uint32_t>(e.chunk_count, 1);
  progress_->push(std::move(e));
}

TransferResult TransferCoordinator::transfer(const std::string& file_path, const TransferOptions& opts,
                                             std::stop_token stop) {
  auto& log = Logger::instance();
  Upload up;
  auto& session = up.session;
  session.transfer_id = random_hex(16);

  if (auto st = validate(opts); !st) return fail(session, st.error(), std::nullopt);

  std::error_code ec;
  if (!fs::is_regular_file(file_path, ec)) {
    return fail(session, Error::fatal("source file not found: " + file_path), std::nullopt);
  }
  if (!std::ifstream(file_path, std::ios::binary)) {
    return fail(session, Error::fatal("source file not readable: " + file_path), std::nullopt);
  }

  log.info("transfer " + session.transfer_id + " starting for " + file_path);
  session.transition(TransferState::Chunking);

  up.source_path = file_path;
  std::optional<crypto::EncryptionMetadata> encryption;
  if (opts.password) {
    up.staging = staging_dir(session.transfer_id);
    fs::create_directories(up.staging, ec);
    if (ec) return fail(session, Error::fatal("cannot create staging dir " + up.staging + ": " + ec.message()), std::nullopt);

    crypto::EncryptionEngine engine(opts.encryption);
    std::string enc_path = (fs::path(up.staging) / (fs::path(file_path).filename().string() + ".enc")).string();
    auto meta = engine.encrypt_file(file_path, enc_path, *opts.password, stop);
    if (!meta) {
      remove_staging(up.staging);
      return fail(session, meta.error(), std::nullopt);
    }
    up.source_path = enc_path;
    encryption = *meta;
  }

  auto digests = ChecksumValidator::digest_file(up.source_path, stop);
  if (!digests) {
    remove_staging(up.staging);
    return fail(session, digests.error(), std::nullopt);
  }
  session.metadata.file_name = fs::path(up.source_path).filename().string();
  session.metadata.file_size = digests->size;
  session.metadata.checksum_md5 = digests->md5;
  session.metadata.checksum_sha256 = digests->sha256;
  session.metadata.created_at = Clock::now();

  auto plan = ChunkPlanner::plan(session.metadata.file_size,
                                 ChunkPlanner::default_strategy(session.metadata.file_size, opts.chunk_size,
                                                                opts.max_concurrent_chunks));
  if (!plan) {
    remove_staging(up.staging);
    return fail(session, plan.error(), std::nullopt);
  }
  session.plan = *plan;

  auto& tok = up.token;
  tok.token = random_hex(32);
  tok.transfer_id = session.transfer_id;
  tok.file_name = session.metadata.file_name;
  tok.file_size = session.metadata.file_size;
  tok.checksum_md5 = session.metadata.checksum_md5;
  tok.checksum_sha256 = session.metadata.checksum_sha256;
  tok.chunk_size = session.plan.strategy.chunk_size;
  tok.temp_directory = up.staging;
  tok.encrypted = opts.password.has_value();
  tok.created_at = session.metadata.created_at;
  tok.last_activity = tok.created_at;
  try {
    store_.create(tok);
  } catch (const std::exception& e) {
    remove_staging(up.staging);
    return fail(session, Error::fatal(std::string("cannot persist resume token: ") + e.what()), std::nullopt);
  }

  auto& req = up.request;
  req.transfer_id = session.transfer_id;
  req.metadata = session.metadata;
  req.strategy = session.plan.strategy;
  req.resume_transfer = false;
  req.authentication_token = opts.authentication_token;
  req.client_id = opts.client_id;
  req.target_path = opts.target_path;
  req.encryption = encryption;

  for (uint32_t i = 0; i < session.plan.chunk_count; i++) up.queue.push_back(i);

  activate(session.transfer_id);
  ActiveGuard guard(active_mu_, active_, session.transfer_id);
  log.info("transfer " + session.transfer_id + ": " + session.metadata.file_name + " " +
           std::to_string(session.metadata.file_size) + " bytes in " + std::to_string(session.plan.chunk_count) +
           " chunks of " + std::to_string(session.plan.strategy.chunk_size) + ", " +
           std::to_string(session.plan.strategy.max_concurrent_chunks) + " concurrent");
  return run_upload(up, stop);
}

TransferResult TransferCoordinator::resume(const std::string& resume_token, const std::string& file_path,
                                           const TransferOptions& opts, std::stop_token stop) {
  auto& log = Logger::instance();
  Upload up;
  auto& session = up.session;

  if (auto st = validate(opts); !st) return fail(session, st.error(), std::nullopt);

  std::optional<storage::ResumeToken> tok;
  try {
    tok = store_.find_by_token(resume_token);
  } catch (const std::exception& e) {
    return fail(session, Error::fatal(std::string("cannot load resume token: ") + e.what()), resume_token);
  }
  if (!tok) return fail(session, Error::fatal("unknown resume token"), std::nullopt);
  session.transfer_id = tok->transfer_id;
  if (tok->is_completed) {
    return fail(session, Error::fatal("transfer " + tok->transfer_id + " already completed"), std::nullopt);
  }
  if (!activate(tok->transfer_id)) {
    return fail(session, Error::fatal("transfer " + tok->transfer_id + " is already in progress"), resume_token);
  }
  ActiveGuard guard(active_mu_, active_, tok->transfer_id);
  session.transition(TransferState::Resuming);
  log.info("resuming transfer " + tok->transfer_id + " for " + file_path);

  std::error_code ec;
  up.source_path = file_path;
  if (tok->encrypted) {
    if (tok->temp_directory.empty() || !fs::is_directory(tok->temp_directory, ec)) {
      return fail(session, Error::fatal("temporary storage for transfer " + tok->transfer_id + " is missing"),
                  std::nullopt);
    }
    up.staging = tok->temp_directory;
    up.source_path = (fs::path(up.staging) / tok->file_name).string();
    crypto::EncryptionMetadata meta;
    try {
      meta = crypto::EncryptionMetadata::load(crypto::EncryptionEngine::metadata_path(up.source_path));
    } catch (const std::exception& e) {
      return fail(session, Error::fatal(std::string("staged ciphertext unusable: ") + e.what()), std::nullopt);
    }
    auto plain = ChecksumValidator::digest_file(file_path, stop);
    if (!plain) return fail(session, plain.error(), resume_token);
    if (plain->size != meta.original_size || !hex_equal(plain->sha256, meta.original_checksum)) {
      return fail(session, Error::stale_resume("source " + file_path + " changed since it was encrypted"),
                  std::nullopt);
    }
    up.request.encryption = meta;
  } else if (!fs::is_regular_file(file_path, ec)) {
    return fail(session, Error::fatal("source file not found: " + file_path), resume_token);
  }

  auto digests = ChecksumValidator::digest_file(up.source_path, stop);
  if (!digests) return fail(session, digests.error(), resume_token);

  FileMetadata stored;
  stored.file_name = tok->file_name;
  stored.file_size = tok->file_size;
  stored.checksum_md5 = tok->checksum_md5;
  stored.checksum_sha256 = tok->checksum_sha256;
  stored.created_at = tok->created_at;

  FileMetadata current = stored;
  current.file_name = fs::path(up.source_path).filename().string();
  current.file_size = digests->size;
  current.checksum_md5 = digests->md5;
  current.checksum_sha256 = digests->sha256;
  if (!stored.same_file(current)) {
    return fail(session, Error::stale_resume("file on disk no longer matches resume token for transfer " +
                                             tok->transfer_id), std::nullopt);
  }

  // the chunk size is fixed by the token; only concurrency may change
  auto strategy = ChunkPlanner::default_strategy(stored.file_size, tok->chunk_size, opts.max_concurrent_chunks);
  auto plan = ChunkPlanner::plan(stored.file_size, strategy);
  if (!plan) return fail(session, plan.error(), resume_token);
  session.metadata = stored;
  session.plan = *plan;

  std::vector<storage::ResumeChunk> completed;
  try {
    completed = store_.completed_chunks(tok->transfer_id);
    store_.touch(tok->transfer_id);
  } catch (const std::exception& e) {
    return fail(session, Error::fatal(std::string("cannot load completed chunks: ") + e.what()), resume_token);
  }
  for (const auto& c : completed) {
    if (c.chunk_index < session.plan.chunk_count && session.acknowledged.insert(c.chunk_index).second) {
      up.bytes_acknowledged += session.plan.span(c.chunk_index).length;
    }
  }
  for (uint32_t i = 0; i < session.plan.chunk_count; i++) {
    if (!session.acknowledged.count(i)) up.queue.push_back(i);
  }
  up.token = *tok;

  log.info("transfer " + tok->transfer_id + ": " + std::to_string(session.acknowledged.size()) + " of " +
           std::to_string(session.plan.chunk_count) + " chunks already complete, " +
           std::to_string(up.queue.size()) + " to send");

  if (up.queue.empty()) {
    // every chunk was acknowledged by an earlier attempt
    up.receiver_complete = true;
    session.transition(TransferState::Finalizing);
    return finish(up, std::nullopt);
  }

  auto& req = up.request;
  req.transfer_id = tok->transfer_id;
  req.metadata = session.metadata;
  req.strategy = session.plan.strategy;
  req.resume_transfer = true;
  req.resume_token = tok->token;
  req.authentication_token = opts.authentication_token;
  req.client_id = opts.client_id;
  req.target_path = opts.target_path;
  return run_upload(up, stop);
}

TransferResult TransferCoordinator::run_upload(Upload& up, std::stop_token stop) {
  auto& session = up.session;
  session.transition(TransferState::Uploading);
  if (cfg_.transfer_timeout.count() > 0) {
    up.deadline = std::chrono::steady_clock::now() + cfg_.transfer_timeout;
  }

  std::stop_callback link(stop, [&up] { up.abort.request_stop(); });

  const int workers = std::max(1, std::min<int>(session.plan.strategy.max_concurrent_chunks,
                                                static_cast<int>(up.queue.size())));
  {
    boost::asio::thread_pool pool(static_cast<size_t>(workers));
    for (int i = 0; i < workers; i++) {
      boost::asio::post(pool, [this, &up] { upload_worker(up, up.abort.get_token()); });
    }
    pool.join();
  }

  std::optional<Error> failure;
  {
    std::lock_guard<std::mutex> lk(up.mu);
    failure = up.failure;
    if (!failure && session.acknowledged.size() < session.plan.chunk_count) {
      failure = Error::cancelled("transfer cancelled with " +
                                 std::to_string(session.plan.chunk_count - session.acknowledged.size()) +
                                 " chunks outstanding");
    }
  }
  if (!failure) session.transition(TransferState::Finalizing);
  return finish(up, std::move(failure));
}

void TransferCoordinator::upload_worker(Upload& up, std::stop_token stop) {
  const auto& id = up.session.transfer_id;
  const auto& plan = up.session.plan;

  auto op_timeout = [this, &up]() {
    auto t = duration_cast<milliseconds>(cfg_.chunk_timeout);
    if (up.deadline) {
      auto remaining = duration_cast<milliseconds>(*up.deadline - std::chrono::steady_clock::now());
      t = std::min(t, std::max(remaining, milliseconds(0)));
    }
    return t;
  };

  try {
    std::ifstream in(up.source_path, std::ios::binary);
    if (!in) {
      up.record(Error::fatal("cannot open " + up.source_path));
      return;
    }

    auto channel = channels_.create();
    auto hs = retry_.execute("handshake for transfer " + id, [&](int) -> Result<TransferResponse> {
      auto r = channel->open(up.request, op_timeout(), stop);
      if (r && !r->success) return receiver_error(*r, "transfer rejected");
      return r;
    }, stop);
    if (!hs) {
      up.record(hs.error());
      return;
    }

    while (!stop.stop_requested()) {
      uint32_t index = 0;
      {
        std::lock_guard<std::mutex> lk(up.mu);
        if (up.queue.empty()) break;
        index = up.queue.front();
        up.queue.pop_front();
      }

      const auto span = plan.span(index);
      ChunkData cd;
      cd.transfer_id = id;
      cd.chunk_index = index;
      cd.is_last_chunk = span.is_last;
      cd.data.resize(span.length);
      if (span.length > 0) {
        in.clear();
        in.seekg(static_cast<std::streamoff>(span.offset));
        in.read(reinterpret_cast<char*>(cd.data.data()), static_cast<std::streamsize>(span.length));
        if (static_cast<uint64_t>(in.gcount()) != span.length) {
          up.record(Error::fatal("short read of chunk " + std::to_string(index) + " from " + up.source_path));
          break;
        }
      }
      cd.chunk_checksum = ChecksumValidator::chunk_checksum(cd.data);

      auto res = retry_.execute("send chunk " + std::to_string(index) + " of " + id,
                                [&](int) -> Result<ChunkResult> {
        auto r = channel->send_chunk(cd, op_timeout(), stop);
        if (r && !r->success) return receiver_error(*r, "chunk " + std::to_string(index) + " rejected");
        return r;
      }, stop);
      if (!res) {
        up.record(res.error());
        break;
      }

      storage::ResumeChunk rc;
      rc.transfer_id = id;
      rc.chunk_index = index;
      rc.chunk_size = span.length;
      rc.chunk_checksum = cd.chunk_checksum;
      rc.completed_at = Clock::now();
      store_.mark_chunk_complete(rc);

      {
        std::lock_guard<std::mutex> lk(up.mu);
        if (up.session.acknowledged.insert(index).second) {
          up.bytes_acknowledged += span.length;
          up.session.bytes_transferred += span.length;
        }
        if (res->is_complete) up.receiver_complete = true;
      }
      Logger::instance().debug("transfer " + id + ": chunk " + std::to_string(index) + " acknowledged");
      publish_progress(up);
    }
    channel->close();
  } catch (const std::exception& e) {
    up.record(Error::fatal("transfer " + id + " worker failed: " + e.what()));
  }
}

TransferResult TransferCoordinator::finish(Upload& up, std::optional<Error> failure) {
  auto& session = up.session;
  const auto& id = session.transfer_id;

  if (!failure && !up.receiver_complete) {
    // The completing acknowledgment was not seen; ask the receiver directly.
    auto stop = up.abort.get_token();
    auto channel = channels_.create();
    auto timeout = duration_cast<milliseconds>(cfg_.chunk_timeout);
    auto res = retry_.execute("finalize transfer " + id, [&](int) -> Result<ReceiveResult> {
      auto hs = channel->open(up.request, timeout, stop);
      if (!hs) return hs.error();
      if (!hs->success) return receiver_error(*hs, "transfer rejected");
      auto r = channel->finalize(FinalizeRequest{id, up.request.authentication_token, up.request.client_id},
                                 timeout, stop);
      if (r && !r->success) return receiver_error(*r, "finalize failed");
      return r;
    }, stop);
    channel->close();
    if (!res) failure = res.error();
  }

  if (failure) {
    if (failure->kind == ErrorKind::Integrity) {
      try {
        store_.remove(id);
      } catch (const std::exception& e) {
        Logger::instance().error("cannot discard resume state of " + id + ": " + e.what());
      }
      remove_staging(up.staging);
      return fail(session, std::move(*failure), std::nullopt);
    }
    try {
      store_.touch(id);
    } catch (const std::exception& e) {
      Logger::instance().warn("cannot touch resume token of " + id + ": " + e.what());
    }
    return fail(session, std::move(*failure), up.token.token);
  }

  try {
    store_.mark_completed(id);
    store_.remove(id);
  } catch (const std::exception& e) {
    Logger::instance().warn("transfer " + id + " completed but resume state was not cleared: " + e.what());
  }
  remove_staging(up.staging);
  session.transition(TransferState::Completed);
  publish_progress(up);

  TransferResult r;
  r.success = true;
  r.transfer_id = id;
  r.bytes_transferred = session.bytes_transferred;
  r.duration = session.elapsed();
  r.checksum_hash = session.metadata.checksum_sha256;
  r.final_state = session.state;
  Logger::instance().info("transfer " + id + " completed: " + std::to_string(r.bytes_transferred) +
                          " bytes sent in " + std::to_string(r.duration.count()) + "ms");
  return r;
}

Result<ResumeInfo> TransferCoordinator::resume_info(const std::string& resume_token) {
  try {
    auto tok = store_.find_by_token(resume_token);
    if (!tok) return Error::fatal("unknown resume token");

    ResumeInfo info;
    info.transfer_id = tok->transfer_id;
    info.metadata.file_name = tok->file_name;
    info.metadata.file_size = tok->file_size;
    info.metadata.checksum_md5 = tok->checksum_md5;
    info.metadata.checksum_sha256 = tok->checksum_sha256;
    info.metadata.created_at = tok->created_at;
    info.chunk_count = tok->chunk_count();
    info.created_at = tok->created_at;
    for (const auto& c : store_.completed_chunks(tok->transfer_id)) info.completed_chunks.push_back(c.chunk_index);
    if (!info.completed_chunks.empty()) info.last_completed_chunk = info.completed_chunks.back();
    return info;
  } catch (const std::exception& e) {
    return Error::fatal(std::string("cannot load resume info: ") + e.what());
  }
}

Result<int> TransferCoordinator::cleanup_stale(std::chrono::seconds max_inactive) {
  int removed = 0;
  try {
    for (const auto& t : store_.list_stale(Clock::now() - max_inactive)) {
      std::lock_guard<std::mutex> lk(active_mu_);
      if (t.is_completed || active_.count(t.transfer_id)) continue;
      auto fresh = store_.find_by_transfer(t.transfer_id);
      if (!fresh || fresh->is_completed) continue;
      remove_staging(fresh->temp_directory);
      if (store_.remove(t.transfer_id)) {
        Logger::instance().info("removed stale resume token for transfer " + t.transfer_id);
        removed++;
      }
    }
  } catch (const std::exception& e) {
    return Error::fatal(std::string("stale cleanup failed: ") + e.what());
  }
  return removed;
}

} // namespace mbt::transfer
