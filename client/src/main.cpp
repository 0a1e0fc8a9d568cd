#include <utility>
#include <boost/asio.hpp>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <ctime>
#include <optional>
#include <sstream>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "mbt/common/config.h"
#include "mbt/crypto/encryption_engine.h"
#include "mbt/db/db.h"
#include "mbt/log/logger.h"
#include "mbt/net/tcp_channel.h"
#include "mbt/storage/pg_resume_store.h"
#include "mbt/transfer/transfer_coordinator.h"

namespace {

void usage() {
  std::cerr <<
    "usage:\n"
    "  mbt-client send <file> [--target <path>] [--chunk-size <bytes>] [--concurrency <n>]\n"
    "  mbt-client resume <token> <file> [--target <path>] [--concurrency <n>]\n"
    "  mbt-client info <token>\n"
    "  mbt-client cleanup\n"
    "  mbt-client encrypt <in> <out>\n"
    "  mbt-client decrypt <in> <out>\n"
    "  mbt-client check-password <in>\n"
    "server, credentials and tuning come from MBT_* variables; the encryption\n"
    "password from MBT_PASSWORD.\n";
}

struct Args {
  std::vector<std::string> positional;
  std::string target;
  std::optional<uint32_t> chunk_size;
  std::optional<int> concurrency;
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 2; i < argc; i++) {
    std::string s = argv[i];
    auto value = [&]() -> std::string {
      if (i + 1 >= argc) throw std::invalid_argument(s + " needs a value");
      return argv[++i];
    };
    if (s == "--target") a.target = value();
    else if (s == "--chunk-size") a.chunk_size = static_cast<uint32_t>(std::stoul(value()));
    else if (s == "--concurrency") a.concurrency = std::stoi(value());
    else a.positional.push_back(s);
  }
  return a;
}

std::optional<std::string> password_from_env() {
  const char* p = std::getenv("MBT_PASSWORD");
  if (!p || !*p) return std::nullopt;
  return std::string(p);
}

std::string format_time(mbt::transfer::Clock::time_point t) {
  std::time_t tt = mbt::transfer::Clock::to_time_t(t);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

int print_result(const mbt::transfer::TransferResult& r) {
  if (r.success) {
    std::cout << "transfer " << r.transfer_id << " completed: " << r.bytes_transferred << " bytes in "
              << r.duration.count() << "ms\n";
    if (r.checksum_hash) std::cout << "sha256 " << *r.checksum_hash << "\n";
    return 0;
  }
  std::cerr << "transfer " << r.transfer_id << " " << mbt::transfer::to_string(r.final_state) << ": "
            << (r.error ? r.error->describe() : r.error_message.value_or("unknown error")) << "\n";
  if (r.resume_token) std::cerr << "resume with: mbt-client resume " << *r.resume_token << " <file>\n";
  return 1;
}

// Drains progress events to stdout until the channel is closed.
std::thread start_progress_printer(mbt::transfer::ProgressChannel& progress) {
  return std::thread([&progress] {
    for (;;) {
      auto e = progress.wait_pop(std::chrono::milliseconds(500));
      if (!e) {
        if (progress.closed()) break;
        continue;
      }
      std::cout << "\r" << e->chunks_done << "/" << e->chunk_count << " chunks, " << std::fixed
                << std::setprecision(1) << e->percent << "%" << std::flush;
    }
    std::cout << "\n";
  });
}

int run_transfer(const std::string& cmd, const Args& args, const mbt::Config& cfg) {
  mbt::db::Db db(mbt::db::DbConfig::from_env());
  db.connect();
  mbt::storage::PgResumeStore store(db);
  store.ensure_schema();

  mbt::net::TcpChannelFactory channels(cfg.host, cfg.port);
  mbt::transfer::ProgressChannel progress;
  mbt::transfer::TransferCoordinator coordinator(mbt::transfer::CoordinatorConfig::from(cfg), store, channels,
                                                 &progress);

  if (cmd == "info") {
    if (args.positional.size() != 1) { usage(); return 2; }
    auto info = coordinator.resume_info(args.positional[0]);
    if (!info) {
      std::cerr << info.error().describe() << "\n";
      return 1;
    }
    std::cout << "transfer  " << info->transfer_id << "\n"
              << "file      " << info->metadata.file_name << " (" << info->metadata.file_size << " bytes)\n"
              << "sha256    " << info->metadata.checksum_sha256 << "\n"
              << "chunks    " << info->completed_chunks.size() << "/" << info->chunk_count << " complete\n"
              << "last      " << info->last_completed_chunk << "\n"
              << "created   " << format_time(info->created_at) << "\n";
    return 0;
  }
  if (cmd == "cleanup") {
    auto n = coordinator.cleanup_stale(std::chrono::duration_cast<std::chrono::seconds>(cfg.stale_after));
    if (!n) {
      std::cerr << n.error().describe() << "\n";
      return 1;
    }
    std::cout << "removed " << *n << " stale transfers\n";
    return 0;
  }

  mbt::transfer::TransferOptions opts;
  opts.authentication_token = cfg.auth_token;
  opts.client_id = cfg.client_id;
  opts.target_path = args.target;
  opts.password = password_from_env();
  opts.chunk_size = args.chunk_size;
  opts.max_concurrent_chunks = args.concurrency;

  // SIGINT/SIGTERM cancel the transfer; the resume token is kept.
  std::stop_source stop;
  boost::asio::io_context sig_io;
  boost::asio::signal_set signals(sig_io, SIGINT, SIGTERM);
  signals.async_wait([&stop](boost::system::error_code ec, int) {
    if (!ec) stop.request_stop();
  });
  std::thread sig_thread([&sig_io] { sig_io.run(); });
  auto printer = start_progress_printer(progress);

  mbt::transfer::TransferResult r;
  if (cmd == "send" && args.positional.size() == 1) {
    r = coordinator.transfer(args.positional[0], opts, stop.get_token());
  } else if (cmd == "resume" && args.positional.size() == 2) {
    r = coordinator.resume(args.positional[0], args.positional[1], opts, stop.get_token());
  } else {
    r.error = mbt::Error::configuration("wrong arguments for " + cmd);
  }

  progress.close();
  printer.join();
  sig_io.stop();
  sig_thread.join();

  if (r.error && r.error->kind == mbt::ErrorKind::Configuration && r.transfer_id.empty()) {
    std::cerr << r.error->describe() << "\n";
    usage();
    return 2;
  }
  return print_result(r);
}

int run_crypto(const std::string& cmd, const Args& args) {
  auto password = password_from_env();
  if (!password) {
    std::cerr << "MBT_PASSWORD is not set\n";
    return 2;
  }
  mbt::crypto::EncryptionEngine engine;

  if (cmd == "encrypt" && args.positional.size() == 2) {
    auto meta = engine.encrypt_file(args.positional[0], args.positional[1], *password);
    if (!meta) {
      std::cerr << meta.error().describe() << "\n";
      return 1;
    }
    std::cout << "encrypted " << meta->original_size << " bytes, metadata in "
              << mbt::crypto::EncryptionEngine::metadata_path(args.positional[1]) << "\n";
    return 0;
  }

  if (args.positional.empty()) { usage(); return 2; }
  mbt::crypto::EncryptionMetadata meta;
  try {
    meta = mbt::crypto::EncryptionMetadata::load(mbt::crypto::EncryptionEngine::metadata_path(args.positional[0]));
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }

  if (cmd == "decrypt" && args.positional.size() == 2) {
    auto st = engine.decrypt_file(args.positional[0], args.positional[1], *password, meta);
    if (!st) {
      std::cerr << st.error().describe() << "\n";
      return 1;
    }
    std::cout << "decrypted " << meta.original_size << " bytes\n";
    return 0;
  }
  if (cmd == "check-password" && args.positional.size() == 1) {
    bool ok = engine.validate_password(args.positional[0], *password, meta);
    std::cout << (ok ? "password OK" : "password rejected") << "\n";
    return ok ? 0 : 1;
  }
  usage();
  return 2;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    usage();
    return 2;
  }
  const std::string cmd = argv[1];

  mbt::Config cfg;
  Args args;
  try {
    cfg = mbt::Config::from_env();
    args = parse_args(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "invalid arguments: " << e.what() << "\n";
    return 2;
  }
  mbt::Logger::instance().init(cfg.log_path, mbt::parse_log_level(cfg.log_level));

  try {
    if (cmd == "encrypt" || cmd == "decrypt" || cmd == "check-password") return run_crypto(cmd, args);
    if (cmd == "send" || cmd == "resume" || cmd == "info" || cmd == "cleanup") return run_transfer(cmd, args, cfg);
  } catch (const std::exception& e) {
    std::cerr << "FATAL: " << e.what() << "\n";
    return 1;
  }
  usage();
  return 2;
}
