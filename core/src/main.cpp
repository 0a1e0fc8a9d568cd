#include <utility>
#include <boost/asio.hpp>
#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>
#include "mbt/auth/authorizer.h"
#include "mbt/common/config.h"
#include "mbt/log/logger.h"
#include "mbt/net/tcp_server.h"
#include "mbt/transfer/chunk_receiver.h"

namespace {

constexpr std::chrono::hours kCleanupInterval{1};

// The sweep itself runs on the disk pool.
void schedule_cleanup(boost::asio::steady_timer& timer, boost::asio::thread_pool& disk,
                      mbt::transfer::ChunkReceiver& receiver, std::chrono::seconds stale_after) {
  timer.expires_after(kCleanupInterval);
  timer.async_wait([&timer, &disk, &receiver, stale_after](boost::system::error_code ec) {
    if (ec) return;
    boost::asio::post(disk, [&receiver, stale_after] {
      int n = receiver.cleanup_stale(stale_after);
      if (n > 0) mbt::Logger::instance().info("[core] removed " + std::to_string(n) + " stale transfers");
    });
    schedule_cleanup(timer, disk, receiver, stale_after);
  });
}

} // namespace

int main(int argc, char** argv) {
  mbt::Config cfg;
  try {
    cfg = mbt::Config::from_env();
    if (argc >= 2) cfg.port = static_cast<uint16_t>(std::stoi(argv[1]));
  } catch (const std::exception& e) {
    std::cerr << "[core] invalid configuration: " << e.what() << "\n";
    return 1;
  }

  auto& log = mbt::Logger::instance();
  log.init(cfg.log_path, mbt::parse_log_level(cfg.log_level));

  mbt::auth::StaticTokenAuthorizer authorizer(cfg.auth_token);
  mbt::transfer::ChunkReceiver receiver(mbt::transfer::ReceiverConfig::from(cfg), authorizer);
  if (!receiver.initialize()) {
    log.error("[core] cannot initialize storage under " + cfg.storage_dir + " / " + cfg.temp_dir);
    return 1;
  }
  if (cfg.auth_token.empty()) log.warn("[core] MBT_AUTH_TOKEN not set, accepting any token");

  const std::chrono::seconds stale_after = cfg.stale_after;
  int n = receiver.cleanup_stale(stale_after);
  if (n > 0) log.info("[core] removed " + std::to_string(n) + " stale transfers");

  const unsigned threads = std::max(2u, std::thread::hardware_concurrency());
  boost::asio::io_context io;
  // chunk writes, reassembly and cleanup; joined before io is destroyed
  boost::asio::thread_pool disk(threads);
  try {
    mbt::net::TcpServer server(io, cfg.port, receiver, cfg.max_chunk_bytes, disk.get_executor());
    server.start();

    boost::asio::steady_timer cleanup(io);
    schedule_cleanup(cleanup, disk, receiver, stale_after);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](boost::system::error_code ec, int sig) {
      if (ec) return;
      log.info("[core] signal " + std::to_string(sig) + ", shutting down");
      server.stop();
      cleanup.cancel();
      io.stop();
    });

    std::vector<std::thread> pool;
    for (unsigned i = 1; i < threads; i++) pool.emplace_back([&io] { io.run(); });
    io.run();
    for (auto& t : pool) t.join();
    disk.join();
  } catch (const std::exception& e) {
    log.error(std::string("[core] FATAL: ") + e.what());
    return 1;
  }
  log.info("[core] stopped");
  return 0;
}
