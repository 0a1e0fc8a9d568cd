#include "mbt/storage/chunk_store.h"
#include "mbt/common/ids.h"
#include "mbt/log/logger.h"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace mbt::storage {

static constexpr size_t kCopyBuffer = 64 * 1024;

static bool parse_chunk_name(const std::string& name, uint32_t& index) {
  // chunk_NNNNNN.dat
  if (name.size() < 11 || name.rfind("chunk_", 0) != 0) return false;
  if (name.compare(name.size() - 4, 4, ".dat") != 0) return false;
  std::string digits = name.substr(6, name.size() - 10);
  if (digits.empty()) return false;
  for (char c : digits) {
    if (c < '0' || c > '9') return false;
  }
  index = static_cast<uint32_t>(std::stoul(digits));
  return true;
}

ChunkStore::ChunkStore(std::string temp_root) : root_(std::move(temp_root)) {}

bool ChunkStore::initialize() {
  std::error_code ec;
  fs::create_directories(root_, ec);
  if (ec) {
    Logger::instance().error("ChunkStore: cannot create " + root_ + ": " + ec.message());
    return false;
  }
  return true;
}

std::string ChunkStore::transfer_dir(const std::string& transfer_id) const {
  return root_ + "/" + transfer_id;
}

std::string ChunkStore::chunk_path(const std::string& transfer_id, uint32_t index) const {
  std::ostringstream oss;
  oss << transfer_dir(transfer_id) << "/chunk_" << std::setw(6) << std::setfill('0') << index << ".dat";
  return oss.str();
}

std::string ChunkStore::manifest_path(const std::string& transfer_id) const {
  return transfer_dir(transfer_id) + "/transfer.meta";
}

Status ChunkStore::write_chunk(const std::string& transfer_id, uint32_t index, const std::vector<uint8_t>& data) {
  std::error_code ec;
  fs::create_directories(transfer_dir(transfer_id), ec);
  if (ec) return Error::fatal("cannot create " + transfer_dir(transfer_id) + ": " + ec.message());

  const std::string final_path = chunk_path(transfer_id, index);
  const std::string tmp_path = final_path + "." + random_hex(6) + ".tmp";

  FILE* f = std::fopen(tmp_path.c_str(), "wb");
  if (!f) return Error::fatal("cannot open " + tmp_path + ": " + std::strerror(errno));

  if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f) != data.size()) {
    int err = errno;
    std::fclose(f);
    std::remove(tmp_path.c_str());
    return Error::fatal("partial write to " + tmp_path + ": " + std::strerror(err));
  }
  if (std::fflush(f) != 0 || ::fsync(::fileno(f)) != 0) {
    int err = errno;
    std::fclose(f);
    std::remove(tmp_path.c_str());
    return Error::fatal("flush failed for " + tmp_path + ": " + std::strerror(err));
  }
  if (std::fclose(f) != 0) {
    std::remove(tmp_path.c_str());
    return Error::fatal("close failed for " + tmp_path);
  }

  if (std::rename(tmp_path.c_str(), final_path.c_str()) != 0) {
    int err = errno;
    std::remove(tmp_path.c_str());
    return Error::fatal("rename failed for " + final_path + ": " + std::strerror(err));
  }
  return {};
}

std::set<uint32_t> ChunkStore::list_chunks(const std::string& transfer_id) const {
  std::set<uint32_t> out;
  std::error_code ec;
  fs::directory_iterator it(transfer_dir(transfer_id), ec);
  if (ec) return out;
  for (const auto& entry : it) {
    uint32_t index = 0;
    if (entry.is_regular_file() && parse_chunk_name(entry.path().filename().string(), index)) {
      out.insert(index);
    }
  }
  return out;
}

std::optional<uint64_t> ChunkStore::chunk_size(const std::string& transfer_id, uint32_t index) const {
  std::error_code ec;
  auto n = fs::file_size(chunk_path(transfer_id, index), ec);
  if (ec) return std::nullopt;
  return static_cast<uint64_t>(n);
}

Result<uint64_t> ChunkStore::assemble(const std::string& transfer_id, uint32_t chunk_count,
                                      const std::string& final_path) const {
  std::error_code ec;
  auto parent = fs::path(final_path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent, ec);
    if (ec) return Error::fatal("cannot create " + parent.string() + ": " + ec.message());
  }

  const std::string part = final_path + ".part";
  FILE* out = std::fopen(part.c_str(), "wb");
  if (!out) return Error::fatal("cannot open " + part + ": " + std::strerror(errno));

  std::vector<char> buf(kCopyBuffer);
  uint64_t total = 0;
  for (uint32_t i = 0; i < chunk_count; i++) {
    const std::string path = chunk_path(transfer_id, i);
    FILE* in = std::fopen(path.c_str(), "rb");
    if (!in) {
      std::fclose(out);
      std::remove(part.c_str());
      return Error::fatal("missing chunk " + std::to_string(i) + " for transfer " + transfer_id);
    }
    size_t n = 0;
    while ((n = std::fread(buf.data(), 1, buf.size(), in)) > 0) {
      if (std::fwrite(buf.data(), 1, n, out) != n) {
        int err = errno;
        std::fclose(in);
        std::fclose(out);
        std::remove(part.c_str());
        return Error::fatal("write failed for " + part + ": " + std::strerror(err));
      }
      total += n;
    }
    bool read_err = std::ferror(in) != 0;
    std::fclose(in);
    if (read_err) {
      std::fclose(out);
      std::remove(part.c_str());
      return Error::fatal("read failed for " + path);
    }
  }

  if (std::fflush(out) != 0 || ::fsync(::fileno(out)) != 0) {
    std::fclose(out);
    std::remove(part.c_str());
    return Error::fatal("flush failed for " + part);
  }
  std::fclose(out);
  return total;
}

Status ChunkStore::save_manifest(const std::string& transfer_id, const std::string& text) {
  std::error_code ec;
  fs::create_directories(transfer_dir(transfer_id), ec);
  if (ec) return Error::fatal("cannot create " + transfer_dir(transfer_id) + ": " + ec.message());

  const std::string path = manifest_path(transfer_id);
  const std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) return Error::fatal("cannot write " + tmp);
    f << text;
    f.flush();
    if (!f) return Error::fatal("write failed: " + tmp);
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    return Error::fatal("rename failed: " + path);
  }
  return {};
}

std::optional<std::string> ChunkStore::load_manifest(const std::string& transfer_id) const {
  std::ifstream f(manifest_path(transfer_id), std::ios::binary);
  if (!f) return std::nullopt;
  std::ostringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

std::vector<std::string> ChunkStore::list_transfers() const {
  std::vector<std::string> out;
  std::error_code ec;
  fs::directory_iterator it(root_, ec);
  if (ec) return out;
  for (const auto& entry : it) {
    if (entry.is_directory()) out.push_back(entry.path().filename().string());
  }
  return out;
}

bool ChunkStore::cleanup_transfer(const std::string& transfer_id) {
  std::error_code ec;
  fs::remove_all(transfer_dir(transfer_id), ec);
  if (ec) {
    Logger::instance().warn("ChunkStore: cannot remove " + transfer_dir(transfer_id) + ": " + ec.message());
    return false;
  }
  return true;
}

int ChunkStore::cleanup_stale(std::chrono::seconds max_age, const std::set<std::string>& keep) {
  const auto now = fs::file_time_type::clock::now();
  int removed = 0;
  for (const auto& id : list_transfers()) {
    if (keep.count(id)) continue;
    std::error_code ec;
    auto newest = fs::last_write_time(transfer_dir(id), ec);
    if (ec) continue;
    for (const auto& entry : fs::directory_iterator(transfer_dir(id), ec)) {
      std::error_code fec;
      auto t = entry.last_write_time(fec);
      if (!fec && t > newest) newest = t;
    }
    if (now - newest > max_age && cleanup_transfer(id)) {
      Logger::instance().info("ChunkStore: removed stale transfer dir " + id);
      removed++;
    }
  }
  return removed;
}

} // namespace mbt::storage
