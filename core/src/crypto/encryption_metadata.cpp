#include "mbt/crypto/encryption_metadata.h"
#include <cstdio>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace mbt::crypto {

std::string EncryptionMetadata::to_text() const {
  using namespace std::chrono;
  std::ostringstream os;
  os << "version=" << version << "\n"
     << "algorithm=" << algorithm << "\n"
     << "key_derivation=" << key_derivation << "\n"
     << "iterations=" << iterations << "\n"
     << "salt=" << salt << "\n"
     << "iv=" << iv << "\n"
     << "encrypted_at=" << duration_cast<seconds>(encrypted_at.time_since_epoch()).count() << "\n"
     << "original_size=" << original_size << "\n"
     << "original_checksum=" << original_checksum << "\n";
  return os.str();
}

EncryptionMetadata EncryptionMetadata::from_text(const std::string& text) {
  std::map<std::string, std::string> kv;
  std::istringstream is(text);
  std::string line;
  while (std::getline(is, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line[0] == '#') continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) throw std::runtime_error("encryption metadata: malformed line: " + line);
    kv[line.substr(0, eq)] = line.substr(eq + 1);
  }

  auto need = [&](const char* key) -> const std::string& {
    auto it = kv.find(key);
    if (it == kv.end()) throw std::runtime_error(std::string("encryption metadata: missing ") + key);
    return it->second;
  };

  EncryptionMetadata m;
  try {
    m.version = std::stoi(need("version"));
    m.algorithm = need("algorithm");
    m.key_derivation = need("key_derivation");
    m.iterations = std::stoi(need("iterations"));
    m.salt = need("salt");
    m.iv = need("iv");
    m.encrypted_at = std::chrono::system_clock::time_point(std::chrono::seconds(std::stoll(need("encrypted_at"))));
    m.original_size = std::stoull(need("original_size"));
    m.original_checksum = need("original_checksum");
  } catch (const std::logic_error& e) {
    // std::stoi and friends
    throw std::runtime_error(std::string("encryption metadata: bad number: ") + e.what());
  }
  return m;
}

void EncryptionMetadata::save(const std::string& path) const {
  std::string tmp = path + ".part";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot write " + tmp);
    f << to_text();
    f.flush();
    if (!f) throw std::runtime_error("write failed: " + tmp);
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    throw std::runtime_error("rename failed: " + path);
  }
}

EncryptionMetadata EncryptionMetadata::load(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) throw std::runtime_error("cannot open " + path);
  std::ostringstream ss;
  ss << f.rdbuf();
  return from_text(ss.str());
}

} // namespace mbt::crypto
