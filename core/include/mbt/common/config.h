#pragma once
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <string>

namespace mbt {

inline std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return (v && *v) ? std::string(v) : def;
}

struct Config {
    std::string host = "127.0.0.1";
    uint16_t port = 9000;
    std::string log_path;
    std::string log_level = "info";

    // receiver
    std::string storage_dir = "./storage/backups";
    std::string temp_dir = "./storage/incoming";
    std::string auth_token;
    uint64_t max_chunk_bytes = 64ull * 1024 * 1024;

    // sender
    std::string work_dir = "./storage/outgoing";
    std::string client_id = "mbt-client";
    int max_retries = 5;
    std::chrono::milliseconds retry_base_delay{2000};
    std::chrono::milliseconds retry_max_delay{120000};
    bool retry_jitter = true;
    std::chrono::seconds chunk_timeout{300};
    std::chrono::seconds transfer_timeout{0};  // 0 = unlimited
    std::chrono::hours stale_after{72};

    static Config from_env() {
        Config c;
        c.host = getenv_or("MBT_HOST", c.host);
        c.port = static_cast<uint16_t>(std::stoi(getenv_or("MBT_PORT", "9000")));
        c.log_path = getenv_or("MBT_LOG_PATH", "");
        c.log_level = getenv_or("MBT_LOG_LEVEL", c.log_level);
        c.storage_dir = getenv_or("MBT_STORAGE_DIR", c.storage_dir);
        c.temp_dir = getenv_or("MBT_TEMP_DIR", c.temp_dir);
        c.auth_token = getenv_or("MBT_AUTH_TOKEN", "");
        c.max_chunk_bytes = std::stoull(getenv_or("MBT_MAX_CHUNK_BYTES", std::to_string(c.max_chunk_bytes)));
        c.work_dir = getenv_or("MBT_WORK_DIR", c.work_dir);
        c.client_id = getenv_or("MBT_CLIENT_ID", c.client_id);
        c.max_retries = std::stoi(getenv_or("MBT_MAX_RETRIES", "5"));
        c.retry_base_delay = std::chrono::milliseconds(std::stoll(getenv_or("MBT_RETRY_BASE_MS", "2000")));
        c.retry_max_delay = std::chrono::milliseconds(std::stoll(getenv_or("MBT_RETRY_MAX_MS", "120000")));
        c.retry_jitter = getenv_or("MBT_RETRY_JITTER", "1") != "0";
        c.chunk_timeout = std::chrono::seconds(std::stoll(getenv_or("MBT_CHUNK_TIMEOUT_S", "300")));
        c.transfer_timeout = std::chrono::seconds(std::stoll(getenv_or("MBT_TRANSFER_TIMEOUT_S", "0")));
        c.stale_after = std::chrono::hours(std::stoll(getenv_or("MBT_STALE_HOURS", "72")));
        return c;
    }
};

} // namespace mbt
