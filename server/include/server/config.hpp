#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/ie.hpp"

namespace gsupbridge::server {

enum class GsmState { Inactive, Active };

struct SubscriberEntry {
  std::string imsi;
  GsmState gsm_state{GsmState::Active};
  std::string auth_algo{"precomputed"};
  // Each tuple is rand(16) | sres(4) | kc(8).
  std::vector<Bytes> auth_tuples;
};

struct LogConfig {
  std::string file{"logs/gsupbridge.log"};
  std::string level{"info"};
  std::size_t max_size{5 * 1024 * 1024};
  std::size_t max_files{3};
};

struct ServerConfig {
  std::string host{"0.0.0.0"};
  std::uint16_t port{2222};
  LogConfig log;
  std::vector<SubscriberEntry> subscribers;
};

// Parse hex ("0a1B..") into bytes; whitespace is not allowed.
std::optional<Bytes> parse_hex(const std::string& hex);

// Validate and convert JSON into a config. Missing keys keep defaults.
std::optional<ServerConfig> config_from_json(const nlohmann::json& j,
                                             std::string& error);

// Read and parse a JSON config file.
bool load_config(const std::string& path, ServerConfig& out,
                 std::string& error);

}  // namespace gsupbridge::server
