#include "server/config.hpp"

#include <fstream>

namespace gsupbridge::server {
namespace {

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool valid_log_level(const std::string& level) {
  return level == "trace" || level == "debug" || level == "info" ||
         level == "warn" || level == "error" || level == "critical" ||
         level == "off";
}

std::optional<SubscriberEntry> subscriber_from_json(const nlohmann::json& j,
                                                    std::string& error) {
  if (!j.is_object()) {
    error = "subscriber must be a JSON object";
    return std::nullopt;
  }
  SubscriberEntry sub;

  if (!j.contains("imsi") || !j["imsi"].is_string() ||
      j["imsi"].get<std::string>().empty()) {
    error = "subscriber imsi missing or not string";
    return std::nullopt;
  }
  sub.imsi = j["imsi"].get<std::string>();
  for (char c : sub.imsi) {
    if (c < '0' || c > '9') {
      error = "subscriber imsi has non-digits: " + sub.imsi;
      return std::nullopt;
    }
  }

  if (j.contains("gsm_state")) {
    if (!j["gsm_state"].is_string()) {
      error = "gsm_state must be string";
      return std::nullopt;
    }
    const auto state = j["gsm_state"].get<std::string>();
    if (state == "active") {
      sub.gsm_state = GsmState::Active;
    } else if (state == "inactive") {
      sub.gsm_state = GsmState::Inactive;
    } else {
      error = "invalid gsm_state for " + sub.imsi + ": " + state;
      return std::nullopt;
    }
  }

  if (j.contains("auth_algo")) {
    if (!j["auth_algo"].is_string()) {
      error = "auth_algo must be string";
      return std::nullopt;
    }
    sub.auth_algo = j["auth_algo"].get<std::string>();
  }

  if (j.contains("auth_tuples")) {
    if (!j["auth_tuples"].is_array()) {
      error = "auth_tuples must be an array";
      return std::nullopt;
    }
    for (const auto& t : j["auth_tuples"]) {
      if (!t.is_string()) {
        error = "auth tuple must be a hex string";
        return std::nullopt;
      }
      auto bytes = parse_hex(t.get<std::string>());
      if (!bytes) {
        error = "auth tuple for " + sub.imsi + " is not valid hex";
        return std::nullopt;
      }
      sub.auth_tuples.push_back(std::move(*bytes));
    }
  }
  return sub;
}

}  // namespace

std::optional<Bytes> parse_hex(const std::string& hex) {
  if (hex.size() % 2 != 0) return std::nullopt;
  Bytes out;
  out.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return out;
}

std::optional<ServerConfig> config_from_json(const nlohmann::json& j,
                                             std::string& error) {
  if (!j.is_object()) {
    error = "config must be a JSON object";
    return std::nullopt;
  }
  ServerConfig cfg;

  if (j.contains("host")) {
    if (!j["host"].is_string()) {
      error = "host must be string";
      return std::nullopt;
    }
    cfg.host = j["host"].get<std::string>();
  }

  if (j.contains("port")) {
    if (!j["port"].is_number_unsigned() || j["port"].get<std::uint64_t>() == 0 ||
        j["port"].get<std::uint64_t>() > 65535) {
      error = "port must be in 1-65535";
      return std::nullopt;
    }
    cfg.port = static_cast<std::uint16_t>(j["port"].get<std::uint64_t>());
  }

  if (j.contains("log")) {
    const auto& log = j["log"];
    if (!log.is_object()) {
      error = "log must be JSON object";
      return std::nullopt;
    }
    if (log.contains("file")) {
      if (!log["file"].is_string()) {
        error = "log.file must be string";
        return std::nullopt;
      }
      cfg.log.file = log["file"].get<std::string>();
    }
    if (log.contains("level")) {
      if (!log["level"].is_string() ||
          !valid_log_level(log["level"].get<std::string>())) {
        error = "invalid log.level";
        return std::nullopt;
      }
      cfg.log.level = log["level"].get<std::string>();
    }
    if (log.contains("max_size")) {
      if (!log["max_size"].is_number_unsigned()) {
        error = "log.max_size must be unsigned number";
        return std::nullopt;
      }
      cfg.log.max_size = log["max_size"].get<std::size_t>();
    }
    if (log.contains("max_files")) {
      if (!log["max_files"].is_number_unsigned()) {
        error = "log.max_files must be unsigned number";
        return std::nullopt;
      }
      cfg.log.max_files = log["max_files"].get<std::size_t>();
    }
  }

  if (j.contains("subscribers")) {
    if (!j["subscribers"].is_array()) {
      error = "subscribers must be an array";
      return std::nullopt;
    }
    for (const auto& s : j["subscribers"]) {
      auto sub = subscriber_from_json(s, error);
      if (!sub) return std::nullopt;
      cfg.subscribers.push_back(std::move(*sub));
    }
  }
  return cfg;
}

bool load_config(const std::string& path, ServerConfig& out,
                 std::string& error) {
  std::ifstream in(path);
  if (!in) {
    error = "cannot open config file: " + path;
    return false;
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(in);
  } catch (const std::exception& ex) {
    error = std::string("JSON parse error: ") + ex.what();
    return false;
  }
  auto cfg = config_from_json(j, error);
  if (!cfg) return false;
  out = std::move(*cfg);
  return true;
}

}  // namespace gsupbridge::server
