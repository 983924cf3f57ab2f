#include "common/ctrl.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <random>

#include <spdlog/spdlog.h>

namespace gsupbridge {
namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Next whitespace separated token starting at pos; pos is left after it.
std::string next_token(const std::string& s, std::size_t& pos) {
  while (pos < s.size() && is_space(s[pos])) ++pos;
  std::size_t start = pos;
  while (pos < s.size() && !is_space(s[pos])) ++pos;
  return s.substr(start, pos - start);
}

std::string rest_of(const std::string& s, std::size_t pos) {
  while (pos < s.size() && is_space(s[pos])) ++pos;
  std::size_t end = s.size();
  while (end > pos && is_space(s[end - 1])) --end;
  return s.substr(pos, end - pos);
}

long random_msg_id() {
  static std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<long> dist(10000, 20000);
  return dist(rng);
}

}  // namespace

void CtrlProcessor::process_response(const CtrlResponse& response) {
  response_ = response;
  if (response.id != request_id_) {
    throw CtrlError(CtrlError::Kind::MsgIdMismatch,
                    "Mismatch between response message id: " +
                        std::to_string(response.id) +
                        " and request message id: " +
                        std::to_string(request_id_));
  }
  if (response.msg_type == kCtrlError) {
    throw CtrlError(CtrlError::Kind::ErrorResponse,
                    "Request id: " + std::to_string(response.id) +
                        ", returned error response: " + response.error);
  }
}

std::optional<CtrlResponse> parse_ctrl_msg(const std::string& text,
                                           std::string& error) {
  std::size_t pos = 0;
  CtrlResponse resp;
  resp.msg_type = next_token(text, pos);
  std::string id = next_token(text, pos);
  std::string rest = rest_of(text, pos);
  if (resp.msg_type.empty() || id.empty() || rest.empty()) {
    error = "CTRL message needs <type> <id> <body>: '" + text + "'";
    return std::nullopt;
  }

  char* end = nullptr;
  errno = 0;
  resp.id = std::strtol(id.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0') {
    error = "CTRL message id is not a number: '" + id + "'";
    return std::nullopt;
  }

  if (resp.msg_type == kCtrlError) {
    resp.error = rest;
    return resp;
  }
  std::size_t rest_pos = 0;
  resp.var = next_token(rest, rest_pos);
  std::string val = rest_of(rest, rest_pos);
  if (!val.empty()) resp.val = val;
  return resp;
}

OsmoCtrlManager::OsmoCtrlManager(CtrlCallback* callback, IpaWriter writer)
    : callback_(callback), writer_(std::move(writer)) {}

void OsmoCtrlManager::handle_msg(const std::uint8_t* payload,
                                 std::size_t length) {
  std::string text(reinterpret_cast<const char*>(payload), length);
  std::string error;
  auto response = parse_ctrl_msg(text, error);
  if (!response) {
    spdlog::warn("Dropping CTRL message: {}", error);
    return;
  }
  spdlog::debug("CTRL {} id={} var={}", response->msg_type, response->id,
                response->var);
  if (callback_ != nullptr) callback_->process_response(*response);
}

std::pair<long, std::string> OsmoCtrlManager::generate_msg(
    const std::string& var, const std::optional<std::string>& val) {
  const long msg_id = random_msg_id();
  if (val) {
    return {msg_id, std::string(kCtrlSet) + " " + std::to_string(msg_id) +
                        " " + var + " " + *val};
  }
  return {msg_id,
          std::string(kCtrlGet) + " " + std::to_string(msg_id) + " " + var};
}

bool OsmoCtrlManager::generate_packet(const std::string& message,
                                      std::string& error) {
  auto buf = writer_.get_write_buf(message.size(), error);
  if (!buf) return false;
  std::copy(message.begin(), message.end(),
            buf->data.begin() + static_cast<std::ptrdiff_t>(buf->offset));
  return writer_.write(*buf, error);
}

}  // namespace gsupbridge
