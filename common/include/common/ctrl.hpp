#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "common/ipa.hpp"

namespace gsupbridge {

// Osmocom CTRL interface carried on the OSMO stream, CTRL extension.
// A command looks like
//   \x00\x0e\xee\x00 SET 14686 mnc 2
// i.e. IPA header, CTRL extension, then "<TYPE> <ID> <VAR> [<VAL>]" in text.
// Replies use GET_REPLY / SET_REPLY / TRAP / ERROR; ERROR carries a free
// text reason instead of VAR/VAL.

constexpr const char* kCtrlGet = "GET";
constexpr const char* kCtrlSet = "SET";
constexpr const char* kCtrlTrap = "TRAP";
constexpr const char* kCtrlError = "ERROR";

struct CtrlResponse {
  std::string msg_type;
  long id{0};
  std::string var;
  std::optional<std::string> val;
  std::string error;  // only for ERROR replies
};

class CtrlError : public std::runtime_error {
 public:
  enum class Kind { MsgIdMismatch, ErrorResponse };

  CtrlError(Kind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  Kind kind() const { return kind_; }

 private:
  Kind kind_;
};

// Application side of the CTRL interface.
class CtrlCallback {
 public:
  virtual ~CtrlCallback() = default;
  virtual void process_response(const CtrlResponse& response) = 0;
};

// Checks replies against the id of the request that was sent and keeps the
// last reply.
class CtrlProcessor : public CtrlCallback {
 public:
  explicit CtrlProcessor(long request_id) : request_id_(request_id) {}

  // Throws CtrlError on an id mismatch or an ERROR reply.
  void process_response(const CtrlResponse& response) override;

  long request_id() const { return request_id_; }
  const std::optional<CtrlResponse>& response() const { return response_; }

 private:
  long request_id_;
  std::optional<CtrlResponse> response_;
};

// Parse the text of a CTRL message. Returns std::nullopt (error filled) if
// it does not have the "<TYPE> <ID> <REST>" shape.
std::optional<CtrlResponse> parse_ctrl_msg(const std::string& text,
                                           std::string& error);

class OsmoCtrlManager {
 public:
  OsmoCtrlManager(CtrlCallback* callback, IpaWriter writer);

  // Payload with the IPA header and CTRL extension stripped.
  void handle_msg(const std::uint8_t* payload, std::size_t length);

  // SET command if `val` is given, GET otherwise. Returns (id, command).
  static std::pair<long, std::string> generate_msg(
      const std::string& var,
      const std::optional<std::string>& val = std::nullopt);

  // Frame `message` and write it to the peer.
  bool generate_packet(const std::string& message, std::string& error);

 private:
  CtrlCallback* callback_;
  IpaWriter writer_;
};

}  // namespace gsupbridge
