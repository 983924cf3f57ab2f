#include "common/gsup_manager.hpp"

#include <spdlog/spdlog.h>

namespace gsupbridge {

std::string to_string(AuthFailure failure) {
  switch (failure) {
    case AuthFailure::None:
      return "NONE";
    case AuthFailure::SubscriberNotFound:
      return "SUBSCRIBER_NOT_FOUND";
    case AuthFailure::CryptoError:
      return "CRYPTO_ERROR";
  }
  return "UNKNOWN";
}

GsupManager::GsupManager(GsmProcessor& processor, IpaWriter writer)
    : processor_(processor), writer_(std::move(writer)) {}

void GsupManager::handle_msg(const std::uint8_t* msg, std::size_t length) {
  CodecError err;
  auto decoded = gsup_protocol().decode(msg, length, err);
  if (!decoded) {
    // Decode failure. Log and continue with the next message.
    spdlog::error("Decoding failed with err: {} ({})", err.message,
                  to_string(err.code));
    return;
  }

  const IEMap& ies = decoded->ies;
  switch (decoded->type) {
    case MsgType::SEND_AUTH_INFO_REQ:
      msg_send_auth_info_req(ies);
      return;
    case MsgType::AUTH_FAILURE_REPORT:
      msg_auth_failure_report(ies);
      return;
    case MsgType::UPDATE_LOCATION_REQ:
      msg_update_location_req(ies);
      return;
    case MsgType::INSERT_SUBS_DATA_RES:
      msg_insert_subs_data_res(ies);
      return;
    case MsgType::INSERT_SUBS_DATA_ERR:
      msg_insert_subs_data_err(ies);
      return;
    case MsgType::UPDATE_LOCATION_ERR:
    case MsgType::UPDATE_LOCATION_RES:
    case MsgType::SEND_AUTH_INFO_ERR:
    case MsgType::SEND_AUTH_INFO_RSP:
    case MsgType::INSERT_SUBS_DATA_REQ:
      spdlog::warn("Unhandled message: {}, IEs: {}", to_string(decoded->type),
                   to_string(ies));
      return;
  }
}

bool GsupManager::send_msg(MsgType type, const IEMap& ies) {
  const Protocol& gsup = gsup_protocol();
  // Provision for the largest possible message, then shrink the header.
  const std::size_t buf_size = gsup.max_bytes(ies);
  std::string error;
  auto buf = writer_.get_write_buf(buf_size, error);
  if (!buf) {
    spdlog::critical("Cannot frame {}: {}", to_string(type), error);
    return false;
  }

  CodecError err;
  auto msg_len =
      gsup.encode(buf->data.data() + buf->offset, buf_size, type, ies, err);
  if (!msg_len) {
    spdlog::critical("Encoding failed with err: {}, for msg: {}, ies: {}",
                     err.message, to_string(type), to_string(ies));
    return false;
  }

  if (!writer_.reset_length(*buf, *msg_len, error) ||
      !writer_.write(*buf, buf->offset + *msg_len, error)) {
    spdlog::error("Failed to send {}: {}", to_string(type), error);
    return false;
  }
  return true;
}

void GsupManager::msg_send_auth_info_req(const IEMap& req_ies) {
  const std::string& imsi = *req_ies.imsi();
  IEMap resp_ies{{IEType::IMSI, imsi}};

  AuthFailure failure = AuthFailure::None;
  std::string error;
  auto vec = processor_.get_gsm_auth_vector(imsi, failure, error);
  if (vec) {
    spdlog::info("Successful auth for {}", imsi);
    resp_ies.set(IEType::AUTH_TUPLE, std::move(*vec));
    send_msg(MsgType::SEND_AUTH_INFO_RSP, resp_ies);
    return;
  }

  if (failure == AuthFailure::SubscriberNotFound) {
    spdlog::warn("Auth error for {}: subscriber not found", imsi);
    resp_ies.set(IEType::CAUSE,
                 static_cast<std::uint8_t>(ErrorCause::IMSI_UNKNOWN));
  } else {
    spdlog::error("Auth error for {}: {}", imsi, error);
    resp_ies.set(IEType::CAUSE,
                 static_cast<std::uint8_t>(ErrorCause::NETWORK_FAILURE));
  }
  send_msg(MsgType::SEND_AUTH_INFO_ERR, resp_ies);
}

void GsupManager::msg_auth_failure_report(const IEMap& req_ies) {
  spdlog::info("Received Auth Failure Report for IMSI: {}", *req_ies.imsi());
}

void GsupManager::msg_update_location_req(const IEMap& req_ies) {
  IEMap resp_ies{
      {IEType::IMSI, *req_ies.imsi()},
      {IEType::PDP_INFO_COMPLETE, Bytes{}},
      {IEType::PDP_INFO, Bytes{}},  // encoded as the wildcard APN
  };
  send_msg(MsgType::INSERT_SUBS_DATA_REQ, resp_ies);
}

void GsupManager::msg_insert_subs_data_res(const IEMap& req_ies) {
  IEMap resp_ies{{IEType::IMSI, *req_ies.imsi()}};
  send_msg(MsgType::UPDATE_LOCATION_RES, resp_ies);
}

void GsupManager::msg_insert_subs_data_err(const IEMap& req_ies) {
  spdlog::info("Received Insert Subscriber Data Error for IMSI: {}, cause: {}",
               *req_ies.imsi(), req_ies.number(IEType::CAUSE).value_or(0));
}

}  // namespace gsupbridge
