#include "common/ipa.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include "common/ctrl.hpp"
#include "common/gsup_manager.hpp"

namespace gsupbridge {

IpaWriter::IpaWriter(Transport* transport, std::uint8_t stream_id,
                     std::optional<std::uint8_t> osmo_extn)
    : transport_(transport),
      stream_id_(stream_id),
      osmo_extn_(osmo_extn),
      header_len_(kIpaHeaderLen + (osmo_extn ? 1 : 0)) {}

std::optional<IpaWriteBuf> IpaWriter::get_write_buf(std::size_t length,
                                                     std::string& error) const {
  IpaWriteBuf buf;
  buf.data.resize(header_len_ + std::min(length, kIpaMaxPayload));
  buf.offset = header_len_;
  if (!reset_length(buf, length, error)) return std::nullopt;
  return buf;
}

bool IpaWriter::reset_length(IpaWriteBuf& buf, std::size_t length,
                             std::string& error) const {
  // The OSMO extension byte is part of the IPA payload.
  const std::size_t ipa_length = length + (osmo_extn_ ? 1 : 0);
  if (ipa_length > kIpaMaxPayload) {
    error = fmt::format("IPA payload of {} bytes exceeds {}", ipa_length,
                        kIpaMaxPayload);
    return false;
  }
  if (buf.offset + length > buf.data.size()) {
    error = "IPA buffer too small for payload";
    return false;
  }
  buf.data[0] = static_cast<std::uint8_t>((ipa_length >> 8) & 0xff);
  buf.data[1] = static_cast<std::uint8_t>(ipa_length & 0xff);
  buf.data[2] = stream_id_;
  if (osmo_extn_) buf.data[3] = *osmo_extn_;
  return true;
}

bool IpaWriter::write(const IpaWriteBuf& buf, std::size_t length,
                      std::string& error) {
  if (transport_ == nullptr) {
    error = "no transport";
    return false;
  }
  if (length > buf.data.size()) {
    error = "write past end of IPA buffer";
    return false;
  }
  return transport_->write(buf.data.data(), length, error);
}

bool IpaWriter::write(const IpaWriteBuf& buf, std::string& error) {
  return write(buf, buf.data.size(), error);
}

IpaConnectionManager::IpaConnectionManager(IpaWriter writer)
    : writer_(std::move(writer)) {}

void IpaConnectionManager::handle_msg(const std::uint8_t* msg,
                                      std::size_t length) {
  if (length == 0) {
    spdlog::debug("Empty CCM message received");
    return;
  }
  if (msg[0] == kIpaCcmPing) {
    spdlog::info("Ping message received. Sending back Pong");
    send_pong();
  } else {
    spdlog::debug("Unknown CCM message received: {}", msg[0]);
  }
}

bool IpaConnectionManager::send_pong() {
  std::string error;
  auto buf = writer_.get_write_buf(1, error);
  if (!buf) {
    spdlog::error("Failed to send Pong: {}", error);
    return false;
  }
  buf->data[buf->offset] = kIpaCcmPong;
  if (!writer_.write(*buf, error)) {
    spdlog::error("Failed to send Pong: {}", error);
    return false;
  }
  return true;
}

IpaProtocol::IpaProtocol(GsmProcessor* gsm_processor,
                         CtrlCallback* ctrl_callback)
    : gsm_processor_(gsm_processor), ctrl_callback_(ctrl_callback) {}

IpaProtocol::~IpaProtocol() = default;

void IpaProtocol::connection_made(Transport& transport) {
  spdlog::info("Connection made!");
  if (gsm_processor_ != nullptr) {
    gsup_manager_ = std::make_unique<GsupManager>(
        *gsm_processor_, IpaWriter(&transport, kIpaStreamOsmo, kIpaOsmoGsup));
  }
  ccm_manager_ = std::make_unique<IpaConnectionManager>(
      IpaWriter(&transport, kIpaStreamCcm));
  if (ctrl_callback_ != nullptr) {
    ctrl_manager_ = std::make_unique<OsmoCtrlManager>(
        ctrl_callback_, IpaWriter(&transport, kIpaStreamOsmo, kIpaOsmoCtrl));
  }
}

void IpaProtocol::data_received(const std::uint8_t* data, std::size_t length) {
  spdlog::debug("Bytes read: {:pn}", spdlog::to_hex(data, data + length));
  readbuf_.insert(readbuf_.end(), data, data + length);

  while (readbuf_.size() - read_pos_ >= kIpaHeaderLen) {
    const std::uint8_t* frame = readbuf_.data() + read_pos_;
    const std::size_t payload_len =
        (static_cast<std::size_t>(frame[0]) << 8) | frame[1];
    const std::uint8_t stream_id = frame[2];
    const std::size_t msg_len = kIpaHeaderLen + payload_len;
    if (readbuf_.size() - read_pos_ < msg_len) break;  // need more data

    try {
      handle_ipa_msg(payload_len, stream_id, frame + kIpaHeaderLen);
    } catch (const std::exception& ex) {
      // One bad message must not take down the rest of the stream.
      spdlog::error("Failed to handle IPA msg (stream 0x{:02x}): {}",
                    stream_id, ex.what());
    }
    read_pos_ += msg_len;
  }

  if (read_pos_ == readbuf_.size()) {
    readbuf_.clear();
    read_pos_ = 0;
  } else if (read_pos_ >= kCompactThreshold) {
    readbuf_.erase(readbuf_.begin(),
                   readbuf_.begin() + static_cast<std::ptrdiff_t>(read_pos_));
    read_pos_ = 0;
  }
}

void IpaProtocol::connection_lost(const std::string& reason) {
  if (!reason.empty()) {
    spdlog::warn("Connection lost, error: {}", reason);
  } else {
    spdlog::info("Closing connection");
  }
  if (buffered() > 0) {
    spdlog::debug("Discarding {} buffered bytes", buffered());
  }
  readbuf_.clear();
  read_pos_ = 0;
  gsup_manager_.reset();
  ccm_manager_.reset();
  ctrl_manager_.reset();
}

void IpaProtocol::handle_ipa_msg(std::size_t length, std::uint8_t stream_id,
                                 const std::uint8_t* payload) {
  if (stream_id == kIpaStreamCcm && ccm_manager_) {
    ccm_manager_->handle_msg(payload, length);
    return;
  }
  if (stream_id == kIpaStreamOsmo && length > 0) {
    handle_osmo_msg(length, payload);
    return;
  }
  spdlog::warn("Unhandled IPA msg: length: {}, stream_id: 0x{:02x}, payload: {:pn}",
               length, stream_id, spdlog::to_hex(payload, payload + length));
}

void IpaProtocol::handle_osmo_msg(std::size_t length,
                                  const std::uint8_t* payload) {
  const std::uint8_t extn = payload[0];
  switch (extn) {
    case kIpaOsmoGsup:
      if (gsup_manager_) {
        gsup_manager_->handle_msg(payload + 1, length - 1);
        return;
      }
      break;
    case kIpaOsmoOap:
      spdlog::debug("OAP message received");
      return;
    case kIpaOsmoCtrl:
      if (ctrl_manager_) {
        ctrl_manager_->handle_msg(payload + 1, length - 1);
        return;
      }
      break;
    default:
      break;
  }
  spdlog::warn("Unhandled OSMO extension 0x{:02x}, length: {}, payload: {:pn}",
               extn, length, spdlog::to_hex(payload, payload + length));
}

}  // namespace gsupbridge
