#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/transport.hpp"

// IPA multiplexing layer, used above TCP to multiplex several protocols
// over one connection and to delimit messages.
//
//   Offset  Length    Field
//   0       2         Payload length (big endian)
//   2       1         Stream id (0xfe CCM, 0xee OSMO, ...)
//   3       variable  Payload
//
// On the OSMO stream the first payload byte selects the extension
// (0x05 GSUP, 0x06 OAP, 0x00 CTRL) and is counted in the payload length.
//
// References: osmobts-abis.pdf, osmobsc-usermanual.pdf

namespace gsupbridge {

constexpr std::size_t kIpaHeaderLen = 3;
constexpr std::size_t kIpaMaxPayload = 0xffff;

// Stream ids
constexpr std::uint8_t kIpaStreamCcm = 0xfe;
constexpr std::uint8_t kIpaStreamOsmo = 0xee;

// OSMO stream extensions
constexpr std::uint8_t kIpaOsmoCtrl = 0x00;
constexpr std::uint8_t kIpaOsmoGsup = 0x05;
constexpr std::uint8_t kIpaOsmoOap = 0x06;

// CCM purposes
constexpr std::uint8_t kIpaCcmPing = 0x00;
constexpr std::uint8_t kIpaCcmPong = 0x01;

// Well-known ports
constexpr std::uint16_t kTcpPortOml = 3002;
constexpr std::uint16_t kTcpPortRsl = 3003;
constexpr std::uint16_t kTcpPortNitbCtrl = 4249;

class GsmProcessor;
class CtrlCallback;
class GsupManager;
class OsmoCtrlManager;

// One allocation holding header + payload; the payload starts at `offset`.
struct IpaWriteBuf {
  std::vector<std::uint8_t> data;
  std::size_t offset{0};
};

// Prepends the IPA header for one stream (and OSMO extension, if any).
class IpaWriter {
 public:
  IpaWriter(Transport* transport, std::uint8_t stream_id,
            std::optional<std::uint8_t> osmo_extn = std::nullopt);

  // Buffer for a `length` byte payload with the header already written.
  // std::nullopt if the payload (plus extension byte) exceeds 0xffff.
  std::optional<IpaWriteBuf> get_write_buf(std::size_t length,
                                           std::string& error) const;

  // Rewrite the header for a payload of `length` bytes. Used when the
  // payload was provisioned for the worst case and came out shorter.
  // Fails without touching buf if `length` does not fit buf or the
  // 16-bit length field.
  bool reset_length(IpaWriteBuf& buf, std::size_t length,
                    std::string& error) const;

  // Hand the first `length` bytes of buf to the transport in one call.
  bool write(const IpaWriteBuf& buf, std::size_t length, std::string& error);
  bool write(const IpaWriteBuf& buf, std::string& error);

  std::size_t header_len() const { return header_len_; }
  std::uint8_t stream_id() const { return stream_id_; }
  std::optional<std::uint8_t> osmo_extn() const { return osmo_extn_; }

 private:
  Transport* transport_;
  std::uint8_t stream_id_;
  std::optional<std::uint8_t> osmo_extn_;
  std::size_t header_len_;
};

// CCM (connection management) stream. Only pings from the peer are
// answered; we never ping proactively.
class IpaConnectionManager {
 public:
  explicit IpaConnectionManager(IpaWriter writer);

  void handle_msg(const std::uint8_t* msg, std::size_t length);
  bool send_pong();

 private:
  IpaWriter writer_;
};

// IPA endpoint state for one connection: the reassembly buffer plus the
// per-stream managers created once the transport is up.
class IpaProtocol {
 public:
  static constexpr std::size_t kCompactThreshold = 4096;

  // gsm_processor may be null (GSUP frames are then dropped); ctrl_callback
  // may be null (CTRL frames are then dropped).
  explicit IpaProtocol(GsmProcessor* gsm_processor,
                       CtrlCallback* ctrl_callback = nullptr);
  ~IpaProtocol();

  IpaProtocol(const IpaProtocol&) = delete;
  IpaProtocol& operator=(const IpaProtocol&) = delete;

  void connection_made(Transport& transport);

  // Append bytes read from the transport and handle every complete frame.
  // Incomplete trailing bytes stay buffered for the next call.
  void data_received(const std::uint8_t* data, std::size_t length);

  // Drops the managers and any partially received frame. `reason` is
  // empty on a clean EOF.
  void connection_lost(const std::string& reason);

  // Bytes of the current partial frame.
  std::size_t buffered() const { return readbuf_.size() - read_pos_; }
  bool connected() const { return ccm_manager_ != nullptr; }

  OsmoCtrlManager* ctrl_manager() { return ctrl_manager_.get(); }

 private:
  void handle_ipa_msg(std::size_t length, std::uint8_t stream_id,
                      const std::uint8_t* payload);
  void handle_osmo_msg(std::size_t length, const std::uint8_t* payload);

  GsmProcessor* gsm_processor_;
  CtrlCallback* ctrl_callback_;
  // Frames before read_pos_ are handled; the prefix is dropped once it
  // reaches kCompactThreshold or the buffer drains.
  std::vector<std::uint8_t> readbuf_;
  std::size_t read_pos_{0};

  std::unique_ptr<GsupManager> gsup_manager_;
  std::unique_ptr<IpaConnectionManager> ccm_manager_;
  std::unique_ptr<OsmoCtrlManager> ctrl_manager_;
};

}  // namespace gsupbridge
