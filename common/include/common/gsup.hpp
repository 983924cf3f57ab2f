#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/ie.hpp"

namespace gsupbridge {

// GSUP message types. Requests marked "from peer" are sent by the MSC/SGSN.
enum class MsgType : std::uint8_t {
  UPDATE_LOCATION_REQ = 0x04,  // from peer
  UPDATE_LOCATION_ERR = 0x05,
  UPDATE_LOCATION_RES = 0x06,
  SEND_AUTH_INFO_REQ = 0x08,  // from peer
  SEND_AUTH_INFO_ERR = 0x09,
  SEND_AUTH_INFO_RSP = 0x0a,
  AUTH_FAILURE_REPORT = 0x0b,  // from peer
  INSERT_SUBS_DATA_REQ = 0x10,
  INSERT_SUBS_DATA_ERR = 0x11,  // from peer
  INSERT_SUBS_DATA_RES = 0x12,  // from peer
};

enum class IEPresence { Mandatory, Optional };

// Values carried in the CAUSE IE.
enum class ErrorCause : std::uint8_t {
  IMSI_UNKNOWN = 0x02,
  NETWORK_FAILURE = 0x11,
  PROTOCOL_ERR = 0x6f,
};

std::string to_string(MsgType type);
std::optional<MsgType> msg_type_from_code(std::uint8_t code);

// IEType -> value, kept in insertion order so encoding is deterministic.
// Setting an existing type replaces its value in place.
class IEMap {
 public:
  using Entry = std::pair<IEType, IEValue>;
  using const_iterator = std::vector<Entry>::const_iterator;

  IEMap() = default;
  IEMap(std::initializer_list<Entry> entries);

  void set(IEType type, IEValue value);
  bool contains(IEType type) const;
  const IEValue* find(IEType type) const;
  bool erase(IEType type);

  // Typed accessors; nullptr if absent or holding another kind of value.
  const std::string* imsi() const;
  std::optional<std::uint8_t> number(IEType type) const;

  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
  const_iterator begin() const { return entries_.begin(); }
  const_iterator end() const { return entries_.end(); }

 private:
  std::vector<Entry> entries_;
};

// Order-insensitive comparison.
bool operator==(const IEMap& a, const IEMap& b);
bool operator!=(const IEMap& a, const IEMap& b);

std::string to_string(const IEMap& ies);

struct DecodedMessage {
  MsgType type{MsgType::SEND_AUTH_INFO_REQ};
  IEMap ies;
};

// GPRS Subscriber Update Protocol codec. GSUP is a simplified 3GPP MAP that
// uses TLV encoding instead of ASN.1. The instance only holds static tables.
class Protocol {
 public:
  // Decode a message (type byte followed by IE triples). Unknown IEs are
  // skipped; a single trailing byte is ignored.
  std::optional<DecodedMessage> decode(const std::uint8_t* data,
                                       std::size_t length,
                                       CodecError& error) const;

  // Upper bound on the encoded size of a message carrying `ies`. Callers
  // allocate at least this much before calling encode().
  std::size_t max_bytes(const IEMap& ies) const;

  // Encode into `out`. Returns the number of bytes written. Nothing is
  // written if the mandatory IEs are not all present.
  std::optional<std::size_t> encode(std::uint8_t* out, std::size_t capacity,
                                    MsgType type, const IEMap& ies,
                                    CodecError& error) const;

  bool validate(MsgType type, const IEMap& ies, CodecError& error) const;

  // Presence of `ie` in messages of `type`; nullopt if the IE is not part
  // of the message format.
  std::optional<IEPresence> presence(MsgType type, IEType ie) const;
  std::vector<std::pair<IEType, IEPresence>> message_format(MsgType type) const;
};

// Process-wide codec instance.
const Protocol& gsup_protocol();

}  // namespace gsupbridge
