#include "common/gsup.hpp"

#include <algorithm>

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

namespace gsupbridge {
namespace {

struct IEFormat {
  IEType type;
  IEPresence presence;
};

constexpr IEFormat kImsiOnly[] = {
    {IEType::IMSI, IEPresence::Mandatory},
};
constexpr IEFormat kImsiCnDomain[] = {
    {IEType::IMSI, IEPresence::Mandatory},
    {IEType::CN_DOMAIN, IEPresence::Optional},
};
constexpr IEFormat kImsiCause[] = {
    {IEType::IMSI, IEPresence::Mandatory},
    {IEType::CAUSE, IEPresence::Mandatory},
};
constexpr IEFormat kAuthInfoResponse[] = {
    {IEType::IMSI, IEPresence::Mandatory},
    {IEType::AUTH_TUPLE, IEPresence::Optional},
};
constexpr IEFormat kInsertSubsDataRequest[] = {
    {IEType::IMSI, IEPresence::Mandatory},
    {IEType::CN_DOMAIN, IEPresence::Optional},
    {IEType::PDP_INFO_COMPLETE, IEPresence::Optional},
    {IEType::PDP_INFO, IEPresence::Optional},
};

template <std::size_t N>
std::vector<std::pair<IEType, IEPresence>> to_vector(const IEFormat (&fmts)[N]) {
  std::vector<std::pair<IEType, IEPresence>> out;
  out.reserve(N);
  for (const auto& f : fmts) out.emplace_back(f.type, f.presence);
  return out;
}

}  // namespace

std::string to_string(MsgType type) {
  switch (type) {
    case MsgType::UPDATE_LOCATION_REQ:
      return "UPDATE_LOCATION_REQ";
    case MsgType::UPDATE_LOCATION_ERR:
      return "UPDATE_LOCATION_ERR";
    case MsgType::UPDATE_LOCATION_RES:
      return "UPDATE_LOCATION_RES";
    case MsgType::SEND_AUTH_INFO_REQ:
      return "SEND_AUTH_INFO_REQ";
    case MsgType::SEND_AUTH_INFO_ERR:
      return "SEND_AUTH_INFO_ERR";
    case MsgType::SEND_AUTH_INFO_RSP:
      return "SEND_AUTH_INFO_RSP";
    case MsgType::AUTH_FAILURE_REPORT:
      return "AUTH_FAILURE_REPORT";
    case MsgType::INSERT_SUBS_DATA_REQ:
      return "INSERT_SUBS_DATA_REQ";
    case MsgType::INSERT_SUBS_DATA_ERR:
      return "INSERT_SUBS_DATA_ERR";
    case MsgType::INSERT_SUBS_DATA_RES:
      return "INSERT_SUBS_DATA_RES";
  }
  return fmt::format("MSG(0x{:02x})", static_cast<unsigned>(type));
}

std::optional<MsgType> msg_type_from_code(std::uint8_t code) {
  switch (static_cast<MsgType>(code)) {
    case MsgType::UPDATE_LOCATION_REQ:
    case MsgType::UPDATE_LOCATION_ERR:
    case MsgType::UPDATE_LOCATION_RES:
    case MsgType::SEND_AUTH_INFO_REQ:
    case MsgType::SEND_AUTH_INFO_ERR:
    case MsgType::SEND_AUTH_INFO_RSP:
    case MsgType::AUTH_FAILURE_REPORT:
    case MsgType::INSERT_SUBS_DATA_REQ:
    case MsgType::INSERT_SUBS_DATA_ERR:
    case MsgType::INSERT_SUBS_DATA_RES:
      return static_cast<MsgType>(code);
  }
  return std::nullopt;
}

IEMap::IEMap(std::initializer_list<Entry> entries) {
  for (const auto& e : entries) set(e.first, e.second);
}

void IEMap::set(IEType type, IEValue value) {
  for (auto& e : entries_) {
    if (e.first == type) {
      e.second = std::move(value);
      return;
    }
  }
  entries_.emplace_back(type, std::move(value));
}

bool IEMap::contains(IEType type) const {
  return find(type) != nullptr;
}

const IEValue* IEMap::find(IEType type) const {
  for (const auto& e : entries_) {
    if (e.first == type) return &e.second;
  }
  return nullptr;
}

bool IEMap::erase(IEType type) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [type](const Entry& e) { return e.first == type; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

const std::string* IEMap::imsi() const {
  const IEValue* v = find(IEType::IMSI);
  return v ? std::get_if<std::string>(v) : nullptr;
}

std::optional<std::uint8_t> IEMap::number(IEType type) const {
  const IEValue* v = find(type);
  if (v == nullptr) return std::nullopt;
  if (const auto* n = std::get_if<std::uint8_t>(v)) return *n;
  return std::nullopt;
}

bool operator==(const IEMap& a, const IEMap& b) {
  if (a.size() != b.size()) return false;
  for (const auto& e : a) {
    const IEValue* other = b.find(e.first);
    if (other == nullptr || !(*other == e.second)) return false;
  }
  return true;
}

bool operator!=(const IEMap& a, const IEMap& b) {
  return !(a == b);
}

std::string to_string(const IEMap& ies) {
  std::string out = "{";
  for (const auto& e : ies) {
    if (out.size() > 1) out += ", ";
    out += to_string(e.first) + ": " + to_string(e.second);
  }
  out += "}";
  return out;
}

std::optional<DecodedMessage> Protocol::decode(const std::uint8_t* data,
                                               std::size_t length,
                                               CodecError& error) const {
  if (length == 0) {
    error.code = CodecErrc::EmptyMessage;
    error.message = "Zero length GSUP msg";
    return std::nullopt;
  }
  auto type = msg_type_from_code(data[0]);
  if (!type) {
    error.code = CodecErrc::UnknownMessageType;
    error.message = fmt::format("Unknown GSUP msg: {:pn}",
                                spdlog::to_hex(data, data + length));
    return std::nullopt;
  }

  DecodedMessage msg;
  msg.type = *type;
  std::size_t offset = 1;
  while (offset + 1 < length) {  // type and length available
    const std::uint8_t ie_code = data[offset];
    const std::size_t ie_length = data[offset + 1];
    const InformationElement* ie = find_information_element(ie_code);
    if (ie == nullptr) {
      // Optional IEs may be ignored; mandatory ones are validated below.
      spdlog::warn("Unknown IE: 0x{:02x}, GSUP msg: {:pn}", ie_code,
                   spdlog::to_hex(data, data + length));
      offset += ie_length + 2;
      continue;
    }
    offset += 2;
    if (offset + ie_length > length) {
      error.code = CodecErrc::TruncatedIE;
      error.message = fmt::format("Invalid IE length: {}, name: {}, GSUP msg: {:pn}",
                                  ie_length, to_string(ie->type()),
                                  spdlog::to_hex(data, data + length));
      return std::nullopt;
    }
    auto value = ie->decode(data + offset, ie_length, error);
    if (!value) return std::nullopt;
    msg.ies.set(ie->type(), std::move(*value));
    offset += ie_length;
  }

  if (!validate(msg.type, msg.ies, error)) return std::nullopt;

  spdlog::debug("Received GSUP msg: > {}, IEs: {}", to_string(msg.type),
                to_string(msg.ies));
  return msg;
}

std::size_t Protocol::max_bytes(const IEMap& ies) const {
  std::size_t size = 1;
  for (const auto& e : ies) {
    const InformationElement* ie = find_information_element(e.first);
    size += 2 + (ie ? ie->max_length() : 0);
  }
  return size;
}

std::optional<std::size_t> Protocol::encode(std::uint8_t* out,
                                            std::size_t capacity, MsgType type,
                                            const IEMap& ies,
                                            CodecError& error) const {
  spdlog::debug("Encoding GSUP msg: < {}, IEs: {}", to_string(type),
                to_string(ies));

  if (!validate(type, ies, error)) return std::nullopt;
  for (const auto& e : ies) {
    if (find_information_element(e.first) == nullptr) {
      error.code = CodecErrc::InvalidValue;
      error.message = "IE cannot be encoded at message level: " +
                      to_string(e.first);
      return std::nullopt;
    }
  }
  if (capacity < max_bytes(ies)) {
    error.code = CodecErrc::BufferTooSmall;
    error.message = fmt::format("buffer of {} bytes, need {}", capacity,
                                max_bytes(ies));
    return std::nullopt;
  }

  std::size_t offset = 0;
  out[offset++] = static_cast<std::uint8_t>(type);
  for (const auto& e : ies) {
    const InformationElement* ie = find_information_element(e.first);
    out[offset] = static_cast<std::uint8_t>(e.first);
    auto ie_length = ie->encode(e.second, out + offset + 2, error);
    if (!ie_length) return std::nullopt;
    out[offset + 1] = static_cast<std::uint8_t>(*ie_length);
    offset += 2 + *ie_length;
  }
  return offset;
}

bool Protocol::validate(MsgType type, const IEMap& ies,
                        CodecError& error) const {
  for (const auto& f : message_format(type)) {
    if (f.second == IEPresence::Mandatory && !ies.contains(f.first)) {
      error.code = CodecErrc::MissingMandatoryIE;
      error.message = "Mandatory IE (" + to_string(f.first) +
                      ") not present in msg: " + to_string(type);
      return false;
    }
  }
  return true;
}

std::optional<IEPresence> Protocol::presence(MsgType type, IEType ie) const {
  for (const auto& f : message_format(type)) {
    if (f.first == ie) return f.second;
  }
  return std::nullopt;
}

std::vector<std::pair<IEType, IEPresence>> Protocol::message_format(
    MsgType type) const {
  switch (type) {
    case MsgType::UPDATE_LOCATION_REQ:
    case MsgType::SEND_AUTH_INFO_REQ:
    case MsgType::AUTH_FAILURE_REPORT:
      return to_vector(kImsiCnDomain);
    case MsgType::UPDATE_LOCATION_ERR:
    case MsgType::SEND_AUTH_INFO_ERR:
    case MsgType::INSERT_SUBS_DATA_ERR:
      return to_vector(kImsiCause);
    case MsgType::UPDATE_LOCATION_RES:
    case MsgType::INSERT_SUBS_DATA_RES:
      return to_vector(kImsiOnly);
    case MsgType::SEND_AUTH_INFO_RSP:
      return to_vector(kAuthInfoResponse);
    case MsgType::INSERT_SUBS_DATA_REQ:
      return to_vector(kInsertSubsDataRequest);
  }
  return {};
}

const Protocol& gsup_protocol() {
  static const Protocol kProtocol;
  return kProtocol;
}

}  // namespace gsupbridge
