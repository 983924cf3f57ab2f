#include "common/ie.hpp"

#include <cstring>

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/fmt/fmt.h>

namespace gsupbridge {
namespace {

constexpr std::uint8_t kImsiFiller = 0x0f;

const InformationElement kInformationElements[] = {
    {IEType::IMSI, 0, 8, decode_imsi, encode_imsi},
    {IEType::CAUSE, 1, 1, decode_num, encode_num},
    {IEType::AUTH_TUPLE, kAuthTupleLength, kAuthTupleLength,
     decode_auth_tuple, encode_auth_tuple},
    {IEType::CN_DOMAIN, 1, 1, decode_num, encode_num},
    {IEType::PDP_INFO_COMPLETE, 0, 0, decode_bytes, encode_bytes},
    {IEType::PDP_INFO, 10, 109, decode_bytes, encode_pdp_info},
};

std::string hex(const Bytes& bytes) {
  if (bytes.empty()) return "''";
  return fmt::format("{:spn}", spdlog::to_hex(bytes));
}

std::uint8_t* put_tlv(std::uint8_t* out, IEType type, const Bytes& value) {
  *out++ = static_cast<std::uint8_t>(type);
  *out++ = static_cast<std::uint8_t>(value.size());
  std::memcpy(out, value.data(), value.size());
  return out + value.size();
}

}  // namespace

bool operator==(const AuthVector& a, const AuthVector& b) {
  return a.rand == b.rand && a.sres == b.sres && a.kc == b.kc;
}

bool operator!=(const AuthVector& a, const AuthVector& b) {
  return !(a == b);
}

std::string to_string(IEType type) {
  switch (type) {
    case IEType::IMSI:
      return "IMSI";
    case IEType::CAUSE:
      return "CAUSE";
    case IEType::AUTH_TUPLE:
      return "AUTH_TUPLE";
    case IEType::PDP_INFO_COMPLETE:
      return "PDP_INFO_COMPLETE";
    case IEType::PDP_INFO:
      return "PDP_INFO";
    case IEType::CN_DOMAIN:
      return "CN_DOMAIN";
    case IEType::RAND:
      return "RAND";
    case IEType::SRES:
      return "SRES";
    case IEType::KC_KEY:
      return "KC_KEY";
    case IEType::PDP_CONTEXT_ID:
      return "PDP_CONTEXT_ID";
    case IEType::PDP_TYPE:
      return "PDP_TYPE";
    case IEType::APN_NAME:
      return "APN_NAME";
  }
  return fmt::format("IE(0x{:02x})", static_cast<unsigned>(type));
}

std::string to_string(const IEValue& value) {
  if (const auto* imsi = std::get_if<std::string>(&value)) return *imsi;
  if (const auto* num = std::get_if<std::uint8_t>(&value)) {
    return fmt::format("0x{:02x}", *num);
  }
  if (const auto* vec = std::get_if<AuthVector>(&value)) {
    return fmt::format("(rand={}, sres={}, kc={})", hex(vec->rand),
                       hex(vec->sres), hex(vec->kc));
  }
  return hex(std::get<Bytes>(value));
}

std::string to_string(CodecErrc code) {
  switch (code) {
    case CodecErrc::EmptyMessage:
      return "EMPTY_MESSAGE";
    case CodecErrc::UnknownMessageType:
      return "UNKNOWN_MESSAGE_TYPE";
    case CodecErrc::TruncatedIE:
      return "TRUNCATED_IE";
    case CodecErrc::InvalidLength:
      return "INVALID_LENGTH";
    case CodecErrc::InvalidValue:
      return "INVALID_VALUE";
    case CodecErrc::MissingMandatoryIE:
      return "MISSING_MANDATORY_IE";
    case CodecErrc::BufferTooSmall:
      return "BUFFER_TOO_SMALL";
  }
  return "UNKNOWN";
}

std::optional<IEValue> InformationElement::decode(const std::uint8_t* data,
                                                  std::size_t length,
                                                  CodecError& error) const {
  if (length < min_length_ || length > max_length_) {
    error.code = CodecErrc::InvalidLength;
    error.message = fmt::format("IE length not in range: {} ({}-{}), ie: {}",
                                length, min_length_, max_length_,
                                to_string(type_));
    return std::nullopt;
  }
  return decoder_(data, length, error);
}

std::optional<std::size_t> InformationElement::encode(const IEValue& value,
                                                      std::uint8_t* out,
                                                      CodecError& error) const {
  return encoder_(value, out, min_length_, max_length_, error);
}

const InformationElement* find_information_element(IEType type) {
  for (const auto& ie : kInformationElements) {
    if (ie.type() == type) return &ie;
  }
  return nullptr;
}

const InformationElement* find_information_element(std::uint8_t code) {
  return find_information_element(static_cast<IEType>(code));
}

// Each byte carries two digits, low nibble first. An odd-length IMSI pads
// the high nibble of its last byte with 0xf.
std::optional<IEValue> decode_imsi(const std::uint8_t* data,
                                   std::size_t length, CodecError& error) {
  std::string imsi;
  imsi.reserve(length * 2);
  for (std::size_t i = 0; i < length; ++i) {
    const std::uint8_t low = data[i] & 0x0f;
    const std::uint8_t high = (data[i] >> 4) & 0x0f;
    if (low > 9 || (high > 9 && high != kImsiFiller)) {
      error.code = CodecErrc::InvalidValue;
      error.message = fmt::format("IMSI has non-BCD byte 0x{:02x} at {}",
                                  data[i], i);
      return std::nullopt;
    }
    imsi.push_back(static_cast<char>('0' + low));
    if (high != kImsiFiller) imsi.push_back(static_cast<char>('0' + high));
  }
  return IEValue{std::move(imsi)};
}

std::optional<std::size_t> encode_imsi(const IEValue& value, std::uint8_t* out,
                                       std::size_t min_length,
                                       std::size_t max_length,
                                       CodecError& error) {
  const auto* imsi = std::get_if<std::string>(&value);
  if (imsi == nullptr) {
    error.code = CodecErrc::InvalidValue;
    error.message = "IMSI must be a digit string";
    return std::nullopt;
  }
  bool digits_only = !imsi->empty();
  for (char c : *imsi) {
    if (c < '0' || c > '9') digits_only = false;
  }
  if (!digits_only) {
    error.code = CodecErrc::InvalidValue;
    error.message = "IMSI has non-digits: '" + *imsi + "'";
    return std::nullopt;
  }
  const std::size_t length = (imsi->size() + 1) / 2;
  if (length < min_length || length > max_length) {
    error.code = CodecErrc::InvalidLength;
    error.message = "Invalid IMSI length: " + *imsi;
    return std::nullopt;
  }
  for (std::size_t i = 0; i < length; ++i) {
    const std::uint8_t digit1 = static_cast<std::uint8_t>((*imsi)[2 * i] - '0');
    std::uint8_t digit2 = kImsiFiller;
    if (2 * i + 1 < imsi->size()) {
      digit2 = static_cast<std::uint8_t>((*imsi)[2 * i + 1] - '0');
    }
    out[i] = static_cast<std::uint8_t>(digit1 | (digit2 << 4));
  }
  return length;
}

std::optional<IEValue> decode_num(const std::uint8_t* data,
                                  std::size_t length, CodecError& error) {
  if (length < 1) {
    error.code = CodecErrc::InvalidLength;
    error.message = "numeric IE needs one byte";
    return std::nullopt;
  }
  return IEValue{data[0]};
}

std::optional<std::size_t> encode_num(const IEValue& value, std::uint8_t* out,
                                      std::size_t /*min_length*/,
                                      std::size_t /*max_length*/,
                                      CodecError& error) {
  const auto* num = std::get_if<std::uint8_t>(&value);
  if (num == nullptr) {
    error.code = CodecErrc::InvalidValue;
    error.message = "numeric IE must be a single byte";
    return std::nullopt;
  }
  out[0] = *num;
  return 1;
}

std::optional<IEValue> decode_bytes(const std::uint8_t* data,
                                    std::size_t length,
                                    CodecError& /*error*/) {
  return IEValue{Bytes(data, data + length)};
}

std::optional<std::size_t> encode_bytes(const IEValue& value,
                                        std::uint8_t* out,
                                        std::size_t min_length,
                                        std::size_t max_length,
                                        CodecError& error) {
  const auto* bytes = std::get_if<Bytes>(&value);
  if (bytes == nullptr) {
    error.code = CodecErrc::InvalidValue;
    error.message = "bytes IE must hold raw bytes";
    return std::nullopt;
  }
  if (bytes->size() < min_length || bytes->size() > max_length) {
    error.code = CodecErrc::InvalidLength;
    error.message = fmt::format("Invalid length for bytes IE: {} ({}-{})",
                                bytes->size(), min_length, max_length);
    return std::nullopt;
  }
  if (!bytes->empty()) std::memcpy(out, bytes->data(), bytes->size());
  return bytes->size();
}

// Layout is fixed: [RAND 16 rand][SRES 4 sres][KC 8 kc], so the fields
// are read by position.
std::optional<IEValue> decode_auth_tuple(const std::uint8_t* data,
                                         std::size_t length,
                                         CodecError& error) {
  if (length != kAuthTupleLength) {
    error.code = CodecErrc::InvalidLength;
    error.message = fmt::format("auth tuple must be {} bytes, got {}",
                                kAuthTupleLength, length);
    return std::nullopt;
  }
  const std::uint8_t* rand = data + 2;
  const std::uint8_t* sres = rand + kRandLength + 2;
  const std::uint8_t* kc = sres + kSresLength + 2;
  AuthVector vec;
  vec.rand.assign(rand, rand + kRandLength);
  vec.sres.assign(sres, sres + kSresLength);
  vec.kc.assign(kc, kc + kKcLength);
  return IEValue{std::move(vec)};
}

std::optional<std::size_t> encode_auth_tuple(const IEValue& value,
                                             std::uint8_t* out,
                                             std::size_t /*min_length*/,
                                             std::size_t /*max_length*/,
                                             CodecError& error) {
  const auto* vec = std::get_if<AuthVector>(&value);
  if (vec == nullptr) {
    error.code = CodecErrc::InvalidValue;
    error.message = "auth tuple IE must hold an AuthVector";
    return std::nullopt;
  }
  if (vec->rand.size() != kRandLength || vec->sres.size() != kSresLength ||
      vec->kc.size() != kKcLength) {
    error.code = CodecErrc::InvalidValue;
    error.message = "Bad auth tuple to encode: " + to_string(value);
    return std::nullopt;
  }
  std::uint8_t* p = put_tlv(out, IEType::RAND, vec->rand);
  p = put_tlv(p, IEType::SRES, vec->sres);
  put_tlv(p, IEType::KC_KEY, vec->kc);
  return kAuthTupleLength;
}

const Bytes& wildcard_pdp_info() {
  static const Bytes kWildcard = {
      static_cast<std::uint8_t>(IEType::PDP_CONTEXT_ID), 1, 1,
      static_cast<std::uint8_t>(IEType::PDP_TYPE), 2, 0x01, 0x21,  // IPv4
      static_cast<std::uint8_t>(IEType::APN_NAME), 2, 1, '*',
  };
  return kWildcard;
}

std::optional<std::size_t> encode_pdp_info(const IEValue& /*value*/,
                                           std::uint8_t* out,
                                           std::size_t /*min_length*/,
                                           std::size_t max_length,
                                           CodecError& error) {
  const Bytes& pdp = wildcard_pdp_info();
  if (pdp.size() > max_length) {
    error.code = CodecErrc::InvalidLength;
    error.message = "PDP info does not fit the IE";
    return std::nullopt;
  }
  std::memcpy(out, pdp.data(), pdp.size());
  return pdp.size();
}

}  // namespace gsupbridge
