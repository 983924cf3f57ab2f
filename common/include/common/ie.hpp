#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace gsupbridge {

using Bytes = std::vector<std::uint8_t>;

// GSUP Information Element types.
enum class IEType : std::uint8_t {
  // IEs encoded directly in messages
  IMSI = 0x01,
  CAUSE = 0x02,
  AUTH_TUPLE = 0x03,
  PDP_INFO_COMPLETE = 0x04,
  PDP_INFO = 0x05,
  CN_DOMAIN = 0x28,

  // IEs only encoded inside other IEs
  RAND = 0x20,
  SRES = 0x21,
  KC_KEY = 0x22,
  PDP_CONTEXT_ID = 0x10,
  PDP_TYPE = 0x11,
  APN_NAME = 0x12,
};

enum class CodecErrc {
  EmptyMessage,
  UnknownMessageType,
  TruncatedIE,
  InvalidLength,
  InvalidValue,
  MissingMandatoryIE,
  BufferTooSmall,
};

struct CodecError {
  CodecErrc code{CodecErrc::InvalidValue};
  std::string message;
};

constexpr std::size_t kRandLength = 16;
constexpr std::size_t kSresLength = 4;
constexpr std::size_t kKcLength = 8;
constexpr std::size_t kAuthTupleLength =
    3 * 2 + kRandLength + kSresLength + kKcLength;  // 34

// GSM auth triplet, carried verbatim inside the AUTH_TUPLE IE.
struct AuthVector {
  Bytes rand;
  Bytes sres;
  Bytes kc;
};

bool operator==(const AuthVector& a, const AuthVector& b);
bool operator!=(const AuthVector& a, const AuthVector& b);

// IMSI -> digit string, CAUSE/CN_DOMAIN -> byte, AUTH_TUPLE -> AuthVector,
// PDP_INFO/PDP_INFO_COMPLETE -> raw bytes.
using IEValue = std::variant<std::string, std::uint8_t, AuthVector, Bytes>;

std::string to_string(IEType type);
std::string to_string(const IEValue& value);
std::string to_string(CodecErrc code);

// Format of a single top-level IE: inclusive length bounds plus the
// decoder/encoder pair for its value.
class InformationElement {
 public:
  using DecodeFn = std::optional<IEValue> (*)(const std::uint8_t* data,
                                              std::size_t length,
                                              CodecError& error);
  // Encoders write at most max_length bytes to `out`.
  using EncodeFn = std::optional<std::size_t> (*)(const IEValue& value,
                                                  std::uint8_t* out,
                                                  std::size_t min_length,
                                                  std::size_t max_length,
                                                  CodecError& error);

  constexpr InformationElement(IEType type, std::size_t min_length,
                               std::size_t max_length, DecodeFn decoder,
                               EncodeFn encoder)
      : type_(type),
        min_length_(min_length),
        max_length_(max_length),
        decoder_(decoder),
        encoder_(encoder) {}

  IEType type() const { return type_; }
  std::size_t min_length() const { return min_length_; }
  std::size_t max_length() const { return max_length_; }

  std::optional<IEValue> decode(const std::uint8_t* data, std::size_t length,
                                CodecError& error) const;
  std::optional<std::size_t> encode(const IEValue& value, std::uint8_t* out,
                                    CodecError& error) const;

 private:
  IEType type_;
  std::size_t min_length_;
  std::size_t max_length_;
  DecodeFn decoder_;
  EncodeFn encoder_;
};

// nullptr for codes that are not top-level IEs (including nested sub-IEs).
const InformationElement* find_information_element(IEType type);
const InformationElement* find_information_element(std::uint8_t code);

// Value codecs, exposed for tests and for callers that build IEs by hand.
std::optional<IEValue> decode_imsi(const std::uint8_t* data, std::size_t length,
                                   CodecError& error);
std::optional<std::size_t> encode_imsi(const IEValue& value, std::uint8_t* out,
                                       std::size_t min_length,
                                       std::size_t max_length,
                                       CodecError& error);
std::optional<IEValue> decode_num(const std::uint8_t* data, std::size_t length,
                                  CodecError& error);
std::optional<std::size_t> encode_num(const IEValue& value, std::uint8_t* out,
                                      std::size_t min_length,
                                      std::size_t max_length,
                                      CodecError& error);
std::optional<IEValue> decode_bytes(const std::uint8_t* data,
                                    std::size_t length, CodecError& error);
std::optional<std::size_t> encode_bytes(const IEValue& value,
                                        std::uint8_t* out,
                                        std::size_t min_length,
                                        std::size_t max_length,
                                        CodecError& error);
std::optional<IEValue> decode_auth_tuple(const std::uint8_t* data,
                                         std::size_t length,
                                         CodecError& error);
std::optional<std::size_t> encode_auth_tuple(const IEValue& value,
                                             std::uint8_t* out,
                                             std::size_t min_length,
                                             std::size_t max_length,
                                             CodecError& error);
// Always grants access to all APNs ("*"); the value is ignored.
std::optional<std::size_t> encode_pdp_info(const IEValue& value,
                                           std::uint8_t* out,
                                           std::size_t min_length,
                                           std::size_t max_length,
                                           CodecError& error);

// The 11 bytes emitted by encode_pdp_info.
const Bytes& wildcard_pdp_info();

}  // namespace gsupbridge
