#include <array>
#include <string>
#include <vector>

#include "common/ie.hpp"
#include "test_runner.hpp"

using gsupbridge::AuthVector;
using gsupbridge::Bytes;
using gsupbridge::CodecErrc;
using gsupbridge::CodecError;
using gsupbridge::IEType;
using gsupbridge::IEValue;
using gsupbridge::test::from_hex;

namespace {

AuthVector dummy_vector() {
  AuthVector vec;
  vec.rand = from_hex("6e6989be6cee7154543770ae80b1ef0d");
  vec.sres = from_hex("d4ac8b53");
  vec.kc = from_hex("9ff5342eb95d8800");
  return vec;
}

}  // namespace

int main() {
  gsupbridge::test::TestRunner tr("ie");

  // Lookup table: only top-level IEs are listed.
  {
    const auto* imsi = gsupbridge::find_information_element(IEType::IMSI);
    tr.expect(imsi != nullptr, "IMSI is a top-level IE");
    tr.expect(imsi && imsi->min_length() == 0 && imsi->max_length() == 8,
              "IMSI length bounds 0-8");
    const auto* tuple = gsupbridge::find_information_element(IEType::AUTH_TUPLE);
    tr.expect(tuple && tuple->min_length() == 34 && tuple->max_length() == 34,
              "AUTH_TUPLE is exactly 34 bytes");
    const auto* pdp = gsupbridge::find_information_element(IEType::PDP_INFO);
    tr.expect(pdp && pdp->min_length() == 10 && pdp->max_length() == 109,
              "PDP_INFO length bounds 10-109");
    const auto* complete =
        gsupbridge::find_information_element(IEType::PDP_INFO_COMPLETE);
    tr.expect(complete && complete->max_length() == 0,
              "PDP_INFO_COMPLETE is empty");
    tr.expect(gsupbridge::find_information_element(IEType::RAND) == nullptr,
              "RAND is nested only");
    tr.expect(gsupbridge::find_information_element(std::uint8_t{0x12}) == nullptr,
              "APN_NAME is nested only");
    tr.expect(gsupbridge::find_information_element(std::uint8_t{0x28}) != nullptr,
              "CN_DOMAIN by code");
    tr.expect(gsupbridge::find_information_element(std::uint8_t{0x99}) == nullptr,
              "unknown code");
  }

  // IMSI BCD, odd length padded with 0xf.
  {
    std::array<std::uint8_t, 8> out{};
    CodecError err;
    auto len = gsupbridge::encode_imsi(IEValue{std::string("00155")}, out.data(),
                                       0, 8, err);
    tr.expect(len && *len == 3, "odd IMSI encodes to 3 bytes");
    tr.expect(out[0] == 0x00 && out[1] == 0x51 && out[2] == 0xf5,
              "odd IMSI bytes");

    auto value = gsupbridge::decode_imsi(out.data(), 3, err);
    tr.expect(value && std::get<std::string>(*value) == "00155",
              "odd IMSI decodes back");
  }

  {
    Bytes data = from_hex("00 51 55 00 00 10 72 f6");
    CodecError err;
    auto value = gsupbridge::decode_imsi(data.data(), data.size(), err);
    tr.expect(value && std::get<std::string>(*value) == "001555000001276",
              "15 digit IMSI decodes");
  }

  {
    std::array<std::uint8_t, 8> out{};
    CodecError err;
    auto len = gsupbridge::encode_imsi(IEValue{std::string("0015")}, out.data(),
                                       0, 8, err);
    tr.expect(len && *len == 2 && out[1] == 0x51, "even IMSI has no filler");
  }

  for (const std::string imsi : {"90155000000001", "901550000000001"}) {
    std::array<std::uint8_t, 8> out{};
    CodecError err;
    auto len = gsupbridge::encode_imsi(IEValue{imsi}, out.data(), 0, 8, err);
    auto value = len ? gsupbridge::decode_imsi(out.data(), *len, err)
                     : std::nullopt;
    tr.expect(value && std::get<std::string>(*value) == imsi,
              "IMSI round trip " + imsi);
  }

  // Every top-level IE rejects lengths outside its bounds.
  for (IEType type : {IEType::IMSI, IEType::CAUSE, IEType::AUTH_TUPLE,
                      IEType::CN_DOMAIN, IEType::PDP_INFO_COMPLETE,
                      IEType::PDP_INFO}) {
    const auto* ie = gsupbridge::find_information_element(type);
    if (ie == nullptr) {
      tr.expect(false, "missing IE " + gsupbridge::to_string(type));
      continue;
    }
    std::array<std::uint8_t, 128> data{};
    CodecError err;
    tr.expect(!ie->decode(data.data(), ie->max_length() + 1, err) &&
                  err.code == CodecErrc::InvalidLength,
              "too long " + gsupbridge::to_string(type));
    if (ie->min_length() > 0) {
      err = CodecError{};
      tr.expect(!ie->decode(data.data(), ie->min_length() - 1, err) &&
                    err.code == CodecErrc::InvalidLength,
                "too short " + gsupbridge::to_string(type));
    }
  }

  // IMSI rejects
  {
    std::array<std::uint8_t, 16> out{};
    CodecError err;
    auto len = gsupbridge::encode_imsi(IEValue{std::string("12a4")}, out.data(),
                                       0, 8, err);
    tr.expect(!len && err.code == CodecErrc::InvalidValue, "non-digit IMSI");

    err = CodecError{};
    len = gsupbridge::encode_imsi(IEValue{std::string()}, out.data(), 0, 8, err);
    tr.expect(!len && err.code == CodecErrc::InvalidValue, "empty IMSI");

    err = CodecError{};
    len = gsupbridge::encode_imsi(IEValue{std::string("12345678901234567")},
                                  out.data(), 0, 8, err);
    tr.expect(!len && err.code == CodecErrc::InvalidLength, "17 digit IMSI");

    err = CodecError{};
    len = gsupbridge::encode_imsi(IEValue{std::uint8_t{1}}, out.data(), 0, 8, err);
    tr.expect(!len && err.code == CodecErrc::InvalidValue, "IMSI of wrong kind");

    Bytes bad = {0x0a};
    err = CodecError{};
    auto value = gsupbridge::decode_imsi(bad.data(), bad.size(), err);
    tr.expect(!value && err.code == CodecErrc::InvalidValue, "non-BCD nibble");
  }

  // Numeric IEs
  {
    std::uint8_t out = 0;
    CodecError err;
    auto len = gsupbridge::encode_num(IEValue{std::uint8_t{0x6f}}, &out, 1, 1, err);
    tr.expect(len && *len == 1 && out == 0x6f, "encode cause");

    const auto* cause = gsupbridge::find_information_element(IEType::CAUSE);
    Bytes two = {0x01, 0x01};
    err = CodecError{};
    auto value = cause->decode(two.data(), two.size(), err);
    tr.expect(!value && err.code == CodecErrc::InvalidLength,
              "cause with length 2 rejected");

    err = CodecError{};
    value = cause->decode(two.data(), 1, err);
    tr.expect(value && std::get<std::uint8_t>(*value) == 0x01, "cause decodes");
  }

  // Auth tuple layout
  {
    std::array<std::uint8_t, 34> out{};
    CodecError err;
    auto len = gsupbridge::encode_auth_tuple(IEValue{dummy_vector()}, out.data(),
                                             34, 34, err);
    tr.expect(len && *len == 34, "auth tuple is 34 bytes");
    tr.expect(out[0] == 0x20 && out[1] == 16, "RAND header");
    tr.expect(out[18] == 0x21 && out[19] == 4, "SRES header");
    tr.expect(out[24] == 0x22 && out[25] == 8, "KC header");
    tr.expect(out[2] == 0x6e && out[20] == 0xd4 && out[26] == 0x9f,
              "tuple fields placed");

    auto value = gsupbridge::decode_auth_tuple(out.data(), out.size(), err);
    tr.expect(value && std::get<AuthVector>(*value) == dummy_vector(),
              "auth tuple decodes back");

    AuthVector short_rand = dummy_vector();
    short_rand.rand.pop_back();
    err = CodecError{};
    len = gsupbridge::encode_auth_tuple(IEValue{short_rand}, out.data(), 34, 34,
                                        err);
    tr.expect(!len && err.code == CodecErrc::InvalidValue, "short RAND rejected");
  }

  // Wildcard PDP info
  {
    std::array<std::uint8_t, 109> out{};
    CodecError err;
    auto len = gsupbridge::encode_pdp_info(IEValue{Bytes{}}, out.data(), 10, 109,
                                           err);
    Bytes expected = from_hex("10 01 01 11 02 01 21 12 02 01 2A");
    tr.expect(len && *len == expected.size(), "PDP info length");
    tr.expect(Bytes(out.begin(), out.begin() + 11) == expected, "PDP info bytes");
    tr.expect(gsupbridge::wildcard_pdp_info() == expected, "wildcard table");
  }

  // Raw bytes honour the bounds.
  {
    std::array<std::uint8_t, 4> out{};
    CodecError err;
    auto len = gsupbridge::encode_bytes(IEValue{Bytes{}}, out.data(), 0, 0, err);
    tr.expect(len && *len == 0, "empty bytes IE");
    err = CodecError{};
    len = gsupbridge::encode_bytes(IEValue{Bytes{1}}, out.data(), 0, 0, err);
    tr.expect(!len && err.code == CodecErrc::InvalidLength,
              "bytes IE too long");
  }

  tr.expect(gsupbridge::to_string(IEType::AUTH_TUPLE) == "AUTH_TUPLE",
            "IE type name");
  tr.expect(gsupbridge::to_string(IEValue{std::uint8_t{0x6f}}) == "0x6f",
            "number formatting");

  return tr.exit_code();
}
