#include <unistd.h>

#include <array>
#include <iostream>
#include <string>
#include <vector>

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include "common/gsup.hpp"
#include "common/ipa.hpp"
#include "common/socket_io.hpp"

using gsupbridge::CodecError;
using gsupbridge::FdTransport;
using gsupbridge::IEMap;
using gsupbridge::IEType;
using gsupbridge::IpaWriter;
using gsupbridge::MsgType;

namespace {

// Read one IPA frame; returns false on EOF/error.
bool read_ipa_frame(int fd, std::uint8_t& stream_id,
                    std::vector<std::uint8_t>& payload, std::string& error) {
  std::array<std::uint8_t, gsupbridge::kIpaHeaderLen> header{};
  ssize_t n = gsupbridge::read_exact(fd, header.data(), header.size());
  if (n != static_cast<ssize_t>(header.size())) {
    error = n == 0 ? "EOF" : "failed to read IPA header";
    return false;
  }
  const std::size_t len = (static_cast<std::size_t>(header[0]) << 8) | header[1];
  stream_id = header[2];
  payload.resize(len);
  if (len == 0) return true;
  n = gsupbridge::read_exact(fd, payload.data(), len);
  if (n != static_cast<ssize_t>(len)) {
    error = "failed to read IPA payload";
    return false;
  }
  return true;
}

void print_frame(std::uint8_t stream_id, const std::vector<std::uint8_t>& payload) {
  if (stream_id == gsupbridge::kIpaStreamCcm) {
    std::cout << "CCM "
              << (payload.size() == 1 && payload[0] == gsupbridge::kIpaCcmPong ? "PONG"
                                                                              : "other")
              << "\n";
    return;
  }
  if (stream_id == gsupbridge::kIpaStreamOsmo && !payload.empty() &&
      payload[0] == gsupbridge::kIpaOsmoGsup) {
    CodecError err;
    auto msg = gsupbridge::gsup_protocol().decode(payload.data() + 1,
                                                  payload.size() - 1, err);
    if (!msg) {
      std::cout << "GSUP decode error: " << err.message << "\n";
      return;
    }
    std::cout << "GSUP " << gsupbridge::to_string(msg->type) << " "
              << gsupbridge::to_string(msg->ies) << "\n";
    return;
  }
  std::cout << fmt::format("stream 0x{:02x}: {:pn}", stream_id,
                           spdlog::to_hex(payload))
            << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 4) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> <imsi>\n";
    return 1;
  }
  std::string host = argv[1];
  uint16_t port = static_cast<uint16_t>(std::stoi(argv[2]));
  std::string imsi = argv[3];
  spdlog::set_level(spdlog::level::warn);

  std::string err;
  int fd = gsupbridge::connect_tcp(host, port, err);
  if (fd < 0) {
    std::cerr << err << "\n";
    return 1;
  }
  FdTransport transport(fd);

  // CCM ping
  IpaWriter ccm(&transport, gsupbridge::kIpaStreamCcm);
  auto ping = ccm.get_write_buf(1, err);
  if (!ping) {
    std::cerr << "framing error: " << err << "\n";
    ::close(fd);
    return 1;
  }
  ping->data[ping->offset] = gsupbridge::kIpaCcmPing;
  if (!ccm.write(*ping, err)) {
    std::cerr << "write error: " << err << "\n";
    ::close(fd);
    return 1;
  }

  // Send Auth Info request
  IpaWriter gsup(&transport, gsupbridge::kIpaStreamOsmo, gsupbridge::kIpaOsmoGsup);
  IEMap ies{{IEType::IMSI, imsi}};
  const auto& protocol = gsupbridge::gsup_protocol();
  const std::size_t max_len = protocol.max_bytes(ies);
  auto req = gsup.get_write_buf(max_len, err);
  if (!req) {
    std::cerr << "framing error: " << err << "\n";
    ::close(fd);
    return 1;
  }
  CodecError codec_err;
  auto len = protocol.encode(req->data.data() + req->offset, max_len,
                             MsgType::SEND_AUTH_INFO_REQ, ies, codec_err);
  if (!len) {
    std::cerr << "encode error: " << codec_err.message << "\n";
    ::close(fd);
    return 1;
  }
  if (!gsup.reset_length(*req, *len, err) ||
      !gsup.write(*req, req->offset + *len, err)) {
    std::cerr << "write error: " << err << "\n";
    ::close(fd);
    return 1;
  }

  for (int i = 0; i < 2; ++i) {
    std::uint8_t stream_id = 0;
    std::vector<std::uint8_t> payload;
    if (!read_ipa_frame(fd, stream_id, payload, err)) {
      std::cerr << "read error: " << err << "\n";
      ::close(fd);
      return 1;
    }
    print_frame(stream_id, payload);
  }

  ::close(fd);
  return 0;
}
