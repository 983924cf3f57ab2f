#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/gsup.hpp"
#include "common/ipa.hpp"
#include "common/transport.hpp"
#include "server/config.hpp"
#include "server/processor.hpp"
#include "test_runner.hpp"

using gsupbridge::AuthFailure;
using gsupbridge::AuthVector;
using gsupbridge::Bytes;
using gsupbridge::CodecError;
using gsupbridge::IEMap;
using gsupbridge::IEType;
using gsupbridge::MsgType;
using gsupbridge::server::GsmState;
using gsupbridge::server::ServerConfig;
using gsupbridge::server::StaticProcessor;
using gsupbridge::server::SubscriberEntry;
using gsupbridge::test::from_hex;

namespace {

class RecordingTransport : public gsupbridge::Transport {
 public:
  bool write(const std::uint8_t* data, std::size_t length,
             std::string& /*error*/) override {
    writes.emplace_back(data, data + length);
    return true;
  }

  std::vector<Bytes> writes;
};

const char* kSampleConfig = R"({
  "host": "127.0.0.1",
  "port": 4222,
  "log": {"file": "/tmp/gsupbridge-test.log", "level": "debug"},
  "subscribers": [
    {"imsi": "901550000000001",
     "auth_tuples": ["00000000000000000000000000000000000000000000000000000000"]},
    {"imsi": "001555000001276", "gsm_state": "active", "auth_algo": "precomputed",
     "auth_tuples": ["6e6989be6cee7154543770ae80b1ef0dd4ac8b539ff5342eb95d8800"]},
    {"imsi": "901550000000002", "gsm_state": "inactive",
     "auth_tuples": ["00000000000000000000000000000000000000000000000000000000"]},
    {"imsi": "901550000000003", "auth_algo": "comp128v1",
     "auth_tuples": ["00000000000000000000000000000000000000000000000000000000"]},
    {"imsi": "901550000000004"},
    {"imsi": "901550000000005", "auth_tuples": ["0011"]}
  ]
})";

bool config_rejected(const std::string& text) {
  std::string err;
  return !gsupbridge::server::config_from_json(nlohmann::json::parse(text), err) &&
         !err.empty();
}

}  // namespace

int main() {
  gsupbridge::test::TestRunner tr("processor");

  // Hex parsing
  {
    auto b = gsupbridge::server::parse_hex("0aFf10");
    tr.expect(b && *b == Bytes({0x0a, 0xff, 0x10}), "parse hex");
    tr.expect(gsupbridge::server::parse_hex("") == Bytes{}, "empty hex");
    tr.expect(!gsupbridge::server::parse_hex("abc"), "odd hex length");
    tr.expect(!gsupbridge::server::parse_hex("0g"), "non-hex digit");
  }

  // Config
  std::string err;
  auto cfg = gsupbridge::server::config_from_json(nlohmann::json::parse(kSampleConfig),
                                                  err);
  tr.expect(cfg.has_value(), "sample config accepted: " + err);
  if (!cfg) return tr.exit_code();

  tr.expect(cfg->host == "127.0.0.1" && cfg->port == 4222, "listen address");
  tr.expect(cfg->log.level == "debug", "log level");
  tr.expect(cfg->log.max_files == 3, "log default kept");
  tr.expect(cfg->subscribers.size() == 6, "subscriber count");
  tr.expect(cfg->subscribers[0].gsm_state == GsmState::Active &&
                cfg->subscribers[0].auth_algo == "precomputed",
            "subscriber defaults");
  tr.expect(cfg->subscribers[2].gsm_state == GsmState::Inactive, "inactive state");
  tr.expect(cfg->subscribers[1].auth_tuples.size() == 1 &&
                cfg->subscribers[1].auth_tuples[0].size() == 28,
            "tuple parsed");

  {
    auto defaults = gsupbridge::server::config_from_json(nlohmann::json::object(), err);
    tr.expect(defaults && defaults->port == 2222 && defaults->host == "0.0.0.0" &&
                  defaults->subscribers.empty(),
              "defaults for empty object");
  }

  tr.expect(config_rejected("[]"), "config must be an object");
  tr.expect(config_rejected(R"({"port": 0})"), "port 0");
  tr.expect(config_rejected(R"({"port": 70000})"), "port too large");
  tr.expect(config_rejected(R"({"port": "2222"})"), "port as string");
  tr.expect(config_rejected(R"({"log": {"level": "loud"}})"), "bad log level");
  tr.expect(config_rejected(R"({"subscribers": [{"imsi": "12a"}]})"),
            "IMSI with letters");
  tr.expect(config_rejected(R"({"subscribers": [{}]})"), "IMSI missing");
  tr.expect(config_rejected(R"({"subscribers": [{"imsi": "1", "gsm_state": "on"}]})"),
            "bad gsm_state");
  tr.expect(config_rejected(R"({"subscribers": [{"imsi": "1", "auth_tuples": ["zz"]}]})"),
            "tuple not hex");

  {
    ServerConfig out;
    tr.expect(!gsupbridge::server::load_config("/nonexistent/gsupbridge.json", out, err),
              "missing file");

    const std::string path = "/tmp/gsupbridge_processor_tests.json";
    {
      std::ofstream f(path);
      f << "{ not json";
    }
    tr.expect(!gsupbridge::server::load_config(path, out, err) &&
                  err.find("JSON parse error") == 0,
              "invalid JSON");
    {
      std::ofstream f(path);
      f << kSampleConfig;
    }
    tr.expect(gsupbridge::server::load_config(path, out, err) &&
                  out.subscribers.size() == 6,
              "config loaded from file");
    std::remove(path.c_str());
  }

  // Lookup outcomes
  StaticProcessor processor(cfg->subscribers);
  tr.expect(processor.subscriber_count() == 6, "all subscribers loaded");
  {
    AuthFailure failure = AuthFailure::None;
    std::string error;
    auto vec = processor.get_gsm_auth_vector("001555000001276", failure, error);
    tr.expect(vec && failure == AuthFailure::None, "vector for known subscriber");
    tr.expect(vec && vec->rand == from_hex("6e6989be6cee7154543770ae80b1ef0d") &&
                  vec->sres == from_hex("d4ac8b53") &&
                  vec->kc == from_hex("9ff5342eb95d8800"),
              "tuple split into rand/sres/kc");

    vec = processor.get_gsm_auth_vector("999999999999999", failure, error);
    tr.expect(!vec && failure == AuthFailure::SubscriberNotFound, "unknown IMSI");

    const char* broken[] = {"901550000000002", "901550000000003", "901550000000004",
                            "901550000000005"};
    for (const char* imsi : broken) {
      failure = AuthFailure::None;
      error.clear();
      vec = processor.get_gsm_auth_vector(imsi, failure, error);
      tr.expect(!vec && failure == AuthFailure::CryptoError && !error.empty(),
                std::string("crypto error for ") + imsi);
    }
  }

  {
    std::vector<SubscriberEntry> dup(2);
    dup[0].imsi = "1";
    dup[1].imsi = "1";
    StaticProcessor p(dup);
    tr.expect(p.subscriber_count() == 1, "duplicate IMSI kept once");
  }

  tr.expect(!gsupbridge::server::split_precomputed_tuple(Bytes(27)),
            "short tuple refused");

  // End to end: auth info request for a subscriber with an all-zero tuple.
  {
    RecordingTransport transport;
    gsupbridge::IpaProtocol protocol(&processor);
    protocol.connection_made(transport);

    const auto& gsup = gsupbridge::gsup_protocol();
    IEMap req{{IEType::IMSI, std::string("901550000000001")}};
    Bytes msg(gsup.max_bytes(req));
    CodecError codec_err;
    auto len = gsup.encode(msg.data(), msg.size(), MsgType::SEND_AUTH_INFO_REQ, req,
                           codec_err);
    tr.expect(len.has_value(), "request encodes");
    msg.resize(len.value_or(0));
    Bytes frame = {0x00, static_cast<std::uint8_t>(msg.size() + 1),
                   gsupbridge::kIpaStreamOsmo, gsupbridge::kIpaOsmoGsup};
    frame.insert(frame.end(), msg.begin(), msg.end());
    protocol.data_received(frame.data(), frame.size());

    tr.expect(transport.writes.size() == 1, "one response");
    if (transport.writes.size() == 1) {
      const Bytes& out = transport.writes[0];
      auto rsp = gsup.decode(out.data() + 4, out.size() - 4, codec_err);
      AuthVector zero;
      zero.rand = Bytes(16, 0);
      zero.sres = Bytes(4, 0);
      zero.kc = Bytes(8, 0);
      tr.expect(rsp && rsp->type == MsgType::SEND_AUTH_INFO_RSP, "SAI response");
      tr.expect(rsp && rsp->ies == IEMap{{IEType::IMSI, std::string("901550000000001")},
                                         {IEType::AUTH_TUPLE, zero}},
                "zero vector returned");
    }
  }

  return tr.exit_code();
}
