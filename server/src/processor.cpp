#include "server/processor.hpp"

#include <spdlog/spdlog.h>

namespace gsupbridge::server {

StaticProcessor::StaticProcessor(const std::vector<SubscriberEntry>& subscribers) {
  for (const auto& sub : subscribers) {
    if (!subscribers_.emplace(sub.imsi, sub).second) {
      spdlog::warn("Duplicate subscriber {} in config, keeping the first",
                   sub.imsi);
    }
  }
}

std::optional<AuthVector> StaticProcessor::get_gsm_auth_vector(
    const std::string& imsi, AuthFailure& failure, std::string& error) {
  auto it = subscribers_.find(imsi);
  if (it == subscribers_.end()) {
    failure = AuthFailure::SubscriberNotFound;
    error = "subscriber not found: IMSI" + imsi;
    return std::nullopt;
  }
  const SubscriberEntry& sub = it->second;

  failure = AuthFailure::CryptoError;
  if (sub.gsm_state != GsmState::Active) {
    error = "GSM service not active for IMSI" + imsi;
    return std::nullopt;
  }
  if (sub.auth_algo != kAuthAlgoPrecomputed) {
    error = "Unknown crypto (" + sub.auth_algo + ") for IMSI" + imsi;
    return std::nullopt;
  }
  if (sub.auth_tuples.empty()) {
    error = "Auth key not present for IMSI" + imsi;
    return std::nullopt;
  }
  auto vec = split_precomputed_tuple(sub.auth_tuples.front());
  if (!vec) {
    error = "Malformed auth tuple for IMSI" + imsi;
    return std::nullopt;
  }
  failure = AuthFailure::None;
  return vec;
}

std::optional<AuthVector> split_precomputed_tuple(const Bytes& tuple) {
  if (tuple.size() != kRandLength + kSresLength + kKcLength) {
    return std::nullopt;
  }
  auto sres = tuple.begin() + kRandLength;
  auto kc = sres + kSresLength;
  AuthVector vec;
  vec.rand.assign(tuple.begin(), sres);
  vec.sres.assign(sres, kc);
  vec.kc.assign(kc, tuple.end());
  return vec;
}

}  // namespace gsupbridge::server
