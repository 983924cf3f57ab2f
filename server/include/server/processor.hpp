#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/processor.hpp"
#include "server/config.hpp"

namespace gsupbridge::server {

constexpr const char* kAuthAlgoPrecomputed = "precomputed";

// Serves auth vectors for the subscribers listed in the configuration.
// The only supported algorithm stores precomputed (rand, sres, kc) triplets
// and hands out the first one; no A3/A8 is computed here.
class StaticProcessor : public GsmProcessor {
 public:
  explicit StaticProcessor(const std::vector<SubscriberEntry>& subscribers);

  std::optional<AuthVector> get_gsm_auth_vector(const std::string& imsi,
                                                AuthFailure& failure,
                                                std::string& error) override;

  std::size_t subscriber_count() const { return subscribers_.size(); }

 private:
  std::map<std::string, SubscriberEntry> subscribers_;
};

// Split a stored rand|sres|kc triplet. std::nullopt if it is not 28 bytes.
std::optional<AuthVector> split_precomputed_tuple(const Bytes& tuple);

}  // namespace gsupbridge::server
