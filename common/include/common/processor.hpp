#pragma once

#include <optional>
#include <string>

#include "common/ie.hpp"

namespace gsupbridge {

enum class AuthFailure {
  None,
  SubscriberNotFound,  // IMSI unknown to the subscriber store
  CryptoError,         // subscriber known but no vector could be produced
};

std::string to_string(AuthFailure failure);

// Interface for the GSM protocols to reach the crypto provider / subscriber
// store. Implementations must not block for long: they run on the
// connection's event loop.
class GsmProcessor {
 public:
  virtual ~GsmProcessor() = default;

  // Returns the (rand, sres, kc) triplet for `imsi`. On failure returns
  // std::nullopt and sets `failure` and `error`.
  virtual std::optional<AuthVector> get_gsm_auth_vector(const std::string& imsi,
                                                        AuthFailure& failure,
                                                        std::string& error) = 0;
};

}  // namespace gsupbridge
