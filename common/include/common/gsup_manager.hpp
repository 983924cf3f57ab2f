#pragma once

#include <cstddef>
#include <cstdint>

#include "common/gsup.hpp"
#include "common/ipa.hpp"
#include "common/processor.hpp"

namespace gsupbridge {

// Bridges the IPA layer and the GSUP codec: decodes inbound messages, asks
// the processor for subscriber data and sends the responses. Keeps no state
// between messages; an UPDATE_LOCATION_REQ whose INSERT_SUBS_DATA exchange
// never completes is simply abandoned.
class GsupManager {
 public:
  GsupManager(GsmProcessor& processor, IpaWriter writer);

  // Handle one GSUP payload (OSMO extension byte already stripped).
  void handle_msg(const std::uint8_t* msg, std::size_t length);

  // Encode and send. Returns false if encoding or the write failed.
  bool send_msg(MsgType type, const IEMap& ies);

 private:
  void msg_send_auth_info_req(const IEMap& req_ies);
  void msg_auth_failure_report(const IEMap& req_ies);
  void msg_update_location_req(const IEMap& req_ies);
  void msg_insert_subs_data_res(const IEMap& req_ies);
  void msg_insert_subs_data_err(const IEMap& req_ies);

  GsmProcessor& processor_;
  IpaWriter writer_;
};

}  // namespace gsupbridge
