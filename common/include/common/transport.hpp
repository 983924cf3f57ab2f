#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gsupbridge {

// Byte sink of one connection. Partial-write retries are the
// implementation's business; callers issue a single write per frame.
class Transport {
 public:
  virtual ~Transport() = default;

  // Returns false and fills error if the bytes could not be written.
  virtual bool write(const std::uint8_t* data, std::size_t length,
                     std::string& error) = 0;
};

}  // namespace gsupbridge
