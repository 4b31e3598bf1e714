#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>

namespace conversion_service {

// Receives one fetched chunk. Returning false aborts the transfer.
using ChunkWriter = std::function<bool(const char* data, std::size_t size)>;
// Fills up to capacity bytes and returns the count; 0 ends the stream, nullopt aborts it.
using ChunkReader = std::function<std::optional<std::size_t>(char* buffer, std::size_t capacity)>;
// Told the payload length once the remote side reports it. Returning false aborts.
using LengthHandler = std::function<bool(std::uint64_t length)>;
// Polled while the transfer is idle; true aborts.
using AbortCheck = std::function<bool()>;

// One transport for moving bytes between a remote location and the workspace.
// Implementations never buffer a whole payload.
class TransferService {
public:
  virtual ~TransferService() = default;

  virtual bool supports(const std::string& uri) const = 0;

  virtual std::expected<void, std::string> fetch(
    const std::string& uri,
    const ChunkWriter& writer,
    const LengthHandler& on_length,
    const AbortCheck& should_abort
  ) = 0;

  // Stores `size` bytes from reader as object_name under destination and returns the
  // resulting location.
  virtual std::expected<std::string, std::string> store(
    const std::string& destination,
    const std::string& object_name,
    std::uint64_t size,
    const ChunkReader& reader,
    const AbortCheck& should_abort
  ) = 0;
};

} // namespace conversion_service
