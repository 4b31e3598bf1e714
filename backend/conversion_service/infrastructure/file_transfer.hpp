#pragma once

#include "domain/transfer_service.hpp"

#include <cstddef>

namespace conversion_service {

// Local filesystem transport: `file://` URIs and plain paths.
class FileTransfer : public TransferService {
public:
  explicit FileTransfer(std::size_t chunk_bytes);

  bool supports(const std::string& uri) const override;

  std::expected<void, std::string> fetch(
    const std::string& uri,
    const ChunkWriter& writer,
    const LengthHandler& on_length,
    const AbortCheck& should_abort
  ) override;

  std::expected<std::string, std::string> store(
    const std::string& destination,
    const std::string& object_name,
    std::uint64_t size,
    const ChunkReader& reader,
    const AbortCheck& should_abort
  ) override;

  static std::string pathFromUri(const std::string& uri);

private:
  std::size_t chunk_bytes_;
};

} // namespace conversion_service
