#include "file_transfer.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace conversion_service {

namespace {

constexpr const char* kFileScheme = "file://";

} // namespace

FileTransfer::FileTransfer(std::size_t chunk_bytes) : chunk_bytes_(chunk_bytes == 0 ? 1 : chunk_bytes) {}

std::string FileTransfer::pathFromUri(const std::string& uri) {
  if (uri.starts_with(kFileScheme)) {
    return uri.substr(std::char_traits<char>::length(kFileScheme));
  }
  return uri;
}

bool FileTransfer::supports(const std::string& uri) const {
  return uri.starts_with(kFileScheme) || uri.find("://") == std::string::npos;
}

std::expected<void, std::string> FileTransfer::fetch(
  const std::string& uri,
  const ChunkWriter& writer,
  const LengthHandler& on_length,
  const AbortCheck& should_abort
) {
  const std::filesystem::path path = pathFromUri(uri);

  std::error_code ec;
  auto length = std::filesystem::file_size(path, ec);
  if (ec) {
    return std::unexpected("Cannot stat " + path.string() + ": " + ec.message());
  }
  if (on_length && !on_length(length)) {
    return std::unexpected("Transfer aborted");
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected("Failed to open input file " + path.string());
  }

  std::vector<char> buffer(chunk_bytes_);
  while (file) {
    if (should_abort && should_abort()) {
      return std::unexpected("Transfer aborted");
    }
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    auto count = static_cast<std::size_t>(file.gcount());
    if (count == 0) {
      break;
    }
    if (!writer(buffer.data(), count)) {
      return std::unexpected("Transfer aborted");
    }
  }

  if (file.bad()) {
    return std::unexpected("Read error on " + path.string());
  }
  return {};
}

std::expected<std::string, std::string> FileTransfer::store(
  const std::string& destination,
  const std::string& object_name,
  std::uint64_t size,
  const ChunkReader& reader,
  const AbortCheck& should_abort
) {
  const auto target = std::filesystem::path(pathFromUri(destination)) / object_name;
  auto partial = target;
  partial += ".part";

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    return std::unexpected("Cannot create " + target.parent_path().string() + ": " + ec.message());
  }

  auto fail = [&partial](std::string message) -> std::expected<std::string, std::string> {
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    return std::unexpected(std::move(message));
  };

  {
    std::ofstream file(partial, std::ios::binary | std::ios::trunc);
    if (!file) {
      return fail("Failed to open output file " + partial.string());
    }

    std::vector<char> buffer(chunk_bytes_);
    std::uint64_t written = 0;
    while (true) {
      if (should_abort && should_abort()) {
        return fail("Transfer aborted");
      }
      auto count = reader(buffer.data(), buffer.size());
      if (!count) {
        return fail("Transfer aborted");
      }
      if (*count == 0) {
        break;
      }
      file.write(buffer.data(), static_cast<std::streamsize>(*count));
      if (!file) {
        return fail("Write error on " + partial.string());
      }
      written += *count;
    }

    file.close();
    if (!file) {
      return fail("Write error on " + partial.string());
    }
    if (written != size) {
      return fail("Short write: " + std::to_string(written) + " of " + std::to_string(size) + " bytes");
    }
  }

  // publish atomically so readers never see a partial artifact
  std::filesystem::rename(partial, target, ec);
  if (ec) {
    return fail("Cannot publish " + target.string() + ": " + ec.message());
  }
  return std::string(kFileScheme) + std::filesystem::absolute(target).lexically_normal().string();
}

} // namespace conversion_service
