#pragma once

#include "domain/transfer_service.hpp"

#include <string>
#include <curl/curl.h>

namespace conversion_service {

// http(s) transport. Downloads with GET, uploads with PUT to <destination>/<object_name>.
// Each call uses its own easy handle, so one instance serves concurrent jobs.
class CurlTransfer : public TransferService {
public:
  explicit CurlTransfer(std::string auth_token = {});

  bool supports(const std::string& uri) const override;

  std::expected<void, std::string> fetch(
    const std::string& url,
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

  // Percent-encodes each path segment of object_name, keeping the '/' separators.
  static std::string escapePath(CURL* curl, const std::string& object_name);

private:
  struct FetchState {
    CURL* curl;
    const ChunkWriter* writer;
    const LengthHandler* on_length;
    bool length_reported{false};
  };

  static size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata);
  static size_t readCallback(char* buffer, size_t size, size_t nitems, void* userdata);
  static int progressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

  curl_slist* authHeaders() const;
  void applyCommonOptions(CURL* curl, const AbortCheck& should_abort) const;

  std::string auth_token_;
};

} // namespace conversion_service
