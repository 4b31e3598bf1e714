#include "curl_transfer.hpp"

#include <memory>
#include <mutex>

namespace conversion_service {

namespace {

std::once_flag g_curl_init;

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

EasyHandle makeEasyHandle() {
  std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  return EasyHandle(curl_easy_init(), &curl_easy_cleanup);
}

std::string describe(CURL* curl, CURLcode res) {
  std::string text = curl_easy_strerror(res);
  if (res == CURLE_HTTP_RETURNED_ERROR) {
    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    text = "HTTP error: " + std::to_string(http_code);
  }
  return text;
}

} // namespace

CurlTransfer::CurlTransfer(std::string auth_token) : auth_token_(std::move(auth_token)) {
  std::call_once(g_curl_init, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

bool CurlTransfer::supports(const std::string& uri) const {
  return uri.starts_with("http://") || uri.starts_with("https://");
}

curl_slist* CurlTransfer::authHeaders() const {
  if (auth_token_.empty()) {
    return nullptr;
  }
  return curl_slist_append(nullptr, ("Authorization: Bearer " + auth_token_).c_str());
}

void CurlTransfer::applyCommonOptions(CURL* curl, const AbortCheck& should_abort) const {
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
  curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
  // a stalled peer (under 1 byte/s for a minute) is a transfer failure
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
  curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, 60L);
  curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
  curl_easy_setopt(curl, CURLOPT_XFERINFODATA, const_cast<AbortCheck*>(&should_abort));
}

std::expected<void, std::string> CurlTransfer::fetch(
  const std::string& url,
  const ChunkWriter& writer,
  const LengthHandler& on_length,
  const AbortCheck& should_abort
) {
  auto curl = makeEasyHandle();
  if (!curl) {
    return std::unexpected("Failed to initialize CURL");
  }

  FetchState state{curl.get(), &writer, &on_length};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
  applyCommonOptions(curl.get(), should_abort);

  HeaderList headers(authHeaders(), &curl_slist_free_all);
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    return std::unexpected(describe(curl.get(), res));
  }
  return {};
}

std::expected<std::string, std::string> CurlTransfer::store(
  const std::string& destination,
  const std::string& object_name,
  std::uint64_t size,
  const ChunkReader& reader,
  const AbortCheck& should_abort
) {
  auto curl = makeEasyHandle();
  if (!curl) {
    return std::unexpected("Failed to initialize CURL");
  }

  std::string url = destination;
  if (!url.ends_with('/')) {
    url += '/';
  }
  url += escapePath(curl.get(), object_name);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_READFUNCTION, readCallback);
  curl_easy_setopt(curl.get(), CURLOPT_READDATA, const_cast<ChunkReader*>(&reader));
  curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
  applyCommonOptions(curl.get(), should_abort);

  HeaderList headers(authHeaders(), &curl_slist_free_all);
  if (headers) {
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  }

  auto res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    return std::unexpected(describe(curl.get(), res));
  }
  return url;
}

std::string CurlTransfer::escapePath(CURL* curl, const std::string& object_name) {
  std::string escaped;
  std::size_t start = 0;
  while (start <= object_name.size()) {
    auto end = object_name.find('/', start);
    if (end == std::string::npos) {
      end = object_name.size();
    }
    auto segment = object_name.substr(start, end - start);
    char* encoded = curl_easy_escape(curl, segment.c_str(), static_cast<int>(segment.size()));
    if (encoded) {
      escaped += encoded;
      curl_free(encoded);
    }
    if (end < object_name.size()) {
      escaped += '/';
    }
    start = end + 1;
  }
  return escaped;
}

size_t CurlTransfer::writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* state = static_cast<FetchState*>(userdata);
  const size_t bytes = size * nmemb;

  if (!state->length_reported) {
    state->length_reported = true;
    curl_off_t length = -1;
    curl_easy_getinfo(state->curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0 && *state->on_length &&
        !(*state->on_length)(static_cast<std::uint64_t>(length))) {
      return 0;
    }
  }

  // any short count makes curl fail the transfer with CURLE_WRITE_ERROR
  return (*state->writer)(ptr, bytes) ? bytes : 0;
}

size_t CurlTransfer::readCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
  auto* reader = static_cast<ChunkReader*>(userdata);
  auto count = (*reader)(buffer, size * nitems);
  if (!count) {
    return CURL_READFUNC_ABORT;
  }
  return *count;
}

int CurlTransfer::progressCallback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                                   curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
  auto* should_abort = static_cast<AbortCheck*>(clientp);
  if (*should_abort && (*should_abort)()) {
    return 1;
  }
  return 0;
}

} // namespace conversion_service
