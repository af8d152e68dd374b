#include "intra_core/http/url.hpp"

#include <curl/curl.h>

#include "intra_core/errors.hpp"

namespace intra_core {

namespace {

struct UrlHandle {
  CURLU *handle;

  UrlHandle() : handle(curl_url()) {}
  ~UrlHandle() {
    if (handle) {
      curl_url_cleanup(handle);
    }
  }

  UrlHandle(const UrlHandle &) = delete;
  UrlHandle &operator=(const UrlHandle &) = delete;
};

}  // namespace

std::string build_url(const std::string &base, const QueryParams &params) {
  UrlHandle url;
  if (!url.handle) {
    throw UrlConstructionError("Failed to allocate URL handle");
  }

  CURLUcode rc = curl_url_set(url.handle, CURLUPART_URL, base.c_str(), 0);
  if (rc != CURLUE_OK) {
    throw UrlConstructionError("Invalid base URL '" + base + "': " + curl_url_strerror(rc));
  }

  for (const auto &[key, value] : params) {
    if (key.empty()) {
      throw UrlConstructionError("Empty query parameter name for '" + base + "'");
    }
    // CURLU_URLENCODE with CURLU_APPENDQUERY encodes the value and keeps the first '='
    std::string pair = key + "=" + value;
    rc = curl_url_set(url.handle, CURLUPART_QUERY, pair.c_str(),
                      CURLU_APPENDQUERY | CURLU_URLENCODE);
    if (rc != CURLUE_OK) {
      throw UrlConstructionError("Cannot append query parameter '" + key +
                                 "': " + curl_url_strerror(rc));
    }
  }

  char *full = nullptr;
  rc = curl_url_get(url.handle, CURLUPART_URL, &full, 0);
  if (rc != CURLUE_OK || !full) {
    throw UrlConstructionError("Cannot assemble URL from '" + base +
                               "': " + curl_url_strerror(rc));
  }
  std::string result(full);
  curl_free(full);
  return result;
}

}  // namespace intra_core
