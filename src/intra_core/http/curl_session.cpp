#include "intra_core/http/curl_session.hpp"

#include <iostream>

#include "intra_core/errors.hpp"

namespace intra_core {

namespace {

// curl_global_init is not thread safe; run it once before the first handle
struct CurlGlobal {
  CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlGlobal() {
    curl_global_cleanup();
  }
};

void ensure_curl_global() {
  static CurlGlobal global;
}

class HeaderList {
 public:
  HeaderList() = default;
  ~HeaderList() {
    curl_slist_free_all(list_);
  }
  HeaderList(const HeaderList &) = delete;
  HeaderList &operator=(const HeaderList &) = delete;

  void append(const std::string &header) {
    curl_slist *next = curl_slist_append(list_, header.c_str());
    if (!next) {
      throw SessionError("Failed to build request headers");
    }
    list_ = next;
  }

  curl_slist *get() const {
    return list_;
  }

 private:
  curl_slist *list_ = nullptr;
};

}  // namespace

CurlSession::CurlSession(const Credentials &credentials, const std::string &api_base_url)
    : api_base_url_(api_base_url),
      client_id_(credentials.client_id),
      login_(credentials.login),
      curl_handle_(nullptr) {
  setup_curl_handle();
  request_token(credentials.client_secret);
}

CurlSession::~CurlSession() {
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
  }
}

CurlSession::CurlSession(CurlSession &&other) noexcept
    : api_base_url_(std::move(other.api_base_url_)),
      client_id_(std::move(other.client_id_)),
      login_(std::move(other.login_)),
      token_(std::move(other.token_)),
      curl_handle_(other.curl_handle_) {
  other.curl_handle_ = nullptr;
}

CurlSession &CurlSession::operator=(CurlSession &&other) noexcept {
  if (this != &other) {
    if (curl_handle_) {
      curl_easy_cleanup(curl_handle_);
    }
    api_base_url_ = std::move(other.api_base_url_);
    client_id_ = std::move(other.client_id_);
    login_ = std::move(other.login_);
    token_ = std::move(other.token_);
    curl_handle_ = other.curl_handle_;
    other.curl_handle_ = nullptr;
  }
  return *this;
}

void CurlSession::setup_curl_handle() {
  ensure_curl_global();
  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    throw SessionError("Failed to initialize CURL");
  }
}

size_t CurlSession::write_callback(void *contents, size_t size, size_t nmemb, std::string *userp) {
  userp->append(static_cast<char *>(contents), size * nmemb);
  return size * nmemb;
}

void CurlSession::request_token(const std::string &client_secret) {
  std::string url = api_base_url_ + "/oauth/token";

  char *id = curl_easy_escape(curl_handle_, client_id_.c_str(), static_cast<int>(client_id_.size()));
  char *secret =
      curl_easy_escape(curl_handle_, client_secret.c_str(), static_cast<int>(client_secret.size()));
  if (!id || !secret) {
    curl_free(id);
    curl_free(secret);
    throw SessionError("Failed to encode client credentials");
  }
  std::string form = std::string("grant_type=client_credentials&client_id=") + id +
                     "&client_secret=" + secret;
  curl_free(id);
  curl_free(secret);

  std::string response_buffer;
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, form.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, kTimeoutSeconds);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw SessionError("Token request failed: " + std::string(curl_easy_strerror(res)));
  }

  long http_code = 0;
  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  if (http_code != 200) {
    throw SessionError("Token request rejected with status code: " + std::to_string(http_code),
                       http_code);
  }

  try {
    token_ = parse_token_info(response_buffer);
  } catch (const DeserializationError &e) {
    throw SessionError(e.what(), http_code);
  }
}

std::string CurlSession::perform(const std::string &url, long &http_code) {
  HeaderList headers;
  headers.append("Authorization: Bearer " + token_.access_token);
  headers.append("Accept: application/json");

  std::string response_buffer;
  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT, kTimeoutSeconds);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res != CURLE_OK) {
    throw SessionError("CURL request failed: " + std::string(curl_easy_strerror(res)));
  }

  curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);
  return response_buffer;
}

std::string CurlSession::call(const std::string &url) {
  if (!curl_handle_) {
    throw SessionError("CURL handle not initialized");
  }

  long http_code = 0;
  std::string body = perform(url, http_code);
  if (http_code < 200 || http_code >= 300) {
    std::cerr << "[session] GET " << url << " -> " << http_code << std::endl;
    throw SessionError("HTTP request failed with status code: " + std::to_string(http_code),
                       http_code);
  }
  return body;
}

}  // namespace intra_core
