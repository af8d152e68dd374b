#pragma once

#include <string>

#include <curl/curl.h>

#include "intra_core/config_store.hpp"
#include "intra_core/http/session.hpp"
#include "intra_core/http/url.hpp"
#include "intra_core/types/token.hpp"

namespace intra_core {

/**
 * @brief Session authenticated with the OAuth2 client-credentials grant.
 *
 * The constructor exchanges client id and secret for an access token; every
 * call() then sends it as a bearer token.
 */
class CurlSession : public Session {
 public:
  // Throws SessionError if the token exchange fails
  explicit CurlSession(const Credentials &credentials,
                       const std::string &api_base_url = kApiBaseUrl);
  ~CurlSession() override;

  // Disable copy constructor and assignment
  CurlSession(const CurlSession &) = delete;
  CurlSession &operator=(const CurlSession &) = delete;

  CurlSession(CurlSession &&) noexcept;
  CurlSession &operator=(CurlSession &&) noexcept;

  std::string call(const std::string &url) override;

  const std::string &get_client_id() const override {
    return client_id_;
  }
  const std::string &get_login() const override {
    return login_;
  }
  const TokenInfo &get_token() const {
    return token_;
  }

  static constexpr long kTimeoutSeconds = 30;

 private:
  std::string api_base_url_;
  std::string client_id_;
  std::string login_;
  TokenInfo token_;
  CURL *curl_handle_;

  void setup_curl_handle();
  void request_token(const std::string &client_secret);
  std::string perform(const std::string &url, long &http_code);

  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace intra_core
