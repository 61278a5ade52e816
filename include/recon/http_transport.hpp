/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */


/**
 * @file http_transport.hpp
 * @brief HttpTransport interface and its libcurl implementation.
 *
 * CurlTransport keeps one easy handle per control-plane endpoint, so
 * connections are reused between requests. Unix sockets go through
 * CURLOPT_UNIX_SOCKET_PATH; https endpoints present the configured client
 * certificate.
 *
 * Only connection setup is bounded by default. LXD holds a
 * "GET <operation>/wait" reply until the operation finishes, which for a
 * graceful stop or an image download is routinely longer than any connect
 * budget. A request can still be aborted through the cancel flag.
 *
 * Failures below the HTTP layer are ErrorKind::kTransport, an abort through
 * the cancel flag is ErrorKind::kCancelled.
 */

#ifndef RECON_HTTP_TRANSPORT_HPP_
#define RECON_HTTP_TRANSPORT_HPP_

#include "recon/http.hpp"
#include "recon/log.hpp"
#include "recon/vocabulary.hpp"

#include <curl/curl.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace recon {

// ============================================================================
// HttpTransport
// ============================================================================

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual Result<http::Response> RoundTrip(const http::Request& req) = 0;
};

// ============================================================================
// CurlTransport
// ============================================================================

struct TransportOptions {
  std::string client_cert;  ///< PEM certificate presented to the server.
  std::string client_key;   ///< PEM private key for client_cert.
  std::string server_cert;  ///< PEM to verify the server; empty = no check.
  int32_t connect_timeout_ms = 10000;
  int32_t request_timeout_ms = 0;  ///< Whole exchange; 0 = unlimited.
  const std::atomic<bool>* cancel = nullptr;
};

namespace detail {

/** curl_global_init/curl_global_cleanup for the process lifetime. */
class CurlGlobal final {
 public:
  static bool Ensure() {
    static CurlGlobal instance;
    return instance.ok_;
  }

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;

 private:
  CurlGlobal() : ok_(curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK) {}
  ~CurlGlobal() {
    if (ok_) curl_global_cleanup();
  }

  bool ok_;
};

static constexpr size_t kMaxResponseBytes = 16U * 1024U * 1024U;

}  // namespace detail

class CurlTransport final : public HttpTransport {
 public:
  static Result<std::unique_ptr<HttpTransport>> Create(
      const http::Endpoint& endpoint, TransportOptions options) {
    using R = Result<std::unique_ptr<HttpTransport>>;
    if (!detail::CurlGlobal::Ensure()) {
      return R::error(
          MakeError(ErrorKind::kTransport, "curl_global_init failed"));
    }
    CURL* handle = curl_easy_init();
    if (handle == nullptr) {
      return R::error(MakeError(ErrorKind::kTransport, "curl_easy_init failed"));
    }
    return R::success(std::unique_ptr<HttpTransport>(
        new CurlTransport(handle, endpoint, std::move(options))));
  }

  ~CurlTransport() override { curl_easy_cleanup(curl_); }

  CurlTransport(const CurlTransport&) = delete;
  CurlTransport& operator=(const CurlTransport&) = delete;

  Result<http::Response> RoundTrip(const http::Request& req) override {
    RECON_LOG_DEBUG("http", "%s %s", req.method.c_str(), req.path.c_str());

    curl_easy_reset(curl_);
    errbuf_[0] = '\0';
    const std::string url = base_url_ + req.path;
    std::string received;

    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Expect:");
    if (!req.body.empty()) {
      headers = curl_slist_append(headers, "Content-Type: application/json");
    }

    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, req.method.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_USERAGENT, "recon");
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf_);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(options_.connect_timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(options_.request_timeout_ms));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &CurlTransport::OnBody);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &received);
    if (!req.body.empty()) {
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, req.body.c_str());
      curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,
                       static_cast<long>(req.body.size()));
    }
    if (options_.cancel != nullptr) {
      curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
      curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION,
                       &CurlTransport::OnProgress);
      curl_easy_setopt(curl_, CURLOPT_XFERINFODATA,
                       static_cast<void*>(
                           const_cast<std::atomic<bool>*>(options_.cancel)));
    }

    switch (endpoint_.scheme) {
      case http::Scheme::kUnix:
        curl_easy_setopt(curl_, CURLOPT_UNIX_SOCKET_PATH,
                         endpoint_.socket_path.c_str());
        break;
      case http::Scheme::kHttps:
        SetTlsOptions();
        break;
      case http::Scheme::kHttp:
        break;
    }

    const CURLcode rc = curl_easy_perform(curl_);
    long status = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);

    if (rc != CURLE_OK) {
      return Result<http::Response>::error(TransferError(rc, req));
    }
    http::Response resp;
    resp.status = static_cast<int32_t>(status);
    resp.body = std::move(received);
    return Result<http::Response>::success(std::move(resp));
  }

 private:
  CurlTransport(CURL* handle, const http::Endpoint& endpoint,
                TransportOptions options)
      : curl_(handle),
        endpoint_(endpoint),
        options_(std::move(options)),
        base_url_(http::BaseUrl(endpoint)),
        errbuf_{} {}

  void SetTlsOptions() {
    if (!options_.client_cert.empty()) {
      curl_easy_setopt(curl_, CURLOPT_SSLCERT, options_.client_cert.c_str());
      curl_easy_setopt(curl_, CURLOPT_SSLCERTTYPE, "PEM");
    }
    if (!options_.client_key.empty()) {
      curl_easy_setopt(curl_, CURLOPT_SSLKEY, options_.client_key.c_str());
      curl_easy_setopt(curl_, CURLOPT_SSLKEYTYPE, "PEM");
    }
    if (!options_.server_cert.empty()) {
      // Pinned certificate: the chain is checked, the host name is not
      // (LXD server certificates are issued for the daemon, not the host).
      curl_easy_setopt(curl_, CURLOPT_CAINFO, options_.server_cert.c_str());
      curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    } else {
      curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 0L);
    }
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 0L);
  }

  Error TransferError(CURLcode rc, const http::Request& req) const {
    const std::string what = req.method + " " + req.path;
    if (rc == CURLE_ABORTED_BY_CALLBACK) {
      return MakeError(ErrorKind::kCancelled, what + ": request cancelled");
    }
    std::string msg = what + ": " + curl_easy_strerror(rc);
    if (errbuf_[0] != '\0') {
      msg += " (";
      msg += errbuf_;
      msg += ")";
    }
    return MakeError(ErrorKind::kTransport, std::move(msg));
  }

  static size_t OnBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = static_cast<std::string*>(userdata);
    const size_t n = size * nmemb;
    if (out->size() + n > detail::kMaxResponseBytes) return 0;
    out->append(ptr, n);
    return n;
  }

  static int OnProgress(void* clientp, curl_off_t, curl_off_t, curl_off_t,
                        curl_off_t) {
    const std::atomic<bool>* cancel =
        static_cast<const std::atomic<bool>*>(clientp);
    return cancel->load(std::memory_order_relaxed) ? 1 : 0;
  }

  CURL* curl_;
  http::Endpoint endpoint_;
  TransportOptions options_;
  std::string base_url_;
  char errbuf_[CURL_ERROR_SIZE];
};

}  // namespace recon

#endif  // RECON_HTTP_TRANSPORT_HPP_
