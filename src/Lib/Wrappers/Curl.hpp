#pragma once

#include <curl/curl.h>
#include <utility> // std::{exchange, move}

#include <Almanac/Utils/Error.hpp>
#include <Almanac/Utils/Types.hpp>

namespace Curl {
  namespace {
    using almanac::utils::error::AlmanacError;
    using enum almanac::utils::error::AlmanacErrorCode;

    using almanac::utils::types::Err;
    using almanac::utils::types::i64;
    using almanac::utils::types::None;
    using almanac::utils::types::Option;
    using almanac::utils::types::RawPointer;
    using almanac::utils::types::Result;
    using almanac::utils::types::String;
    using almanac::utils::types::Unit;
    using almanac::utils::types::usize;
  } // namespace

  /**
   * @brief Options for initializing a Curl::Easy handle.
   */
  struct EasyOptions {
    Option<String> url                = None; ///< URL to set for the transfer
    Option<i64>    timeoutSecs        = None; ///< Timeout for the entire request in seconds
    Option<i64>    connectTimeoutSecs = None; ///< Timeout for the connection phase in seconds
    Option<String> userAgent          = None; ///< User-agent string
    Option<String> username           = None; ///< HTTP basic auth user
    Option<String> password           = None; ///< HTTP basic auth password
  };

  /**
   * @brief Body and status of a completed transfer.
   */
  struct Response {
    i64    status = 0;
    String body;
  };

  /**
   * @brief RAII wrapper for CURL easy handle.
   *
   * A handle owns its response buffer, so one handle serves one request at a time.
   */
  class Easy {
    CURL*                m_curl      = nullptr;
    Option<AlmanacError> m_initError = None;
    String               m_body;

    static fn writeCallback(RawPointer contents, const usize size, const usize nmemb, String* str) -> usize {
      const usize totalSize = size * nmemb;
      str->append(static_cast<char*>(contents), totalSize);
      return totalSize;
    }

    // Separates failures worth retrying elsewhere (transport) from ones the server reported.
    static fn codeFor(const CURLcode res) -> almanac::utils::error::AlmanacErrorCode {
      switch (res) {
        case CURLE_OPERATION_TIMEDOUT:
          return Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_GOT_NOTHING:
          return NetworkError;
        default:
          return ApiUnavailable;
      }
    }

    fn apply(const EasyOptions& options) -> Result<> {
      if (options.url)
        if (Result res = setUrl(*options.url); !res)
          return res;

      if (Result res = setOpt(CURLOPT_WRITEFUNCTION, writeCallback); !res)
        return res;

      if (Result res = setOpt(CURLOPT_WRITEDATA, &m_body); !res)
        return res;

      // Worker threads must not receive SIGALRM from the resolver.
      if (Result res = setOpt(CURLOPT_NOSIGNAL, 1L); !res)
        return res;

      if (Result res = setOpt(CURLOPT_FOLLOWLOCATION, 1L); !res)
        return res;

      if (options.timeoutSecs)
        if (Result res = setOpt(CURLOPT_TIMEOUT, *options.timeoutSecs); !res)
          return res;

      if (options.connectTimeoutSecs)
        if (Result res = setOpt(CURLOPT_CONNECTTIMEOUT, *options.connectTimeoutSecs); !res)
          return res;

      if (options.userAgent)
        if (Result res = setOpt(CURLOPT_USERAGENT, options.userAgent->c_str()); !res)
          return res;

      if (options.username && options.password) {
        if (Result res = setOpt(CURLOPT_HTTPAUTH, static_cast<long>(CURLAUTH_BASIC)); !res)
          return res;

        if (Result res = setOpt(CURLOPT_USERNAME, options.username->c_str()); !res)
          return res;

        if (Result res = setOpt(CURLOPT_PASSWORD, options.password->c_str()); !res)
          return res;
      }

      return {};
    }

   public:
    /**
     * @brief Constructor with options. Initializes a CURL easy handle and sets options.
     * @param options The options to configure the CURL handle.
     */
    explicit Easy(const EasyOptions& options = {})
      : m_curl(curl_easy_init()) {
      if (!m_curl) {
        m_initError = AlmanacError(ApiUnavailable, "curl_easy_init() failed");
        return;
      }

      if (Result res = apply(options); !res)
        m_initError = res.error();
    }

    ~Easy() {
      if (m_curl)
        curl_easy_cleanup(m_curl);
    }

    // The write callback points at m_body, so the handle cannot move.
    Easy(const Easy&)                = delete;
    Easy(Easy&&)                     = delete;
    fn operator=(const Easy&)->Easy& = delete;
    fn operator=(Easy&&)->Easy&      = delete;

    [[nodiscard]] explicit operator bool() const {
      return m_curl != nullptr && !m_initError;
    }

    [[nodiscard]] fn getInitializationError() const -> const Option<AlmanacError>& {
      return m_initError;
    }

    /**
     * @brief Sets a CURL option.
     * @tparam T The type of the option value.
     * @param option The CURL option to set.
     * @param value The value to set for the option.
     * @return A Result indicating success or failure.
     */
    template <typename T>
    fn setOpt(const CURLoption option, T value) -> Result<> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (const CURLcode res = curl_easy_setopt(m_curl, option, value); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_setopt failed: {}", curl_easy_strerror(res));

      return {};
    }

    fn setUrl(const String& url) -> Result<> {
      return setOpt(CURLOPT_URL, url.c_str());
    }

    /**
     * @brief Performs a blocking transfer and returns the HTTP status with the body.
     *
     * Transport failures map to Timeout or NetworkError where libcurl says so,
     * anything else to ApiUnavailable. HTTP error statuses are returned, not raised.
     */
    fn perform() -> Result<Response> {
      if (!m_curl)
        ERR(InternalError, "CURL handle is not initialized or init failed");

      if (m_initError)
        ERR_FMT(InternalError, "Cannot perform request, CURL handle initialization failed: {}", m_initError->message);

      m_body.clear();

      if (const CURLcode res = curl_easy_perform(m_curl); res != CURLE_OK)
        ERR_FMT(codeFor(res), "curl_easy_perform failed: {}", curl_easy_strerror(res));

      long status = 0;

      if (const CURLcode res = curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &status); res != CURLE_OK)
        ERR_FMT(InternalError, "curl_easy_getinfo failed: {}", curl_easy_strerror(res));

      return Response { .status = static_cast<i64>(status), .body = std::exchange(m_body, {}) };
    }

    /**
     * @brief Escapes a URL component.
     */
    static fn escape(const String& text) -> Result<String> {
      char* escaped = curl_easy_escape(nullptr, text.c_str(), static_cast<int>(text.length()));

      if (!escaped)
        ERR(InternalError, "curl_easy_escape failed");

      String result(escaped);

      curl_free(escaped);

      return result;
    }
  };

  /**
   * @brief Initializes CURL globally. Call once before any worker thread starts.
   */
  inline fn GlobalInit(const long flags = CURL_GLOBAL_ALL) -> Result<> {
    if (const CURLcode res = curl_global_init(flags); res != CURLE_OK)
      ERR_FMT(InternalError, "curl_global_init failed: {}", curl_easy_strerror(res));

    return {};
  }

  /**
   * @brief Cleans up CURL globally. Call once after every handle is gone.
   */
  inline fn GlobalCleanup() -> Unit {
    curl_global_cleanup();
  }
} // namespace Curl
