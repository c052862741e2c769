/**
 * @file SpecFetcher.cpp
 * @brief HTTP(S) GET through libcurl.
 */

#include "src/spec/inc/SpecFetcher.hpp"
#include "src/helpers/inc/Log.hpp"

#include <memory>
#include <mutex>

#include <curl/curl.h>
#include <fmt/core.h>

namespace ibcheck {

namespace spec {

namespace {

std::once_flag gCurlInit;

struct Sink {
  std::string* body;
  bool overflow{false};
};

std::size_t writeBody(char* data, std::size_t size, std::size_t count, void* user) {
  Sink* sink = static_cast<Sink*>(user);
  const std::size_t N = size * count;
  if (sink->body->size() + N > MAX_SPEC_BYTES) {
    sink->overflow = true;
    return 0;
  }
  sink->body->append(data, N);
  return N;
}

} // namespace

std::string FetchResult::describe() const {
  if (!error.empty()) {
    return error;
  }
  return fmt::format("HTTP {}", status);
}

CurlSpecFetcher::CurlSpecFetcher(std::chrono::milliseconds timeout,
                                 std::chrono::milliseconds connectTimeout)
    : timeout_(timeout), connectTimeout_(connectTimeout) {
  std::call_once(gCurlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

FetchResult CurlSpecFetcher::fetch(const std::string& url) {
  FetchResult result;

  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
  if (!curl) {
    result.error = "curl_easy_init failed";
    return result;
  }

  Sink sink{&result.body};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                   static_cast<long>(connectTimeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &writeBody);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sink);

  helpers::log::logger()->debug("GET {}", url);
  const CURLcode RC = curl_easy_perform(curl.get());
  if (RC != CURLE_OK) {
    result.error = sink.overflow
                       ? fmt::format("GET {}: body exceeds {} bytes", url, MAX_SPEC_BYTES)
                       : fmt::format("GET {}: {}", url, curl_easy_strerror(RC));
    result.body.clear();
    return result;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
  if (result.status != HTTP_OK) {
    helpers::log::logger()->debug("GET {} -> HTTP {}", url, result.status);
  }
  return result;
}

} // namespace spec

} // namespace ibcheck
