#include "curl_webhook_sender.hpp"

#include <curl/curl.h>

#include <fcntl.h>

#include <memory>
#include <stdexcept>

namespace tams::events {

namespace {

struct EasyDeleter {
  void operator()(CURL* curl) const {
    curl_easy_cleanup(curl);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

} // namespace

CurlWebhookSender::CurlWebhookSender(std::string user_agent) : user_agent_(std::move(user_agent)) {
  if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

CurlWebhookSender::~CurlWebhookSender() {
  curl_global_cleanup();
}

SendResult CurlWebhookSender::Send(const WebhookRequest& request) {
  SendResult result;

  std::unique_ptr<CURL, EasyDeleter> curl(curl_easy_init());
  if (!curl) {
    result.error = "curl_easy_init failed";
    return result;
  }

  curl_slist* raw_headers = nullptr;
  auto        append      = [&](const std::string& line) {
    if (auto* next = curl_slist_append(raw_headers, line.c_str())) raw_headers = next;
  };
  append("Content-Type: application/json");
  for (const auto& [name, value] : request.headers) {
    append(name + ": " + value);
  }
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  const long timeout_ms = static_cast<long>(request.timeout.count());

  bool ok = true;
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, timeout_ms);
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
  // response bodies are not used; the variadic setopt needs a plain function pointer
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, +[](char*, size_t size, size_t nmemb, void*) { return size * nmemb; });
  ok &= !curl_easy_setopt(curl.get(), CURLOPT_SOCKOPTFUNCTION, +[](void*, curl_socket_t fd, curlsocktype) {
    fcntl(fd, F_SETFD, FD_CLOEXEC);
    return static_cast<int>(CURL_SOCKOPT_OK);
  });
  if (!ok) {
    result.error = "failed to set libcurl options";
    return result;
  }

  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    result.error = curl_easy_strerror(res);
    return result;
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &result.status);
  result.ok = result.status >= 200 && result.status < 300;
  if (!result.ok) {
    result.error = "HTTP " + std::to_string(result.status);
  }
  return result;
}

} // namespace tams::events
