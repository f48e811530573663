#ifndef REMEX_HTTP_UTILS_H_
#define REMEX_HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <thread>
#include <memory>
#include <httplib.h>
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const char*);
std::string FormatOneParam(const std::string&);
std::string FormatOneParam(const httplib::Params&);
std::string FormatOneParam(const httplib::Headers&);
template <class T>
std::string FormatOneParam(const T&) { return "(unknown)"; }

std::string FormatParam();
template <class T, class... U>
std::string FormatParam(T&& head, U&&... tail) {
  return FormatOneParam(std::forward<T>(head)) + ' ' + FormatParam(std::forward<U>(tail)...);
}

bool IsSuccess(int code);
// transport errors and 5xx are worth another attempt; other statuses are final
bool IsRetryable(const httplib::Result&);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Get(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Post(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPPut {
  constexpr static char method_name[] = "PUT";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Put(endpoint, std::forward<T>(params)...);
  }
};
struct HTTPDelete {
  constexpr static char method_name[] = "DELETE";
  template <class... T>
  auto operator()(httplib::Client& cli, const std::string& endpoint, T&&... params) {
    return cli.Delete(endpoint, std::forward<T>(params)...);
  }
};

template <class Method, class... T>
httplib::Result HTTPRequest(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  spdlog::debug("{} {} params {}", Method::method_name, endpoint, http_utils::FormatParam(params...));
  return Method()(cli, endpoint, std::forward<T>(params)...);
}

template <class Method, class... T>
httplib::Result RequestRetry(httplib::Client& cli, const std::string& endpoint, T&&... params) {
  const int kRetries = 5;
  using namespace std::chrono_literals;
  std::unique_ptr<httplib::Result> last_res;
  for (int i = 0; i < kRetries; i++) {
    if (i) std::this_thread::sleep_for(1s);
    last_res = std::make_unique<httplib::Result>(
            HTTPRequest<Method>(cli, endpoint, std::forward<T>(params)...));
    if (!http_utils::IsRetryable(*last_res)) return std::move(*last_res);
    spdlog::warn("Retrying {} {}: error={} status={}", Method::method_name, endpoint,
                 httplib::to_string(last_res->error()), *last_res ? (*last_res)->status : -1);
  }
  spdlog::warn("Request {} {} failed after {} retries", Method::method_name, endpoint, kRetries);
  return std::move(*last_res);
}

#endif  // REMEX_HTTP_UTILS_H_
