#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  // request bodies may be archives
  const size_t kMaxLogged = 200;
  if (str.size() <= kMaxLogged) return str;
  return fmt::format("{}...({} bytes)", str.substr(0, kMaxLogged), str.size());
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers&) {
  // never log credentials
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

bool IsRetryable(const httplib::Result& res) {
  return !res || res->status >= 500;
}

} // namespace http_utils
