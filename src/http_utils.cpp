#include "http_utils.h"
#include <fmt/ranges.h>
#include "pygrade/utils.h"

namespace http_utils {

std::string FormatOneParam(const httplib::Params& params) {
  if (params.empty()) return "(none)";
  return fmt::format("{}", params);
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

httplib::Headers CorsHeaders() {
  return {
    {"Access-Control-Allow-Origin", "*"},
    {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
    {"Access-Control-Allow-Headers", "*"},
  };
}

void SetJson(httplib::Response& res, const nlohmann::json& body, int status) {
  res.status = status;
  res.set_content(DumpJson(body), "application/json");
}

} // namespace http_utils
