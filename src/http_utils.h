#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests & build JSON responses

#include <chrono>
#include <string>
#include <utility>
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);

bool IsSuccess(int code);

// Sent with every response; any origin may call the API
httplib::Headers CorsHeaders();

void SetJson(httplib::Response&, const nlohmann::json&, int status = 200);

} // namespace http_utils

struct HTTPGet {
  constexpr static char method_name[] = "GET";
  template <class Handler>
  void operator()(httplib::Server& svr, const std::string& pattern, Handler&& handler) {
    svr.Get(pattern, std::forward<Handler>(handler));
  }
};
struct HTTPPost {
  constexpr static char method_name[] = "POST";
  template <class Handler>
  void operator()(httplib::Server& svr, const std::string& pattern, Handler&& handler) {
    svr.Post(pattern, std::forward<Handler>(handler));
  }
};
struct HTTPOptions {
  constexpr static char method_name[] = "OPTIONS";
  template <class Handler>
  void operator()(httplib::Server& svr, const std::string& pattern, Handler&& handler) {
    svr.Options(pattern, std::forward<Handler>(handler));
  }
};

// Register a handler; every request is logged with its status and handling time
template <class Method, class Handler>
void AddRoute(httplib::Server& svr, const std::string& pattern, Handler handler) {
  spdlog::debug("Route {} {}", Method::method_name, pattern);
  Method()(svr, pattern, [handler](const httplib::Request& req, httplib::Response& res) {
    spdlog::debug("{} {} params {}", Method::method_name, req.path, http_utils::FormatOneParam(req.params));
    auto start = std::chrono::steady_clock::now();
    handler(req, res);
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (http_utils::IsSuccess(res.status)) {
      spdlog::info("{} {} {} {:.3f}s", Method::method_name, req.path, res.status, elapsed);
    } else {
      spdlog::warn("{} {} {} {:.3f}s", Method::method_name, req.path, res.status, elapsed);
    }
  });
}

#endif  // HTTP_UTILS_H_
