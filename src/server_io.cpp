#include "server_io.h"

#include <thread>
#include <algorithm>

#include <httplib.h>
#include <spdlog/spdlog.h>

#include "http_utils.h"
#include "pygrade/utils.h"
#include <pygrade/catalog.h>
#include <pygrade/grading.h>

std::string kServerHost = "0.0.0.0";
int kServerPort = 8000;
int kServerThreads = std::max(4u, std::thread::hardware_concurrency());

namespace {

const char kBanner[] = "Python Typing Practice API";

int StatusCode(RequestStatus status) {
  switch (status) {
    case RequestStatus::OK: return 200;
    case RequestStatus::NOT_FOUND: return 404;
    case RequestStatus::INVALID_TEST_TYPE: return 400;
    case RequestStatus::TRANSPORT_FAILURE: return 500;
  }
  __builtin_unreachable();
}

inline HttpReply Error(int status, const std::string& detail) {
  return {status, {{"detail", detail}}};
}

} // namespace

HttpReply HandleChapter(const std::string& chapter_id) {
  const Chapter* ch = FindChapter(chapter_id);
  if (!ch) return Error(404, "Chapter not found");
  return {200, ChapterJson(*ch)};
}

HttpReply HandleEvaluate(const std::string& body) {
  std::string chapter_id, exercise_id, code;
  try {
    nlohmann::json req = nlohmann::json::parse(body);
    chapter_id = req.at("chapter_id").get<std::string>();
    exercise_id = req.at("exercise_id").get<std::string>();
    code = req.at("code").get<std::string>();
  } catch (nlohmann::json::exception& err) {
    spdlog::info("Malformed evaluate request: {}", err.what());
    return Error(400, "Malformed request");
  }
  EvaluateResponse res = Evaluate(chapter_id, exercise_id, code);
  if (res.status != RequestStatus::OK) {
    spdlog::info("Evaluate {}/{} rejected: {}", chapter_id, exercise_id, RequestStatusName(res.status));
    return Error(StatusCode(res.status), res.message);
  }
  return {200, ToJson(res.grade)};
}

bool ServerWorkLoop() {
  httplib::Server svr;
  svr.new_task_queue = [] { return new httplib::ThreadPool(kServerThreads); };
  svr.set_default_headers(http_utils::CorsHeaders());

  AddRoute<HTTPGet>(svr, "/", [](const httplib::Request&, httplib::Response& res) {
    http_utils::SetJson(res, {{"message", kBanner}});
  });
  AddRoute<HTTPGet>(svr, "/chapters", [](const httplib::Request&, httplib::Response& res) {
    http_utils::SetJson(res, ChapterListJson());
  });
  AddRoute<HTTPGet>(svr, R"(/chapters/([^/]+))", [](const httplib::Request& req, httplib::Response& res) {
    HttpReply reply = HandleChapter(req.matches[1]);
    http_utils::SetJson(res, reply.body, reply.status);
  });
  AddRoute<HTTPPost>(svr, "/evaluate", [](const httplib::Request& req, httplib::Response& res) {
    HttpReply reply = HandleEvaluate(req.body);
    http_utils::SetJson(res, reply.body, reply.status);
  });
  // CORS preflight
  AddRoute<HTTPOptions>(svr, R"(/.*)", [](const httplib::Request&, httplib::Response& res) {
    res.status = 204;
  });

  spdlog::info("Listening on {}:{} with {} threads", kServerHost, kServerPort, kServerThreads);
  if (!svr.listen(kServerHost.c_str(), kServerPort)) {
    spdlog::error("Failed to listen on {}:{}", kServerHost, kServerPort);
    return false;
  }
  return true;
}
