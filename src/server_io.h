#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <nlohmann/json.hpp>

extern std::string kServerHost;
extern int kServerPort;
extern int kServerThreads;

struct HttpReply {
  int status;
  nlohmann::json body;
};

// Handlers behind the routes; exposed for testing
HttpReply HandleChapter(const std::string& chapter_id);
// body: {"chapter_id", "exercise_id", "code"}
HttpReply HandleEvaluate(const std::string& body);

// Serve the HTTP front end until the server is stopped.
// Returns false if it cannot listen on kServerHost:kServerPort.
bool ServerWorkLoop();

#endif  // SERVER_IO_H_
