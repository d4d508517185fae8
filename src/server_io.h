#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <nlohmann/json.hpp>
#include <scriptbox/execution.h>

namespace httplib {
class Server;
}

extern std::string kListenHost;
extern int kPort;
// empty disables authentication
extern std::string kApiKey;
extern int kMaxParallel;
extern size_t kMaxQueue;
// MiB
extern size_t kMaxPayload;

// Decode a POST /execute body; false (and the reason) on malformed JSON or
//   fields of the wrong type. Scalar parameter values are converted to strings.
bool ParseExecuteRequest(const std::string& body, ExecutionRequest& req, std::string& error);
nlohmann::json ResultToJSON(const ExecutionResult&);

// Register routes, hooks and limits; split out so tests can serve on any port
void SetupServer(httplib::Server&);

// Listen on kListenHost:kPort until StopServer is called.
// Returns false if the socket cannot be bound.
bool ServerWorkLoop();
void StopServer();

#endif  // SERVER_IO_H_
