#ifndef INCLUDE_BOXRUNNER_STOMP_H_
#define INCLUDE_BOXRUNNER_STOMP_H_

/// STOMP 1.2 frames, as spoken to the broker over websocket

#include <string>
#include <vector>
#include <utility>

class StompFrame {
 public:
  std::string command; // empty for a heart-beat
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  StompFrame() {}
  explicit StompFrame(const std::string& cmd) : command(cmd) {}

  bool IsHeartbeat() const { return command.empty(); }
  // repeated headers: the first one wins
  const std::string* Header(const std::string& name) const;
  std::string HeaderOr(const std::string& name, const std::string& default_value) const;
  StompFrame& Add(const std::string& name, const std::string& value);

  // content-length is added for non-empty bodies if absent
  std::string Serialize() const;
};

// Parse one frame from a websocket message.
// Return false if the data is truncated or violates the frame grammar.
bool ParseStompFrame(const std::string& data, StompFrame& frame);

std::string StompEscape(const std::string&);
// return false on an undefined escape sequence
bool StompUnescape(const std::string&, std::string&);

#endif  // INCLUDE_BOXRUNNER_STOMP_H_
