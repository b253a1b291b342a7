#include <boxrunner/stomp.h>

#include <stdexcept>

namespace {

// CONNECT and CONNECTED predate header escaping
inline bool UsesEscaping(const std::string& command) {
  return command != "CONNECT" && command != "CONNECTED";
}

// read a line terminated by LF or CRLF starting at pos; false if there is no terminator
bool ReadLine(const std::string& data, size_t& pos, std::string& line) {
  size_t end = data.find('\n', pos);
  if (end == std::string::npos) return false;
  size_t len = end - pos;
  if (len && data[end - 1] == '\r') len--;
  line = data.substr(pos, len);
  pos = end + 1;
  return true;
}

} // namespace

const std::string* StompFrame::Header(const std::string& name) const {
  for (auto& i : headers) {
    if (i.first == name) return &i.second;
  }
  return nullptr;
}

std::string StompFrame::HeaderOr(const std::string& name, const std::string& default_value) const {
  const std::string* val = Header(name);
  return val ? *val : default_value;
}

StompFrame& StompFrame::Add(const std::string& name, const std::string& value) {
  headers.emplace_back(name, value);
  return *this;
}

std::string StompFrame::Serialize() const {
  if (IsHeartbeat()) return "\n";
  bool escape = UsesEscaping(command);
  std::string ret = command + '\n';
  for (auto& i : headers) {
    if (escape) {
      ret += StompEscape(i.first) + ':' + StompEscape(i.second) + '\n';
    } else {
      ret += i.first + ':' + i.second + '\n';
    }
  }
  if (!body.empty() && !Header("content-length")) {
    ret += "content-length:" + std::to_string(body.size()) + '\n';
  }
  ret += '\n';
  ret += body;
  ret += '\0';
  return ret;
}

bool ParseStompFrame(const std::string& data, StompFrame& frame) {
  frame = StompFrame();
  size_t pos = 0;
  // EOLs between frames are heart-beats
  while (pos < data.size() && (data[pos] == '\n' || data[pos] == '\r')) pos++;
  if (pos == data.size()) return true;

  if (!ReadLine(data, pos, frame.command) || frame.command.empty()) return false;
  bool escape = UsesEscaping(frame.command);
  for (std::string line;;) {
    if (!ReadLine(data, pos, line)) return false;
    if (line.empty()) break;
    size_t colon = line.find(':');
    if (colon == std::string::npos) return false;
    std::string name = line.substr(0, colon), value = line.substr(colon + 1);
    if (escape) {
      std::string uname, uvalue;
      if (!StompUnescape(name, uname) || !StompUnescape(value, uvalue)) return false;
      name = std::move(uname), value = std::move(uvalue);
    }
    frame.headers.emplace_back(std::move(name), std::move(value));
  }
  if (const std::string* len_str = frame.Header("content-length")) {
    size_t len;
    try {
      size_t idx;
      len = std::stoul(*len_str, &idx);
      if (idx != len_str->size()) return false;
    } catch (std::logic_error&) {
      return false;
    }
    if (data.size() < pos + len + 1 || data[pos + len] != '\0') return false;
    frame.body = data.substr(pos, len);
  } else {
    size_t end = data.find('\0', pos);
    if (end == std::string::npos) return false;
    frame.body = data.substr(pos, end - pos);
  }
  return true;
}

std::string StompEscape(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  for (char c : str) {
    switch (c) {
      case '\\': ret += "\\\\"; break;
      case '\n': ret += "\\n"; break;
      case '\r': ret += "\\r"; break;
      case ':': ret += "\\c"; break;
      default: ret += c;
    }
  }
  return ret;
}

bool StompUnescape(const std::string& str, std::string& out) {
  out.clear();
  out.reserve(str.size());
  for (size_t i = 0; i < str.size(); i++) {
    if (str[i] != '\\') {
      out += str[i];
      continue;
    }
    if (++i == str.size()) return false;
    switch (str[i]) {
      case '\\': out += '\\'; break;
      case 'n': out += '\n'; break;
      case 'r': out += '\r'; break;
      case 'c': out += ':'; break;
      default: return false;
    }
  }
  return true;
}
