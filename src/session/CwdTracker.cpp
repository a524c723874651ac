#include "CwdTracker.hpp"

namespace tt {
namespace {
const char ESC = '\x1b';
const char BEL = '\x07';
const char CAN = '\x18';
const char SUB = '\x1a';
// Longer bodies are not cwd reports, stop buffering them
const size_t MAX_PAYLOAD_LENGTH = 4096;

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}
}  // namespace

CwdTracker::CwdTracker() : state(ScanState::GROUND) {}

void CwdTracker::reset() {
  state = ScanState::GROUND;
  payload.clear();
}

optional<string> CwdTracker::scan(const string& chunk) {
  optional<string> lastCwd;
  for (char c : chunk) {
    switch (state) {
      case ScanState::GROUND:
        if (c == ESC) {
          state = ScanState::ESCAPE;
        }
        break;
      case ScanState::ESCAPE:
        if (c == ']') {
          payload.clear();
          state = ScanState::OSC;
        } else if (c != ESC) {
          state = ScanState::GROUND;
        }
        break;
      case ScanState::OSC:
        if (c == BEL) {
          auto cwd = parsePayload(payload);
          if (cwd) {
            lastCwd = cwd;
          }
          reset();
        } else if (c == ESC) {
          state = ScanState::OSC_ESCAPE;
        } else if (c == CAN || c == SUB ||
                   payload.length() >= MAX_PAYLOAD_LENGTH) {
          reset();
        } else {
          payload.push_back(c);
        }
        break;
      case ScanState::OSC_ESCAPE:
        if (c == '\\') {
          auto cwd = parsePayload(payload);
          if (cwd) {
            lastCwd = cwd;
          }
          reset();
        } else if (c == ']') {
          // Unterminated sequence followed by a new OSC
          payload.clear();
          state = ScanState::OSC;
        } else {
          reset();
        }
        break;
    }
  }
  return lastCwd;
}

optional<string> CwdTracker::parsePayload(const string& payload) {
  const string prefix = "7;";
  if (payload.compare(0, prefix.length(), prefix) != 0) {
    return nullopt;
  }
  string location = payload.substr(prefix.length());
  const string scheme = "file://";
  if (location.compare(0, scheme.length(), scheme) == 0) {
    // Skip the host name, the path starts at the next slash
    auto pathStart = location.find('/', scheme.length());
    if (pathStart == string::npos) {
      return nullopt;
    }
    location = location.substr(pathStart);
  }
  if (location.empty()) {
    return nullopt;
  }
  return percentDecode(location);
}

string CwdTracker::percentDecode(const string& s) {
  string decoded;
  decoded.reserve(s.length());
  for (size_t a = 0; a < s.length(); a++) {
    if (s[a] == '%' && a + 2 < s.length()) {
      int high = hexValue(s[a + 1]);
      int low = hexValue(s[a + 2]);
      if (high >= 0 && low >= 0) {
        decoded.push_back(char(high * 16 + low));
        a += 2;
        continue;
      }
    }
    decoded.push_back(s[a]);
  }
  return decoded;
}

}  // namespace tt
