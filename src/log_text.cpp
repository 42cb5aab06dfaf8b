// === log_text.cpp — implementation for log_text.hpp
#include "flightdiag/log_text.hpp"

#include <cctype>
#include <unordered_set>

#include "flightdiag/text_util.hpp"

namespace flightdiag {

namespace {

// Cursor over one log line. Every step is a single forward scan, so line
// length only costs time.
struct Cursor {
  const std::string& s;
  size_t pos{0};

  bool at_end() const { return pos >= s.size(); }
  char peek() const { return s[pos]; }

  bool digits(size_t n) {
    for (size_t i = 0; i < n; ++i) {
      if (pos + i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[pos + i]))) return false;
    }
    pos += n;
    return true;
  }

  bool literal(char c) {
    if (at_end() || peek() != c) return false;
    ++pos;
    return true;
  }

  bool spaces() {
    const size_t start = pos;
    while (!at_end() && std::isspace(static_cast<unsigned char>(peek()))) ++pos;
    return pos > start;
  }

  // Longest run of [A-Za-z0-9_] (plus '.' when `dots`); an empty run fails.
  bool word(bool dots, std::string& out) {
    const size_t start = pos;
    while (!at_end()) {
      const unsigned char c = static_cast<unsigned char>(peek());
      if (!(std::isalnum(c) || c == '_' || (dots && c == '.'))) break;
      ++pos;
    }
    if (pos == start) return false;
    out = s.substr(start, pos - start);
    return true;
  }
};

} // namespace

// ---------------------------------------------------------------------------
// parse_log_line()
// ----------------
// "YYYY-MM-DD HH:MM:SS,mmm LEVEL Logger.Name - message"
// The header is fixed-shape; the message is whatever follows " - ".
// ---------------------------------------------------------------------------
bool parse_log_line(const std::string& line, LogLine& out) {
  const std::string l = trim(line);
  Cursor c{l};

  if (!(c.digits(4) && c.literal('-') && c.digits(2) && c.literal('-') && c.digits(2))) return false;
  if (!c.spaces()) return false;
  if (!(c.digits(2) && c.literal(':') && c.digits(2) && c.literal(':') && c.digits(2) &&
        c.literal(',') && c.digits(1))) {
    return false;
  }
  while (c.digits(1)) {}
  const std::string timestamp = l.substr(0, c.pos);

  std::string level, logger;
  if (!(c.spaces() && c.word(false, level))) return false;
  if (!(c.spaces() && c.word(true, logger))) return false;
  if (!(c.spaces() && c.literal('-') && c.spaces())) return false;
  if (c.at_end()) return false;

  out.timestamp = timestamp;
  out.level = level;
  out.logger = logger;
  out.message = l.substr(c.pos);
  return true;
}

std::vector<LogFinding> find_prearm_messages(const std::vector<std::string>& lines) {
  static const std::string kTag = "prearm:";
  std::vector<LogFinding> out;
  for (const auto& line : lines) {
    const auto pos = find_icase(line, kTag);
    if (pos == std::string::npos) continue;

    LogFinding f;
    f.message = trim(line.substr(pos + kTag.size()));
    LogLine parsed;
    if (parse_log_line(line, parsed)) {
      f.timestamp = parsed.timestamp;
      f.level = parsed.level;
    } else {
      f.timestamp = "unknown";
    }
    out.push_back(std::move(f));
  }
  return out;
}

std::vector<LogFinding> find_errors(const std::vector<std::string>& lines,
                                    const std::vector<std::string>& levels) {
  std::vector<LogFinding> out;
  for (const auto& line : lines) {
    LogLine parsed;
    if (!parse_log_line(line, parsed)) continue;
    for (const auto& lv : levels) {
      if (parsed.level == lv) {
        out.push_back(LogFinding{parsed.timestamp, parsed.level, parsed.message});
        break;
      }
    }
  }
  return out;
}

std::vector<std::string> unique_messages(const std::vector<LogFinding>& findings) {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& f : findings) {
    if (seen.insert(f.message).second) out.push_back(f.message);
  }
  return out;
}

std::vector<std::string> tail_lines(const std::string& text, size_t n) {
  std::vector<std::string> all = split_lines(text);
  if (all.size() <= n) return all;
  return std::vector<std::string>(all.end() - static_cast<std::ptrdiff_t>(n), all.end());
}

// "disconnected" contains "connected", so the negative forms are checked first.
LinkHint connection_hint(const std::vector<std::string>& lines) {
  for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
    if (find_icase(*it, "disconnected") != std::string::npos ||
        find_icase(*it, "not connected") != std::string::npos) {
      return LinkHint::Disconnected;
    }
    if (find_icase(*it, "connected") != std::string::npos) return LinkHint::Connected;
  }
  return LinkHint::Unknown;
}

const char* to_string(LinkHint hint) {
  switch (hint) {
    case LinkHint::Connected:    return "connected";
    case LinkHint::Disconnected: return "disconnected";
    case LinkHint::Unknown:      return "unknown";
  }
  return "unknown";
}

} // namespace flightdiag
