// ============================================================================
// status.cpp — implementation for status.hpp
// For the taxonomy see the matching .hpp.
// ============================================================================
#include "flightdiag/status.hpp"

#include <sstream>

namespace flightdiag {

const char* reason(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:                return "ok";
    case ErrorCode::LinkTimeout:         return "link_timeout";
    case ErrorCode::MalformedResponse:   return "malformed_response";
    case ErrorCode::LinkIo:              return "link_io";
    case ErrorCode::NoLogsFound:         return "no_logs_found";
    case ErrorCode::ChunkRetryExhausted: return "chunk_retry_exhausted";
    case ErrorCode::Stalled:             return "stalled";
    case ErrorCode::Cancelled:           return "cancelled";
    case ErrorCode::InvalidRule:         return "invalid_rule";
    case ErrorCode::UnsupportedLanguage: return "unsupported_language";
    case ErrorCode::CatalogIo:           return "catalog_io";
    case ErrorCode::ConfigInvalid:       return "config_invalid";
  }
  return "unknown";
}

// Only print context keys that carry information for this code, so the line
// stays short enough to grep.
std::string describe(const Error& err) {
  std::ostringstream os;
  if (err.ok()) {
    os << "status=ok";
    return os.str();
  }
  os << "status=error reason=" << reason(err.code);

  switch (err.code) {
    case ErrorCode::ChunkRetryExhausted:
    case ErrorCode::Stalled:
    case ErrorCode::Cancelled:
      os << " log_id=" << err.log_id << " offset=" << err.offset
         << " retries=" << err.retries;
      break;
    case ErrorCode::LinkTimeout:
    case ErrorCode::MalformedResponse:
      if (err.log_id) os << " log_id=" << err.log_id;
      if (err.retries) os << " retries=" << err.retries;
      break;
    case ErrorCode::InvalidRule:
      os << " rule_id=" << (err.rule_id.empty() ? "-" : err.rule_id) << " record=" << err.record;
      break;
    default:
      break;
  }
  if (!err.detail.empty()) os << " detail=" << err.detail;
  return os.str();
}

Error make_error(ErrorCode code, const std::string& detail) {
  Error e;
  e.code = code;
  e.detail = detail;
  return e;
}

Error make_transfer_error(ErrorCode code, uint16_t log_id, uint32_t offset, uint32_t retries) {
  Error e;
  e.code = code;
  e.log_id = log_id;
  e.offset = offset;
  e.retries = retries;
  return e;
}

Error make_rule_error(const std::string& rule_id, uint32_t record, const std::string& detail) {
  Error e;
  e.code = ErrorCode::InvalidRule;
  e.rule_id = rule_id;
  e.record = record;
  e.detail = detail;
  return e;
}

} // namespace flightdiag
