#include "anchorfit/common/log.hpp"
#include "anchorfit/common/StringUtils.hpp"

namespace anchorfit::common {

LogLevel parseLogLevel(const std::string& level_name, bool* ok) {
  const std::string upper = toUpperCopy(trimCopy(level_name));
  if (ok) *ok = true;
  if (upper == "TRACE") return LogLevel::TRACE;
  if (upper == "DEBUG") return LogLevel::DEBUG;
  if (upper == "INFO") return LogLevel::INFO;
  if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
  if (upper == "ERROR") return LogLevel::ERROR;
  if (ok) *ok = false;
  return LogLevel::INFO;
}

}  // namespace anchorfit::common
