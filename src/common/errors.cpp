#include <auditchain/common/errors.hpp>

namespace auditchain::common {

std::string_view to_string(const error_code code) {
  switch (code) {
    case error_code::encoding_error:
      return "encoding_error";
    case error_code::append_error:
      return "append_error";
    case error_code::sequence_conflict:
      return "sequence_conflict";
    case error_code::validation_error:
      return "validation_error";
    case error_code::integrity_violation:
      return "integrity_violation";
  }
  return "unknown";
}

}  // namespace auditchain::common
