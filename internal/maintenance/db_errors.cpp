#include "db_errors.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace artifact::maintenance {

void ThrowTranslated(db::ErrorCode code, const std::string& message) {
  switch (code) {
    case db::ErrorCode::Conflict:
    case db::ErrorCode::SerializationFailure:
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::ConcurrentModification(message);
    case db::ErrorCode::Busy:
    case db::ErrorCode::IOError:
    case db::ErrorCode::Corruption:
      throw util::StoreUnavailable(message);
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw std::runtime_error(message);
  }
}

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context + ": " + db::ToString(result.code) : context + ": " + result.message;
  ThrowTranslated(result.code, message);
}

} // namespace artifact::maintenance
