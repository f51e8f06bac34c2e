#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace artifact::maintenance {

/*
  Translation of portable db codes into the util error taxonomy:

    Conflict, SerializationFailure,
    AlreadyExists, ConstraintViolation  -> util::ConcurrentModification
    Busy, IOError, Corruption           -> util::StoreUnavailable
    NotFound                            -> util::NotFound
    anything else                       -> std::runtime_error
*/
[[noreturn]] void ThrowTranslated(db::ErrorCode code, const std::string& message);

void ThrowIfDbError(const db::Result& result, const std::string& context);

template <typename Fn>
auto TranslateDbErrors(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const db::Error& e) {
    ThrowTranslated(e.code(), context + ": " + e.what());
  }
}

} // namespace artifact::maintenance
