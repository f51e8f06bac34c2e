#pragma once

#include <string>

#include "internal/model/entity_id.hpp"

namespace artifact::db::model {

/*
  Persistent component row: one logical artifact version.

  A component exclusively owns the assets whose component_id points at it.
*/
struct ComponentRecord {
  artifact::model::EntityId id;
  artifact::model::EntityId bucket_id;

  std::string format;
  std::string group;
  std::string name;
  std::string version;

  // group:name:version, skipping the empty parts
  std::string ToStringExternal() const {
    std::string out;
    for (const auto* part : {&group, &name, &version}) {
      if (part->empty()) continue;
      if (!out.empty()) out += ':';
      out += *part;
    }
    return out;
  }
};

} // namespace artifact::db::model
