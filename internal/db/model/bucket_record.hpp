#pragma once

#include <string>

#include "internal/model/entity_id.hpp"

namespace artifact::db::model {

/*
  Scoping namespace of one repository.

  Every component/asset lookup is resolved within a bucket so that identifiers
  of another repository can never be addressed by accident.
*/
struct BucketRecord {
  artifact::model::EntityId id;
  std::string               repository_name;
};

} // namespace artifact::db::model
