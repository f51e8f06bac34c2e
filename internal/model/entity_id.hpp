#pragma once

#include <compare>
#include <functional>
#include <string>

namespace artifact::model {

/*
  Opaque identifier of a component, asset or bucket.

  Nothing is assumed about the structure of the value beyond equality,
  ordering and hashing.
*/
class EntityId {
 public:
  EntityId() = default;
  explicit EntityId(std::string value) : value_(std::move(value)) {
  }

  const std::string& value() const {
    return value_;
  }

  bool empty() const {
    return value_.empty();
  }

  friend bool operator==(const EntityId&, const EntityId&)  = default;
  friend auto operator<=>(const EntityId&, const EntityId&) = default;

 private:
  std::string value_;
};

} // namespace artifact::model

template <>
struct std::hash<artifact::model::EntityId> {
  std::size_t operator()(const artifact::model::EntityId& id) const noexcept {
    return std::hash<std::string>{}(id.value());
  }
};
