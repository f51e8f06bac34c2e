#pragma once

#include <string>

namespace artifact::maintenance {

// The repository a facade instance is bound to.
struct RepositoryContext {
  std::string repository_name;
};

} // namespace artifact::maintenance
