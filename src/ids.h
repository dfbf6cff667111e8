#pragma once

#include <string>

namespace datalens {

// Random (v4) UUID in lowercase canonical form.
auto GenerateUuid() -> std::string;

} // namespace datalens
