#pragma once

#include <string>

namespace pricing::util {

/*
  Entity id helpers.

  Ids are RFC4122 v4 UUIDs in canonical text form.
*/

std::string GenerateId();

} // namespace pricing::util
