#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace vault::util {

/*
  UUID helpers

  File ids and upload ids are RFC4122 v4 UUIDs carried as their canonical
  36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

// shorthand for ToString(GenerateUUID())
std::string NewId();

// true when str is a canonical lowercase/uppercase UUID text form
bool IsUUID(const std::string& str);

} // namespace vault::util
