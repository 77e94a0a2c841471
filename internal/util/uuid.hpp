#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace creditgate::util {

/*
  UUID helpers

  Row ids, ledger ids and trace ids are RFC4122 v4 UUIDs in their
  canonical string form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// Canonical string of a fresh UUID, optionally prefixed ("ut_", "r_").
std::string NewId(const std::string& prefix = {});

} // namespace creditgate::util
