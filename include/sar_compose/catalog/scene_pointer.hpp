#pragma once

#include "sar_compose/core/types.hpp"

#include <string>

namespace sar_compose::catalog {

// Parses "..._<start>_<end>_..." with YYYYMMDDThhmmss timestamps (UTC).
// Throws ParseError when the pattern is missing, a timestamp is invalid or
// start > end.
ScenePointer parse_scene_pointer(const std::string& id);

// Identifier with its trailing "_XXXX" hex variant code (and optional "_COG")
// removed. Returned unchanged when no such suffix is present.
std::string derive_name_prefix(const std::string& id);

} // namespace sar_compose::catalog
