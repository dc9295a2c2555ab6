#include "sar_compose/catalog/scene_pointer.hpp"
#include "sar_compose/core/errors.hpp"
#include "sar_compose/core/utils.hpp"

#include <regex>

namespace sar_compose::catalog {

ScenePointer parse_scene_pointer(const std::string& id) {
    static const std::regex re(R"(_(\d{8}T\d{6})_(\d{8}T\d{6})_)");
    std::smatch m;
    if (!std::regex_search(id, m, re)) {
        throw ParseError("cannot parse sensing times from '" + id + "'");
    }

    ScenePointer ptr;
    ptr.id = id;
    ptr.sensing.start = core::parse_compact_utc(m[1].str());
    ptr.sensing.end = core::parse_compact_utc(m[2].str());
    if (ptr.sensing.end < ptr.sensing.start) {
        throw ParseError("sensing end precedes start in '" + id + "'");
    }
    ptr.prefix = derive_name_prefix(id);
    return ptr;
}

std::string derive_name_prefix(const std::string& id) {
    static const std::regex suffix(R"(_[0-9A-F]{4}(_COG)?$)");
    return std::regex_replace(id, suffix, "");
}

} // namespace sar_compose::catalog
