#pragma once

#include "bundle/manifest.hpp"

#include <expected>
#include <string>
#include <string_view>

namespace rbp {

class ManifestParser {
  public:
    // Errors are "Syntax Error: ...", "Missing required field: <field>" or
    // "Invalid field type: <field> ...". Unknown keys are ignored.
    std::expected<Manifest, std::string> Parse(std::string_view json_input) const;
};

} // namespace rbp
