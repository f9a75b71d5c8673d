#pragma once

#include <string>

#include "enumkit/registry/type_record.hpp"

namespace enumkit::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Multi-line summary of a record: header, classification, then one line per
// legal value with its index and name.
auto FormatRecord(const registry::TypeRecord& record) -> std::string;

}  // namespace enumkit::driver
