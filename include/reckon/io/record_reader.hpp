#pragma once

#include <istream>
#include <string>
#include <vector>

#include "reckon/core/event.hpp"


namespace reckon::io {

// JSON Lines input: one raw record per non-blank line. Line numbers are
// 1-based physical line numbers, blank lines included, so triage rows point
// at the exact line of the input file.
[[nodiscard]] std::vector<core::RawRecord> read_records(std::istream& in);

// False when the file cannot be opened or read
[[nodiscard]] bool read_records_file(const std::string& path, std::vector<core::RawRecord>& out);

} // namespace reckon::io
