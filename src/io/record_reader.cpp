#include "reckon/io/record_reader.hpp"

#include <cstdint>
#include <fstream>
#include <string_view>
#include <utility>

#include "lcr/log/logger.hpp"


namespace reckon::io {

namespace {

[[nodiscard]]
inline bool is_blank(std::string_view sv) noexcept {
    for (char c : sv) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') return false;
    }
    return true;
}

} // namespace


std::vector<core::RawRecord> read_records(std::istream& in) {
    std::vector<core::RawRecord> records;
    std::string line;
    std::uint64_t number = 0;

    while (std::getline(in, line)) {
        ++number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) {
            continue;
        }
        records.push_back(core::RawRecord{number, std::move(line)});
        line.clear();
    }
    return records;
}


bool read_records_file(const std::string& path, std::vector<core::RawRecord>& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        RK_ERROR("[INPUT] Cannot open '" << path << "'");
        return false;
    }

    out = read_records(in);
    if (in.bad()) {
        RK_ERROR("[INPUT] Read error on '" << path << "'");
        return false;
    }

    RK_INFO("[INPUT] " << out.size() << " records from " << path);
    return true;
}

} // namespace reckon::io
