#pragma once

#include <string>
#include <string_view>

#include "reckon/config/engine.hpp"
#include "reckon/config/error.hpp"


namespace reckon::config {

/*
===============================================================================
JSON configuration overlay
===============================================================================

Keys present in the document overwrite the corresponding Engine fields; absent
keys keep their current value (compile-time default or an earlier source).

{
  "tolerance": "0.005",
  "default_decimals": 2,
  "rounding_mode": "half_up",
  "currency_decimals": {"SAR": 3, "BHD": 4},
  "known_currencies": ["USD", "EUR"],
  "mad_threshold": 6.0,
  "burst_window_ms": 1000,
  "rapid_repeat_window_s": 60,
  "business_hours": {"start_hour": 8, "end_hour": 18,
                     "utc_offset_minutes": 180, "flag_weekends": true},
  "rounding_pattern_min_occurrences": 3,
  "rounding_pattern_max_magnitude": "1",
  "workers": 4
}

"currency_decimals" is merged into the existing map, "known_currencies"
replaces the existing set. Wrongly typed values yield Error::FileInvalid.
Range checks are left to validate().
===============================================================================
*/

[[nodiscard]] Error load_json(std::string_view json, Engine& cfg);

[[nodiscard]] Error load_file(const std::string& path, Engine& cfg);

} // namespace reckon::config
