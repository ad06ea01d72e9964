#pragma once

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include <CLI/CLI.hpp>

#include "reckon/config/engine.hpp"
#include "reckon/config/error.hpp"
#include "common/logger.hpp"
#include "common/cli/validators.hpp"


namespace reckon::examples::cli::reconcile {

    // -------------------------------------------------------------
    // Command-line parameters
    // -------------------------------------------------------------
    // Unset optionals keep the value from the config file (or the default).
    struct Params {
        std::string input;
        std::string output_dir           = "reckon_out";
        std::string config_file;
        std::string log_level            = "info";
        bool color                       = false;

        std::optional<std::string> tolerance;
        std::optional<int> default_decimals;
        std::optional<std::string> rounding_mode;
        std::vector<std::string> currency_decimals;   // CODE=PLACES
        std::optional<double> mad_threshold;
        std::optional<std::int64_t> burst_window_ms;
        std::optional<std::int64_t> rapid_repeat_window_s;
        std::optional<int> business_start_hour;
        std::optional<int> business_end_hour;
        std::optional<int> utc_offset_minutes;
        bool no_weekend_flag             = false;
        std::optional<unsigned> workers;

        inline void dump(const std::string& header, std::ostream& os) const {
            os << header << ":\n"
               << "  Input      : " << input << "\n"
               << "  Output dir : " << output_dir << "\n"
               << "  Config     : " << (config_file.empty() ? "(defaults)" : config_file) << "\n"
               << "  Log Level  : " << log_level << "\n";
        }

        // Overlays the explicitly given options onto `cfg`
        [[nodiscard]]
        inline config::Error apply(config::Engine& cfg) const {
            if (tolerance && !core::Decimal::parse(*tolerance, cfg.tolerance)) {
                return config::Error::InvalidOption;
            }
            if (default_decimals) cfg.default_decimals = *default_decimals;
            if (rounding_mode) {
                (void)core::parse_rounding_mode(*rounding_mode, cfg.rounding_mode); // validated by CLI11
            }
            for (const auto& item : currency_decimals) {
                std::string code;
                int places = 0;
                if (!split_currency_override(item, code, places)) {
                    return config::Error::InvalidOption;
                }
                cfg.currency_decimals[code] = places;
            }
            if (mad_threshold) cfg.mad_threshold = *mad_threshold;
            if (burst_window_ms) cfg.burst_window = std::chrono::milliseconds(*burst_window_ms);
            if (rapid_repeat_window_s) {
                if (*rapid_repeat_window_s > config::MAX_RAPID_REPEAT_WINDOW_S ||
                    *rapid_repeat_window_s < -config::MAX_RAPID_REPEAT_WINDOW_S) {
                    return config::Error::InvalidOption;
                }
                cfg.rapid_repeat_window = std::chrono::seconds(*rapid_repeat_window_s);
            }
            if (business_start_hour) cfg.business_hours.start_hour = *business_start_hour;
            if (business_end_hour) cfg.business_hours.end_hour = *business_end_hour;
            if (utc_offset_minutes) cfg.business_hours.utc_offset_minutes = *utc_offset_minutes;
            if (no_weekend_flag) cfg.business_hours.flag_weekends = false;
            if (workers) cfg.workers = *workers;
            return config::Error::None;
        }
    };

    // -------------------------------------------------------------
    // Build CLI
    // -------------------------------------------------------------
    [[nodiscard]]
    inline Params configure(int argc, char** argv, std::string_view description) {
        CLI::App app{std::string(description)};
        Params params{};

        app.add_option("-i,--input", params.input, "Raw records, one JSON object per line")->required()->check(CLI::ExistingFile);
        app.add_option("-o,--output", params.output_dir, "Directory for the output tables")->default_val(params.output_dir);
        app.add_option("-c,--config", params.config_file, "JSON configuration file")->check(CLI::ExistingFile);

        app.add_option("--tolerance", params.tolerance, "Balance comparison tolerance (default 0.005)")->check(decimal_validator);
        app.add_option("--default-decimals", params.default_decimals, "Decimal places for currencies without a rule (default 2)");
        app.add_option("--rounding-mode", params.rounding_mode, "half_up | half_even | down (default half_up)")->check(rounding_mode_validator);
        app.add_option("--currency-decimals", params.currency_decimals, "Per-currency precision, repeatable (e.g. --currency-decimals KWD=3)")->check(currency_override_validator);
        app.add_option("--mad-k", params.mad_threshold, "MAD spike multiplier k (default 6.0)");
        app.add_option("--burst-window-ms", params.burst_window_ms, "Burst window in milliseconds (default 1000)");
        app.add_option("--rapid-window-s", params.rapid_repeat_window_s, "Rapid repeated deduction window in seconds (default 60)");
        app.add_option("--business-start", params.business_start_hour, "Business hours start, local hour (default 8)");
        app.add_option("--business-end", params.business_end_hour, "Business hours end, local hour, exclusive (default 18)");
        app.add_option("--utc-offset-minutes", params.utc_offset_minutes, "Local time offset from UTC in minutes (default 0)");
        app.add_flag("--no-weekend-flag", params.no_weekend_flag, "Do not flag weekend transactions as after hours");
        app.add_option("-w,--workers", params.workers, "Worker threads for ledger folding and detection (default 1)");

        app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error | fatal | off")->check(log_level_validator)->default_val(params.log_level);
        app.add_flag("--color", params.color, "Colored log output");

        app.footer(
            "Options override the configuration file, which overrides the defaults.\n"
            "Tables are written as JSON Lines into the output directory."
        );

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            std::exit(app.exit(e, std::cout, std::cerr));
        }

        // -------------------------------------------------------------
        // Logging
        // -------------------------------------------------------------
        set_log_level(params.log_level, params.color);
        return params;
    }

} // namespace reckon::examples::cli::reconcile
