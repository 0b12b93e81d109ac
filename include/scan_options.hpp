#pragma once

#include <optional>
#include <string>

namespace pytch {

// Options for one scan/preparse pass. Loaded from pytch.json when present.
struct ScanOptions {
    std::string filename = "<input>";
    bool skip_bom = true;
    bool trace_preparser = false;
    bool color_diagnostics = false;

    static ScanOptions defaults();
};

// Reads the options file at `filepath`. Returns std::nullopt when the file
// cannot be opened; throws PytchConfigError on malformed content.
std::optional<ScanOptions> load_scan_options(const std::string& filepath);

// Parses options from a JSON document held in memory.
ScanOptions parse_scan_options(const std::string& json_text, const std::string& origin = "<string>");

// Directory of the nearest pytch.json at or above `start_dir`, or "" if none.
std::string find_options_root(const std::string& start_dir = ".");

std::optional<ScanOptions> find_scan_options(const std::string& start_dir = ".");

}  // namespace pytch
