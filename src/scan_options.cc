#include "scan_options.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

#include "PytchError.hpp"
#include "colors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace pytch {

static const char* kOptionsFile = "pytch.json";

ScanOptions ScanOptions::defaults() {
    ScanOptions opts;
    opts.color_diagnostics = Color::supports_color();
    return opts;
}

static ScanOptions options_from_json(const json& j, const std::string& origin) {
    if (!j.is_object()) {
        throw PytchConfigError("Options in " + origin + " must be a JSON object");
    }

    ScanOptions opts = ScanOptions::defaults();
    try {
        // Extract fields, keeping defaults for anything missing
        opts.filename = j.value("filename", opts.filename);
        opts.skip_bom = j.value("skip_bom", opts.skip_bom);
        opts.trace_preparser = j.value("trace_preparser", opts.trace_preparser);
        opts.color_diagnostics = j.value("color_diagnostics", opts.color_diagnostics);
    } catch (const json::type_error& e) {
        throw PytchConfigError("Invalid option type in " + origin + ": " + e.what());
    }
    return opts;
}

ScanOptions parse_scan_options(const std::string& json_text, const std::string& origin) {
    try {
        return options_from_json(json::parse(json_text), origin);
    } catch (const json::parse_error& e) {
        throw PytchConfigError("JSON parse error in " + origin + ": " + e.what());
    }
}

std::optional<ScanOptions> load_scan_options(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        return options_from_json(json::parse(file), filepath);
    } catch (const json::parse_error& e) {
        throw PytchConfigError("JSON parse error in " + filepath + ": " + e.what());
    }
}

std::string find_options_root(const std::string& start_dir) {
    std::error_code ec;
    fs::path current = fs::absolute(start_dir, ec);
    if (ec) return "";

    while (true) {
        if (fs::exists(current / kOptionsFile, ec)) {
            return current.string();
        }

        if (!current.has_parent_path() || current == current.parent_path()) {
            break;
        }
        current = current.parent_path();
    }

    return "";
}

std::optional<ScanOptions> find_scan_options(const std::string& start_dir) {
    std::string root = find_options_root(start_dir);
    if (root.empty()) {
        return std::nullopt;
    }

    return load_scan_options((fs::path(root) / kOptionsFile).string());
}

}  // namespace pytch
