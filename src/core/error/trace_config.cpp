#include "trace_config.h"

#include <filesystem>
#include <system_error>
#include <utility>

namespace stackerr::core::error {

namespace {

// Forces the process config to be captured during static initialisation,
// before main() gets a chance to change directory.
[[maybe_unused]] const TraceConfig& startup_config = TraceConfig::process();

} // namespace

TraceConfig::TraceConfig(std::string working_directory)
    : working_directory_(std::move(working_directory)) {
    while (working_directory_.size() > 1 && working_directory_.back() == '/') {
        working_directory_.pop_back();
    }
}

TraceConfig TraceConfig::from_current_directory() {
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        return TraceConfig();
    }
    return TraceConfig(cwd.string());
}

const TraceConfig& TraceConfig::process() {
    static const TraceConfig instance = from_current_directory();
    return instance;
}

std::string TraceConfig::relative_path(std::string_view file) const {
    if (working_directory_.empty()) {
        return std::string(file);
    }

    std::string prefix = working_directory_;
    if (prefix != "/") {
        prefix += '/';
    }

    if (file.size() > prefix.size() && file.starts_with(prefix)) {
        return std::string(file.substr(prefix.size()));
    }
    return std::string(file);
}

} // namespace stackerr::core::error
