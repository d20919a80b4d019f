#pragma once
#include "io/Logger.hpp"
#include "units.hpp"

#include <string>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

#define APP_NAME "readmeter"

#define ANSI_CLEAR_EOL     "\x1b[0K"

extern std::shared_ptr<Logger> logger;

// attach a log file to the global logger; later calls are ignored
void init_log(const fs::path& log_fname);
