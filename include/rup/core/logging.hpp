#pragma once

#include <cstddef>
#include <string>

namespace rup::logging {

struct LogOptions {
    std::string level = "info";                         ///< trace|debug|info|warn|error|critical|off
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
    std::string file;                                   ///< Empty: console only
    std::size_t max_file_size = 10 * 1024 * 1024;
    std::size_t max_files = 3;
};

/**
 * @brief Install the process-wide spdlog default logger
 *
 * Console output always; a rotating file sink is added when
 * options.file is set. Safe to call more than once.
 */
void configure(const LogOptions& options);

} // namespace rup::logging
