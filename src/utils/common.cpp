/**
 * @file common.cpp
 * @brief Global logger and its setup.
 */

#include "common.hpp"

std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::get(""));

/**
 * @brief Adds a log file to the global logger and logs the session start.
 *
 * @param log_fname Path to the log file.
 * @throws std::runtime_error If the log file cannot be opened.
 */
void init_log(const fs::path& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }

    // explicit log pathname, can't continue without log
    if( !logger->add_file(log_fname) ){
        throw std::runtime_error(fmt::format("cannot log to {}", log_fname));
    }
    inited = true;
    logger->set_banner(APP_NAME);
    logger->start();
}
