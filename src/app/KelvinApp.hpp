/**
 * @file KelvinApp.hpp
 * @brief Command-line front-end for Kelvin.
 */

#pragma once

#include <iostream>
#include <optional>

#include "domain/Date.hpp"

namespace kelvin::app {

/**
 * @class KelvinApp
 * @brief Parses the command line, wires config, store and service, and runs one command.
 */
class KelvinApp {
public:
    /**
     * @param today Overrides the local date; tests pin it.
     */
    explicit KelvinApp(std::ostream& out = std::cout,
                       std::ostream& err = std::cerr,
                       std::optional<domain::Date> today = std::nullopt);

    /**
     * @brief Runs a single command.
     * @return 0 on success, 1 on a task/storage/config error, CLI11's code on a usage error.
     */
    int Run(int argc, char** argv);

private:
    std::ostream& m_out; ///< Command results.
    std::ostream& m_err; ///< Error reports.
    std::optional<domain::Date> m_today;
};

} // namespace kelvin::app
