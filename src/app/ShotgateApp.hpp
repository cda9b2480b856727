/**
 * @file ShotgateApp.hpp
 * @brief Command-line front end for shotgate.
 */

#pragma once

#include <functional>
#include <iostream>
#include "application/AppContext.hpp"

namespace shotgate::app {

/**
 * @class ShotgateApp
 * @brief Parses arguments, runs one command and maps failures to exit codes.
 *
 * Every failure is printed through the sanitizer; security failures are
 * prefixed "Security error:". Exit code is 0 on success, 1 otherwise.
 */
class ShotgateApp {
public:
    /**
     * @param input Answers for the interactive configure prompts.
     */
    explicit ShotgateApp(application::AppContext context, std::istream& input = std::cin);

    /**
     * @brief Dispatches to fetch (the default), configure or migrate-config.
     * @return Process exit code.
     */
    int Run(int argc, char* argv[]);

private:
    int RunFetch(int argc, char* argv[]);
    int RunConfigure(int argc, char* argv[]);
    int RunMigrate(int argc, char* argv[]);

    static void PrintUsage(std::ostream& os);
    static int Guard(const std::function<int()>& body);

    application::AppContext m_context;
    std::istream& m_input;
};

} // namespace shotgate::app
