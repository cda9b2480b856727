/**
 * @file ShotgateApp.cpp
 * @brief Implementation of the ShotgateApp command dispatcher.
 */

#include "app/ShotgateApp.hpp"
#include "application/ConfigService.hpp"
#include "application/ScreenshotService.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/ErrorSanitizer.hpp"

#include <cmath>
#include <filesystem>
#include <getopt.h>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace shotgate::app {

namespace keys = domain::config_keys;

using infrastructure::ErrorSanitizer;

namespace {

constexpr const char* kVersion = "shotgate 0.1.0";

enum LongOnlyOption {
    kOptNoTransfer = 256,
    kOptAllowSymlinks,
    kOptAutoStage,
    kOptMaxFileSize,
    kOptMaxTotalSize,
    kOptDryRun
};

const struct option kFetchOptions[] = {{"source", required_argument, nullptr, 's'},
                                       {"destination", required_argument, nullptr, 'd'},
                                       {"count", required_argument, nullptr, 'n'},
                                       {"output-style", required_argument, nullptr, 'o'},
                                       {"output-format", required_argument, nullptr, 'f'},
                                       {"convert-to", required_argument, nullptr, 'c'},
                                       {"no-transfer", no_argument, nullptr, kOptNoTransfer},
                                       {"allow-symlinks", no_argument, nullptr, kOptAllowSymlinks},
                                       {"help", no_argument, nullptr, 'h'},
                                       {}};

const struct option kConfigureOptions[] = {{"source", required_argument, nullptr, 's'},
                                           {"destination", required_argument, nullptr, 'd'},
                                           {"auto-stage-enabled", required_argument, nullptr, kOptAutoStage},
                                           {"output-style", required_argument, nullptr, 'o'},
                                           {"output-format", required_argument, nullptr, 'f'},
                                           {"convert-to", required_argument, nullptr, 'c'},
                                           {"max-file-size-mb", required_argument, nullptr, kOptMaxFileSize},
                                           {"max-total-size-mb", required_argument, nullptr, kOptMaxTotalSize},
                                           {"help", no_argument, nullptr, 'h'},
                                           {}};

const struct option kMigrateOptions[] = {{"dry-run", no_argument, nullptr, kOptDryRun},
                                         {"help", no_argument, nullptr, 'h'},
                                         {}};

int ParseCount(const std::string& text) {
    std::size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(text, &consumed);
    } catch (const std::exception&) {
        throw domain::InvalidInputError("Invalid count: " + text);
    }
    if (consumed != text.size() || value < 1) {
        throw domain::InvalidInputError("Count must be a whole number of at least 1: " + text);
    }
    return value;
}

double ParseMegabytes(const std::string& text) {
    std::size_t consumed = 0;
    double value = 0;
    try {
        value = std::stod(text, &consumed);
    } catch (const std::exception&) {
        throw domain::InvalidInputError("Invalid size: " + text);
    }
    if (consumed != text.size() || !std::isfinite(value)) {
        throw domain::InvalidInputError("Invalid size: " + text);
    }
    return value;
}

bool ParseBool(const std::string& text) {
    const std::string lower = domain::ToLower(text);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") return true;
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") return false;
    throw domain::InvalidInputError("Expected true or false, got: " + text);
}

} // namespace

ShotgateApp::ShotgateApp(application::AppContext context, std::istream& input)
    : m_context(std::move(context)), m_input(input) {}

void ShotgateApp::PrintUsage(std::ostream& os) {
    os << "Usage:\n"
          "  shotgate [fetch] [OPTIONS] [IMAGE]\n"
          "      -s --source <dir>          Directory to take screenshots from\n"
          "      -d --destination <dir>     Directory to copy screenshots into\n"
          "      -n --count <n>             Number of most recent screenshots (default 1)\n"
          "      -o --output-style <style>  markdown, html or text\n"
          "      -f --output-format <style> Deprecated alias of --output-style\n"
          "      -c --convert-to <fmt>      png or jpg\n"
          "         --no-transfer           Print source paths without copying\n"
          "         --allow-symlinks        Trust symlinks in source/destination paths\n"
          "  shotgate configure               Prompt for each setting\n"
          "  shotgate configure [--source DIR] [--destination DIR] [--auto-stage-enabled BOOL]\n"
          "                     [--output-style STYLE] [--convert-to FMT|none]\n"
          "                     [--max-file-size-mb N] [--max-total-size-mb N]\n"
          "  shotgate migrate-config [--dry-run]\n"
          "  shotgate --help | --version\n";
}

int ShotgateApp::Guard(const std::function<int()>& body) {
    try {
        return body();
    } catch (const domain::SecurityError& e) {
        std::cerr << "Security error: " << e.what() << std::endl;
    } catch (const domain::ShotgateError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error: " << ErrorSanitizer::FormatPathError(e) << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << ErrorSanitizer::FormatPathError(std::string(e.what())) << std::endl;
    }
    return 1;
}

int ShotgateApp::Run(int argc, char* argv[]) {
    if (argc >= 2) {
        const std::string command = argv[1];
        if (command == "fetch") return RunFetch(argc - 1, argv + 1);
        if (command == "configure") return RunConfigure(argc - 1, argv + 1);
        if (command == "migrate-config") return RunMigrate(argc - 1, argv + 1);
        if (command == "--version" || command == "-V") {
            std::cout << kVersion << std::endl;
            return 0;
        }
    }
    return RunFetch(argc, argv);
}

int ShotgateApp::RunFetch(int argc, char* argv[]) {
    return Guard([&]() {
        application::FetchRequest request;
        int c;
        optind = 0; // full getopt reset, so Run() can be called more than once
        while ((c = getopt_long(argc, argv, "s:d:n:o:f:c:h", kFetchOptions, nullptr)) >= 0) {
            switch (c) {
            case 's': request.source = optarg; break;
            case 'd': request.destination = optarg; break;
            case 'n': request.count = ParseCount(optarg); break;
            case 'o': request.outputStyle = optarg; break;
            case 'f':
                std::cerr << "[ShotgateApp] Warning: The --output-format/-f option is deprecated and will be "
                             "removed in v1.0.0. Use --output-style instead." << std::endl;
                if (!request.outputStyle) {
                    request.outputStyle = optarg;
                }
                break;
            case 'c': request.convertTo = optarg; break;
            case kOptNoTransfer: request.noTransfer = true; break;
            case kOptAllowSymlinks: request.allowSymlinks = true; break;
            case 'h':
                PrintUsage(std::cout);
                return 0;
            default:
                PrintUsage(std::cerr);
                return 1;
            }
        }
        if (optind < argc) {
            request.imagePath = argv[optind++];
        }
        if (optind < argc) {
            throw domain::InvalidInputError("Only one image path may be given");
        }

        application::ConfigService configService(m_context);
        // --no-transfer must not create anything, config file included.
        domain::ConfigDocument config = configService.load(!request.noTransfer);

        application::ScreenshotService service(m_context, config);
        application::FetchResult result = service.fetch(request);
        for (const auto& line : result.lines) {
            std::cout << line << std::endl;
        }
        return 0;
    });
}

int ShotgateApp::RunConfigure(int argc, char* argv[]) {
    return Guard([&]() {
        std::vector<std::pair<std::string, nlohmann::json>> updates;
        int c;
        optind = 0; // full getopt reset, so Run() can be called more than once
        while ((c = getopt_long(argc, argv, "s:d:o:f:c:h", kConfigureOptions, nullptr)) >= 0) {
            switch (c) {
            case 's': updates.emplace_back(keys::kDefaultSource, std::string(optarg)); break;
            case 'd': updates.emplace_back(keys::kDefaultDestination, std::string(optarg)); break;
            case 'o':
            case 'f': updates.emplace_back(keys::kDefaultOutputFormat, std::string(optarg)); break;
            case 'c': {
                const std::string value = optarg;
                if (domain::ToLower(value) == "none") {
                    updates.emplace_back(keys::kDefaultConvertTo, nullptr);
                } else {
                    updates.emplace_back(keys::kDefaultConvertTo, value);
                }
                break;
            }
            case kOptAutoStage: updates.emplace_back(keys::kAutoStageEnabled, ParseBool(optarg)); break;
            case kOptMaxFileSize: updates.emplace_back(keys::kMaxFileSizeMb, ParseMegabytes(optarg)); break;
            case kOptMaxTotalSize: updates.emplace_back(keys::kMaxTotalSizeMb, ParseMegabytes(optarg)); break;
            case 'h':
                PrintUsage(std::cout);
                return 0;
            default:
                PrintUsage(std::cerr);
                return 1;
            }
        }
        if (optind < argc) {
            throw domain::InvalidInputError(std::string("Unexpected argument: ") + argv[optind]);
        }

        application::ConfigService configService(m_context);
        if (updates.empty()) {
            configService.configureInteractive(m_input, std::cout);
            return 0;
        }
        domain::ConfigDocument doc = configService.load();
        for (const auto& [field, value] : updates) {
            doc = configService.updateField(field, value);
        }
        std::cout << infrastructure::ConfigLoader::ToJson(doc).dump(4) << std::endl;
        return 0;
    });
}

int ShotgateApp::RunMigrate(int argc, char* argv[]) {
    return Guard([&]() {
        bool dryRun = false;
        int c;
        optind = 0; // full getopt reset, so Run() can be called more than once
        while ((c = getopt_long(argc, argv, "h", kMigrateOptions, nullptr)) >= 0) {
            switch (c) {
            case kOptDryRun: dryRun = true; break;
            case 'h':
                PrintUsage(std::cout);
                return 0;
            default:
                PrintUsage(std::cerr);
                return 1;
            }
        }

        application::ConfigService configService(m_context);
        application::MigrationResult result = configService.migrate(dryRun);
        if (!result.error.empty()) {
            std::cerr << "Error: " << result.error << std::endl;
            return 1;
        }
        if (!result.migrated) {
            std::cout << "Config is already up to date." << std::endl;
            return 0;
        }
        std::cout << (dryRun ? "Would migrate:" : "Migrated:") << std::endl;
        for (const auto& change : result.changes) {
            std::cout << "  " << change << std::endl;
        }
        if (dryRun) {
            std::cout << result.config.dump(4) << std::endl;
        }
        return 0;
    });
}

} // namespace shotgate::app
