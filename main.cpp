#include <filesystem>
#include <iostream>

#include "app/ShotgateApp.hpp"
#include "infrastructure/ErrorSanitizer.hpp"

using namespace shotgate;

int main(int argc, char* argv[]) {
    try {
        app::ShotgateApp app(application::AppContext::FromEnvironment());
        return app.Run(argc, argv);
    } catch (const std::filesystem::filesystem_error& e) {
        // Working directory unavailable before any command ran.
        std::cerr << "Error: " << infrastructure::ErrorSanitizer::FormatPathError(e) << std::endl;
        return 1;
    }
}
