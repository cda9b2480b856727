/**
 * @file ScreenshotService.cpp
 * @brief Implementation of ScreenshotService.
 */

#include "application/ScreenshotService.hpp"
#include "application/OutputFormatter.hpp"
#include "domain/Errors.hpp"
#include "infrastructure/DirectoryMaterializer.hpp"
#include "infrastructure/ErrorSanitizer.hpp"
#include "infrastructure/GitClient.hpp"
#include "infrastructure/ImageConverter.hpp"
#include "infrastructure/ImageValidator.hpp"
#include "infrastructure/PathResolver.hpp"
#include "infrastructure/PosixFile.hpp"
#include "infrastructure/ScreenshotScanner.hpp"
#include "infrastructure/SizeLimitResolver.hpp"

#include <cstdio>
#include <iostream>
#include <random>
#include <utility>

namespace shotgate::application {

namespace fs = std::filesystem;

using infrastructure::DirectoryMaterializer;
using infrastructure::ErrorSanitizer;
using infrastructure::PathResolver;

namespace {

const char* const kRepoImageDirs[] = {"img", "images", "assets/img", "assets/images"};

std::string Megabytes(std::uint64_t bytes) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2fMB", static_cast<double>(bytes) / domain::kBytesPerMegabyte);
    return buffer;
}

std::optional<fs::path> RelativeToRoot(const fs::path& path, const fs::path& root) {
    fs::path rel = path.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..") {
        return std::nullopt;
    }
    return rel;
}

} // namespace

ScreenshotService::ScreenshotService(AppContext context, domain::ConfigDocument config)
    : m_context(std::move(context)), m_config(std::move(config)) {}

std::string ScreenshotService::GenerateCopyName(const fs::path& source) {
    static const char hex[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int> dist(0, 15);

    std::string token;
    token.reserve(32);
    for (int i = 0; i < 32; ++i) {
        token += hex[dist(gen)];
    }

    const std::string ext = domain::ToLower(source.extension().string());
    const std::string prefix = (ext == ".gif") ? "animated_" : "screenshot_";
    return prefix + token + ext;
}

fs::path ScreenshotService::resolveExistingDirectory(const std::string& value, bool allowSymlinks) const {
    const fs::path path = PathResolver::Resolve(value, !allowSymlinks).value().path;
    if (!fs::is_directory(path)) {
        throw domain::NotFoundError("Not a directory: " + ErrorSanitizer::SanitizePath(path.string()));
    }
    return path;
}

fs::path ScreenshotService::resolveSource(const std::optional<std::string>& requested, bool allowSymlinks) const {
    const std::string value = requested ? *requested : m_config.defaultSource;
    if (value.empty()) {
        throw domain::InvalidInputError("No source directory specified. Pass --source or run 'shotgate configure --source <dir>'.");
    }
    return resolveExistingDirectory(value, allowSymlinks);
}

fs::path ScreenshotService::resolveDestination(const std::optional<std::string>& requested, bool allowSymlinks) const {
    if (requested) {
        fs::path dir = resolveExistingDirectory(*requested, allowSymlinks);
        return DirectoryMaterializer::Ensure(dir, 0755, false).path;
    }

    infrastructure::GitClient git(m_context.workingDirectory);
    if (auto root = git.getRoot()) {
        for (const char* candidate : kRepoImageDirs) {
            const fs::path dir = *root / candidate;
            std::error_code ec;
            if (fs::is_directory(fs::symlink_status(dir, ec))) {
                return DirectoryMaterializer::Ensure(dir, 0755, false).path;
            }
        }
        return DirectoryMaterializer::Ensure(*root / "assets" / "images", 0755, true).path;
    }

    if (!m_config.defaultDestination.empty()) {
        fs::path dir = resolveExistingDirectory(m_config.defaultDestination, allowSymlinks);
        return DirectoryMaterializer::Ensure(dir, 0755, false).path;
    }

    fs::path cwd = resolveExistingDirectory(m_context.workingDirectory.string(), allowSymlinks);
    return DirectoryMaterializer::Ensure(cwd, 0755, false).path;
}

std::vector<domain::ScreenshotCandidate> ScreenshotService::selectRecent(const fs::path& sourceDir,
                                                                         int count,
                                                                         bool allowSymlinks,
                                                                         const domain::SizeLimitPolicy& policy) const {
    if (count < 1) {
        throw domain::InvalidInputError("Count must be at least 1");
    }

    infrastructure::ScreenshotScanner scanner(sourceDir, allowSymlinks);
    std::vector<domain::ScreenshotCandidate> selected;

    // Files older than the last one we need are never examined, so stale
    // junk in the source directory stays silent.
    for (const auto& candidate : scanner.scan()) {
        if (static_cast<int>(selected.size()) == count) {
            break;
        }
        domain::ImageArtifact artifact = infrastructure::ImageValidator::Validate(
            candidate.path, candidate.sizeBytes, policy.maxFileBytes, allowSymlinks);
        if (!artifact.isValid()) {
            std::cerr << "[ScreenshotService] Skipping invalid image file: " << artifact.message << std::endl;
            continue;
        }
        selected.push_back(candidate);
    }

    if (selected.empty()) {
        throw domain::NotFoundError("No screenshot found.");
    }
    if (static_cast<int>(selected.size()) < count) {
        throw domain::NotFoundError("You requested " + std::to_string(count) + " screenshot(s), but only "
                                    + std::to_string(selected.size()) + " were found.");
    }
    return selected;
}

fs::path ScreenshotService::validateExplicit(const std::string& imagePath,
                                             bool allowSymlinks,
                                             const domain::SizeLimitPolicy& policy) const {
    const fs::path path = PathResolver::Resolve(imagePath, !allowSymlinks).value().path;
    if (!fs::is_regular_file(path)) {
        throw domain::ValidationError("Not a regular file: " + ErrorSanitizer::SanitizePath(path.string()));
    }
    domain::ImageArtifact artifact = infrastructure::ImageValidator::Validate(path, std::nullopt, policy.maxFileBytes, allowSymlinks);
    if (!artifact.isValid()) {
        throw domain::ValidationError(artifact.message);
    }
    return path;
}

std::vector<fs::path> ScreenshotService::copyScreenshots(const std::vector<fs::path>& files,
                                                         const fs::path& destination,
                                                         const domain::SizeLimitPolicy& policy,
                                                         bool allowSymlinks) const {
    std::vector<fs::path> copied;
    std::uint64_t total = 0;

    for (const auto& file : files) {
        // The copy is written from the bytes checked here, never by reopening the source.
        std::string bytes;
        domain::ImageArtifact artifact = infrastructure::ImageValidator::ReadValidated(
            file, bytes, std::nullopt, policy.maxFileBytes, allowSymlinks);
        if (!artifact.isValid()) {
            throw domain::SecurityError("Screenshot changed after validation: " + artifact.message);
        }
        if (total + bytes.size() > policy.maxTotalBytes) {
            std::cerr << "[ScreenshotService] Warning: Total size limit of " << Megabytes(policy.maxTotalBytes)
                      << " reached; copied " << copied.size() << " of " << files.size() << " screenshot(s)" << std::endl;
            break;
        }

        const fs::path target = destination / GenerateCopyName(file);
        infrastructure::WriteFileExclusive(target, bytes);
        copied.push_back(target);
        total += bytes.size();
    }
    return copied;
}

std::vector<fs::path> ScreenshotService::convertAll(const std::vector<fs::path>& files, const std::string& target) const {
    std::vector<fs::path> converted;
    converted.reserve(files.size());
    for (const auto& file : files) {
        fs::path output = infrastructure::ImageConverter::Convert(file, target);
        if (output != file) {
            std::error_code ec;
            fs::remove(file, ec);
            if (ec) {
                std::cerr << "[ScreenshotService] Warning: could not remove unconverted copy: "
                          << ErrorSanitizer::FormatPathError(ec, file) << std::endl;
            }
        }
        converted.push_back(output);
    }
    return converted;
}

FetchResult ScreenshotService::fetch(const FetchRequest& request) const {
    if (request.noTransfer && (request.destination || request.convertTo)) {
        throw domain::InvalidInputError("--no-transfer cannot be combined with --destination or --convert-to");
    }

    domain::OutputStyle style = request.noTransfer ? domain::OutputStyle::Text : m_config.defaultOutputFormat;
    if (request.outputStyle) {
        style = OutputFormatter::ParseStyle(*request.outputStyle);
    }

    std::optional<std::string> convertTo = request.convertTo ? request.convertTo : m_config.defaultConvertTo;
    if (convertTo) {
        auto normalized = domain::NormalizeConvertTarget(*convertTo);
        if (!normalized) {
            throw domain::InvalidInputError("Invalid conversion format: " + *convertTo + ". Valid options: png, jpg.");
        }
        convertTo = normalized;
    }

    const domain::SizeLimitPolicy policy = infrastructure::SizeLimitResolver::Resolve(m_config);

    std::vector<fs::path> sources;
    if (request.imagePath) {
        sources.push_back(validateExplicit(*request.imagePath, request.allowSymlinks, policy));
    } else {
        const fs::path sourceDir = resolveSource(request.source, request.allowSymlinks);
        for (const auto& candidate : selectRecent(sourceDir, request.count, request.allowSymlinks, policy)) {
            sources.push_back(candidate.path);
        }
    }

    FetchResult result;
    if (request.noTransfer) {
        for (const auto& source : sources) {
            result.lines.push_back(OutputFormatter::FormatPath(style, source, false));
        }
        result.files = sources;
        return result;
    }

    const fs::path destination = resolveDestination(request.destination, request.allowSymlinks);
    result.files = copyScreenshots(sources, destination, policy, request.allowSymlinks);
    if (result.files.empty()) {
        throw domain::ValidationError("No screenshots copied: total size limit of " + Megabytes(policy.maxTotalBytes) + " reached");
    }
    if (convertTo) {
        result.files = convertAll(result.files, *convertTo);
    }

    infrastructure::GitClient git(m_context.workingDirectory);
    std::optional<fs::path> root = git.getRoot();

    std::vector<fs::path> relativeFiles;
    for (const auto& file : result.files) {
        std::optional<fs::path> rel = root ? RelativeToRoot(file, *root) : std::nullopt;
        if (rel) {
            relativeFiles.push_back(*rel);
            result.lines.push_back(OutputFormatter::FormatPath(style, *rel, true));
        } else {
            result.lines.push_back(OutputFormatter::FormatPath(style, file, false));
        }
    }

    if (m_config.autoStageEnabled && root && !relativeFiles.empty()) {
        result.staged = git.stage(relativeFiles, *root);
        if (!result.staged) {
            std::cerr << "[ScreenshotService] Warning: failed to stage screenshots in git" << std::endl;
        }
    }
    return result;
}

} // namespace shotgate::application
