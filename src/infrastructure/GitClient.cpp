#include "infrastructure/GitClient.hpp"

#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace shotgate::infrastructure {

namespace fs = std::filesystem;

GitClient::GitClient(const fs::path& workingDirectory)
    : m_workingDirectory(workingDirectory) {}

std::string GitClient::ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

GitClient::CommandResult GitClient::RunCommand(const std::string& cmd) {
    CommandResult result;
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return result;
    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        result.output.append(buffer);
    }
    int status = pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    }
    return result;
}

bool GitClient::isInsideWorkTree() const {
    CommandResult r = RunCommand("git -C " + ShellQuote(m_workingDirectory.string())
                                 + " rev-parse --is-inside-work-tree 2>/dev/null");
    return r.exitCode == 0 && r.output.rfind("true", 0) == 0;
}

std::optional<fs::path> GitClient::getRoot() const {
    if (!isInsideWorkTree()) {
        return std::nullopt;
    }
    CommandResult r = RunCommand("git -C " + ShellQuote(m_workingDirectory.string())
                                 + " rev-parse --show-toplevel 2>/dev/null");
    if (r.exitCode != 0) {
        return std::nullopt;
    }
    while (!r.output.empty() && (r.output.back() == '\n' || r.output.back() == '\r')) {
        r.output.pop_back();
    }
    if (r.output.empty()) {
        return std::nullopt;
    }
    return fs::path(r.output);
}

bool GitClient::stage(const std::vector<fs::path>& files, const fs::path& root) const {
    if (files.empty()) {
        return true;
    }
    std::ostringstream cmd;
    cmd << "git -C " << ShellQuote(root.string()) << " add --";
    for (const auto& file : files) {
        cmd << " " << ShellQuote(file.string());
    }
    cmd << " 2>&1";
    return RunCommand(cmd.str()).exitCode == 0;
}

} // namespace shotgate::infrastructure
