/**
 * @file ExternalCommandStorage.cpp
 * @brief Implementation of the ExternalCommandStorage class.
 */
#include "infrastructure/ExternalCommandStorage.hpp"
#include "infrastructure/CommandRunner.hpp"

#include <cctype>
#include <sstream>

namespace dropkeeper::infrastructure {

namespace {

std::string Trim(const std::string& text) {
    size_t start = 0;
    while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    size_t end = text.size();
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::string LastLine(const std::string& output) {
    std::string trimmed = Trim(output);
    size_t pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

std::string Describe(const CommandResult& result) {
    if (result.timedOut) return "command timed out";
    std::string message = "exit status " + std::to_string(result.exitCode);
    std::string tail = LastLine(result.output);
    if (!tail.empty()) message += ": " + tail;
    return message;
}

} // namespace

ExternalCommandStorage::ExternalCommandStorage(std::string provider, domain::CommandTemplates commands, std::chrono::seconds timeout)
    : m_provider(std::move(provider)), m_commands(std::move(commands)), m_timeout(timeout) {}

std::string ExternalCommandStorage::Expand(const std::string& commandTemplate, const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(commandTemplate.size());
    size_t i = 0;
    while (i < commandTemplate.size()) {
        if (commandTemplate[i] == '{') {
            size_t close = commandTemplate.find('}', i);
            if (close != std::string::npos) {
                auto it = values.find(commandTemplate.substr(i + 1, close - i - 1));
                if (it != values.end()) {
                    out += CommandRunner::Quote(it->second);
                    i = close + 1;
                    continue;
                }
            }
        }
        out.push_back(commandTemplate[i]);
        ++i;
    }
    return out;
}

domain::AuthResult ExternalCommandStorage::authenticate() {
    domain::AuthResult result;
    if (m_commands.authenticate.empty()) {
        m_authenticated = true;
        result.session = domain::Session{m_provider, "", std::chrono::system_clock::now()};
        result.message = "No authentication command configured";
        return result;
    }

    CommandResult run = CommandRunner::RunWithTimeout(m_commands.authenticate, m_timeout);
    if (run.timedOut) {
        m_authenticated = false;
        result.error = domain::StorageError::Timeout;
        result.message = Describe(run);
        return result;
    }
    if (run.exitCode != 0) {
        m_authenticated = false;
        result.error = domain::StorageError::AuthError;
        result.message = Describe(run);
        return result;
    }

    m_authenticated = true;
    result.session = domain::Session{m_provider, LastLine(run.output), std::chrono::system_clock::now()};
    result.message = "Authenticated";
    return result;
}

domain::PutResult ExternalCommandStorage::put(const domain::BackupArtifact& artifact, const std::string& remoteKey) {
    domain::PutResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    std::string command = Expand(m_commands.put, {{"file", artifact.localPath}, {"key", remoteKey}});
    CommandResult run = CommandRunner::RunWithTimeout(command, m_timeout);
    if (run.timedOut || run.exitCode != 0) {
        result.error = run.timedOut ? domain::StorageError::Timeout : domain::StorageError::UploadError;
        result.message = Describe(run);
        return result;
    }

    result.ref = domain::RemoteRef{remoteKey, artifact.sizeBytes};
    result.message = "Uploaded";
    return result;
}

domain::ListResult ExternalCommandStorage::list(const std::string& prefix) {
    domain::ListResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    std::string command = Expand(m_commands.list, {{"prefix", prefix}});
    CommandResult run = CommandRunner::RunWithTimeout(command, m_timeout);
    if (run.timedOut || run.exitCode != 0) {
        result.error = run.timedOut ? domain::StorageError::Timeout : domain::StorageError::ListError;
        result.message = Describe(run);
        return result;
    }

    std::istringstream lines(run.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        domain::RemoteRef ref;
        size_t tab = line.find('\t');
        if (tab != std::string::npos) {
            ref.key = Trim(line.substr(0, tab));
            std::string size = Trim(line.substr(tab + 1));
            try {
                ref.sizeBytes = std::stoll(size);
            } catch (const std::exception&) {
                ref.sizeBytes = 0;
            }
        } else {
            ref.key = Trim(line);
        }
        if (ref.key.empty() || ref.key.compare(0, prefix.size(), prefix) != 0) continue;
        result.refs.push_back(ref);
    }
    result.success = true;
    return result;
}

domain::DeleteResult ExternalCommandStorage::remove(const domain::RemoteRef& ref) {
    domain::DeleteResult result;
    if (!m_authenticated) {
        result.error = domain::StorageError::AuthError;
        result.message = "Not authenticated";
        return result;
    }

    std::string command = Expand(m_commands.remove, {{"key", ref.key}});
    CommandResult run = CommandRunner::RunWithTimeout(command, m_timeout);
    if (run.timedOut || run.exitCode != 0) {
        result.error = run.timedOut ? domain::StorageError::Timeout : domain::StorageError::DeleteError;
        result.message = Describe(run);
        return result;
    }
    result.success = true;
    return result;
}

} // namespace dropkeeper::infrastructure
