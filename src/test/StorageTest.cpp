#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "domain/Configuration.hpp"
#include "infrastructure/CommandRunner.hpp"
#include "infrastructure/ExternalCommandStorage.hpp"
#include "infrastructure/LocalMirrorStorage.hpp"
#include "infrastructure/StorageFactory.hpp"
#include "test/TestSupport.hpp"

using namespace dropkeeper;
namespace fs = std::filesystem;

namespace {

domain::BackupArtifact MakeArtifact(const fs::path& path, const std::string& content) {
    test::WriteFile(path, content);
    domain::BackupArtifact artifact;
    artifact.localPath = path.string();
    artifact.sizeBytes = static_cast<long long>(content.size());
    return artifact;
}

void TestLocalMirror() {
    test::TempRoot root("storage_mirror");
    const fs::path mirrorRoot = root.path() / "mirror";
    infrastructure::LocalMirrorStorage storage(mirrorRoot.string());
    auto artifact = MakeArtifact(root.path() / "a.zip", "zipped bytes");

    // Nothing works before authentication.
    assert(!storage.isAuthenticated());
    assert(storage.put(artifact, "Acme/daily/a.zip").error == domain::StorageError::AuthError);
    assert(storage.list("Acme/").error == domain::StorageError::AuthError);

    auto auth = storage.authenticate();
    assert(auth.session && auth.session->provider == "local-mirror");
    assert(storage.isAuthenticated());

    auto put = storage.put(artifact, "Acme/daily/a.zip");
    assert(put.ref && put.ref->key == "Acme/daily/a.zip" && put.ref->sizeBytes == 12);
    // Same key again replaces the object.
    test::WriteFile(artifact.localPath, "zipped bytes v2");
    assert(storage.put(artifact, "Acme/daily/a.zip").ref);
    assert(test::ReadFile(mirrorRoot / "Acme/daily/a.zip") == "zipped bytes v2");

    assert(storage.put(artifact, "Acme/weekly/b.zip").ref);
    test::WriteFile(mirrorRoot / "Acme/daily/.a.zip.123.tmp", "partial");

    auto daily = storage.list("Acme/daily/");
    assert(daily.success);
    assert(daily.refs.size() == 1);
    assert(daily.refs[0].key == "Acme/daily/a.zip");
    assert(storage.list("Acme/").refs.size() == 2);
    assert(storage.list("Other/").refs.empty());

    auto removed = storage.remove(daily.refs[0]);
    assert(removed.success);
    assert(!fs::exists(mirrorRoot / "Acme/daily/a.zip"));
    auto again = storage.remove(daily.refs[0]);
    assert(!again.success && again.error == domain::StorageError::DeleteError);
    std::cout << "[PASS] Local mirror storage." << std::endl;
}

void TestExternalCommands() {
    test::TempRoot root("storage_commands");
    const std::string remote = infrastructure::CommandRunner::Quote((root.path() / "remote").string());

    domain::CommandTemplates commands;
    commands.authenticate = "echo backup-operator@example.org";
    commands.put = "mkdir -p " + remote + "/$(dirname {key}) && cp {file} " + remote + "/{key}";
    commands.list = "mkdir -p " + remote + " && cd " + remote + " && find . -type f | sed 's|^\\./||'";
    commands.remove = "rm " + remote + "/{key}";

    infrastructure::ExternalCommandStorage storage("s3", commands, std::chrono::seconds(10));
    assert(storage.providerName() == "s3");
    auto auth = storage.authenticate();
    assert(auth.session && auth.session->account == "backup-operator@example.org");

    auto artifact = MakeArtifact(root.path() / "Acme backup.zip", "payload");
    auto put = storage.put(artifact, "Acme/daily/Acme backup.zip");
    assert(put.ref);
    assert(test::ReadFile(root.path() / "remote" / "Acme" / "daily" / "Acme backup.zip") == "payload");

    auto listing = storage.list("Acme/daily/");
    assert(listing.success);
    assert(listing.refs.size() == 1);
    assert(listing.refs[0].key == "Acme/daily/Acme backup.zip");

    assert(storage.remove(listing.refs[0]).success);
    assert(storage.list("Acme/daily/").refs.empty());
    std::cout << "[PASS] Command-driven storage round trip." << std::endl;

    // Failing commands map onto the storage taxonomy.
    domain::CommandTemplates broken = commands;
    broken.authenticate = "echo 'token expired' >&2; exit 3";
    infrastructure::ExternalCommandStorage denied("google_drive", broken, std::chrono::seconds(10));
    auto refused = denied.authenticate();
    assert(!refused.session && refused.error == domain::StorageError::AuthError);
    assert(refused.message.find("token expired") != std::string::npos);
    assert(denied.put(artifact, "k").error == domain::StorageError::AuthError);

    broken.authenticate.clear();
    broken.put = "exit 1";
    broken.list = "exit 2";
    infrastructure::ExternalCommandStorage failing("dropbox", broken, std::chrono::seconds(10));
    assert(failing.authenticate().session);
    assert(failing.put(artifact, "k").error == domain::StorageError::UploadError);
    assert(failing.list("").error == domain::StorageError::ListError);
    assert(failing.remove(domain::RemoteRef{"missing", 0}).error == domain::StorageError::DeleteError);

    broken.put = "sleep 3";
    infrastructure::ExternalCommandStorage slow("s3", broken, std::chrono::seconds(1));
    assert(slow.authenticate().session);
    auto timedOut = slow.put(artifact, "k");
    assert(!timedOut.ref && timedOut.error == domain::StorageError::Timeout);
    assert(domain::IsRetryable(timedOut.error));

    // The tool's own exit status 124 is an ordinary failure, not a timeout.
    broken.put = "exit 124";
    infrastructure::ExternalCommandStorage exits124("s3", broken, std::chrono::seconds(30));
    assert(exits124.authenticate().session);
    assert(exits124.put(artifact, "k").error == domain::StorageError::UploadError);
    auto direct = infrastructure::CommandRunner::RunWithTimeout("exit 124", std::chrono::seconds(30));
    assert(direct.exitCode == 124 && !direct.timedOut);
    std::cout << "[PASS] Command failures and timeouts." << std::endl;
}

void TestTemplateExpansion() {
    std::string expanded = infrastructure::ExternalCommandStorage::Expand(
        "upload {file} to {key} {unknown}", {{"file", "/tmp/it's.zip"}, {"key", "a/b"}});
    assert(expanded == "upload '/tmp/it'\\''s.zip' to 'a/b' {unknown}");
    std::cout << "[PASS] Template expansion quotes values." << std::endl;
}

void TestFactory() {
    domain::StorageSettings settings;
    settings.provider = "local";
    settings.localStoragePath = "/tmp/dropkeeper-mirror";
    assert(infrastructure::StorageFactory::Create(settings)->providerName() == "local-mirror");

    settings.provider = "cloud-object-store";
    settings.commands.put = "true";
    assert(infrastructure::StorageFactory::Create(settings)->providerName() == "cloud-object-store");

    settings.provider = "ftp";
    bool threw = false;
    try {
        infrastructure::StorageFactory::Create(settings);
    } catch (const domain::ConfigError&) {
        threw = true;
    }
    assert(threw);
    std::cout << "[PASS] Storage factory." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting Storage Test..." << std::endl;
    TestLocalMirror();
    TestExternalCommands();
    TestTemplateExpansion();
    TestFactory();
    std::cout << "[PASS] Storage Test." << std::endl;
    return 0;
}
