#include "project_manifest.hpp"
#include "version_control.hpp"
#include "test_support.hpp"

#include <cassert>
#include <string>

static const char* kWorkspaceMetadata = R"({
  "packages": [
    {
      "name": "bootloader",
      "version": "0.1.0",
      "manifest_path": "/work/fw/bootloader/Cargo.toml",
      "dependencies": [ { "name": "cortex-m" } ]
    },
    {
      "name": "sensor-node",
      "version": "1.4.2",
      "manifest_path": "/work/fw/Cargo.toml",
      "dependencies": [
        { "name": "embassy-executor", "kind": null },
        { "name": "embassy-stm32", "kind": null },
        { "name": "defmt", "kind": null }
      ]
    }
  ],
  "target_directory": "/work/fw/target",
  "version": 1
})";

int main() {
    // Package matching the project directory wins over the first entry.
    ProjectManifest m;
    std::string error;
    assert(ManifestReader::parseCargoMetadata(kWorkspaceMetadata, "/work/fw/", m, error));
    assert(m.name == "sensor-node");
    assert(m.version == "1.4.2");
    assert(m.manifest_path == "/work/fw/Cargo.toml");
    assert(m.target_directory == "/work/fw/target");
    assert(m.dependencies.size() == 3);
    assert(m.hasDependency("embassy"));
    assert(!m.hasDependency("rtic"));
    assert(m.elfPath("thumbv7em-none-eabihf", "release") ==
           "/work/fw/target/thumbv7em-none-eabihf/release/sensor-node");

    // No match: first package.
    ProjectManifest first;
    assert(ManifestReader::parseCargoMetadata(kWorkspaceMetadata, "/elsewhere", first, error));
    assert(first.name == "bootloader");
    assert(!first.hasDependency("embassy"));

    // Missing target_directory: <project>/target.
    ProjectManifest fallback;
    assert(ManifestReader::parseCargoMetadata(
        R"({"packages":[{"name":"app","dependencies":[]}]})", "/p", fallback, error));
    assert(fallback.target_directory == "/p/target");

    // Rejected inputs.
    ProjectManifest bad;
    assert(!ManifestReader::parseCargoMetadata("not json", "/p", bad, error));
    assert(!error.empty());
    assert(!ManifestReader::parseCargoMetadata(R"({"packages":[]})", "/p", bad, error));
    assert(!ManifestReader::parseCargoMetadata(R"({"workspace_root":"/p"})", "/p", bad, error));
    assert(!ManifestReader::parseCargoMetadata(R"({"packages":[{"version":"1"}]})", "/p", bad, error));

    // Build id normalization.
    assert(VersionControl::normalizeHash(" a1b2c3d\n") == "a1b2c3d");
    assert(VersionControl::normalizeHash("a1b\t2c3d\r\n") == "a1b2c3d");
    assert(VersionControl::composeVersion("a1b2c3d", true, "-dirty") == "a1b2c3d-dirty");
    assert(VersionControl::composeVersion("a1b2c3d", false, "-dirty") == "a1b2c3d");

    // Fake git / cargo through the process runner.
    std::string dir = make_temp_dir();
    ProcessRunner runner;

    write_script(dir + "/git-dirty",
        "case \"$1\" in\n"
        "  rev-parse) echo ' a1b2c3d ' ;;\n"
        "  status) echo ' M src/main.rs' ;;\n"
        "esac\n");
    write_script(dir + "/git-clean",
        "case \"$1\" in\n"
        "  rev-parse) echo 'a1b2c3d' ;;\n"
        "  status) ;;\n"
        "esac\n");
    write_script(dir + "/git-broken", "echo 'fatal: not a git repository' 1>&2\nexit 128\n");

    BuildId id;
    assert(VersionControl(runner, dir + "/git-dirty", "-dirty").describe(dir, id));
    assert(id.hash == "a1b2c3d");
    assert(id.dirty);
    assert(id.version == "a1b2c3d-dirty");

    assert(VersionControl(runner, dir + "/git-clean", "-dirty").describe(dir, id));
    assert(!id.dirty);
    assert(id.version == "a1b2c3d");

    assert(!VersionControl(runner, dir + "/git-broken", "-dirty").describe(dir, id));
    assert(!VersionControl(runner, dir + "/no-such-git", "-dirty").describe(dir, id));

    write_script(dir + "/cargo",
        "[ \"$1\" = metadata ] || exit 2\n"
        "echo '{\"packages\":[{\"name\":\"blinky\",\"version\":\"0.2.0\","
        "\"dependencies\":[{\"name\":\"embassy-rp\"}]}],\"target_directory\":\"/t\"}'\n");
    ProjectManifest read;
    assert(ManifestReader(runner, dir + "/cargo").read(dir, read));
    assert(read.name == "blinky");
    assert(read.target_directory == "/t");
    assert(read.hasDependency("embassy"));

    write_script(dir + "/cargo-broken", "echo 'error: could not find Cargo.toml' 1>&2\nexit 101\n");
    assert(!ManifestReader(runner, dir + "/cargo-broken").read(dir, read));

    remove_tree(dir);
    return 0;
}
