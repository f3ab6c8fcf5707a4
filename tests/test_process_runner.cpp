#include "process_runner.hpp"

#include <cassert>
#include <string>

int main() {
    ProcessRunner runner;

    // Both streams captured, exit status reported.
    ProcessResult r = runner.run({"sh", "-c", "echo hello; echo oops 1>&2; exit 3"});
    assert(r.spawned);
    assert(r.exit_code == 3);
    assert(!r.success());
    assert(r.out == "hello\n");
    assert(r.err == "oops\n");

    // Far more than a pipe buffer on stderr: must not deadlock.
    ProcessResult big = runner.run({"sh", "-c",
        "i=0; while [ $i -lt 20000 ]; do echo 0123456789012345678901234567890123456789; i=$((i+1)); done 1>&2; echo done"});
    assert(big.success());
    assert(big.out == "done\n");
    assert(big.err.size() == 20000u * 41u);

    // Live echo still captures.
    ProcessResult live = runner.run({"sh", "-c", "printf 'a\\nb'"}, "", true);
    assert(live.success());
    assert(live.out == "a\nb");

    // Working directory.
    ProcessResult pwd = runner.run({"pwd"}, "/");
    assert(pwd.success());
    assert(pwd.out == "/\n");

    // Killed by a signal: 128 + signo.
    ProcessResult killed = runner.run({"sh", "-c", "kill -9 $$"});
    assert(killed.spawned);
    assert(killed.exit_code == 128 + 9);

    // Missing program / directory: not spawned, with a reason.
    ProcessResult missing = runner.run({"/nonexistent/ota-packer-tool"});
    assert(!missing.spawned);
    assert(!missing.error.empty());

    ProcessResult bad_dir = runner.run({"pwd"}, "/nonexistent/dir");
    assert(!bad_dir.spawned);
    assert(!bad_dir.error.empty());

    ProcessResult empty = runner.run({});
    assert(!empty.spawned);

    return 0;
}
