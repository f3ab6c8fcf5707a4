/**
 * @file process_runner.hpp
 * @brief External process execution (objcopy, git, cargo)
 * 
 * stdout and stderr are piped and drained on two threads until EOF.
 * The child is reaped only after both readers have finished, so a
 * chatty child can never block on a full pipe.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>

struct ProcessResult {
    bool spawned;                   /* false: fork/exec failed (tool missing?) */
    int exit_code;                  /* Exit status, 128 + signal if killed */
    std::string out;                /* Captured stdout */
    std::string err;                /* Captured stderr */
    std::string error;              /* Spawn failure description */
    
    bool success() const { return spawned && exit_code == 0; }
};

class ProcessRunner {
public:
    /**
     * @brief Run a command and wait for it
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @param working_dir Child working directory (empty: inherit)
     * @param live_output Echo child lines to our stdout/stderr while running
     * @return Process result
     */
    ProcessResult run(const std::vector<std::string>& argv,
                      const std::string& working_dir = "",
                      bool live_output = false) const;
};

#endif // PROCESS_RUNNER_HPP
