/**
 * @file process_runner.cpp
 * @brief External process execution implementation
 */

#include "process_runner.hpp"
#include <cerrno>
#include <cstring>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {

std::mutex g_console_mutex;

void closeFd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

/**
 * @brief Read fd until EOF, optionally echoing complete lines
 */
void drainPipe(int fd, std::string& captured, std::ostream* echo) {
    char buffer[4096];
    std::string pending;
    
    for (;;) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            break;
        }
        captured.append(buffer, static_cast<size_t>(n));
        
        if (echo != nullptr) {
            pending.append(buffer, static_cast<size_t>(n));
            size_t newline;
            while ((newline = pending.find('\n')) != std::string::npos) {
                std::lock_guard<std::mutex> lock(g_console_mutex);
                *echo << pending.substr(0, newline) << std::endl;
                pending.erase(0, newline + 1);
            }
        }
    }
    
    if (echo != nullptr && !pending.empty()) {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        *echo << pending << std::endl;
    }
}

} // namespace

ProcessResult ProcessRunner::run(const std::vector<std::string>& argv,
                                 const std::string& working_dir,
                                 bool live_output) const {
    ProcessResult result;
    result.spawned = false;
    result.exit_code = -1;
    
    if (argv.empty()) {
        result.error = "empty command line";
        return result;
    }
    
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec errno, closed on successful exec
    
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe() failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        closeFd(exec_pipe[0]); closeFd(exec_pipe[1]);
        return result;
    }
    
    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& a : argv) cargs.push_back(const_cast<char*>(a.c_str()));
    cargs.push_back(nullptr);
    
    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork() failed: ") + std::strerror(errno);
        closeFd(out_pipe[0]); closeFd(out_pipe[1]);
        closeFd(err_pipe[0]); closeFd(err_pipe[1]);
        closeFd(exec_pipe[0]); closeFd(exec_pipe[1]);
        return result;
    }
    
    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        close(exec_pipe[0]);
        
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            int e = errno;
            ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }
        
        execvp(cargs[0], cargs.data());
        int e = errno;
        ssize_t ignored = write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }
    
    // Parent
    closeFd(out_pipe[1]);
    closeFd(err_pipe[1]);
    closeFd(exec_pipe[1]);
    
    std::thread stdout_reader(drainPipe, out_pipe[0], std::ref(result.out),
                              live_output ? &std::cout : nullptr);
    std::thread stderr_reader(drainPipe, err_pipe[0], std::ref(result.err),
                              live_output ? &std::cerr : nullptr);
    
    int exec_errno = 0;
    ssize_t got;
    do {
        got = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (got < 0 && errno == EINTR);
    closeFd(exec_pipe[0]);
    
    stdout_reader.join();
    stderr_reader.join();
    closeFd(out_pipe[0]);
    closeFd(err_pipe[0]);
    
    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    
    if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error = "failed to start " + argv[0] + ": " + std::strerror(exec_errno);
        return result;
    }
    if (waited < 0) {
        result.error = std::string("waitpid() failed: ") + std::strerror(errno);
        return result;
    }
    
    result.spawned = true;
    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) result.exit_code = 128 + WTERMSIG(status);
    else result.exit_code = 1;
    
    return result;
}
