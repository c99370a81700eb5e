// === src/Logger/Logger.cpp ===
#include "Logger.hpp"
#include <cstdio>
#include <cstring>
#include <ctime>
#include <cerrno>
#include <iostream>
#include <unistd.h>
#include <sys/wait.h>


// Desc: logger loop to read from pipe and append to log file
// In: int pipe_read_fd, const std::string& log_path
// Out: void (returns when every write end is closed)
void logger_loop(int pipe_read_fd, const std::string& log_path) {
    char buf[1024];
    // [Main loop of logger process]
    while (true) {
        ssize_t len = read(pipe_read_fd, buf, sizeof(buf) - 1);
        if (len == 0) break;
        if (len < 0) {
            if (errno == EINTR) continue;
            break;
        }
        buf[len] = '\0';
        FILE* f = fopen(log_path.c_str(), "a");
        if (f) {
            fwrite(buf, 1, static_cast<size_t>(len), f);
            fclose(f);
        }
    }
}

// Desc: create the log pipe and fork the logger process
// In: const std::string& log_path, pid_t& out_pid
// Out: int (write end of the pipe, -1 on failure)
int start_logger_process(const std::string& log_path, pid_t& out_pid) {
    out_pid = -1;
    int log_pipe[2];
    if (pipe(log_pipe) == -1) { perror("pipe"); return -1; }

    pid_t pid = fork();
    if (pid == -1) {
        perror("fork");
        close(log_pipe[0]);
        close(log_pipe[1]);
        return -1;
    }
    if (pid == 0) {
        close(log_pipe[1]);
        logger_loop(log_pipe[0], log_path);
        _exit(0);
    }

    close(log_pipe[0]);
    out_pid = pid;
    return log_pipe[1];
}

void stop_logger_process(int log_write_fd, pid_t pid) {
    if (log_write_fd >= 0) close(log_write_fd);
    if (pid > 0) {
        int status = 0;
        if (waitpid(pid, &status, 0) == -1) perror("waitpid");
    }
}

// Desc: prefix a timestamp and push one line into the log pipe
// In: int log_fd, const std::string& msg
// Out: void
void log_write(int log_fd, const std::string& msg) {
    if (log_fd < 0) return;
    time_t now = ::time(nullptr);
    char ts[64];
    ctime_r(&now, ts);
    ts[std::strlen(ts) - 1] = '\0';
    std::string line = "[" + std::string(ts) + "] " + msg;
    if (line.empty() || line.back() != '\n') line += '\n';
    ssize_t wr = ::write(log_fd, line.c_str(), line.size());
    if (wr < 0) {
        std::cerr << "[Logger] write failed: " << std::strerror(errno) << "\n";
    }
}
