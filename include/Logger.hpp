#pragma once
#include <string>
#include <sys/types.h>

// Operational log: request handlers write lines into a pipe, a forked logger
// process drains it into the log file. A line shorter than PIPE_BUF is
// written atomically, so concurrent handlers never interleave.

// reads pipe_read_fd until EOF, appending to log_path
void logger_loop(int pipe_read_fd, const std::string& log_path);

// forks the logger; returns the write end (or -1 on failure)
int start_logger_process(const std::string& log_path, pid_t& out_pid);

// closes the write end and reaps the logger process
void stop_logger_process(int log_write_fd, pid_t pid);

// timestamped line; no-op when log_fd < 0
void log_write(int log_fd, const std::string& msg);
