/**
 * Shared helpers for the memboot test suites
 */

#pragma once

#include <memboot/exec.hpp>
#include <memboot/health.hpp>
#include <memboot/platform.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace memboot::test {

namespace fs = std::filesystem;

// Scratch directory removed with everything under it
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("memboot_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string read_text(const std::string& path) {
    return read_file(path).value_or("");
}

inline std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

inline bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Write an executable /bin/sh script
inline void write_script(const std::string& path, const std::string& body) {
    write_text(path, "#!/bin/sh\n" + body + "\n");
    fs::permissions(path,
                    fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec,
                    fs::perm_options::replace);
}

// Poll for a file written by a detached child
inline bool wait_for_path(const std::string& path, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!path_exists(path)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return true;
}

// Points fds 1 and 2 of this process at files for the lifetime of the
// object, so output written by children can be inspected afterwards
class StdioCapture {
public:
    explicit StdioCapture(const TempDir& tmp)
        : out_path_(tmp.file("stdout.txt")), err_path_(tmp.file("stderr.txt")) {
        std::fflush(stdout);
        std::fflush(stderr);
        saved_out_ = dup(STDOUT_FILENO);
        saved_err_ = dup(STDERR_FILENO);
        redirect(out_path_, STDOUT_FILENO);
        redirect(err_path_, STDERR_FILENO);
    }

    ~StdioCapture() { restore(); }

    void restore() {
        if (saved_out_ < 0) return;
        std::fflush(stdout);
        std::fflush(stderr);
        dup2(saved_out_, STDOUT_FILENO);
        dup2(saved_err_, STDERR_FILENO);
        close(saved_out_);
        close(saved_err_);
        saved_out_ = saved_err_ = -1;
    }

    std::string out() const { return read_text(out_path_); }
    std::string err() const { return read_text(err_path_); }

private:
    static void redirect(const std::string& path, int target) {
        int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
        dup2(fd, target);
        close(fd);
    }

    std::string out_path_;
    std::string err_path_;
    int saved_out_ = -1;
    int saved_err_ = -1;
};

// Search path with a private bin directory in front of the system ones
inline ToolLocations tools_with(const std::string& bin_dir) {
    return ToolLocations({bin_dir, "/usr/bin", "/bin"});
}

// Probe returning a scripted sequence of results; the last one repeats
class ScriptedProbe : public HealthProbe {
public:
    explicit ScriptedProbe(std::vector<bool> answers) : answers_(std::move(answers)) {}

    HealthCheckResult check() override {
        bool healthy = answers_.empty() ? false
                                        : answers_[std::min(calls_, answers_.size() - 1)];
        ++calls_;
        HealthCheckResult result;
        result.ok = healthy;
        result.reachable = healthy;
        if (!healthy) result.error = "connection refused";
        return result;
    }

    size_t calls() const { return calls_; }

private:
    std::vector<bool> answers_;
    size_t calls_ = 0;
};

/**
 * Loopback HTTP responder. Answers every request with a fixed status and
 * body until destroyed.
 */
class LoopbackHttpServer {
public:
    LoopbackHttpServer(int status, std::string body) : status_(status), body_(std::move(body)) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        listen(fd_, 8);

        socklen_t len = sizeof(addr);
        getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackHttpServer() {
        stopping_ = true;
        shutdown(fd_, SHUT_RDWR);
        close(fd_);
        if (thread_.joinable()) thread_.join();
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    int port() const { return port_; }

    std::string url(const std::string& path = "/api/health") const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    int requests() const { return requests_; }

private:
    void serve() {
        while (!stopping_) {
            int client = accept(fd_, nullptr, nullptr);
            if (client < 0) break;

            // Read the request head; the probe sends no body
            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = recv(client, buf, sizeof(buf), 0);
                if (n <= 0) break;
                request.append(buf, static_cast<size_t>(n));
            }
            ++requests_;

            std::string response = "HTTP/1.1 " + std::to_string(status_) + " X\r\n" +
                                   "Content-Type: application/json\r\n" +
                                   "Content-Length: " + std::to_string(body_.size()) + "\r\n" +
                                   "Connection: close\r\n\r\n" + body_;
            send(client, response.data(), response.size(), MSG_NOSIGNAL);
            close(client);
        }
    }

    int status_;
    std::string body_;
    int fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stopping_{false};
    std::atomic<int> requests_{0};
    std::thread thread_;
};

} // namespace memboot::test
