#include "log_follower.h"
#include <cerrno>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>
#include <vector>
#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace fs = std::filesystem;

const std::chrono::milliseconds LogReader::DEFAULT_POLL_INTERVAL(250);

namespace {

const size_t READ_CHUNK_SIZE = 64 * 1024;

// Move every '\n'-terminated line out of buffer; the unterminated rest stays
void takeCompleteLines(std::string& buffer, std::vector<std::string>& lines) {
    size_t start = 0;
    size_t newline;
    while ((newline = buffer.find('\n', start)) != std::string::npos) {
        size_t end = newline;
        if (end > start && buffer[end - 1] == '\r') {
            end--;
        }
        lines.emplace_back(buffer, start, end - start);
        start = newline + 1;
    }
    buffer.erase(0, start);
}

bool openLogFile(const std::string& path, std::ifstream& file, std::string& errorMessage) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        errorMessage = "failed to open log file " + path + ": is a directory";
        return false;
    }

    errno = 0;
    file.open(path, std::ios::in | std::ios::binary);
    if (!file.is_open()) {
        errorMessage = LogReader::openFailureMessage(path, errno);
        return false;
    }
    return true;
}

// Identifies the file behind a path so a replaced log is noticed
bool fileIdentity(const std::string& path, std::uintmax_t& device, std::uintmax_t& inode) {
#ifdef _WIN32
    (void)path;
    device = 0;
    inode = 0;
    return true;
#else
    struct stat info;
    if (stat(path.c_str(), &info) != 0) {
        return false;
    }
    device = static_cast<std::uintmax_t>(info.st_dev);
    inode = static_cast<std::uintmax_t>(info.st_ino);
    return true;
#endif
}

} // namespace

LogFollower::LogFollower(const std::string& path, int tailLines, std::ostream& out)
    : m_path(path), m_tailLines(tailLines), m_out(out), m_state(State::Init) {}

bool LogFollower::start(std::string& errorMessage) {
    if (m_state != State::Init) {
        return m_state == State::Polling;
    }

    std::ifstream file;
    if (!openLogFile(m_path, file, errorMessage)) {
        m_state = State::Done;
        return false;
    }

    // Ring of the most recent complete lines, bounded by the tail count
    std::deque<std::string> window;
    std::vector<char> buffer(READ_CHUNK_SIZE);
    std::vector<std::string> lines;
    std::string pending;
    std::uintmax_t consumed = 0;

    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        std::streamsize count = file.gcount();
        consumed += static_cast<std::uintmax_t>(count);
        pending.append(buffer.data(), static_cast<size_t>(count));

        lines.clear();
        takeCompleteLines(pending, lines);
        for (auto& line : lines) {
            window.push_back(std::move(line));
            if (m_tailLines > 0 && window.size() > static_cast<size_t>(m_tailLines)) {
                window.pop_front();
            }
        }
    }
    if (file.bad()) {
        return fail("failed to read log file " + m_path, errorMessage);
    }
    file.close();

    m_cursor.offset = consumed;
    m_cursor.lastSize = consumed;
    m_cursor.pending = pending;
    m_cursor.vanished = false;
    fileIdentity(m_path, m_cursor.device, m_cursor.inode);

    for (const auto& line : window) {
        if (!emitLine(line, errorMessage)) {
            return false;
        }
    }
    m_out.flush();
    if (!m_out) {
        return fail("failed to write log output", errorMessage);
    }

    m_state = State::Polling;
    return true;
}

bool LogFollower::poll(std::string& errorMessage) {
    if (m_state == State::Init) {
        return start(errorMessage);
    }
    if (m_state == State::Done) {
        return true;
    }

    std::error_code ec;
    std::uintmax_t size = fs::file_size(m_path, ec);
    std::uintmax_t device = 0;
    std::uintmax_t inode = 0;
    if (ec || !fileIdentity(m_path, device, inode)) {
        // Missing while being rotated; wait for it to come back
        m_cursor.vanished = true;
        return true;
    }

    if (m_cursor.vanished) {
        restartFromBeginning("was recreated");
    } else if (device != m_cursor.device || inode != m_cursor.inode) {
        restartFromBeginning("was replaced");
    } else if (size < m_cursor.offset) {
        restartFromBeginning("was truncated");
    }
    m_cursor.device = device;
    m_cursor.inode = inode;
    m_cursor.lastSize = size;
    if (size == m_cursor.offset) {
        return true;
    }

    std::string chunk;
    if (!readNewBytes(chunk, errorMessage)) {
        return false;
    }
    m_cursor.pending += chunk;

    std::vector<std::string> lines;
    takeCompleteLines(m_cursor.pending, lines);
    for (const auto& line : lines) {
        if (!emitLine(line, errorMessage)) {
            return false;
        }
    }
    m_out.flush();
    if (!m_out) {
        return fail("failed to write log output", errorMessage);
    }
    return true;
}

void LogFollower::stop() {
    m_state = State::Done;
    m_cursor.pending.clear();
}

bool LogFollower::run(const CancellationToken& cancel, std::chrono::milliseconds pollInterval,
                      std::string& errorMessage) {
    if (cancel.isCancelled()) {
        stop();
        return true;
    }

    if (!start(errorMessage)) {
        return false;
    }

    while (!cancel.waitFor(pollInterval)) {
        if (!poll(errorMessage)) {
            return false;
        }
    }

    stop();
    return true;
}

void LogFollower::restartFromBeginning(const char* reason) {
    std::cerr << "Warning: log file " << m_path << " " << reason << ", reading from the start" << std::endl;
    m_cursor.offset = 0;
    m_cursor.pending.clear();
    m_cursor.vanished = false;
}

bool LogFollower::readNewBytes(std::string& chunk, std::string& errorMessage) {
    std::ifstream file;
    if (!openLogFile(m_path, file, errorMessage)) {
        std::error_code ec;
        if (!fs::exists(m_path, ec)) {
            // Removed after the size check; the next poll waits for it
            errorMessage.clear();
            m_cursor.vanished = true;
            return true;
        }
        m_state = State::Done;
        return false;
    }

    file.seekg(static_cast<std::streamoff>(m_cursor.offset));
    if (!file) {
        return fail("failed to seek in log file " + m_path, errorMessage);
    }

    std::vector<char> buffer(READ_CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        std::streamsize count = file.gcount();
        chunk.append(buffer.data(), static_cast<size_t>(count));
        m_cursor.offset += static_cast<std::uintmax_t>(count);
    }
    if (file.bad()) {
        return fail("failed to read log file " + m_path, errorMessage);
    }
    return true;
}

bool LogFollower::emitLine(const std::string& line, std::string& errorMessage) {
    m_out << line << '\n';
    if (!m_out) {
        return fail("failed to write log output", errorMessage);
    }
    return true;
}

bool LogFollower::fail(const std::string& message, std::string& errorMessage) {
    m_state = State::Done;
    errorMessage = message;
    return false;
}

bool LogReader::tail(const std::string& path, int lastLines, std::ostream& out, std::string& errorMessage) {
    std::ifstream file;
    if (!openLogFile(path, file, errorMessage)) {
        return false;
    }

    std::deque<std::string> window;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        window.push_back(line);
        if (lastLines > 0 && window.size() > static_cast<size_t>(lastLines)) {
            window.pop_front();
        }
    }
    if (file.bad()) {
        errorMessage = "failed to read log file " + path;
        return false;
    }
    file.close();

    for (const auto& entry : window) {
        out << entry << '\n';
    }
    out.flush();
    if (!out) {
        errorMessage = "failed to write log output";
        return false;
    }
    return true;
}

bool LogReader::follow(const CancellationToken& cancel, const std::string& path, int lastLines,
                       std::ostream& out, std::string& errorMessage,
                       std::chrono::milliseconds pollInterval) {
    LogFollower follower(path, lastLines, out);
    return follower.run(cancel, pollInterval, errorMessage);
}

std::string LogReader::openFailureMessage(const std::string& path, int systemError) {
    std::error_code ec;
    if (!fs::exists(path, ec) || systemError == ENOENT) {
        return "failed to open log file " + path + ": no such file or directory";
    }
    if (systemError == 0) {
        return "failed to open log file " + path + ": unable to open file";
    }
    return "failed to open log file " + path + ": " + std::generic_category().message(systemError);
}
