#ifndef LOG_FOLLOWER_H
#define LOG_FOLLOWER_H

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include "cancellation_token.h"

/**
 * @brief Streams a growing log file: last lines first, then appended lines
 *
 * The follower is a small state machine:
 * - Init: nothing read yet; start() emits the tail window and moves to Polling
 * - Polling: each poll() emits lines completed since the previous call
 * - Done: stop() or a fatal error; nothing more is emitted
 *
 * Only complete lines are written. Bytes after the last line break are kept
 * as a pending fragment until their line break arrives. If the file shrinks
 * below the read offset, disappears and comes back, or is replaced by a
 * different file, it is read again from the start.
 */
class LogFollower {
public:
    enum class State {
        Init,
        Polling,
        Done
    };

    /**
     * @brief Constructor
     * @param path Path of the log file
     * @param tailLines Number of existing lines to emit first (0 or less: all)
     * @param out Stream receiving the lines
     */
    LogFollower(const std::string& path, int tailLines, std::ostream& out);

    /**
     * @brief Emit the initial window and record the end-of-file offset (Init -> Polling)
     * @param errorMessage Output: reason for failure
     * @return False if the file could not be opened or read, or the output failed
     */
    bool start(std::string& errorMessage);

    /**
     * @brief Check the file once and emit newly completed lines
     *
     * Calls start() if the follower is still in Init; does nothing once Done.
     * @param errorMessage Output: reason for failure
     * @return False on a read or output failure (the follower is then Done)
     */
    bool poll(std::string& errorMessage);

    /**
     * @brief Stop following; any pending fragment is discarded
     */
    void stop();

    /**
     * @brief start(), then poll() every interval until cancelled
     * @param cancel Cancellation signal, checked before starting and after every wait
     * @param pollInterval Time between two polls
     * @param errorMessage Output: reason for failure
     * @return True when stopped by cancellation, false on failure
     */
    bool run(const CancellationToken& cancel, std::chrono::milliseconds pollInterval,
             std::string& errorMessage);

    State state() const { return m_state; }
    std::uintmax_t offset() const { return m_cursor.offset; }
    const std::string& pendingFragment() const { return m_cursor.pending; }
    const std::string& path() const { return m_path; }

private:
    struct TailCursor {
        std::uintmax_t offset = 0;      ///< Bytes consumed from the start of the file
        std::uintmax_t lastSize = 0;    ///< File size seen by the last check
        std::string pending;            ///< Bytes after the last line break
        bool vanished = false;          ///< The file was missing at the last check
        std::uintmax_t device = 0;      ///< Device of the file being read (0 if unknown)
        std::uintmax_t inode = 0;       ///< Inode of the file being read (0 if unknown)
    };

    std::string m_path;
    int m_tailLines;
    std::ostream& m_out;
    State m_state;
    TailCursor m_cursor;

    bool readNewBytes(std::string& chunk, std::string& errorMessage);
    void restartFromBeginning(const char* reason);
    bool emitLine(const std::string& line, std::string& errorMessage);
    bool fail(const std::string& message, std::string& errorMessage);
};

/**
 * @brief Entry points for showing log files
 */
class LogReader {
public:
    static const std::chrono::milliseconds DEFAULT_POLL_INTERVAL;

    /**
     * @brief Write the last lines of a file
     * @param path Path of the log file
     * @param lastLines Number of lines to write (0 or less: the whole file)
     * @param out Stream receiving the lines, each terminated by '\n'
     * @param errorMessage Output: reason for failure
     * @return False if the file could not be opened or read, or the output failed
     */
    static bool tail(const std::string& path, int lastLines, std::ostream& out, std::string& errorMessage);

    /**
     * @brief Write the last lines of a file, then new lines as they are appended
     * @param cancel Cancellation signal; cancellation is not an error
     * @param path Path of the log file
     * @param lastLines Number of existing lines to write first (0 or less: all)
     * @param out Stream receiving the lines
     * @param errorMessage Output: reason for failure
     * @param pollInterval Time between two checks of the file
     * @return True when stopped by cancellation, false on failure
     */
    static bool follow(const CancellationToken& cancel, const std::string& path, int lastLines,
                       std::ostream& out, std::string& errorMessage,
                       std::chrono::milliseconds pollInterval = DEFAULT_POLL_INTERVAL);

    /**
     * @brief Describe why a log file could not be opened
     * @param path Path of the log file
     * @param systemError errno captured right after the failed open
     * @return "failed to open log file <path>: <reason>"
     */
    static std::string openFailureMessage(const std::string& path, int systemError);
};

#endif // LOG_FOLLOWER_H
