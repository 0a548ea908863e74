#ifndef APP_PATHS_H
#define APP_PATHS_H

#include <string>

/**
 * @brief Platform-specific locations used by modelctl
 */
class AppPaths {
public:
    /**
     * @brief Get the current user's home directory
     * @return Home directory, or "." if it cannot be determined
     */
    static std::string homeDirectory();

    /**
     * @brief Default directory holding the server and app logs
     * @return ~/.modelctl/logs on Unix, %LOCALAPPDATA%\modelctl\logs on Windows
     */
    static std::string defaultLogDirectory();

    /**
     * @brief Directory searched for the user config file
     * @return ~/.config/modelctl on Unix, %APPDATA%\modelctl on Windows
     */
    static std::string configDirectory();

    /**
     * @brief Path of the server log inside a log directory
     */
    static std::string serverLogFile(const std::string& logDirectory);

    /**
     * @brief Path of the desktop app log inside a log directory
     */
    static std::string appLogFile(const std::string& logDirectory);
};

#endif // APP_PATHS_H
