#include "app_paths.h"
#include <cstdlib>
#include <filesystem>
#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#include <pwd.h>
#endif

namespace fs = std::filesystem;

static std::string environmentValue(const char* name)
{
#ifdef _WIN32
    char *value = nullptr;
    size_t len = 0;
    std::string result;
    if (_dupenv_s(&value, &len, name) == 0 && value != nullptr)
    {
        result = value;
        free(value);
    }
    return result;
#else
    const char *value = getenv(name);
    return value ? std::string(value) : std::string();
#endif
}

std::string AppPaths::homeDirectory()
{
#ifdef _WIN32
    std::string home = environmentValue("USERPROFILE");
#else
    std::string home = environmentValue("HOME");
    if (home.empty())
    {
        struct passwd *pw = getpwuid(getuid());
        if (pw && pw->pw_dir)
        {
            home = pw->pw_dir;
        }
    }
#endif
    return home.empty() ? std::string(".") : home;
}

std::string AppPaths::defaultLogDirectory()
{
#ifdef _WIN32
    std::string localAppData = environmentValue("LOCALAPPDATA");
    if (!localAppData.empty())
    {
        return (fs::path(localAppData) / "modelctl" / "logs").string();
    }
#endif
    return (fs::path(homeDirectory()) / ".modelctl" / "logs").string();
}

std::string AppPaths::configDirectory()
{
#ifdef _WIN32
    std::string appData = environmentValue("APPDATA");
    if (!appData.empty())
    {
        return (fs::path(appData) / "modelctl").string();
    }
    return (fs::path(homeDirectory()) / "modelctl").string();
#else
    std::string xdgConfig = environmentValue("XDG_CONFIG_HOME");
    if (!xdgConfig.empty())
    {
        return (fs::path(xdgConfig) / "modelctl").string();
    }
    return (fs::path(homeDirectory()) / ".config" / "modelctl").string();
#endif
}

std::string AppPaths::serverLogFile(const std::string &logDirectory)
{
    return (fs::path(logDirectory) / "server.log").string();
}

std::string AppPaths::appLogFile(const std::string &logDirectory)
{
    return (fs::path(logDirectory) / "app.log").string();
}
