#include "modelctl_cli.h"
#include "app_paths.h"
#include "http_client.h"
#include "log_follower.h"
#include "modelfile.h"
#include "number_format.h"
#include "report_renderer.h"
#include "version.h"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <vector>

#ifdef _WIN32
#include <windows.h>
#endif

namespace
{

// Rewrites one status line in place; a new status starts a new line
class ProgressPrinter
{
public:
    explicit ProgressPrinter(std::ostream &out) : m_out(out) {}

    void update(const ProgressUpdate &progress)
    {
        if (!m_lastStatus.empty() && progress.status != m_lastStatus)
        {
            m_out << "\n";
        }
        m_lastStatus = progress.status;

        m_out << "\r" << progress.status;
        if (progress.total > 0)
        {
            double percentage = (static_cast<double>(progress.completed) / progress.total) * 100.0;
            m_out << " " << NumberFormat::formatBytes(progress.completed) << "/"
                  << NumberFormat::formatBytes(progress.total)
                  << " (" << static_cast<int>(percentage) << "%)";
        }
        m_out << std::flush;
    }

    void finish()
    {
        if (!m_lastStatus.empty())
        {
            m_out << "\n";
            m_lastStatus.clear();
        }
    }

private:
    std::ostream &m_out;
    std::string m_lastStatus;
};

} // namespace

// Static member initialization
ModelctlCLI *ModelctlCLI::s_instance = nullptr;
const int ModelctlCLI::EXIT_FAILED = 1;
const int ModelctlCLI::EXIT_UNREACHABLE = 2;

void ModelctlCLI::initialize()
{
#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
#endif

    m_config = ConfigLoader::load();

    HttpClient::initialize();
    HttpClient::setTimeout(m_config.requestTimeout);
    m_client = std::make_unique<ModelClient>(m_config.host);

    s_instance = this;
    std::signal(SIGINT, signalHandler);  // Ctrl+C
    std::signal(SIGTERM, signalHandler); // Termination request
#ifdef _WIN32
    SetConsoleCtrlHandler([](DWORD dwCtrlType) -> BOOL
                          {
        if (dwCtrlType == CTRL_C_EVENT || dwCtrlType == CTRL_BREAK_EVENT) {
            if (ModelctlCLI::s_instance && ModelctlCLI::s_instance->m_following.load()) {
                ModelctlCLI::s_instance->requestStop();
                return TRUE;
            }
        }
        return FALSE; }, TRUE);
#endif
}

void ModelctlCLI::cleanup()
{
    // Reset signal instance before destroying the client
    s_instance = nullptr;

    m_client.reset();
    HttpClient::cleanup();
}

bool ModelctlCLI::ensureServerConnection()
{
    if (!m_client)
    {
        std::cerr << "Error: Client not initialized\n";
        return false;
    }

    if (!m_client->isServerRunning())
    {
        std::cerr << "Error: could not connect to the model server at " << m_config.host << "\n";
        std::cerr << "   Start the server, or set MODELCTL_HOST to the address it listens on\n";
        return false;
    }
    return true;
}

int ModelctlCLI::showModel(const std::string &modelName, bool verbose)
{
    if (!ensureServerConnection())
    {
        return EXIT_UNREACHABLE;
    }

    ModelDescription description;
    std::string errorMessage;
    if (!m_client->showModel(modelName, verbose, description, errorMessage))
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }

    if (!ReportRenderer::render(description, verbose, std::cout, errorMessage))
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }
    return 0;
}

int ModelctlCLI::listModels(const std::string &prefix)
{
    if (!ensureServerConnection())
    {
        return EXIT_UNREACHABLE;
    }

    std::vector<ModelSummary> models;
    std::string errorMessage;
    if (!m_client->listModels(models, errorMessage))
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }

    if (!ReportRenderer::renderModelList(models, prefix, std::chrono::system_clock::now(), std::cout, errorMessage))
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }
    return 0;
}

int ModelctlCLI::createModel(const std::string &modelName, const std::string &modelfilePath,
                             const std::string &sourceModel)
{
    CreateRequest request;
    std::string errorMessage;

    // A broken Modelfile is reported before contacting the server
    if (sourceModel.empty())
    {
        std::error_code ec;
        const std::string workingDirectory = std::filesystem::current_path(ec).string();
        std::string path;
        if (!Modelfile::resolvePath(modelfilePath, workingDirectory, path, errorMessage) ||
            !Modelfile::load(path, request, errorMessage))
        {
            std::cerr << "Error: " << errorMessage << "\n";
            return EXIT_FAILED;
        }
        request.model = modelName;
    }

    if (!ensureServerConnection())
    {
        return EXIT_UNREACHABLE;
    }

    if (!sourceModel.empty())
    {
        ModelDescription description;
        if (!m_client->showModel(sourceModel, false, description, errorMessage))
        {
            std::cerr << "Error: " << errorMessage << "\n";
            return EXIT_FAILED;
        }
        request = Modelfile::derivedRequest(modelName, sourceModel, description.details.parentModel,
                                            description.system,
                                            Modelfile::parseParameterText(description.parameters),
                                            description.messages);
    }

    ProgressPrinter progress(std::cerr);
    bool created = m_client->createModel(request, [&progress](const ProgressUpdate &update)
                                         { progress.update(update); }, errorMessage);
    progress.finish();

    if (!created)
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }
    return 0;
}

int ModelctlCLI::pushModel(const std::string &modelName, bool insecure)
{
    if (!ensureServerConnection())
    {
        return EXIT_UNREACHABLE;
    }

    std::string errorMessage;
    ProgressPrinter progress(std::cerr);
    bool pushed = m_client->pushModel(modelName, insecure, [&progress](const ProgressUpdate &update)
                                      { progress.update(update); }, errorMessage);
    progress.finish();

    if (!pushed)
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }

    std::cout << "\nYou can find your model at:\n\n";
    std::cout << "\t" << ModelClient::pushDestination(modelName) << "\n";
    return 0;
}

int ModelctlCLI::deleteModels(const std::vector<std::string> &modelNames)
{
    if (!ensureServerConnection())
    {
        return EXIT_UNREACHABLE;
    }

    for (const auto &modelName : modelNames)
    {
        std::string errorMessage;
        if (!m_client->deleteModel(modelName, errorMessage))
        {
            std::cerr << "Error: " << errorMessage << "\n";
            return EXIT_FAILED;
        }
        std::cout << "deleted '" << modelName << "'\n";
    }
    return 0;
}

int ModelctlCLI::showLogs(const LogOptions &options)
{
    const std::string path = options.appLog ? AppPaths::appLogFile(m_config.logDirectory)
                                            : AppPaths::serverLogFile(m_config.logDirectory);

    std::string errorMessage;
    bool success;
    if (options.follow)
    {
        m_following.store(true);
        success = LogReader::follow(m_followCancel, path, options.tail, std::cout, errorMessage,
                                    std::chrono::milliseconds(m_config.pollIntervalMs));
        m_following.store(false);
    }
    else
    {
        success = LogReader::tail(path, options.tail, std::cout, errorMessage);
    }

    if (!success)
    {
        std::cerr << "Error: " << errorMessage << "\n";
        return EXIT_FAILED;
    }
    return 0;
}

int ModelctlCLI::showVersion()
{
    std::cout << "client version is " << MODELCTL_VERSION << "\n";

    std::string serverVersion;
    std::string errorMessage;
    if (!m_client || !m_client->getVersion(serverVersion, errorMessage))
    {
        std::cerr << "Warning: could not read server version from " << m_config.host;
        if (!errorMessage.empty())
        {
            std::cerr << ": " << errorMessage;
        }
        std::cerr << "\n";
        return 0;
    }

    std::cout << "server version is " << serverVersion << "\n";
    return 0;
}

void ModelctlCLI::requestStop()
{
    m_followCancel.requestCancel();
}

void ModelctlCLI::signalHandler(int signal)
{
    // While following logs an interrupt only ends the follow loop
    if (s_instance && s_instance->m_following.load())
    {
        s_instance->requestStop();
        return;
    }

    // Reset signal handler to default and re-raise signal for clean exit
    std::signal(signal, SIG_DFL);
    std::raise(signal);
}
