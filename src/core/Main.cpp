/*
  ==============================================================================
    Main.cpp - Application Entry Point
  ==============================================================================
*/

#include <JuceHeader.h>
#include <atomic>
#include <csignal>
#include <iostream>
#include "ProcessManager.h"
#include "ServiceConfig.h"
#include "SessionLogger.h"
#include "../jobs/RenderJobStore.h"
#include "../jobs/ProjectCatalog.h"
#include "../jobs/RenderQueue.h"
#include "../jobs/WorkerDispatcher.h"
#include "../rendering/ArtifactPublisher.h"
#include "../rendering/FFmpegExecutor.h"
#include "../rendering/RenderOrchestrator.h"
#include "../service/MaintenanceThread.h"
#include "../service/RemoteWorker.h"
#include "../service/RenderService.h"
#include "../workspace/WorkspaceJanitor.h"

namespace
{
    std::atomic<bool> stopRequested { false };

    void handleStopSignal(int)
    {
        stopRequested = true;
    }

    void waitForStopSignal()
    {
        std::signal(SIGINT, handleStopSignal);
        std::signal(SIGTERM, handleStopSignal);

        while (!stopRequested)
            juce::Thread::sleep(200);
    }

    //==============================================================================
    /** Installs a SessionLogger for the lifetime of a command and brackets it with banner lines. */
    class ScopedSessionLog
    {
    public:
        ScopedSessionLog(const ServiceConfig& config, const juce::String& command)
        {
            const juce::File directory = config.logsRoot != juce::File() ? config.logsRoot
                                                                         : config.dataRoot.getChildFile("logs");

            logger = std::make_unique<SessionLogger>(SessionLogger::createSessionLogFile(directory, "musicreel_" + command), true);
            juce::Logger::setCurrentLogger(logger.get());

            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("MusicReel " + command + " started: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("Version: " + juce::String(ProjectInfo::versionString));
            juce::Logger::writeToLog("----------------------------------------------------");
        }

        ~ScopedSessionLog()
        {
            juce::Logger::writeToLog("----------------------------------------------------");
            juce::Logger::writeToLog("Shutting down: " + juce::Time::getCurrentTime().toString(true, true));
            juce::Logger::writeToLog("----------------------------------------------------");

            const int killed = ProcessManager::getInstance().terminateAllProcesses();
            if (killed > 0)
                juce::Logger::writeToLog("Killed " + juce::String(killed) + " encoder processes on exit");

            juce::Logger::setCurrentLogger(nullptr);
            logger = nullptr;
        }

    private:
        std::unique_ptr<SessionLogger> logger;
    };

    //==============================================================================
    ServiceConfig loadConfig(const juce::ArgumentList& args)
    {
        ServiceConfig config = ServiceConfig::fromEnvironment();
        config.applyArguments(args);

        const juce::Result valid = config.validate();
        if (valid.failed())
            juce::ConsoleApplication::fail("Invalid configuration: " + valid.getErrorMessage());

        return config;
    }

    std::unique_ptr<ArtifactStorage> createStorage(const ServiceConfig& config)
    {
        if (!config.hasStorage())
            return nullptr;

        return std::make_unique<HttpArtifactStorage>(config.storageUploadUrl,
                                                     config.storagePublicUrl,
                                                     config.storageToken);
    }

    MaintenanceThread::Settings maintenanceSettings(const ServiceConfig& config)
    {
        MaintenanceThread::Settings settings;
        settings.sweepMaxAge = juce::RelativeTime::hours(config.sweepMaxAgeHours);
        settings.staleJobAge = juce::RelativeTime::seconds(config.jobTimeoutSeconds + 60);
        settings.interval = juce::RelativeTime::minutes(config.sweepIntervalMinutes);
        return settings;
    }

    //==============================================================================
    void runServe(const juce::ArgumentList& args)
    {
        const ServiceConfig config = loadConfig(args);
        ScopedSessionLog session(config, "serve");

        WorkspaceJanitor janitor(config.workRoot);
        RenderJobStore store(config.getJobsDirectory());
        ProjectCatalog projects(config.getProjectsDirectory());
        ArtifactPublisher publisher(createStorage(config), janitor, config.getPublicBaseUrl());

        std::unique_ptr<RenderQueue> queue;
        if (!config.usesRemoteWorker())
            queue = std::make_unique<RenderQueue>(RenderOrchestrator::Settings::fromConfig(config),
                                                  config.maxConcurrentRenders, store, projects, janitor, publisher);

        WorkerDispatcher dispatcher(WorkerDispatcher::Settings::fromConfig(config), store, queue.get());
        MaintenanceThread maintenance(maintenanceSettings(config), janitor, &store);
        RenderService service(config, store, projects, janitor, dispatcher);

        const juce::Result started = service.start();
        if (started.failed())
            juce::ConsoleApplication::fail(started.getErrorMessage());

        juce::Logger::writeToLog(config.usesRemoteWorker() ? "Dispatching renders to " + config.workerUrl
                                                           : "Rendering in process, concurrency " + juce::String(config.maxConcurrentRenders));

        maintenance.startThread();
        waitForStopSignal();

        service.stop();
        maintenance.stopThread(10000);
        ProcessManager::getInstance().terminateAllProcesses();
        queue = nullptr;
    }

    void runWorker(const juce::ArgumentList& args)
    {
        const ServiceConfig config = loadConfig(args);

        if (config.internalSecret.isEmpty())
            juce::ConsoleApplication::fail("INTERNAL_RENDER_SECRET is required in worker mode");

        ScopedSessionLog session(config, "worker");

        WorkspaceJanitor janitor(config.workRoot);
        ArtifactPublisher publisher(createStorage(config), janitor, config.getPublicBaseUrl());
        MaintenanceThread maintenance(maintenanceSettings(config), janitor, nullptr);
        RemoteWorker worker(config, janitor, publisher);

        const juce::Result started = worker.start();
        if (started.failed())
            juce::ConsoleApplication::fail(started.getErrorMessage());

        maintenance.startThread();
        waitForStopSignal();

        worker.stop();
        maintenance.stopThread(10000);
        ProcessManager::getInstance().terminateAllProcesses();
    }

    void runStoredRender(const juce::ArgumentList& args)
    {
        const juce::String userId = args.getValueForOption("--user");
        const juce::String renderId = args.getValueForOption("--render");

        if (userId.isEmpty() || renderId.isEmpty())
            juce::ConsoleApplication::fail("run needs --user=<userId> and --render=<renderId>");

        const ServiceConfig config = loadConfig(args);
        ScopedSessionLog session(config, "run");

        WorkspaceJanitor janitor(config.workRoot);
        RenderJobStore store(config.getJobsDirectory());
        ProjectCatalog projects(config.getProjectsDirectory());
        ArtifactPublisher publisher(createStorage(config), janitor, config.getPublicBaseUrl());

        RenderOrchestrator orchestrator(RenderOrchestrator::Settings::fromConfig(config), janitor, publisher);
        const auto outcome = orchestrator.runStoredJob(store, projects, userId, renderId);

        if (!outcome.ran)
        {
            std::cout << "Render " << renderId << " skipped: " << outcome.error << std::endl;
            return;
        }

        if (!outcome.succeeded)
            juce::ConsoleApplication::fail("Render failed: " + outcome.error);

        std::cout << "Render " << renderId << " complete (" << RenderTypes::toString(outcome.strategy)
                  << "): " << outcome.outputUrl << std::endl;
    }

    void runSweep(const juce::ArgumentList& args)
    {
        const ServiceConfig config = loadConfig(args);
        ScopedSessionLog session(config, "sweep");

        WorkspaceJanitor janitor(config.workRoot);
        RenderJobStore store(config.getJobsDirectory());
        MaintenanceThread maintenance(maintenanceSettings(config), janitor, &store);

        const auto pass = maintenance.runOnce();
        std::cout << "Swept " << pass.entriesSwept << " entries, failed "
                  << pass.jobsFailed << " stale jobs" << std::endl;
    }

    void runDiag(const juce::ArgumentList& args)
    {
        const ServiceConfig config = loadConfig(args);

        FFmpegExecutor executor(config.ffmpegPath, config.ffprobePath);
        const juce::String version = executor.getVersionString();

        if (version.isEmpty())
            juce::ConsoleApplication::fail("FFmpeg not available at " + executor.getFFmpegPath());

        std::cout << "ffmpeg:  " << executor.getFFmpegPath() << std::endl
                  << "ffprobe: " << executor.getFFprobePath() << std::endl
                  << version << std::endl;
    }
}

//==============================================================================
int main(int argc, char* argv[])
{
    juce::ConsoleApplication app;

    app.addHelpCommand("--help|-h", "MusicReel render engine", true);
    app.addVersionCommand("--version|-v", "MusicReel " + juce::String(ProjectInfo::versionString));

    app.addCommand({ "serve",
                     "serve [--port=N] [--data=DIR] [--work=DIR] [--worker-url=URL]",
                     "Runs the render job service",
                     "Serves the job API, renders in process (or dispatches to a remote worker) "
                     "and sweeps abandoned workspaces until SIGINT or SIGTERM.",
                     runServe });

    app.addCommand({ "worker",
                     "worker [--port=N] [--work=DIR]",
                     "Runs the remote encoding worker",
                     "Accepts dispatched renders on POST /render and reports back through the "
                     "service callback endpoint.",
                     runWorker });

    app.addCommand({ "run",
                     "run --user=USER --render=RENDER_ID",
                     "Renders one stored job in this process",
                     "Claims a pending job from the store and renders it. A job that is no longer "
                     "pending is left alone.",
                     runStoredRender });

    app.addCommand({ "sweep",
                     "sweep",
                     "Removes abandoned workspaces and fails stale jobs",
                     {},
                     runSweep });

    app.addCommand({ "diag",
                     "diag [--ffmpeg=PATH]",
                     "Reports the FFmpeg in use",
                     {},
                     runDiag });

    return app.findAndRunCommand(argc, argv);
}
