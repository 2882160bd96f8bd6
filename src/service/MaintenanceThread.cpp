#include "MaintenanceThread.h"
#include "../core/SessionLogger.h"

MaintenanceThread::MaintenanceThread(const Settings& maintenanceSettings, WorkspaceJanitor& workspaceJanitor, RenderJobStore* jobStore)
    : juce::Thread("Maintenance"),
      settings(maintenanceSettings),
      janitor(workspaceJanitor),
      store(jobStore)
{
}

MaintenanceThread::~MaintenanceThread()
{
    stopThread(10000);
}

MaintenanceThread::PassResult MaintenanceThread::runOnce()
{
    PassResult result;
    result.entriesSwept = janitor.sweep(settings.sweepMaxAge);

    if (store != nullptr)
        result.jobsFailed = store->failStaleJobs(settings.staleJobAge);

    if (result.entriesSwept > 0 || result.jobsFailed > 0)
        RenderLog::info("maintenance.pass", { { "swept", result.entriesSwept },
                                              { "staleJobsFailed", result.jobsFailed } });

    return result;
}

void MaintenanceThread::run()
{
    const int intervalMs = (int) juce::jmax((juce::int64) 1000, settings.interval.inMilliseconds());

    while (!threadShouldExit())
    {
        runOnce();
        wait(intervalMs);
    }
}
