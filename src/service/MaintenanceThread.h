#pragma once
#include <JuceHeader.h>
#include "../jobs/RenderJobStore.h"
#include "../workspace/WorkspaceJanitor.h"

/**
 * Periodic housekeeping for the job service: sweeps abandoned workspaces and
 * spooled artifacts, and fails jobs whose executor went silent.
 *
 * Runs one pass at start and then every interval until stopped.
 */
class MaintenanceThread : public juce::Thread
{
public:
    struct Settings
    {
        juce::RelativeTime sweepMaxAge = WorkspaceJanitor::defaultMaxAge();
        juce::RelativeTime staleJobAge = juce::RelativeTime::seconds(360);
        juce::RelativeTime interval = juce::RelativeTime::minutes(60);
    };

    struct PassResult
    {
        int entriesSwept = 0;
        int jobsFailed = 0;
    };

    /** @param store  job store to scan for stale jobs, or nullptr on a worker */
    MaintenanceThread(const Settings& settings, WorkspaceJanitor& janitor, RenderJobStore* store);
    ~MaintenanceThread() override;

    PassResult runOnce();

    void run() override;

private:
    Settings settings;
    WorkspaceJanitor& janitor;
    RenderJobStore* store;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MaintenanceThread)
};
