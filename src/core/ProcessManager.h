#pragma once
#include <JuceHeader.h>

/**
 * Process registry singleton that tracks every running encoder process.
 * Shutdown (signal or command end) kills whatever is still registered so no
 * FFmpeg outlives the service.
 */
class ProcessManager
{
public:
    static ProcessManager& getInstance()
    {
        static ProcessManager instance;
        return instance;
    }

    void registerProcess(juce::ChildProcess* process, const juce::String& description = "")
    {
        juce::ScopedLock lock(criticalSection);
        activeProcesses.add(process);
        processDescriptions.set(process, description);
        ++totalRegistered;
    }

    void unregisterProcess(juce::ChildProcess* process)
    {
        juce::ScopedLock lock(criticalSection);
        activeProcesses.removeFirstMatchingValue(process);
        processDescriptions.remove(process);
    }

    int getNumActiveProcesses() const
    {
        juce::ScopedLock lock(criticalSection);
        return activeProcesses.size();
    }

    /** Number of processes ever registered in this run */
    juce::int64 getTotalRegistered() const
    {
        juce::ScopedLock lock(criticalSection);
        return totalRegistered;
    }

    /** Descriptions of the encoders running right now, for diagnostics */
    juce::StringArray getActiveDescriptions() const
    {
        juce::ScopedLock lock(criticalSection);
        juce::StringArray descriptions;

        for (auto* process : activeProcesses)
            descriptions.add(processDescriptions[process]);

        return descriptions;
    }

    /** Kills every registered process that is still running. Returns the number killed. */
    int terminateAllProcesses()
    {
        juce::ScopedLock lock(criticalSection);
        int killed = 0;

        for (auto* process : activeProcesses)
        {
            if (process == nullptr || !process->isRunning())
                continue;

            juce::Logger::writeToLog("Killing encoder: " + processDescriptions[process]);

            if (process->kill())
                ++killed;
        }

        return killed;
    }

private:
    ProcessManager() = default;

    juce::Array<juce::ChildProcess*> activeProcesses;
    juce::HashMap<juce::ChildProcess*, juce::String> processDescriptions;
    juce::int64 totalRegistered = 0;
    juce::CriticalSection criticalSection;

    ProcessManager(const ProcessManager&) = delete;
    ProcessManager& operator=(const ProcessManager&) = delete;
};

/**
 * ChildProcess that registers itself with the ProcessManager for its lifetime
 * and is killed on destruction if still running.
 */
class ManagedChildProcess : public juce::ChildProcess
{
public:
    explicit ManagedChildProcess(const juce::String& processDescription = "")
        : description(processDescription)
    {
        ProcessManager::getInstance().registerProcess(this, description);
    }

    ~ManagedChildProcess()
    {
        if (isRunning())
            kill();

        ProcessManager::getInstance().unregisterProcess(this);
    }

private:
    juce::String description;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ManagedChildProcess)
};
