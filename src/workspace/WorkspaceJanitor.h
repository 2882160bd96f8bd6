#pragma once
#include <JuceHeader.h>

/**
 * Owns the shared scratch root.
 *
 * Every job gets "<root>/render_<renderId>" for its intermediate files, and
 * published-but-not-uploaded artifacts are spooled in "<root>/published".
 * sweep() is the safety net for jobs whose process died before cleanup.
 */
class WorkspaceJanitor
{
public:
    static constexpr const char* workspacePrefix = "render_";
    static constexpr const char* spoolDirectoryName = "published";

    explicit WorkspaceJanitor(const juce::File& rootDirectory);

    const juce::File& getRoot() const { return root; }

    /** Render ids become path components, so only [A-Za-z0-9_-] is accepted. */
    static bool isValidRenderId(const juce::String& renderId);

    juce::File getWorkspace(const juce::String& renderId) const;

    /**
     * Creates an empty workspace for the job, discarding leftovers from a
     * previous attempt with the same id.
     */
    juce::Result createWorkspace(const juce::String& renderId, juce::File& workspace);

    /** Recursively removes the job's workspace. Returns true if nothing remains. */
    bool cleanup(const juce::String& renderId);

    juce::File getSpoolDirectory() const;
    juce::File getSpooledArtifact(const juce::String& renderId) const;

    /** Removes the spooled artifact of a job, if any. */
    bool removeSpooledArtifact(const juce::String& renderId);

    /**
     * Removes every workspace directory and spooled artifact whose last
     * modification is older than maxAge, whatever job it belonged to.
     *
     * @return number of entries removed
     */
    int sweep(juce::RelativeTime maxAge);

    static juce::RelativeTime defaultMaxAge() { return juce::RelativeTime::hours(24); }

private:
    juce::File root;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WorkspaceJanitor)
};
