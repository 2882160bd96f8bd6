#include "WorkspaceJanitor.h"
#include "../core/SessionLogger.h"

WorkspaceJanitor::WorkspaceJanitor(const juce::File& rootDirectory)
    : root(rootDirectory)
{
}

bool WorkspaceJanitor::isValidRenderId(const juce::String& renderId)
{
    return renderId.isNotEmpty()
        && renderId.length() <= 128
        && renderId.containsOnly("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-");
}

juce::File WorkspaceJanitor::getWorkspace(const juce::String& renderId) const
{
    jassert(isValidRenderId(renderId));
    return root.getChildFile(workspacePrefix + renderId);
}

juce::Result WorkspaceJanitor::createWorkspace(const juce::String& renderId, juce::File& workspace)
{
    if (!isValidRenderId(renderId))
        return juce::Result::fail("Invalid render id: " + renderId);

    juce::ScopedLock sl(lock);

    const juce::Result rootResult = root.createDirectory();
    if (rootResult.failed())
        return juce::Result::fail("Cannot create work root " + root.getFullPathName() + ": " + rootResult.getErrorMessage());

    workspace = getWorkspace(renderId);

    if (workspace.exists() && !workspace.deleteRecursively())
        return juce::Result::fail("Cannot clear stale workspace " + workspace.getFullPathName());

    const juce::Result created = workspace.createDirectory();
    if (created.failed())
        return juce::Result::fail("Cannot create workspace " + workspace.getFullPathName() + ": " + created.getErrorMessage());

    return juce::Result::ok();
}

bool WorkspaceJanitor::cleanup(const juce::String& renderId)
{
    if (!isValidRenderId(renderId))
        return false;

    const juce::File workspace = getWorkspace(renderId);

    if (workspace.exists() && !workspace.deleteRecursively())
    {
        RenderLog::warn("janitor.cleanup_failed", { { "renderId", renderId } });
        return false;
    }

    return true;
}

juce::File WorkspaceJanitor::getSpoolDirectory() const
{
    return root.getChildFile(spoolDirectoryName);
}

juce::File WorkspaceJanitor::getSpooledArtifact(const juce::String& renderId) const
{
    if (!isValidRenderId(renderId))
        return {};

    return getSpoolDirectory().getChildFile(renderId + ".mp4");
}

bool WorkspaceJanitor::removeSpooledArtifact(const juce::String& renderId)
{
    const juce::File artifact = getSpooledArtifact(renderId);
    return artifact == juce::File() || !artifact.exists() || artifact.deleteFile();
}

int WorkspaceJanitor::sweep(juce::RelativeTime maxAge)
{
    if (!root.isDirectory())
        return 0;

    juce::ScopedLock sl(lock);

    const juce::Time cutoff = juce::Time::getCurrentTime() - maxAge;
    int removed = 0;

    for (const auto& directory : root.findChildFiles(juce::File::findDirectories, false, juce::String(workspacePrefix) + "*"))
    {
        if (directory.getLastModificationTime() < cutoff && directory.deleteRecursively())
            ++removed;
    }

    const juce::File spool = getSpoolDirectory();
    if (spool.isDirectory())
    {
        for (const auto& artifact : spool.findChildFiles(juce::File::findFiles, false, "*.mp4"))
        {
            if (artifact.getLastModificationTime() < cutoff && artifact.deleteFile())
                ++removed;
        }
    }

    RenderLog::info("janitor.sweep", { { "removed", removed },
                                       { "maxAgeHours", maxAge.inHours() } });
    return removed;
}
