#pragma once
#include <JuceHeader.h>
#include "RenderPayload.h"

/**
 * Read access to project documents ("<root>/<projectId>.json").
 *
 * Projects are owned by the surrounding application; the render engine only
 * reads the audio reference, storyboard and assets out of them.
 */
class ProjectCatalog
{
public:
    explicit ProjectCatalog(const juce::File& rootDirectory);

    static bool isValidProjectId(const juce::String& projectId);

    bool exists(const juce::String& projectId) const;

    /** Loads and parses a project into a render payload. */
    juce::Result load(const juce::String& projectId, RenderPayload& payload) const;

    /** Stores a project document; used by import tooling and tests. */
    juce::Result save(const juce::String& projectId, const juce::var& document);

private:
    juce::File getProjectFile(const juce::String& projectId) const;

    juce::File root;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProjectCatalog)
};
