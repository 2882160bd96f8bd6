#include "ProjectCatalog.h"

ProjectCatalog::ProjectCatalog(const juce::File& rootDirectory)
    : root(rootDirectory)
{
}

bool ProjectCatalog::isValidProjectId(const juce::String& projectId)
{
    return projectId.isNotEmpty()
        && projectId.length() <= 128
        && projectId.containsOnly("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789_-");
}

juce::File ProjectCatalog::getProjectFile(const juce::String& projectId) const
{
    return root.getChildFile(projectId + ".json");
}

bool ProjectCatalog::exists(const juce::String& projectId) const
{
    return isValidProjectId(projectId) && getProjectFile(projectId).existsAsFile();
}

juce::Result ProjectCatalog::load(const juce::String& projectId, RenderPayload& payload) const
{
    if (!exists(projectId))
        return juce::Result::fail("Project not found");

    juce::var document;
    const juce::Result parsed = juce::JSON::parse(getProjectFile(projectId).loadFileAsString(), document);
    if (parsed.failed())
        return juce::Result::fail("Project " + projectId + " is not valid JSON: " + parsed.getErrorMessage());

    const juce::Result read = RenderPayload::fromVar(document, payload);
    if (read.failed())
        return read;

    payload.projectId = projectId;
    return juce::Result::ok();
}

juce::Result ProjectCatalog::save(const juce::String& projectId, const juce::var& document)
{
    if (!isValidProjectId(projectId))
        return juce::Result::fail("Invalid project id: " + projectId);

    const juce::Result dir = root.createDirectory();
    if (dir.failed())
        return dir;

    const juce::File file = getProjectFile(projectId);
    juce::TemporaryFile temp(file);

    if (!temp.getFile().replaceWithText(juce::JSON::toString(document, false))
        || !temp.overwriteTargetFileWithTemporary())
        return juce::Result::fail("Cannot write " + file.getFullPathName());

    return juce::Result::ok();
}
