#pragma once
#include <JuceHeader.h>

/**
 * Runtime configuration for the render service, the remote worker and the
 * one-shot commands.
 *
 * Values come from compiled defaults, then environment variables, then
 * "--name=value" command-line options, each layer overriding the previous.
 */
struct ServiceConfig
{
    // Network
    juce::String host = "0.0.0.0";
    int port = 8080;
    juce::String publicBaseUrl;

    // Filesystem
    juce::File dataRoot;
    juce::File workRoot;
    juce::File logsRoot;

    // Encoder
    juce::String ffmpegPath;
    juce::String ffprobePath;
    int fps = 30;
    juce::String watermarkText = "MUSICREEL DEMO";

    // Remote worker contract
    juce::String workerUrl;
    juce::String workerToken;
    juce::String internalSecret;

    // Durable storage upload
    juce::String storageUploadUrl;
    juce::String storagePublicUrl;
    juce::String storageToken;

    // Limits
    int downloadTimeoutSeconds = 60;
    int jobTimeoutSeconds = 300;
    int sweepMaxAgeHours = 24;
    int sweepIntervalMinutes = 60;
    int maxConcurrentRenders = 1;
    int maxParallelEncodes = 1;
    bool allowLocalAudioPath = false;

    /** Defaults with the data and work roots under the user and temp directories. */
    static ServiceConfig withDefaults();

    /** Defaults overridden by the process environment. */
    static ServiceConfig fromEnvironment();

    /** Same, with a custom lookup (used by tests). */
    static ServiceConfig fromLookup(const std::function<juce::String(const juce::String&)>& lookup);

    /** Applies "--port=9000" style options on top of the current values. */
    void applyArguments(const juce::ArgumentList& args);

    juce::Result validate() const;

    bool usesRemoteWorker() const { return workerUrl.isNotEmpty(); }
    bool hasStorage() const { return storageUploadUrl.isNotEmpty(); }

    juce::File getJobsDirectory() const      { return dataRoot.getChildFile("jobs"); }
    juce::File getProjectsDirectory() const  { return dataRoot.getChildFile("projects"); }

    /** publicBaseUrl, or http://127.0.0.1:<port> when unset, without a trailing slash. */
    juce::String getPublicBaseUrl() const;
};
