#include "ServiceConfig.h"

namespace
{
    bool parseFlag(const juce::String& text, bool fallback)
    {
        const juce::String value = text.trim().toLowerCase();

        if (value == "1" || value == "true" || value == "yes" || value == "on")
            return true;
        if (value == "0" || value == "false" || value == "no" || value == "off")
            return false;

        return fallback;
    }

    void readInt(const juce::String& text, int& target)
    {
        if (text.trim().containsOnly("0123456789") && text.trim().isNotEmpty())
            target = text.trim().getIntValue();
    }

    juce::File readDirectory(const juce::String& text, const juce::File& fallback)
    {
        const juce::String path = text.trim();

        if (path.isEmpty())
            return fallback;

        if (juce::File::isAbsolutePath(path))
            return juce::File(path);

        return juce::File::getCurrentWorkingDirectory().getChildFile(path);
    }
}

//==============================================================================
ServiceConfig ServiceConfig::withDefaults()
{
    ServiceConfig config;
    config.dataRoot = juce::File::getSpecialLocation(juce::File::userHomeDirectory).getChildFile(".musicreel");
    config.workRoot = juce::File::getSpecialLocation(juce::File::tempDirectory).getChildFile("musicreel");
    config.maxParallelEncodes = juce::SystemStats::getNumCpus() >= 8 ? 2 : 1;
    return config;
}

ServiceConfig ServiceConfig::fromEnvironment()
{
    return fromLookup([](const juce::String& name)
    {
        return juce::SystemStats::getEnvironmentVariable(name, {});
    });
}

ServiceConfig ServiceConfig::fromLookup(const std::function<juce::String(const juce::String&)>& lookup)
{
    ServiceConfig config = withDefaults();

    auto readString = [&lookup](const char* name, juce::String& target)
    {
        const juce::String value = lookup(name).trim();
        if (value.isNotEmpty())
            target = value;
    };

    readString("RENDER_HOST", config.host);
    readInt(lookup("PORT"), config.port);
    readString("PUBLIC_BASE_URL", config.publicBaseUrl);

    config.dataRoot = readDirectory(lookup("RENDER_DATA_DIR"), config.dataRoot);
    config.workRoot = readDirectory(lookup("RENDER_WORK_DIR"), config.workRoot);
    config.logsRoot = readDirectory(lookup("RENDER_LOG_DIR"), config.logsRoot);

    readString("FFMPEG_PATH", config.ffmpegPath);
    readString("FFPROBE_PATH", config.ffprobePath);
    readString("RENDER_WATERMARK_TEXT", config.watermarkText);

    readString("RENDER_WORKER_URL", config.workerUrl);
    readString("RENDER_WORKER_TOKEN", config.workerToken);
    readString("INTERNAL_RENDER_SECRET", config.internalSecret);

    readString("STORAGE_UPLOAD_URL", config.storageUploadUrl);
    readString("STORAGE_PUBLIC_URL", config.storagePublicUrl);
    readString("STORAGE_TOKEN", config.storageToken);

    readInt(lookup("RENDER_DOWNLOAD_TIMEOUT"), config.downloadTimeoutSeconds);
    readInt(lookup("RENDER_JOB_TIMEOUT"), config.jobTimeoutSeconds);
    readInt(lookup("RENDER_SWEEP_MAX_AGE_HOURS"), config.sweepMaxAgeHours);
    readInt(lookup("RENDER_CONCURRENCY"), config.maxConcurrentRenders);
    readInt(lookup("RENDER_PARALLEL_ENCODES"), config.maxParallelEncodes);

    config.allowLocalAudioPath = parseFlag(lookup("RENDER_ALLOW_LOCAL_AUDIO"), config.allowLocalAudioPath);

    return config;
}

void ServiceConfig::applyArguments(const juce::ArgumentList& args)
{
    auto option = [&args](const char* name) { return args.getValueForOption(name); };

    if (option("--host").isNotEmpty())       host = option("--host");
    readInt(option("--port"), port);
    if (option("--public-url").isNotEmpty()) publicBaseUrl = option("--public-url");

    dataRoot = readDirectory(option("--data"), dataRoot);
    workRoot = readDirectory(option("--work"), workRoot);
    logsRoot = readDirectory(option("--logs"), logsRoot);

    if (option("--ffmpeg").isNotEmpty())     ffmpegPath = option("--ffmpeg");
    if (option("--ffprobe").isNotEmpty())    ffprobePath = option("--ffprobe");
    if (option("--worker-url").isNotEmpty()) workerUrl = option("--worker-url");

    readInt(option("--concurrency"), maxConcurrentRenders);
    readInt(option("--parallel-encodes"), maxParallelEncodes);

    if (args.containsOption("--allow-local-audio"))
        allowLocalAudioPath = true;
}

juce::Result ServiceConfig::validate() const
{
    if (port < 0 || port > 65535)
        return juce::Result::fail("Invalid port: " + juce::String(port));

    if (dataRoot == juce::File() || workRoot == juce::File())
        return juce::Result::fail("Data and work directories must be set");

    if (fps <= 0)
        return juce::Result::fail("Invalid frame rate: " + juce::String(fps));

    if (downloadTimeoutSeconds <= 0 || jobTimeoutSeconds <= 0)
        return juce::Result::fail("Timeouts must be positive");

    if (sweepMaxAgeHours <= 0 || sweepIntervalMinutes <= 0)
        return juce::Result::fail("Sweep settings must be positive");

    if (maxConcurrentRenders <= 0 || maxParallelEncodes <= 0)
        return juce::Result::fail("Concurrency settings must be positive");

    if (usesRemoteWorker() && internalSecret.isEmpty())
        return juce::Result::fail("INTERNAL_RENDER_SECRET is required when RENDER_WORKER_URL is set");

    if (usesRemoteWorker() && !workerUrl.startsWithIgnoreCase("http"))
        return juce::Result::fail("RENDER_WORKER_URL must be an http(s) URL");

    return juce::Result::ok();
}

juce::String ServiceConfig::getPublicBaseUrl() const
{
    juce::String base = publicBaseUrl.isNotEmpty() ? publicBaseUrl
                                                   : "http://127.0.0.1:" + juce::String(port);

    while (base.endsWithChar('/'))
        base = base.dropLastCharacters(1);

    return base;
}
