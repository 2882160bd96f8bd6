//==============================================================================
/**
 * @file FFmpegExecutor.cpp
 *
 * Implementation of the FFmpegExecutor class. FFmpeg is started from an
 * argument array, its merged output is read in small chunks and scanned for
 * "time=" stamps, and a watchdog thread enforces the job deadline.
 */

#include "FFmpegExecutor.h"
#include "../core/ProcessManager.h"

namespace
{
    juce::String timestamp()
    {
        return juce::Time::getCurrentTime().toString(true, true);
    }

    juce::String quoteForLog(const juce::StringArray& arguments)
    {
        juce::StringArray quoted;
        for (const auto& arg : arguments)
            quoted.add(arg.containsAnyOf(" '\"") ? arg.quoted() : arg);
        return quoted.joinIntoString(" ");
    }

    juce::String firstExistingFile(const juce::StringArray& candidates)
    {
        for (const auto& candidate : candidates)
            if (juce::File::isAbsolutePath(candidate) && juce::File(candidate).existsAsFile())
                return candidate;
        return {};
    }

    juce::String findBinary(const juce::String& configuredPath, const juce::String& name)
    {
        if (configuredPath.isNotEmpty())
            return configuredPath;

        const juce::File appDir = juce::File::getSpecialLocation(juce::File::currentExecutableFile).getParentDirectory();

        juce::StringArray candidates;
        candidates.add(appDir.getChildFile(name).getFullPathName());
        candidates.add("/usr/bin/" + name);
        candidates.add("/usr/local/bin/" + name);

        const juce::String found = firstExistingFile(candidates);
        if (found.isNotEmpty())
            return found;

        // Fallback to system PATH
        return name;
    }

    //==========================================================================
    /** Kills the supervised process once the deadline passes or a cancel is requested. */
    class ProcessWatchdog : private juce::Thread
    {
    public:
        ProcessWatchdog(juce::ChildProcess& processToWatch, juce::Time deadlineTime, const std::atomic<bool>& cancelFlag)
            : juce::Thread("FFmpeg watchdog"),
              process(processToWatch),
              deadline(deadlineTime),
              cancel(cancelFlag)
        {
            startThread();
        }

        ~ProcessWatchdog() override
        {
            signalThreadShouldExit();
            notify();
            stopThread(2000);
        }

        bool hasTimedOut() const { return timedOut.load(); }

    private:
        void run() override
        {
            while (!threadShouldExit())
            {
                const bool deadlinePassed = deadline != juce::Time() && juce::Time::getCurrentTime() >= deadline;

                if (cancel.load() || deadlinePassed)
                {
                    timedOut = deadlinePassed && !cancel.load();
                    process.kill();
                    return;
                }

                wait(100);
            }
        }

        juce::ChildProcess& process;
        const juce::Time deadline;
        const std::atomic<bool>& cancel;
        std::atomic<bool> timedOut { false };
    };
}

//==============================================================================
FFmpegCommandLog::FFmpegCommandLog(const juce::File& directory)
{
    if (directory == juce::File())
        return;

    if (!directory.isDirectory() && !directory.createDirectory())
        return;

    logDirectory = directory;
    aggregateLogFile = logDirectory.getChildFile("ffmpeg.log");
    enabled = true;
}

juce::File FFmpegCommandLog::nextCommandLogFile(int& outIndex)
{
    juce::ScopedLock sl(lock);

    if (!enabled)
    {
        outIndex = -1;
        return {};
    }

    outIndex = ++commandIndex;
    return logDirectory.getChildFile(juce::String::formatted("ffmpeg_%03d.log", outIndex));
}

void FFmpegCommandLog::writeToAggregateLog(const juce::String& message)
{
    juce::ScopedLock sl(lock);

    if (!enabled)
        return;

    juce::FileOutputStream stream(aggregateLogFile, 1024);
    if (stream.openedOk())
        stream.writeText(message + "\n", false, false, nullptr);
}

//==============================================================================
juce::String FFmpegExecutor::ExecutionResult::describeFailure(const juce::String& executable) const
{
    if (cancelled && !started)
        return "FFmpeg was cancelled";

    if (!started)
        return "Failed to start FFmpeg: " + executable;

    if (timedOut)
        return "FFmpeg was stopped at the render deadline. Log: " + BoundedLogTail::clip(capturedTail, errorTailCharacters);

    if (cancelled)
        return "FFmpeg was cancelled";

    return "FFmpeg exited with code " + juce::String(exitCode) + ". Log: "
         + BoundedLogTail::clip(capturedTail, errorTailCharacters);
}

//==============================================================================
FFmpegExecutor::FFmpegExecutor(const juce::String& configuredFFmpeg, const juce::String& configuredFFprobe)
    : ffmpegPath(findFFmpegPath(configuredFFmpeg)),
      ffprobePath(findFFprobePath(configuredFFprobe))
{
}

FFmpegExecutor::~FFmpegExecutor()
{
    cancelExecution();
}

void FFmpegExecutor::setProgressCallback(std::function<void(double)> callback)    { progressCallback = std::move(callback); }
void FFmpegExecutor::setOutputCallback(std::function<void(const juce::String&)> callback) { outputCallback = std::move(callback); }
void FFmpegExecutor::setLogCallback(std::function<void(const juce::String&)> callback)    { logCallback = std::move(callback); }
void FFmpegExecutor::setDeadline(juce::Time newDeadline)                          { deadline = newDeadline; }
void FFmpegExecutor::setCommandLog(std::shared_ptr<FFmpegCommandLog> log)         { commandLog = std::move(log); }

void FFmpegExecutor::log(const juce::String& message)
{
    if (logCallback)
        logCallback(message);
    else
        juce::Logger::writeToLog(message);
}

//==============================================================================
FFmpegExecutor::ExecutionResult FFmpegExecutor::execute(const juce::StringArray& arguments, double expectedDurationSeconds)
{
    ExecutionResult result;
    BoundedLogTail tail(tailCapacity);

    juce::StringArray command;
    command.add(ffmpegPath);
    command.add("-nostdin");
    command.addArray(arguments);

    int commandIndex = -1;
    const juce::File commandLogFile = commandLog != nullptr ? commandLog->nextCommandLogFile(commandIndex) : juce::File();
    const juce::String label = commandIndex > 0 ? juce::String::formatted("#%03d", commandIndex) : juce::String("#---");

    std::unique_ptr<juce::FileOutputStream> commandLogStream;
    if (commandLogFile != juce::File())
    {
        auto stream = std::make_unique<juce::FileOutputStream>(commandLogFile);
        if (stream->openedOk())
        {
            stream->writeText("Started: " + timestamp() + "\nCommand: " + quoteForLog(command)
                              + "\n------------------------------------------------------------\n",
                              false, false, nullptr);
            commandLogStream = std::move(stream);
        }
    }

    auto writeCommandLog = [&commandLogStream](const juce::String& text)
    {
        if (commandLogStream != nullptr)
            commandLogStream->writeText(text, false, false, nullptr);
    };

    auto writeAggregate = [this, &label](const juce::String& text)
    {
        if (commandLog != nullptr)
            commandLog->writeToAggregateLog(label + " [" + timestamp() + "] " + text);
    };

    writeAggregate("START " + quoteForLog(command));

    if (juce::File::isAbsolutePath(ffmpegPath) && !juce::File(ffmpegPath).existsAsFile())
    {
        log("FFmpeg binary not found: " + ffmpegPath);
        writeCommandLog("FFmpeg binary not found\n");
        writeAggregate("START_FAILED");
        return result;
    }

    // A cancel can land between handing out the executor and this call.
    if (shouldCancel.load())
    {
        result.cancelled = true;
        writeAggregate("CANCELLED");
        return result;
    }

    ManagedChildProcess process("ffmpeg " + label);

    if (!process.start(command, juce::ChildProcess::wantStdOut | juce::ChildProcess::wantStdErr))
    {
        log("Failed to start FFmpeg process: " + ffmpegPath);
        writeCommandLog("Failed to start FFmpeg process\n");
        writeAggregate("START_FAILED");
        return result;
    }

    result.started = true;
    currentProgress.store(0.0);

    {
        juce::ScopedLock sl(processLock);
        activeProcess = &process;
    }

    int lastPercent = -1;

    {
        ProcessWatchdog watchdog(process, deadline, shouldCancel);

        char buffer[1024];

        for (;;)
        {
            const int bytesRead = process.readProcessOutput(buffer, (int) sizeof(buffer) - 1);

            if (bytesRead > 0)
            {
                buffer[bytesRead] = 0;
                const juce::String output = juce::String::fromUTF8(buffer, bytesRead).replace("\r", "\n");

                tail.append(output);
                writeCommandLog(output);

                if (outputCallback)
                    outputCallback(output);

                const double seconds = FFmpegProgress::parseTimeSeconds(output);
                if (seconds >= 0.0 && expectedDurationSeconds > 0.0)
                {
                    const int percent = FFmpegProgress::toPercent(seconds, expectedDurationSeconds);
                    if (percent > lastPercent)
                    {
                        lastPercent = percent;
                        currentProgress.store(percent / 100.0);

                        if (progressCallback)
                            progressCallback(percent / 100.0);
                    }
                }
                continue;
            }

            if (!process.isRunning())
                break;

            juce::Thread::sleep(50);
        }

        result.timedOut = watchdog.hasTimedOut();
    }

    {
        juce::ScopedLock sl(processLock);
        activeProcess = nullptr;
    }

    result.cancelled = shouldCancel.load() && !result.timedOut;
    result.exitCode = (int) process.getExitCode();
    result.capturedTail = tail.getText();

    if (!result.succeeded())
        log("FFmpeg error (exit code: " + juce::String(result.exitCode) + ")"
            + (result.timedOut ? " after deadline" : "") + (result.cancelled ? " after cancel" : ""));

    writeCommandLog("\n------------------------------------------------------------\n"
                    "Finished: " + timestamp() + "\nExit code: " + juce::String(result.exitCode) + "\n");
    writeAggregate("END exitCode=" + juce::String(result.exitCode));

    return result;
}

//==============================================================================
void FFmpegExecutor::cancelExecution()
{
    shouldCancel.store(true);

    juce::ScopedLock sl(processLock);
    if (activeProcess != nullptr && activeProcess->isRunning())
        activeProcess->kill();
}

//==============================================================================
juce::String FFmpegExecutor::executeCommandAndGetOutput(const juce::StringArray& command, int timeoutMs)
{
    if (command.isEmpty())
        return {};

    if (juce::File::isAbsolutePath(command[0]) && !juce::File(command[0]).existsAsFile())
        return {};

    juce::ChildProcess process;
    if (!process.start(command, juce::ChildProcess::wantStdOut))
        return {};

    const juce::String output = process.readAllProcessOutput();

    if (!process.waitForProcessToFinish(timeoutMs))
    {
        process.kill();
        return {};
    }

    return output;
}

//==============================================================================
juce::String FFmpegExecutor::findFFmpegPath(const juce::String& configuredPath)
{
    return findBinary(configuredPath, "ffmpeg");
}

juce::String FFmpegExecutor::findFFprobePath(const juce::String& configuredPath)
{
    return findBinary(configuredPath, "ffprobe");
}

bool FFmpegExecutor::checkFFmpegAvailability()
{
    return getVersionString().isNotEmpty();
}

juce::String FFmpegExecutor::getVersionString()
{
    juce::StringArray command;
    command.add(ffmpegPath);
    command.add("-hide_banner");
    command.add("-version");

    const juce::String output = executeCommandAndGetOutput(command, 5000);

    juce::StringArray lines;
    lines.addLines(output);
    lines.removeEmptyStrings();

    if (lines.isEmpty() || !lines[0].startsWithIgnoreCase("ffmpeg"))
        return {};

    return lines[0].trim();
}

double FFmpegExecutor::getFileDuration(const juce::File& file)
{
    if (!file.existsAsFile())
        return 0.0;

    juce::StringArray command;
    command.add(ffprobePath);
    command.addArray(juce::StringArray::fromTokens("-v error -show_entries format=duration "
                                                   "-of default=noprint_wrappers=1:nokey=1", false));
    command.add(file.getFullPathName());

    const juce::String output = executeCommandAndGetOutput(command);

    const double duration = output.trim().getDoubleValue();
    return duration > 0.0 ? duration : 0.0;
}
