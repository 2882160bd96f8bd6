#pragma once
#include <JuceHeader.h>
#include "FFmpegProgress.h"

//==============================================================================
/**
 * @file FFmpegExecutor.h
 *
 * This file declares the FFmpegExecutor class which is responsible for running
 * FFmpeg commands as child processes and supervising their execution.
 *
 * The class handles:
 * - Spawning FFmpeg from an argument list (no shell involved)
 * - Streaming the merged stdout/stderr output and extracting time progress
 * - Keeping a bounded tail of the output for error reporting
 * - Enforcing a wall-clock deadline and cancellation through a watchdog
 * - Querying file durations via FFprobe
 */

/**
 * Per-job record of every FFmpeg invocation.
 *
 * Writes one ffmpeg_NNN.log per command plus an aggregate ffmpeg.log with
 * START/END lines. Shared between the executors of one job, so parallel
 * sub-clip encodes get distinct command numbers.
 */
class FFmpegCommandLog
{
public:
    explicit FFmpegCommandLog(const juce::File& directory);

    bool isEnabled() const { return enabled; }

    /** Reserves the next command number and returns its log file. */
    juce::File nextCommandLogFile(int& outIndex);

    void writeToAggregateLog(const juce::String& message);

private:
    juce::CriticalSection lock;
    juce::File logDirectory;
    juce::File aggregateLogFile;
    bool enabled { false };
    int commandIndex { 0 };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegCommandLog)
};

//==============================================================================
/**
 * The FFmpegExecutor class handles all interaction with FFmpeg as an external process.
 *
 * One executor runs one command at a time, and a cancelled executor stays
 * cancelled. Parallel encodes use one executor
 * each. Progress is reported as a 0.0-0.95 fraction of the expected output
 * duration; 1.0 is only implied by a clean exit.
 */
class FFmpegExecutor
{
public:
    struct ExecutionResult
    {
        int exitCode = -1;
        juce::String capturedTail;
        bool started = false;
        bool timedOut = false;
        bool cancelled = false;

        bool succeeded() const { return started && exitCode == 0 && !timedOut && !cancelled; }

        /** Human-readable failure, ending in the last part of the captured output. */
        juce::String describeFailure(const juce::String& executable) const;
    };

    /** Characters of output kept per command */
    static constexpr int tailCapacity = BoundedLogTail::defaultCapacity;

    /** Characters of tail quoted in error messages */
    static constexpr int errorTailCharacters = 500;

    /**
     * @param ffmpegPath  configured FFmpeg binary, or empty to search for one
     * @param ffprobePath configured FFprobe binary, or empty to search for one
     */
    explicit FFmpegExecutor(const juce::String& ffmpegPath = {}, const juce::String& ffprobePath = {});

    /** Ensures a running process is killed. */
    ~FFmpegExecutor();

    /**
     * Sets a callback receiving the progress of the running command as a
     * fraction between 0.0 and 0.95.
     */
    void setProgressCallback(std::function<void(double)> callback);

    /** Sets a callback receiving raw output chunks (carriage returns turned into newlines). */
    void setOutputCallback(std::function<void(const juce::String&)> callback);

    /** Sets a callback for the executor's own log lines. */
    void setLogCallback(std::function<void(const juce::String&)> callback);

    /** Commands still running at this time are killed. A null Time disables the deadline. */
    void setDeadline(juce::Time deadline);

    /** Records commands and their output into a shared per-job log directory. */
    void setCommandLog(std::shared_ptr<FFmpegCommandLog> log);

    /**
     * Runs FFmpeg with the given arguments and waits for it to exit.
     *
     * @param arguments                 arguments after the executable name
     * @param expectedDurationSeconds   output length used to turn time= into progress
     */
    ExecutionResult execute(const juce::StringArray& arguments, double expectedDurationSeconds);

    /**
     * Runs an arbitrary command (executable first) and returns its output.
     * Used for FFprobe queries and version checks.
     */
    juce::String executeCommandAndGetOutput(const juce::StringArray& command, int timeoutMs = 5000);

    /**
     * Kills the running process, if any. The pending execute() returns
     * cancelled, and so does any later execute() on this executor.
     */
    void cancelExecution();

    const juce::String& getFFmpegPath() const { return ffmpegPath; }
    const juce::String& getFFprobePath() const { return ffprobePath; }

    /**
     * Resolves the FFmpeg binary: the configured path, a copy next to the
     * executable, /usr/bin, /usr/local/bin, then plain "ffmpeg" from PATH.
     */
    static juce::String findFFmpegPath(const juce::String& configuredPath = {});
    static juce::String findFFprobePath(const juce::String& configuredPath = {});

    bool checkFFmpegAvailability();

    /** First line of "ffmpeg -version", or empty if FFmpeg cannot run. */
    juce::String getVersionString();

    /**
     * Gets the duration of a media file in seconds using FFprobe.
     * @return the duration, or 0.0 if unavailable
     */
    double getFileDuration(const juce::File& file);

    double getCurrentProgress() const { return currentProgress; }

private:
    void log(const juce::String& message);

    juce::String ffmpegPath;
    juce::String ffprobePath;

    juce::CriticalSection processLock;
    juce::ChildProcess* activeProcess = nullptr;

    std::atomic<bool> shouldCancel { false };
    std::atomic<double> currentProgress { 0.0 };
    juce::Time deadline;

    std::function<void(double)> progressCallback;
    std::function<void(const juce::String&)> outputCallback;
    std::function<void(const juce::String&)> logCallback;

    std::shared_ptr<FFmpegCommandLog> commandLog;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(FFmpegExecutor)
};
