#pragma once
#include <JuceHeader.h>

/**
 * Logger installed for a whole service session.
 *
 * Each message is written as "timestamp | message" to the session log file
 * and echoed to stderr. Safe to use from any thread.
 */
class SessionLogger : public juce::Logger
{
public:
    /**
     * @param logFile       destination file, or a null File for console only
     * @param echoToConsole mirror every line to stderr
     */
    SessionLogger(const juce::File& logFile, bool echoToConsole);
    ~SessionLogger() override;

    const juce::File& getLogFile() const { return logFile; }

    /** Creates "<directory>/<prefix>_YYYYmmdd_HHMMSS.log", or a null File if the directory is unusable. */
    static juce::File createSessionLogFile(const juce::File& directory, const juce::String& prefix);

protected:
    void logMessage(const juce::String& message) override;

private:
    juce::File logFile;
    bool echo;
    std::unique_ptr<juce::FileOutputStream> fileStream;
    juce::CriticalSection writeLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SessionLogger)
};

//==============================================================================
/**
 * Structured render events: one "[LEVEL] event {json}" line per call,
 * written through juce::Logger so they land in the session log.
 */
namespace RenderLog
{
    using Fields = std::initializer_list<std::pair<const char*, juce::var>>;

    void info(const juce::String& event, Fields fields = {});
    void warn(const juce::String& event, Fields fields = {});
    void error(const juce::String& event, Fields fields = {});

    /** Formats without writing; exposed for tests. */
    juce::String format(const juce::String& level, const juce::String& event, Fields fields);
}
