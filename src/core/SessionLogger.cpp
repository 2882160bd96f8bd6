#include "SessionLogger.h"
#include <iostream>

SessionLogger::SessionLogger(const juce::File& destination, bool echoToConsole)
    : logFile(destination),
      echo(echoToConsole)
{
    if (logFile == juce::File())
        return;

    logFile.getParentDirectory().createDirectory();

    auto stream = std::make_unique<juce::FileOutputStream>(logFile);
    if (stream->openedOk())
    {
        stream->writeText("Session log started at " + juce::Time::getCurrentTime().toString(true, true) + "\n",
                          false, false, nullptr);
        stream->flush();
        fileStream = std::move(stream);
    }
}

SessionLogger::~SessionLogger()
{
    juce::ScopedLock lock(writeLock);
    if (fileStream != nullptr)
        fileStream->flush();
}

void SessionLogger::logMessage(const juce::String& message)
{
    const juce::String line = juce::Time::getCurrentTime().toString(true, true, true, true) + " | " + message;

    juce::ScopedLock lock(writeLock);

    if (fileStream != nullptr)
    {
        fileStream->writeText(line + "\n", false, false, nullptr);
        fileStream->flush();
    }

    if (echo)
        std::cerr << line << std::endl;
}

juce::File SessionLogger::createSessionLogFile(const juce::File& directory, const juce::String& prefix)
{
    if (!directory.isDirectory() && !directory.createDirectory())
        return {};

    const juce::String sessionStamp = juce::Time::getCurrentTime().formatted("%Y%m%d_%H%M%S");
    return directory.getChildFile(prefix + "_" + sessionStamp + ".log");
}

//==============================================================================
namespace RenderLog
{
    juce::String format(const juce::String& level, const juce::String& event, Fields fields)
    {
        juce::String line = "[" + level + "] " + event;

        if (fields.size() > 0)
        {
            juce::DynamicObject::Ptr meta = new juce::DynamicObject();
            for (const auto& field : fields)
                meta->setProperty(field.first, field.second);

            line << " " << juce::JSON::toString(juce::var(meta.get()), true);
        }

        return line;
    }

    void info(const juce::String& event, Fields fields)  { juce::Logger::writeToLog(format("INFO", event, fields)); }
    void warn(const juce::String& event, Fields fields)  { juce::Logger::writeToLog(format("WARN", event, fields)); }
    void error(const juce::String& event, Fields fields) { juce::Logger::writeToLog(format("ERROR", event, fields)); }
}
