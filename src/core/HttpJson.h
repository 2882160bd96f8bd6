#pragma once
#include <JuceHeader.h>

/**
 * Small JSON-over-HTTP client used for the worker contract (dispatch,
 * payload fetch and status callbacks). Built on juce::URL.
 */
namespace HttpJson
{
    struct Response
    {
        bool connected = false;
        int statusCode = 0;
        juce::String body;

        bool isSuccess() const { return connected && statusCode >= 200 && statusCode < 300; }

        /** Parsed body, or a void var if it is not JSON. */
        juce::var json() const;
    };

    /**
     * POSTs body as application/json.
     * @param headers  extra "Name: value" pairs
     */
    Response post(const juce::String& url,
                  const juce::var& body,
                  const juce::StringPairArray& headers = {},
                  int timeoutMs = 15000);

    juce::String toCompactJson(const juce::var& value);
}
