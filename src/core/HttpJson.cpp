#include "HttpJson.h"

namespace HttpJson
{
    juce::var Response::json() const
    {
        juce::var parsed;
        if (juce::JSON::parse(body, parsed).wasOk())
            return parsed;
        return {};
    }

    juce::String toCompactJson(const juce::var& value)
    {
        return juce::JSON::toString(value, true);
    }

    Response post(const juce::String& url,
                  const juce::var& body,
                  const juce::StringPairArray& headers,
                  int timeoutMs)
    {
        Response response;

        juce::String headerText = "Content-Type: application/json";
        for (int i = 0; i < headers.size(); ++i)
            headerText << "\r\n" << headers.getAllKeys()[i] << ": " << headers.getAllValues()[i];

        auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inPostData)
                           .withExtraHeaders(headerText)
                           .withConnectionTimeoutMs(timeoutMs)
                           .withStatusCode(&response.statusCode);

        const juce::URL target = juce::URL(url).withPOSTData(toCompactJson(body));
        std::unique_ptr<juce::InputStream> stream = target.createInputStream(options);

        // Error statuses can come back without a body stream.
        response.connected = stream != nullptr || response.statusCode > 0;

        if (stream != nullptr)
            response.body = stream->readEntireStreamAsString();

        return response;
    }
}
