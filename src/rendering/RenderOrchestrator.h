#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "FFmpegExecutor.h"
#include "SceneMaterializer.h"
#include "CompositionPlanner.h"
#include "ProgressReporter.h"
#include "ArtifactPublisher.h"
#include "../jobs/RenderJobSink.h"
#include "../jobs/RenderJobStore.h"
#include "../jobs/ProjectCatalog.h"
#include "../jobs/RenderPayload.h"
#include "../workspace/WorkspaceJanitor.h"
#include "../core/ServiceConfig.h"

/**
 * Coordinates one render from a claimed job to a published video.
 *
 * The pipeline runs on the calling thread: workspace, materialise, choose a
 * strategy, plan, encode, publish, report. Sub-clip encodes of a sequential
 * render fan out over a thread pool and join before the concat step. Every
 * exit path, including exceptions, ends in exactly one terminal sink call
 * and removes the job workspace.
 */
class RenderOrchestrator
{
public:
    /** Progress windows of the pipeline, in percent */
    static constexpr int materializeStartPercent = 5;
    static constexpr int encodeStartPercent = 10;
    static constexpr int subClipsEndPercent = 80;
    static constexpr int muxEndPercent = 95;

    struct Settings
    {
        juce::String ffmpegPath;
        juce::String ffprobePath;
        int fps = 30;
        juce::String watermarkText = "MUSICREEL DEMO";
        int jobTimeoutSeconds = 300;
        int downloadTimeoutSeconds = 60;
        int maxParallelEncodes = 1;
        bool allowLocalAudioPath = false;   // also admits local animation clips
        juce::File logsRoot;

        static Settings fromConfig(const ServiceConfig& config);
    };

    struct RenderRequest
    {
        juce::String userId;
        juce::String renderId;
        RenderTypes::RenderOptions options;
        RenderPayload payload;
    };

    struct Outcome
    {
        bool ran = false;           // false when the job could not be claimed
        bool succeeded = false;
        juce::String outputUrl;
        juce::String error;
        RenderTypes::CompositionStrategy strategy = RenderTypes::CompositionStrategy::Sequential;
    };

    RenderOrchestrator(const Settings& settings, WorkspaceJanitor& janitor, ArtifactPublisher& publisher);
    ~RenderOrchestrator();

    /** Runs the whole pipeline for one job and reports through the sink. */
    Outcome render(const RenderRequest& request, RenderJobSink& sink);

    /**
     * Loads a stored job and its project, then renders it into the store.
     * A job that is no longer pending is left alone.
     */
    Outcome runStoredJob(RenderJobStore& store, const ProjectCatalog& projects,
                         const juce::String& userId, const juce::String& renderId);

    const Settings& getSettings() const { return settings; }

private:
    struct RunContext;
    struct SubClipProgress;
    class SubClipJob;

    juce::Result runPipeline(const RenderRequest& request, RunContext& context);

    juce::Result encodeSequential(const SceneMaterializer::MaterializedProject& project,
                                  const CompositionPlanner& planner,
                                  RunContext& context);

    juce::Result encodeCrossfade(const SceneMaterializer::MaterializedProject& project,
                                 const CompositionPlanner& planner,
                                 RunContext& context);

    juce::Result checkExecution(const FFmpegExecutor::ExecutionResult& result,
                                const FFmpegExecutor& executor) const;

    /** An executor wired to the job deadline, command log and log tail. */
    std::unique_ptr<FFmpegExecutor> createExecutor(RunContext& context) const;

    juce::String timeoutMessage() const;

    Settings settings;
    WorkspaceJanitor& janitor;
    ArtifactPublisher& publisher;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderOrchestrator)
};
