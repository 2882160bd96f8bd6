#include "RenderOrchestrator.h"
#include "RenderPresets.h"
#include "AssetDownloader.h"
#include "../jobs/RenderJobSinks.h"
#include "../core/SessionLogger.h"

using namespace RenderTypes;

//==============================================================================
struct RenderOrchestrator::RunContext
{
    explicit RunContext(RenderJobSink& sink) : reporter(sink) {}

    juce::String renderId;
    juce::File workspace;
    juce::File outputFile;
    juce::Time deadline;
    ProgressReporter reporter;
    std::shared_ptr<FFmpegCommandLog> commandLog;
    std::function<void(const juce::String&)> log;

    CompositionStrategy strategy = CompositionStrategy::Sequential;
    double audioDuration = 0.0;
    juce::String outputUrl;
    juce::String note;
};

//==============================================================================
/** Weighted progress of the sub-clip fan-out, mapped onto the 10..80 window. */
struct RenderOrchestrator::SubClipProgress
{
    SubClipProgress(ProgressReporter& progressReporter, const juce::Array<double>& durations)
        : reporter(progressReporter),
          weights(durations)
    {
        for (auto w : weights)
        {
            totalWeight += w;
            fractions.add(0.0);
        }
    }

    void set(int slot, double fraction)
    {
        double done = 0.0;

        {
            const juce::ScopedLock sl(lock);
            fractions.set(slot, juce::jlimit(0.0, 1.0, fraction));

            for (int i = 0; i < fractions.size(); ++i)
                done += fractions[i] * weights[i];
        }

        const double share = totalWeight > 0.0 ? done / totalWeight : 0.0;
        reporter.update(encodeStartPercent + juce::roundToInt((subClipsEndPercent - encodeStartPercent) * share));
    }

    ProgressReporter& reporter;
    juce::Array<double> weights;
    juce::Array<double> fractions;
    double totalWeight = 0.0;
    juce::CriticalSection lock;
};

//==============================================================================
/** Encodes one scene into its sub-clip on a pool thread. */
class RenderOrchestrator::SubClipJob : public juce::ThreadPoolJob
{
public:
    SubClipJob(const RenderOrchestrator& orchestrator,
               RunContext& runContext,
               const CompositionPlanner& compositionPlanner,
               const SceneSpec& sceneToEncode,
               const juce::File& output,
               SubClipProgress& sharedProgress,
               std::function<void()> failureCallback)
        : juce::ThreadPoolJob("Sub-clip " + juce::String(sceneToEncode.index)),
          owner(orchestrator),
          context(runContext),
          planner(compositionPlanner),
          scene(sceneToEncode),
          outputFile(output),
          progress(sharedProgress),
          onFailure(std::move(failureCallback))
    {
    }

    JobStatus runJob() override
    {
        auto executor = owner.createExecutor(context);
        const int slot = scene.index;
        executor->setProgressCallback([this, slot](double fraction) { progress.set(slot, fraction); });

        {
            const juce::ScopedLock sl(lock);
            if (shouldExit())
                return jobHasFinished;
            activeExecutor = executor.get();
        }

        const auto execution = executor->execute(planner.buildSubClipCommand(scene, outputFile), scene.durationSec);

        {
            const juce::ScopedLock sl(lock);
            activeExecutor = nullptr;
        }

        ran = true;
        wasCancelled = execution.cancelled;
        result = owner.checkExecution(execution, *executor);

        if (result.wasOk())
            progress.set(slot, 1.0);
        else if (!execution.cancelled && onFailure)
            onFailure();

        return jobHasFinished;
    }

    /** Stops the encode if it is running, or prevents it from starting. */
    void abort()
    {
        signalJobShouldExit();

        const juce::ScopedLock sl(lock);
        if (activeExecutor != nullptr)
            activeExecutor->cancelExecution();
    }

    bool hasRun() const               { return ran; }
    bool wasAborted() const           { return wasCancelled || !ran; }
    const juce::Result& getResult() const { return result; }

private:
    const RenderOrchestrator& owner;
    RunContext& context;
    const CompositionPlanner& planner;
    const SceneSpec scene;
    const juce::File outputFile;
    SubClipProgress& progress;
    std::function<void()> onFailure;

    juce::CriticalSection lock;
    FFmpegExecutor* activeExecutor = nullptr;
    std::atomic<bool> ran { false };
    bool wasCancelled = false;
    juce::Result result = juce::Result::ok();

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SubClipJob)
};

//==============================================================================
RenderOrchestrator::Settings RenderOrchestrator::Settings::fromConfig(const ServiceConfig& config)
{
    Settings s;
    s.ffmpegPath = config.ffmpegPath;
    s.ffprobePath = config.ffprobePath;
    s.fps = config.fps;
    s.watermarkText = config.watermarkText;
    s.jobTimeoutSeconds = config.jobTimeoutSeconds;
    s.downloadTimeoutSeconds = config.downloadTimeoutSeconds;
    s.maxParallelEncodes = config.maxParallelEncodes;
    s.allowLocalAudioPath = config.allowLocalAudioPath;
    s.logsRoot = config.logsRoot;
    return s;
}

RenderOrchestrator::RenderOrchestrator(const Settings& renderSettings, WorkspaceJanitor& workspaceJanitor, ArtifactPublisher& artifactPublisher)
    : settings(renderSettings),
      janitor(workspaceJanitor),
      publisher(artifactPublisher)
{
}

RenderOrchestrator::~RenderOrchestrator() = default;

juce::String RenderOrchestrator::timeoutMessage() const
{
    return "Render exceeded the wall-clock limit of " + juce::String(settings.jobTimeoutSeconds) + "s";
}

std::unique_ptr<FFmpegExecutor> RenderOrchestrator::createExecutor(RunContext& context) const
{
    auto executor = std::make_unique<FFmpegExecutor>(settings.ffmpegPath, settings.ffprobePath);
    executor->setDeadline(context.deadline);
    executor->setCommandLog(context.commandLog);
    executor->setLogCallback(context.log);

    ProgressReporter* reporter = &context.reporter;
    executor->setOutputCallback([reporter](const juce::String& text) { reporter->appendOutput(text); });
    return executor;
}

juce::Result RenderOrchestrator::checkExecution(const FFmpegExecutor::ExecutionResult& result,
                                                const FFmpegExecutor& executor) const
{
    if (result.succeeded())
        return juce::Result::ok();

    if (result.timedOut)
        return juce::Result::fail(timeoutMessage());

    return juce::Result::fail(result.describeFailure(executor.getFFmpegPath()));
}

//==============================================================================
RenderOrchestrator::Outcome RenderOrchestrator::render(const RenderRequest& request, RenderJobSink& sink)
{
    Outcome outcome;

    if (!sink.begin())
    {
        RenderLog::info("render.run.skipped", { { "renderId", request.renderId } });
        return outcome;
    }

    outcome.ran = true;

    RunContext context(sink);
    context.renderId = request.renderId;
    context.deadline = juce::Time::getCurrentTime() + juce::RelativeTime::seconds(settings.jobTimeoutSeconds);

    const juce::String shortId = request.renderId.substring(0, 8);
    context.log = [shortId](const juce::String& message) { juce::Logger::writeToLog("[render " + shortId + "] " + message); };

    if (settings.logsRoot != juce::File() && WorkspaceJanitor::isValidRenderId(request.renderId))
        context.commandLog = std::make_shared<FFmpegCommandLog>(settings.logsRoot.getChildFile("render_" + request.renderId));

    RenderLog::info("render.run.start", { { "renderId", request.renderId },
                                          { "format", toString(request.options.format) },
                                          { "quality", toString(request.options.quality) },
                                          { "crossfade", request.options.crossfade } });

    const juce::uint32 startMs = juce::Time::getMillisecondCounter();
    juce::Result result = juce::Result::ok();

    try
    {
        result = runPipeline(request, context);
    }
    catch (const std::exception& e)
    {
        result = juce::Result::fail("Render crashed: " + juce::String(e.what()));
    }

    context.reporter.flush();
    outcome.strategy = context.strategy;

    const double elapsedSec = (juce::Time::getMillisecondCounter() - startMs) / 1000.0;

    if (result.wasOk())
    {
        outcome.succeeded = true;
        outcome.outputUrl = context.outputUrl;
        sink.complete(context.outputUrl, context.note);

        RenderLog::info("render.run.complete", { { "renderId", request.renderId },
                                                 { "strategy", toString(context.strategy) },
                                                 { "seconds", elapsedSec },
                                                 { "url", context.outputUrl } });
    }
    else
    {
        outcome.error = result.getErrorMessage();
        sink.fail(outcome.error, context.reporter.getTail());

        RenderLog::error("render.run.failed", { { "renderId", request.renderId },
                                                { "seconds", elapsedSec },
                                                { "error", outcome.error.substring(0, 300) } });
    }

    if (WorkspaceJanitor::isValidRenderId(request.renderId) && !janitor.cleanup(request.renderId))
        RenderLog::warn("render.cleanup.failed", { { "renderId", request.renderId } });

    return outcome;
}

juce::Result RenderOrchestrator::runPipeline(const RenderRequest& request, RunContext& context)
{
    if (!WorkspaceJanitor::isValidRenderId(request.renderId))
        return juce::Result::fail("Invalid render id");

    const juce::Result created = janitor.createWorkspace(request.renderId, context.workspace);
    if (created.failed())
        return created;

    context.log("Workspace: " + context.workspace.getFullPathName());
    context.reporter.update(materializeStartPercent);

    // Materialise
    AssetDownloader downloader(settings.downloadTimeoutSeconds, settings.allowLocalAudioPath);
    downloader.setDeadline(context.deadline);

    SceneMaterializer materializer(context.workspace, downloader, settings.allowLocalAudioPath);
    materializer.setLogCallback(context.log);

    SceneMaterializer::MaterializedProject project;
    const juce::Result materialized = materializer.materialize(request.payload, project);
    if (materialized.failed())
        return materialized;

    if (juce::Time::getCurrentTime() >= context.deadline)
        return juce::Result::fail(timeoutMessage());

    context.reporter.update(encodeStartPercent);

    // Plan
    context.strategy = CompositionStrategySelector::select(project.scenes, request.options.crossfade);

    CompositionPlanner::Settings planSettings;
    planSettings.target = RenderPresets::resolutionFor(request.options.format, request.options.quality);
    planSettings.fps = settings.fps;
    planSettings.quality = request.options.quality;
    planSettings.watermark = request.options.watermark;
    planSettings.watermarkText = settings.watermarkText;
    planSettings.crossfadeSec = request.options.crossfadeDuration;

    const CompositionPlanner planner(planSettings);

    context.log("Strategy: " + toString(context.strategy) + ", " + juce::String(project.scenes.size())
                + " scenes at " + planSettings.target.toString());

    {
        auto probe = createExecutor(context);
        context.audioDuration = probe->getFileDuration(project.audioFile);
    }

    if (context.audioDuration > 0.0)
        context.log("Audio length: " + juce::String(context.audioDuration, 2) + "s");

    // Encode
    context.outputFile = context.workspace.getChildFile("output.mp4");

    const juce::Result encoded = context.strategy == CompositionStrategy::Crossfade
                                     ? encodeCrossfade(project, planner, context)
                                     : encodeSequential(project, planner, context);
    if (encoded.failed())
        return encoded;

    context.reporter.update(muxEndPercent);

    // Publish
    const auto publication = publisher.publish(request.renderId, context.outputFile);
    if (publication.result.failed())
        return publication.result;

    context.outputUrl = publication.url;
    context.note = publication.note;
    return juce::Result::ok();
}

juce::Result RenderOrchestrator::encodeSequential(const SceneMaterializer::MaterializedProject& project,
                                                  const CompositionPlanner& planner,
                                                  RunContext& context)
{
    const auto& scenes = project.scenes;
    const int threads = juce::jlimit(1, juce::jmax(1, scenes.size()), settings.maxParallelEncodes);

    juce::Array<SceneSpec> slotted;
    juce::Array<juce::File> clips;

    for (int i = 0; i < scenes.size(); ++i)
    {
        SceneSpec scene = scenes.getReference(i);
        scene.index = i;    // progress slot
        slotted.add(scene);
        clips.add(CompositionPlanner::subClipFileFor(context.workspace, i));
    }

    SubClipProgress progress(context.reporter, CompositionPlanner::durationsOf(slotted));

    juce::OwnedArray<SubClipJob> jobs;
    std::atomic<bool> failed { false };

    auto abortAll = [&jobs, &failed]
    {
        if (failed.exchange(true))
            return;

        for (auto* job : jobs)
            job->abort();
    };

    for (int i = 0; i < slotted.size(); ++i)
        jobs.add(new SubClipJob(*this, context, planner, slotted.getReference(i), clips[i], progress, abortAll));

    context.log("Encoding " + juce::String(jobs.size()) + " sub-clips on " + juce::String(threads) + " threads");

    {
        juce::ThreadPool pool(threads);

        for (auto* job : jobs)
            pool.addJob(job, false);

        for (auto* job : jobs)
            pool.waitForJobToFinish(job, -1);
    }

    // The first real failure wins over encodes it aborted.
    for (auto* job : jobs)
        if (job->hasRun() && job->getResult().failed() && !job->wasAborted())
            return job->getResult();

    for (auto* job : jobs)
        if (job->getResult().failed())
            return job->getResult();

    if (failed.load())
        return juce::Result::fail("Sub-clip encoding was aborted");

    // Concat and mux
    const juce::File manifest = context.workspace.getChildFile("concat.txt");
    if (!manifest.replaceWithText(CompositionPlanner::buildConcatManifest(clips)))
        return juce::Result::fail("Cannot write " + manifest.getFullPathName());

    const double videoDuration = project.getTotalSceneDuration();
    const double expected = context.audioDuration > 0.0 ? juce::jmin(videoDuration, context.audioDuration) : videoDuration;

    auto executor = createExecutor(context);
    ProgressReporter* reporter = &context.reporter;
    executor->setProgressCallback([reporter](double fraction)
    {
        reporter->update(subClipsEndPercent + juce::roundToInt((muxEndPercent - subClipsEndPercent) * fraction));
    });

    const auto execution = executor->execute(planner.buildConcatMuxCommand(manifest, project.audioFile, context.outputFile), expected);
    return checkExecution(execution, *executor);
}

juce::Result RenderOrchestrator::encodeCrossfade(const SceneMaterializer::MaterializedProject& project,
                                                 const CompositionPlanner& planner,
                                                 RunContext& context)
{
    const double crossfade = planner.effectiveCrossfade(project.scenes);
    const double videoDuration = CompositionStrategySelector::crossfadeOutputDuration(CompositionPlanner::durationsOf(project.scenes), crossfade);
    const double expected = context.audioDuration > 0.0 ? juce::jmin(videoDuration, context.audioDuration) : videoDuration;

    context.log("Crossfade of " + juce::String(crossfade, 2) + "s, output " + juce::String(videoDuration, 2) + "s");

    auto executor = createExecutor(context);
    ProgressReporter* reporter = &context.reporter;
    executor->setProgressCallback([reporter](double fraction)
    {
        reporter->update(encodeStartPercent + juce::roundToInt((muxEndPercent - encodeStartPercent) * fraction));
    });

    const auto execution = executor->execute(planner.buildCrossfadeCommand(project.scenes, project.audioFile, context.outputFile), expected);
    return checkExecution(execution, *executor);
}

//==============================================================================
RenderOrchestrator::Outcome RenderOrchestrator::runStoredJob(RenderJobStore& store, const ProjectCatalog& projects,
                                                             const juce::String& userId, const juce::String& renderId)
{
    Outcome outcome;

    RenderJob job;
    if (!store.get(userId, renderId, job))
    {
        outcome.error = "Render job not found";
        RenderLog::warn("render.run.missing", { { "renderId", renderId } });
        return outcome;
    }

    if (job.status != JobStatus::Pending)
    {
        RenderLog::info("render.run.skipped", { { "renderId", renderId }, { "status", toString(job.status) } });
        return outcome;
    }

    StoreJobSink sink(store, userId, renderId);

    RenderRequest request;
    request.userId = userId;
    request.renderId = renderId;
    request.options = job.options;

    const juce::Result loaded = projects.load(job.projectId, request.payload);
    if (loaded.failed())
    {
        if (sink.begin())
        {
            outcome.ran = true;
            sink.fail(loaded.getErrorMessage(), {});
        }

        outcome.error = loaded.getErrorMessage();
        RenderLog::error("render.run.failed", { { "renderId", renderId }, { "error", outcome.error } });
        return outcome;
    }

    request.payload.renderId = renderId;
    request.payload.options = job.options;
    return render(request, sink);
}
