#include "rendering/FilterChainBuilder.h"
#include "rendering/RenderPresets.h"

#include <doctest/doctest.h>

using namespace RenderTypes;

TEST_SUITE("FilterChainBuilder") {

TEST_CASE("Plain scene scales, pads and re-scales to the exact target") {
    const auto chain = FilterChainBuilder::build({ 1080, 1920 }, 5.0, 30, AnimateKind::None, false);

    CHECK(chain == "scale=1080:1920:force_original_aspect_ratio=decrease,"
                   "pad=1080:1920:(ow-iw)/2:(oh-ih)/2:black,setsar=1,fps=30,"
                   "scale=1080:1920,setsar=1");
}

TEST_CASE("Identical requests produce identical chains") {
    FilterChainBuilder::FilterChainRequest request;
    request.target = { 1920, 1080 };
    request.durationSec = 4.0;
    request.animate = AnimateKind::PanLeft;
    request.watermarkEnabled = true;

    CHECK(FilterChainBuilder::build(request) == FilterChainBuilder::build(request));
}

TEST_CASE("Zoom ramps span the scene's frame count") {
    const auto chain = FilterChainBuilder::build({ 1080, 1920 }, 5.0, 30, AnimateKind::ZoomIn, false);

    CHECK(chain.contains("zoompan=z='min(1+0.10*on/149,1.10)'"));
    CHECK(chain.contains(":d=1:s=1080x1920:fps=30"));

    const auto zoomOut = FilterChainBuilder::build({ 1080, 1920 }, 5.0, 30, AnimateKind::ZoomOut, false);
    CHECK(zoomOut.contains("zoompan=z='max(1.10-0.10*on/149,1)'"));
}

TEST_CASE("Animation sits between the pad and the safeguard") {
    const auto chain = FilterChainBuilder::build({ 1080, 1080 }, 3.0, 30, AnimateKind::PanRight, false);

    const int pad = chain.indexOf("pad=");
    const int pan = chain.indexOf("zoompan=");
    const int safeguard = chain.lastIndexOf("scale=1080:1080,setsar=1");

    CHECK(pad >= 0);
    CHECK(pan > pad);
    CHECK(safeguard > pan);
}

TEST_CASE("Fades last half a second") {
    const auto fadeIn = FilterChainBuilder::build({ 1080, 1920 }, 4.0, 30, AnimateKind::FadeIn, false);
    CHECK(fadeIn.contains("fade=t=in:st=0:d=0.50"));

    const auto fadeOut = FilterChainBuilder::build({ 1080, 1920 }, 4.0, 30, AnimateKind::FadeOut, false);
    CHECK(fadeOut.contains("fade=t=out:st=3.50:d=0.50"));
}

TEST_CASE("Watermark is the last stage") {
    const auto chain = FilterChainBuilder::build({ 1080, 1920 }, 5.0, 30, AnimateKind::None, true, "MUSICREEL DEMO");

    CHECK(chain.endsWith("drawtext=text='MUSICREEL DEMO':fontsize=48:fontcolor=white@0.4"
                         ":x=w-tw-20:y=h-th-20:shadowcolor=black@0.3:shadowx=2:shadowy=2"));
}

TEST_CASE("Watermark text is reduced to a safe character set") {
    CHECK(FilterChainBuilder::escapeDrawText("It's 100%: ok") == "Its 100 ok");
    CHECK(FilterChainBuilder::escapeDrawText("a\\b'c") == "abc");

    // Nothing printable left means no drawtext at all.
    const auto chain = FilterChainBuilder::build({ 1080, 1920 }, 5.0, 30, AnimateKind::None, true, "':%");
    CHECK_FALSE(chain.contains("drawtext"));
}

TEST_CASE("Resolution table") {
    CHECK(RenderPresets::resolutionFor(RenderFormat::Vertical, RenderQuality::Standard) == Resolution { 1080, 1920 });
    CHECK(RenderPresets::resolutionFor(RenderFormat::Horizontal, RenderQuality::Pro) == Resolution { 1920, 1080 });
    CHECK(RenderPresets::resolutionFor(RenderFormat::Square, RenderQuality::Standard) == Resolution { 1080, 1080 });
    CHECK(RenderPresets::resolutionFor(RenderFormat::Vertical, RenderQuality::Basic) == Resolution { 720, 1280 });
    CHECK(RenderPresets::resolutionFor(RenderFormat::Square, RenderQuality::Basic) == Resolution { 720, 720 });
}

}
