// Audio bridge tests: decode polling, playback pool, ramps and both wirings

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fake_guest.h"
#include "hostbridge/async/event_loop.h"
#include "hostbridge/audio/audio_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/fs/async_file.h"
#include <cstring>
#include <vector>

using namespace hostbridge;
using namespace hostbridge::test;
using Catch::Matchers::WithinAbs;

namespace {

void putLe(std::vector<uint8_t>& out, uint32_t value, int bytes) {
    for (int i = 0; i < bytes; i++) {
        out.push_back(static_cast<uint8_t>((value >> (8 * i)) & 0xFF));
    }
}

void putTag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// 16-bit PCM mono WAV holding `frames` copies of `sample`
std::vector<uint8_t> makeWav(uint32_t frames, int16_t sample, uint32_t rate = 44100) {
    uint32_t dataSize = frames * 2;
    std::vector<uint8_t> wav;
    putTag(wav, "RIFF");
    putLe(wav, 36 + dataSize, 4);
    putTag(wav, "WAVE");
    putTag(wav, "fmt ");
    putLe(wav, 16, 4);
    putLe(wav, 1, 2);         // PCM
    putLe(wav, 1, 2);         // mono
    putLe(wav, rate, 4);
    putLe(wav, rate * 2, 4);  // byte rate
    putLe(wav, 2, 2);         // block align
    putLe(wav, 16, 2);        // bits per sample
    putTag(wav, "data");
    putLe(wav, dataSize, 4);
    for (uint32_t i = 0; i < frames; i++) {
        putLe(wav, static_cast<uint16_t>(sample), 2);
    }
    return wav;
}

struct AudioFixture {
    audio::AudioContext context{audio::AudioContext::Options{false, 44100.0f}};
    async::EventLoop loop;
    // Not initialized: decode tasks run inline and complete on processCompletedReads()
    fs::AsyncFileReader reader{loop};
    FakeGuest guest;
    bridge::GuestMemory memory{&guest};
    audio::AudioBridge audioBridge;

    explicit AudioFixture(audio::AudioVariant variant = audio::AudioVariant::Pooled)
        : audioBridge(context, reader, memory, variant) {}

    int32_t loadSound(uint32_t frames = 4410, int16_t sample = 16384) {
        int32_t sound = audioBridge.addBuffer(makeWav(frames, sample));
        reader.processCompletedReads();
        return sound;
    }

    std::vector<float> render(size_t frames) {
        std::vector<float> out(frames * 2, 0.0f);
        context.render(out.data(), frames);
        return out;
    }
};

}  // namespace

TEST_CASE("Sounds become loaded once the decode is delivered", "[audio]") {
    AudioFixture f;
    int32_t sound = f.audioBridge.addBuffer(makeWav(100, 1000));
    REQUIRE(sound > 0);
    REQUIRE_FALSE(f.audioBridge.isLoaded(sound));

    f.reader.processCompletedReads();
    REQUIRE(f.audioBridge.isLoaded(sound));
}

TEST_CASE("Undecodable data never becomes loaded", "[audio]") {
    AudioFixture f;
    int32_t sound = f.audioBridge.addBuffer({1, 2, 3, 4, 5, 6, 7, 8});
    f.reader.processCompletedReads();
    REQUIRE_FALSE(f.audioBridge.isLoaded(sound));
    REQUIRE(f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false) == 0);
}

TEST_CASE("A sound deleted while decoding stays deleted", "[audio]") {
    AudioFixture f;
    int32_t sound = f.audioBridge.addBuffer(makeWav(100, 1000));
    f.audioBridge.deleteSound(sound);
    f.reader.processCompletedReads();
    REQUIRE_FALSE(f.audioBridge.isLoaded(sound));
}

TEST_CASE("Decoding runs on the libuv thread pool", "[audio]") {
    audio::AudioContext context(audio::AudioContext::Options{false, 44100.0f});
    async::EventLoop loop;
    REQUIRE(loop.init());
    fs::AsyncFileReader reader(loop);
    REQUIRE(reader.init());
    FakeGuest guest;
    bridge::GuestMemory memory(&guest);

    {
        audio::AudioBridge audioBridge(context, reader, memory, audio::AudioVariant::Pooled);
        int32_t sound = audioBridge.addBuffer(makeWav(200, 500));
        REQUIRE(reader.pendingCount() == 1);

        REQUIRE(loop.runUntil([&reader]() { return reader.pendingCount() == 0; }));
        REQUIRE_FALSE(audioBridge.isLoaded(sound));
        REQUIRE(reader.processCompletedReads());
        REQUIRE(audioBridge.isLoaded(sound));
    }

    reader.shutdown();
    loop.shutdown();
}

TEST_CASE("Playing an unloaded sound returns no playback", "[audio]") {
    AudioFixture f;
    REQUIRE(f.audioBridge.play(42, 1.0f, 1.0f, 1.0f, false) == 0);
    REQUIRE(f.audioBridge.poolSize() == 0);
}

TEST_CASE("Finished playbacks return their slot to the pool", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound(100);

    int32_t first = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    REQUIRE(first > 0);
    REQUIRE(f.audioBridge.activePlaybackCount() == 1);

    f.render(256);
    REQUIRE(f.context.dispatchEndedEvents() == 1);
    REQUIRE(f.audioBridge.activePlaybackCount() == 0);
    REQUIRE(f.audioBridge.findPlayback(first) == nullptr);

    int32_t second = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    REQUIRE(second != first);
    REQUIRE(f.audioBridge.poolSize() == 1);
}

TEST_CASE("Concurrent playbacks grow the pool", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound();
    f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    REQUIRE(f.audioBridge.poolSize() == 3);
    REQUIRE(f.audioBridge.activePlaybackCount() == 3);

    f.audioBridge.stopSound(sound);
    REQUIRE(f.audioBridge.activePlaybackCount() == 0);
    REQUIRE(f.audioBridge.poolSize() == 3);
}

TEST_CASE("Stopping a playback twice is harmless", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound();
    int32_t playback = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, true);

    f.audioBridge.stopPlayback(playback);
    f.audioBridge.stopPlayback(playback);
    f.audioBridge.stopPlayback(0);
    REQUIRE(f.audioBridge.activePlaybackCount() == 0);

    f.render(128);
    REQUIRE(f.context.dispatchEndedEvents() == 1);
    REQUIRE(f.audioBridge.activePlaybackCount() == 0);
}

TEST_CASE("Looping playbacks keep running", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound(64);
    int32_t playback = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, true);

    f.render(1024);
    REQUIRE(f.context.dispatchEndedEvents() == 0);
    REQUIRE(f.audioBridge.findPlayback(playback) != nullptr);
}

TEST_CASE("Pooled variant averages the channel volumes", "[audio]") {
    AudioFixture f(audio::AudioVariant::Pooled);
    int32_t sound = f.loadSound();
    int32_t playback = f.audioBridge.play(sound, 1.0f, 0.25f, 1.0f, false);

    const audio::Playback* slot = f.audioBridge.findPlayback(playback);
    REQUIRE(slot != nullptr);
    REQUIRE(slot->gainRight == nullptr);
    REQUIRE_THAT(slot->gainLeft->gain().value(), WithinAbs(0.625, 1e-6));

    std::vector<float> out = f.render(16);
    REQUIRE_THAT(out[0], WithinAbs(0.3125, 1e-4));
    REQUIRE_THAT(out[1], WithinAbs(0.3125, 1e-4));
}

TEST_CASE("Stereo variant pans through the merger", "[audio]") {
    AudioFixture f(audio::AudioVariant::StereoPanned);
    int32_t sound = f.loadSound();
    int32_t playback = f.audioBridge.play(sound, 1.0f, 0.25f, 1.0f, false);

    const audio::Playback* slot = f.audioBridge.findPlayback(playback);
    REQUIRE(slot->merger != nullptr);
    REQUIRE(slot->gainRight != nullptr);

    std::vector<float> out = f.render(16);
    REQUIRE_THAT(out[0], WithinAbs(0.5, 1e-4));
    REQUIRE_THAT(out[1], WithinAbs(0.125, 1e-4));
}

TEST_CASE("Stereo variant restarts a sound instead of layering it", "[audio]") {
    AudioFixture f(audio::AudioVariant::StereoPanned);
    int32_t sound = f.loadSound();
    int32_t first = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    int32_t second = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);

    REQUIRE(second != first);
    REQUIRE(f.audioBridge.findPlayback(first) == nullptr);
    REQUIRE(f.audioBridge.activePlaybackCount() == 1);
}

TEST_CASE("Volume changes ramp instead of jumping", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound();
    int32_t playback = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    f.audioBridge.setPlaybackVolume(playback, 0.0f);

    const audio::AudioParam& gain = f.audioBridge.findPlayback(playback)->gainLeft->gain();
    double now = f.context.currentTime();
    REQUIRE_THAT(gain.valueAtTime(now), WithinAbs(1.0, 1e-6));
    REQUIRE_THAT(gain.valueAtTime(now + audio::kVolumeRampSeconds / 2), WithinAbs(0.5, 1e-3));
    REQUIRE_THAT(gain.valueAtTime(now + audio::kVolumeRampSeconds), WithinAbs(0.0, 1e-6));
}

TEST_CASE("Sound volume applies to every playback of the sound", "[audio]") {
    AudioFixture f;
    int32_t sound = f.loadSound();
    int32_t a = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    int32_t b = f.audioBridge.play(sound, 1.0f, 1.0f, 1.0f, false);
    f.audioBridge.setSoundVolume(sound, 0.5f, 0.5f);

    double end = f.context.currentTime() + audio::kVolumeRampSeconds;
    REQUIRE_THAT(f.audioBridge.findPlayback(a)->gainLeft->gain().valueAtTime(end), WithinAbs(0.5, 1e-6));
    REQUIRE_THAT(f.audioBridge.findPlayback(b)->gainLeft->gain().valueAtTime(end), WithinAbs(0.5, 1e-6));
}

TEST_CASE("Call table entries read sound data from guest memory", "[audio]") {
    AudioFixture f;
    bridge::CallTable table;
    f.audioBridge.registerFunctions(table);

    std::vector<uint8_t> wav = makeWav(100, 2000);
    f.guest.putBytes(1024, wav);
    int32_t sound = table.call("audio_add_buffer", {u32(1024), u32(static_cast<uint32_t>(wav.size()))}).asI32();
    REQUIRE_FALSE(table.call("audio_source_is_loaded", {i32(sound)}).asBool());

    f.reader.processCompletedReads();
    REQUIRE(table.call("audio_source_is_loaded", {i32(sound)}).asBool());

    int32_t playback = table.call("audio_play_buffer", {i32(sound), f32(1.0f), f32(1.0f), f32(1.0f), i32(0)}).asI32();
    REQUIRE(playback > 0);
    table.call("audio_playback_stop", {i32(playback)});
    REQUIRE(f.audioBridge.activePlaybackCount() == 0);
}

TEST_CASE("Out-of-range sound data is rejected", "[audio]") {
    AudioFixture f;
    bridge::CallTable table;
    f.audioBridge.registerFunctions(table);
    REQUIRE(table.call("audio_add_buffer", {u32(65000), u32(4096)}).asI32() == 0);
}
