#pragma once

/**
 * Audio Bridge
 *
 * The "audio" call-table group. Sounds are decoded asynchronously and
 * polled for readiness; every play() takes a slot from a recycling pool of
 * playbacks (source + gain nodes) and returns a playback key.
 *
 * Two wiring variants:
 *   - Pooled:       source -> gain -> destination, one gain per slot
 *                   (left/right volumes are averaged)
 *   - StereoPanned: source -> gainL/gainR -> channel merger -> destination;
 *                   playing a sound first stops its previous playback
 *
 * Volume changes ramp over 1/120 s instead of jumping, to avoid clicks.
 * End-of-playback frees the slot through the source's onended handler,
 * which AudioContext::dispatchEndedEvents() runs on the main thread.
 */

#include "hostbridge/audio/audio_context.h"
#include "hostbridge/bridge/call_table.h"
#include "hostbridge/bridge/handle_table.h"
#include <cstdint>
#include <memory>
#include <vector>

namespace hostbridge {
namespace bridge {
class GuestMemory;
}
namespace fs {
class AsyncFileReader;
}

namespace audio {

enum class AudioVariant {
    Pooled,
    StereoPanned
};

/**
 * Duration of every volume ramp, in seconds.
 */
constexpr double kVolumeRampSeconds = 1.0 / 120.0;

/**
 * One recyclable playback. soundKey == 0 marks a free slot.
 */
struct Playback {
    int32_t soundKey = 0;
    int32_t playbackKey = 0;
    std::unique_ptr<AudioBufferSourceNode> source;
    std::unique_ptr<GainNode> gainLeft;    // the only gain in the Pooled variant
    std::unique_ptr<GainNode> gainRight;   // StereoPanned only
    std::unique_ptr<ChannelMergerNode> merger;  // StereoPanned only

    bool isFree() const { return soundKey == 0; }
};

class AudioBridge {
public:
    static constexpr uint32_t kVersion = 1;

    AudioBridge(AudioContext& context, fs::AsyncFileReader& reader, bridge::GuestMemory& memory,
                AudioVariant variant);
    ~AudioBridge();

    void registerFunctions(bridge::CallTable& table);

    /**
     * Resume the context and play one silent frame to unlock the device.
     */
    void init();

    /**
     * Start decoding encoded audio. Returns the sound key right away;
     * isLoaded() turns true once the decode has been delivered.
     */
    int32_t addBuffer(std::vector<uint8_t> bytes);

    bool isLoaded(int32_t sound) const;

    /**
     * Returns the playback key, or 0 if the sound is not loaded.
     */
    int32_t play(int32_t sound, float volumeLeft, float volumeRight, float speed, bool loop);

    void setSoundVolume(int32_t sound, float volumeLeft, float volumeRight);
    void setPlaybackVolume(int32_t playback, float volume);

    void stopSound(int32_t sound);
    void stopPlayback(int32_t playback);
    void deleteSound(int32_t sound);

    AudioVariant variant() const { return variant_; }

    /**
     * Slots ever allocated (free and busy).
     */
    size_t poolSize() const { return pool_.size(); }
    size_t activePlaybackCount() const;

    /**
     * Busy slot for a playback key, or nullptr.
     */
    const Playback* findPlayback(int32_t playback) const;

    AudioBridge(const AudioBridge&) = delete;
    AudioBridge& operator=(const AudioBridge&) = delete;

private:
    Playback& recycle();
    void wire(Playback& slot);
    void stop(Playback& slot);
    void rampTo(GainNode* gain, float value);

    AudioContext& context_;
    fs::AsyncFileReader& reader_;
    bridge::GuestMemory& memory_;
    AudioVariant variant_;

    bridge::HandleTable<std::shared_ptr<AudioBuffer>> sounds_{"sound"};
    std::vector<std::unique_ptr<Playback>> pool_;
    int32_t nextPlaybackKey_ = 1;

    bool initialized_ = false;
    std::unique_ptr<AudioBufferSourceNode> unlockSource_;

    // Decode completions check this before touching the bridge
    std::shared_ptr<bool> alive_;
};

}  // namespace audio
}  // namespace hostbridge
