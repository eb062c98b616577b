#include "hostbridge/audio/audio_bridge.h"
#include "hostbridge/bridge/guest_memory.h"
#include "hostbridge/fs/async_file.h"
#include <iostream>
#include <mutex>

namespace hostbridge {
namespace audio {

using bridge::Args;
using guest::Value;

using GraphLock = std::lock_guard<std::recursive_mutex>;

AudioBridge::AudioBridge(AudioContext& context, fs::AsyncFileReader& reader, bridge::GuestMemory& memory,
                         AudioVariant variant)
    : context_(context)
    , reader_(reader)
    , memory_(memory)
    , variant_(variant)
    , alive_(std::make_shared<bool>(true)) {}

AudioBridge::~AudioBridge() {
    *alive_ = false;
    GraphLock lock(context_.graphMutex());
    for (auto& slot : pool_) {
        if (!slot->isFree()) {
            stop(*slot);
        }
    }
    pool_.clear();
    unlockSource_.reset();
}

void AudioBridge::init() {
    if (initialized_) return;
    initialized_ = true;

    context_.resume();

    // One silent frame wakes up devices that start muted
    auto silence = context_.createBuffer(1, 1, 22050.0f);
    unlockSource_ = context_.createBufferSource();
    unlockSource_->setBuffer(silence);
    unlockSource_->connect(context_.destination());
    AudioBufferSourceNode* source = unlockSource_.get();
    unlockSource_->onended = [source]() { source->disconnect(); };
    unlockSource_->start(0);

    std::cout << "[Audio] Initialized (" << (variant_ == AudioVariant::Pooled ? "pooled" : "stereo panned")
              << ", " << context_.sampleRate() << " Hz)" << std::endl;
}

int32_t AudioBridge::addBuffer(std::vector<uint8_t> bytes) {
    int32_t sound = sounds_.reserve();

    auto encoded = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
    auto decoded = std::make_shared<std::shared_ptr<AudioBuffer>>();
    std::weak_ptr<bool> alive = alive_;

    reader_.runTask(
        [encoded, decoded](std::vector<uint8_t>&, std::string& error) {
            *decoded = decodeAudioFile(encoded->data(), encoded->size(), &error);
        },
        [this, alive, sound, decoded](std::vector<uint8_t>, std::string error) {
            auto token = alive.lock();
            if (!token || !*token) return;

            if (!error.empty() || !*decoded) {
                std::cerr << "[Audio] Failed to decode audio buffer " << sound << ": " << error << std::endl;
                return;
            }
            // A sound deleted while decoding stays deleted
            if (!sounds_.set(sound, *decoded)) return;
        });

    return sound;
}

bool AudioBridge::isLoaded(int32_t sound) const {
    return sounds_.isLive(sound);
}

Playback& AudioBridge::recycle() {
    for (auto& slot : pool_) {
        if (slot->isFree()) {
            slot->source = context_.createBufferSource();
            return *slot;
        }
    }

    auto slot = std::make_unique<Playback>();
    slot->source = context_.createBufferSource();
    slot->gainLeft = context_.createGain();
    if (variant_ == AudioVariant::StereoPanned) {
        slot->gainRight = context_.createGain();
        slot->merger = context_.createChannelMerger(2);
    }
    pool_.push_back(std::move(slot));
    return *pool_.back();
}

void AudioBridge::wire(Playback& slot) {
    if (variant_ == AudioVariant::StereoPanned) {
        slot.source->connect(slot.gainLeft.get());
        slot.source->connect(slot.gainRight.get());
        slot.gainLeft->connect(slot.merger.get(), 0, 0);
        slot.gainRight->connect(slot.merger.get(), 0, 1);
        slot.merger->connect(context_.destination());
    } else {
        slot.source->connect(slot.gainLeft.get());
        slot.gainLeft->connect(context_.destination());
    }
}

void AudioBridge::stop(Playback& slot) {
    GraphLock lock(context_.graphMutex());
    if (slot.source) {
        slot.source->onended = nullptr;
        slot.source->stop(0);
        slot.source->disconnect();
    }
    slot.gainLeft->disconnect();
    if (slot.gainRight) slot.gainRight->disconnect();
    if (slot.merger) slot.merger->disconnect();
    slot.soundKey = 0;
    slot.playbackKey = 0;
}

void AudioBridge::rampTo(GainNode* gain, float value) {
    if (!gain) return;
    double now = context_.currentTime();
    AudioParam& param = gain->gain();
    param.setValueAtTime(param.valueAtTime(now), now);
    param.linearRampToValueAtTime(value, now + kVolumeRampSeconds);
}

int32_t AudioBridge::play(int32_t sound, float volumeLeft, float volumeRight, float speed, bool loop) {
    std::shared_ptr<AudioBuffer>* buffer = sounds_.lookup(sound, "audio_play_buffer");
    if (!buffer || !*buffer) {
        std::cerr << "[Audio] Sound " << sound << " is not loaded, ignoring play" << std::endl;
        return 0;
    }

    if (variant_ == AudioVariant::StereoPanned) {
        stopSound(sound);
    }

    GraphLock lock(context_.graphMutex());
    Playback& slot = recycle();
    slot.soundKey = sound;
    slot.playbackKey = nextPlaybackKey_++;

    if (variant_ == AudioVariant::StereoPanned) {
        slot.gainLeft->gain().setValue(volumeLeft);
        slot.gainRight->gain().setValue(volumeRight);
    } else {
        slot.gainLeft->gain().setValue((volumeLeft + volumeRight) * 0.5f);
    }

    slot.source->setLoop(loop);
    slot.source->playbackRate().setValue(speed);
    slot.source->setBuffer(*buffer);
    wire(slot);

    Playback* target = &slot;
    int32_t key = slot.playbackKey;
    slot.source->onended = [this, target, key]() {
        // The slot may already have been stopped and handed to a new play
        if (target->playbackKey == key) {
            stop(*target);
        }
    };

    if (!slot.source->start(0)) {
        std::cerr << "[Audio] Error starting sound " << sound << std::endl;
        stop(slot);
        return 0;
    }
    return key;
}

void AudioBridge::setSoundVolume(int32_t sound, float volumeLeft, float volumeRight) {
    GraphLock lock(context_.graphMutex());
    for (auto& slot : pool_) {
        if (slot->isFree() || slot->soundKey != sound) continue;
        if (variant_ == AudioVariant::StereoPanned) {
            rampTo(slot->gainLeft.get(), volumeLeft);
            rampTo(slot->gainRight.get(), volumeRight);
        } else {
            rampTo(slot->gainLeft.get(), (volumeLeft + volumeRight) * 0.5f);
        }
    }
}

void AudioBridge::setPlaybackVolume(int32_t playback, float volume) {
    GraphLock lock(context_.graphMutex());
    for (auto& slot : pool_) {
        if (slot->isFree() || slot->playbackKey != playback) continue;
        rampTo(slot->gainLeft.get(), volume);
        rampTo(slot->gainRight.get(), volume);
        return;
    }
}

void AudioBridge::stopSound(int32_t sound) {
    for (auto& slot : pool_) {
        if (!slot->isFree() && slot->soundKey == sound) {
            stop(*slot);
        }
    }
}

void AudioBridge::stopPlayback(int32_t playback) {
    if (playback == 0) return;
    for (auto& slot : pool_) {
        if (!slot->isFree() && slot->playbackKey == playback) {
            stop(*slot);
            return;
        }
    }
    std::cout << "[Audio] Playback " << playback << " already stopped" << std::endl;
}

void AudioBridge::deleteSound(int32_t sound) {
    stopSound(sound);
    sounds_.free(sound);
}

size_t AudioBridge::activePlaybackCount() const {
    size_t count = 0;
    for (const auto& slot : pool_) {
        if (!slot->isFree()) count++;
    }
    return count;
}

const Playback* AudioBridge::findPlayback(int32_t playback) const {
    for (const auto& slot : pool_) {
        if (!slot->isFree() && slot->playbackKey == playback) return slot.get();
    }
    return nullptr;
}

void AudioBridge::registerFunctions(bridge::CallTable& table) {
    table.set("audio_init", [this](const Args&) {
        init();
        return Value::none();
    });
    table.set("audio_add_buffer", [this](const Args& args) {
        uint32_t ptr = bridge::arg(args, 0).asU32();
        size_t len = bridge::arg(args, 1).asU32();
        uint8_t* data = memory_.bytes(ptr, len, "audio_add_buffer");
        if (!data) return Value::fromI32(0);
        return Value::fromI32(addBuffer(std::vector<uint8_t>(data, data + len)));
    });
    table.set("audio_source_is_loaded", [this](const Args& args) {
        return Value::fromBool(isLoaded(bridge::arg(args, 0).asI32()));
    });
    table.set("audio_play_buffer", [this](const Args& args) {
        return Value::fromI32(play(bridge::arg(args, 0).asI32(),
                                   bridge::arg(args, 1).asF32(),
                                   bridge::arg(args, 2).asF32(),
                                   bridge::arg(args, 3).asF32(),
                                   bridge::arg(args, 4).asBool()));
    });
    table.set("audio_source_set_volume", [this](const Args& args) {
        setSoundVolume(bridge::arg(args, 0).asI32(), bridge::arg(args, 1).asF32(), bridge::arg(args, 2).asF32());
        return Value::none();
    });
    table.set("audio_source_stop", [this](const Args& args) {
        stopSound(bridge::arg(args, 0).asI32());
        return Value::none();
    });
    table.set("audio_source_delete", [this](const Args& args) {
        deleteSound(bridge::arg(args, 0).asI32());
        return Value::none();
    });
    table.set("audio_playback_stop", [this](const Args& args) {
        stopPlayback(bridge::arg(args, 0).asI32());
        return Value::none();
    });
    table.set("audio_playback_set_volume", [this](const Args& args) {
        setPlaybackVolume(bridge::arg(args, 0).asI32(), bridge::arg(args, 1).asF32());
        return Value::none();
    });
}

}  // namespace audio
}  // namespace hostbridge
