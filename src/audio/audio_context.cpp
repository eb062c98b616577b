/**
 * Audio graph implementation using SDL3
 */

#include "hostbridge/audio/audio_context.h"
#include <SDL3/SDL.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

namespace hostbridge {
namespace audio {

using GraphLock = std::lock_guard<std::recursive_mutex>;

// ============================================================================
// AudioBuffer
// ============================================================================

AudioBuffer::AudioBuffer(float sampleRate, int numberOfChannels, size_t length)
    : sampleRate_(sampleRate)
    , numberOfChannels_(numberOfChannels)
    , length_(length) {
    channelData_.resize(numberOfChannels);
    for (int i = 0; i < numberOfChannels; i++) {
        channelData_[i].resize(length, 0.0f);
    }
}

float* AudioBuffer::getChannelData(int channel) {
    if (channel < 0 || channel >= numberOfChannels_) return nullptr;
    return channelData_[channel].data();
}

const float* AudioBuffer::getChannelData(int channel) const {
    if (channel < 0 || channel >= numberOfChannels_) return nullptr;
    return channelData_[channel].data();
}

void AudioBuffer::setFromInterleaved(const float* data, size_t numSamples, int numChannels) {
    size_t frames = numSamples / numChannels;
    length_ = frames;
    numberOfChannels_ = numChannels;
    channelData_.resize(numChannels);

    for (int ch = 0; ch < numChannels; ch++) {
        channelData_[ch].resize(frames);
        for (size_t i = 0; i < frames; i++) {
            channelData_[ch][i] = data[i * numChannels + ch];
        }
    }
}

// ============================================================================
// AudioParam
// ============================================================================

AudioParam::AudioParam(float defaultValue, std::recursive_mutex* guard)
    : guard_(guard)
    , value_(defaultValue)
    , defaultValue_(defaultValue) {}

float AudioParam::value() const {
    std::unique_lock<std::recursive_mutex> lock;
    if (guard_) lock = std::unique_lock<std::recursive_mutex>(*guard_);
    return events_.empty() ? value_ : events_.back().value;
}

void AudioParam::setValue(float v) {
    std::unique_lock<std::recursive_mutex> lock;
    if (guard_) lock = std::unique_lock<std::recursive_mutex>(*guard_);
    events_.clear();
    value_ = v;
}

void AudioParam::setValueAtTime(float value, double time) {
    std::unique_lock<std::recursive_mutex> lock;
    if (guard_) lock = std::unique_lock<std::recursive_mutex>(*guard_);

    // Render time only moves forward, so events before this one are spent
    value_ = valueAtTime(time);
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [time](const Event& e) { return e.time < time; }),
                  events_.end());

    Event event{Event::Type::Set, value, time};
    auto pos = std::upper_bound(events_.begin(), events_.end(), time,
                                [](double t, const Event& e) { return t < e.time; });
    events_.insert(pos, event);
}

void AudioParam::linearRampToValueAtTime(float value, double time) {
    std::unique_lock<std::recursive_mutex> lock;
    if (guard_) lock = std::unique_lock<std::recursive_mutex>(*guard_);

    Event event{Event::Type::LinearRamp, value, time};
    auto pos = std::upper_bound(events_.begin(), events_.end(), time,
                                [](double t, const Event& e) { return t < e.time; });
    events_.insert(pos, event);
}

void AudioParam::cancelScheduledValues(double time) {
    std::unique_lock<std::recursive_mutex> lock;
    if (guard_) lock = std::unique_lock<std::recursive_mutex>(*guard_);
    events_.erase(std::remove_if(events_.begin(), events_.end(),
                                 [time](const Event& e) { return e.time >= time; }),
                  events_.end());
}

float AudioParam::valueAtTime(double time) const {
    float current = value_;
    double previousTime = 0.0;

    for (const Event& e : events_) {
        if (e.time > time) {
            if (e.type == Event::Type::LinearRamp && e.time > previousTime) {
                double t = (time - previousTime) / (e.time - previousTime);
                if (t < 0.0) t = 0.0;
                return static_cast<float>(current + (e.value - current) * t);
            }
            return current;
        }
        current = e.value;
        previousTime = e.time;
    }
    return current;
}

// ============================================================================
// AudioNode
// ============================================================================

AudioNode::AudioNode(AudioContext* context, int numberOfInputs)
    : context_(context)
    , numberOfInputs_(numberOfInputs) {}

AudioNode::~AudioNode() {
    GraphLock lock(context_->graphMutex());
    disconnect();
    for (const Connection& c : inputs_) {
        c.node->removeOutput(this);
    }
    inputs_.clear();
}

void AudioNode::connect(AudioNode* destination, int output, int input) {
    if (!destination) return;
    if (output != 0 || input < 0 || input >= destination->numberOfInputs_) {
        std::cerr << "[Audio] connect: output " << output << " / input " << input
                  << " out of range" << std::endl;
        return;
    }

    GraphLock lock(context_->graphMutex());
    for (const Connection& c : destination->inputs_) {
        if (c.node == this && c.input == input) return;
    }
    destination->inputs_.push_back({this, input});
    outputs_.push_back(destination);
}

void AudioNode::disconnect() {
    GraphLock lock(context_->graphMutex());
    for (AudioNode* out : outputs_) {
        out->removeInput(this);
    }
    outputs_.clear();
}

void AudioNode::removeInput(AudioNode* node) {
    inputs_.erase(std::remove_if(inputs_.begin(), inputs_.end(),
                                 [node](const Connection& c) { return c.node == node; }),
                  inputs_.end());
}

void AudioNode::removeOutput(AudioNode* node) {
    outputs_.erase(std::remove(outputs_.begin(), outputs_.end(), node), outputs_.end());
}

const float* AudioNode::pull(uint64_t quantum, size_t numFrames, int numChannels, double time) {
    size_t n = numFrames * numChannels;
    if (renderedQuantum_ == quantum && renderBuffer_.size() == n) {
        return renderBuffer_.data();
    }

    renderBuffer_.assign(n, 0.0f);
    renderedQuantum_ = quantum;
    currentQuantum_ = quantum;
    process(renderBuffer_.data(), numFrames, numChannels, time);
    return renderBuffer_.data();
}

void AudioNode::process(float* output, size_t numFrames, int numChannels, double time) {
    mixInputs(output, numFrames, numChannels, time);
}

void AudioNode::mixInputs(float* output, size_t numFrames, int numChannels, double time, int inputIndex) {
    size_t n = numFrames * numChannels;
    for (const Connection& c : inputs_) {
        if (inputIndex >= 0 && c.input != inputIndex) continue;
        const float* in = c.node->pull(currentQuantum_, numFrames, numChannels, time);
        for (size_t i = 0; i < n; i++) {
            output[i] += in[i];
        }
    }
}

// ============================================================================
// AudioDestinationNode
// ============================================================================

AudioDestinationNode::AudioDestinationNode(AudioContext* context)
    : AudioNode(context) {}

// ============================================================================
// GainNode
// ============================================================================

GainNode::GainNode(AudioContext* context)
    : AudioNode(context)
    , gain_(1.0f, &context->graphMutex()) {}

void GainNode::process(float* output, size_t numFrames, int numChannels, double time) {
    mixInputs(output, numFrames, numChannels, time);

    double frameDuration = 1.0 / context_->sampleRate();
    for (size_t frame = 0; frame < numFrames; frame++) {
        float g = gain_.valueAtTime(time + frame * frameDuration);
        for (int ch = 0; ch < numChannels; ch++) {
            output[frame * numChannels + ch] *= g;
        }
    }
}

// ============================================================================
// ChannelMergerNode
// ============================================================================

ChannelMergerNode::ChannelMergerNode(AudioContext* context, int numberOfInputs)
    : AudioNode(context, numberOfInputs) {}

void ChannelMergerNode::process(float* output, size_t numFrames, int numChannels, double time) {
    int merged = std::min(numberOfInputs_, numChannels);
    scratch_.resize(numFrames * numChannels);

    for (int input = 0; input < merged; input++) {
        std::fill(scratch_.begin(), scratch_.end(), 0.0f);
        mixInputs(scratch_.data(), numFrames, numChannels, time, input);

        for (size_t frame = 0; frame < numFrames; frame++) {
            float mono = 0.0f;
            for (int ch = 0; ch < numChannels; ch++) {
                mono += scratch_[frame * numChannels + ch];
            }
            output[frame * numChannels + input] = mono / numChannels;
        }
    }
}

// ============================================================================
// AudioBufferSourceNode
// ============================================================================

AudioBufferSourceNode::AudioBufferSourceNode(AudioContext* context)
    : AudioNode(context, 0)
    , playbackRate_(1.0f, &context->graphMutex()) {}

AudioBufferSourceNode::~AudioBufferSourceNode() {
    context_->forgetEnded(this);
}

void AudioBufferSourceNode::setBuffer(std::shared_ptr<AudioBuffer> buffer) {
    GraphLock lock(context_->graphMutex());
    buffer_ = std::move(buffer);
}

bool AudioBufferSourceNode::start(double when, double offset) {
    GraphLock lock(context_->graphMutex());
    if (started_ || !buffer_) return false;

    started_ = true;
    isPlaying_ = true;
    startTime_ = context_->currentTime() + when;
    position_ = offset * buffer_->sampleRate();
    return true;
}

bool AudioBufferSourceNode::stop(double when) {
    GraphLock lock(context_->graphMutex());
    if (!isPlaying_) return false;
    stopTime_ = context_->currentTime() + when;
    return true;
}

void AudioBufferSourceNode::finish() {
    isPlaying_ = false;
    ended_ = true;
    context_->queueEnded(this);
}

void AudioBufferSourceNode::process(float* output, size_t numFrames, int numChannels, double time) {
    if (!isPlaying_ || !buffer_) return;

    double frameDuration = 1.0 / context_->sampleRate();
    double step = buffer_->sampleRate() / context_->sampleRate();
    int bufferChannels = buffer_->numberOfChannels();
    size_t bufferLength = buffer_->length();

    for (size_t frame = 0; frame < numFrames; frame++) {
        double t = time + frame * frameDuration;

        if (stopTime_ >= 0 && t >= stopTime_) {
            finish();
            return;
        }
        if (t < startTime_) {
            continue;
        }

        size_t index = static_cast<size_t>(position_);
        if (index >= bufferLength) {
            if (loop_ && bufferLength > 0) {
                position_ = std::fmod(position_, static_cast<double>(bufferLength));
                index = static_cast<size_t>(position_);
            } else {
                finish();
                return;
            }
        }

        for (int ch = 0; ch < numChannels; ch++) {
            const float* channelData = buffer_->getChannelData(ch % bufferChannels);
            if (channelData) {
                output[frame * numChannels + ch] += channelData[index];
            }
        }

        float rate = playbackRate_.valueAtTime(t);
        position_ += step * (rate > 0.0f ? rate : 0.0f);
    }
}

// ============================================================================
// AudioContext
// ============================================================================

AudioContext::AudioContext() : AudioContext(Options()) {}

AudioContext::AudioContext(const Options& options)
    : sampleRate_(options.sampleRate) {
    destination_ = std::make_unique<AudioDestinationNode>(this);

    if (!options.openDevice) {
        return;
    }

    if (!SDL_WasInit(SDL_INIT_AUDIO)) {
        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            std::cerr << "[Audio] Failed to init SDL audio: " << SDL_GetError() << std::endl;
            return;
        }
    }

    SDL_AudioSpec spec;
    spec.freq = static_cast<int>(sampleRate_);
    spec.format = SDL_AUDIO_F32;
    spec.channels = 2;

    audioStream_ = SDL_OpenAudioDeviceStream(
        SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK,
        &spec,
        sdlAudioCallback,
        this
    );

    if (!audioStream_) {
        std::cerr << "[Audio] Failed to open audio device: " << SDL_GetError() << std::endl;
        return;
    }

    std::cout << "[Audio] AudioContext created (sample rate: " << sampleRate_ << " Hz)" << std::endl;
}

AudioContext::~AudioContext() {
    close();
}

double AudioContext::currentTime() const {
    return static_cast<double>(sampleCount_.load(std::memory_order_acquire)) / sampleRate_;
}

std::shared_ptr<AudioBuffer> AudioContext::createBuffer(int numberOfChannels, size_t length, float sampleRate) {
    return std::make_shared<AudioBuffer>(sampleRate, numberOfChannels, length);
}

std::unique_ptr<AudioBufferSourceNode> AudioContext::createBufferSource() {
    return std::make_unique<AudioBufferSourceNode>(this);
}

std::unique_ptr<GainNode> AudioContext::createGain() {
    return std::make_unique<GainNode>(this);
}

std::unique_ptr<ChannelMergerNode> AudioContext::createChannelMerger(int numberOfInputs) {
    return std::make_unique<ChannelMergerNode>(this, numberOfInputs);
}

void AudioContext::resume() {
    if (state_ == State::Closed || state_ == State::Running) return;
    if (audioStream_) {
        SDL_ResumeAudioStreamDevice(audioStream_);
    }
    state_ = State::Running;
    std::cout << "[Audio] AudioContext resumed" << std::endl;
}

void AudioContext::suspend() {
    if (state_ == State::Closed) return;
    if (audioStream_) {
        SDL_PauseAudioStreamDevice(audioStream_);
    }
    state_ = State::Suspended;
}

void AudioContext::close() {
    if (state_ == State::Closed) return;

    // Signal callback to stop processing first
    shuttingDown_.store(true, std::memory_order_release);

    if (audioStream_) {
        // SDL waits for a running callback to finish
        SDL_DestroyAudioStream(audioStream_);
        audioStream_ = nullptr;
    }

    state_ = State::Closed;
}

void AudioContext::render(float* output, size_t numFrames) {
    GraphLock lock(graphMutex_);

    quantum_++;
    const float* mixed = destination_->pull(quantum_, numFrames, 2, currentTime());

    for (size_t i = 0; i < numFrames * 2; i++) {
        output[i] = std::clamp(mixed[i], -1.0f, 1.0f);
    }

    sampleCount_.fetch_add(numFrames, std::memory_order_release);
}

void AudioContext::queueEnded(AudioBufferSourceNode* source) {
    GraphLock lock(graphMutex_);
    endedSources_.push_back(source);
}

void AudioContext::forgetEnded(AudioBufferSourceNode* source) {
    GraphLock lock(graphMutex_);
    endedSources_.erase(std::remove(endedSources_.begin(), endedSources_.end(), source),
                        endedSources_.end());
}

int AudioContext::dispatchEndedEvents() {
    int delivered = 0;
    for (;;) {
        std::function<void()> handler;
        {
            GraphLock lock(graphMutex_);
            if (endedSources_.empty()) break;
            AudioBufferSourceNode* source = endedSources_.front();
            endedSources_.erase(endedSources_.begin());
            handler = source->onended;
        }
        // The handler may destroy the source; it only holds a copy
        if (handler) handler();
        delivered++;
    }
    return delivered;
}

void AudioContext::sdlAudioCallback(void* userdata, SDL_AudioStream* stream, int additionalAmount, int totalAmount) {
    (void)totalAmount;
    auto* ctx = static_cast<AudioContext*>(userdata);

    // No I/O (cout) in here - it runs on SDL's audio thread
    if (ctx->shuttingDown_.load(std::memory_order_relaxed)) {
        if (additionalAmount > 0) {
            std::vector<float> silence(additionalAmount / sizeof(float), 0.0f);
            SDL_PutAudioStreamData(stream, silence.data(), additionalAmount);
        }
        return;
    }

    if (additionalAmount <= 0) return;

    int numFrames = additionalAmount / static_cast<int>(2 * sizeof(float));  // Stereo float
    std::vector<float> buffer(numFrames * 2);
    ctx->render(buffer.data(), numFrames);

    SDL_PutAudioStreamData(stream, buffer.data(), numFrames * 2 * static_cast<int>(sizeof(float)));
}

// ============================================================================
// Audio Decoding
// ============================================================================

std::shared_ptr<AudioBuffer> decodeAudioFile(const uint8_t* data, size_t length, std::string* error) {
    auto fail = [error](const std::string& message) -> std::shared_ptr<AudioBuffer> {
        if (error) *error = message;
        return nullptr;
    };

    SDL_IOStream* io = SDL_IOFromConstMem(data, length);
    if (!io) {
        return fail(std::string("Failed to create IO stream: ") + SDL_GetError());
    }

    SDL_AudioSpec spec;
    uint8_t* audioData = nullptr;
    uint32_t audioLen = 0;

    if (!SDL_LoadWAV_IO(io, true, &spec, &audioData, &audioLen)) {
        return fail(std::string("Failed to load audio: ") + SDL_GetError());
    }

    std::vector<float> floatData;
    int numChannels = spec.channels;
    size_t numSamples = 0;

    if (spec.format == SDL_AUDIO_F32) {
        numSamples = audioLen / sizeof(float);
        floatData.resize(numSamples);
        std::memcpy(floatData.data(), audioData, numSamples * sizeof(float));
    } else if (spec.format == SDL_AUDIO_S16) {
        numSamples = audioLen / sizeof(int16_t);
        floatData.resize(numSamples);
        const int16_t* src = reinterpret_cast<const int16_t*>(audioData);
        for (size_t i = 0; i < numSamples; i++) {
            floatData[i] = src[i] / 32768.0f;
        }
    } else if (spec.format == SDL_AUDIO_U8) {
        numSamples = audioLen;
        floatData.resize(numSamples);
        for (size_t i = 0; i < numSamples; i++) {
            floatData[i] = (audioData[i] - 128) / 128.0f;
        }
    } else {
        SDL_free(audioData);
        return fail("Unsupported audio format: " + std::to_string(static_cast<int>(spec.format)));
    }

    SDL_free(audioData);

    if (numChannels <= 0) {
        return fail("Audio has no channels");
    }

    size_t numFrames = numSamples / numChannels;
    auto buffer = std::make_shared<AudioBuffer>(static_cast<float>(spec.freq), numChannels, numFrames);
    buffer->setFromInterleaved(floatData.data(), numSamples, numChannels);
    return buffer;
}

}  // namespace audio
}  // namespace hostbridge
