/**
 * Audio Graph
 *
 * AudioContext, AudioBufferSourceNode, GainNode and ChannelMergerNode
 * rendered into an SDL3 audio stream. A small subset of the W3C Web Audio
 * model: nodes form a pull graph rooted at the destination, and every node
 * renders at most once per render quantum so fan-out is safe.
 *
 * Threading: SDL pulls audio on its own thread. All graph mutation goes
 * through the context's graph mutex (recursive, so node methods can be
 * called while the caller already holds it). `onended` never runs on the
 * audio thread; ended sources are queued and delivered by
 * dispatchEndedEvents() on the main thread.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct SDL_AudioStream;

namespace hostbridge {
namespace audio {

class AudioContext;
class AudioBufferSourceNode;

/**
 * AudioBuffer - holds decoded audio data
 */
class AudioBuffer {
public:
    AudioBuffer(float sampleRate, int numberOfChannels, size_t length);

    float sampleRate() const { return sampleRate_; }
    int numberOfChannels() const { return numberOfChannels_; }
    size_t length() const { return length_; }
    double duration() const { return static_cast<double>(length_) / sampleRate_; }

    float* getChannelData(int channel);
    const float* getChannelData(int channel) const;

    void setFromInterleaved(const float* data, size_t numSamples, int numChannels);

private:
    float sampleRate_;
    int numberOfChannels_;
    size_t length_;  // Number of sample frames
    std::vector<std::vector<float>> channelData_;
};

/**
 * AudioParam - an automatable parameter
 *
 * Supports immediate assignment plus setValueAtTime and
 * linearRampToValueAtTime events, evaluated per sample frame.
 */
class AudioParam {
public:
    explicit AudioParam(float defaultValue = 1.0f, std::recursive_mutex* guard = nullptr);

    /**
     * Value at the most recent evaluation point (or the static value).
     */
    float value() const;

    /**
     * Set immediately; cancels scheduled automation.
     */
    void setValue(float v);

    void setValueAtTime(float value, double time);
    void linearRampToValueAtTime(float value, double time);
    void cancelScheduledValues(double time);

    /**
     * Evaluate automation at a context time.
     */
    float valueAtTime(double time) const;

private:
    struct Event {
        enum class Type { Set, LinearRamp } type;
        float value;
        double time;
    };

    std::recursive_mutex* guard_;
    float value_;
    float defaultValue_;
    std::vector<Event> events_;  // sorted by time
};

/**
 * AudioNode - base class for all audio nodes
 */
class AudioNode {
public:
    explicit AudioNode(AudioContext* context, int numberOfInputs = 1);
    virtual ~AudioNode();

    AudioContext* context() const { return context_; }

    /**
     * Connect this node's output to one input of `destination`.
     */
    virtual void connect(AudioNode* destination, int output = 0, int input = 0);

    /**
     * Remove every outgoing connection.
     */
    virtual void disconnect();

    size_t outputCount() const { return outputs_.size(); }
    size_t inputCount() const { return inputs_.size(); }

    /**
     * Output of this node for the render quantum `quantum`, computed at
     * most once per quantum. Caller holds the graph mutex.
     */
    const float* pull(uint64_t quantum, size_t numFrames, int numChannels, double time);

    AudioNode(const AudioNode&) = delete;
    AudioNode& operator=(const AudioNode&) = delete;

protected:
    /**
     * Produce output into a zeroed buffer.
     */
    virtual void process(float* output, size_t numFrames, int numChannels, double time);

    /**
     * Sum the connected inputs (optionally only those on one input index).
     */
    void mixInputs(float* output, size_t numFrames, int numChannels, double time, int inputIndex = -1);

    struct Connection {
        AudioNode* node;
        int input;
    };

    AudioContext* context_;
    int numberOfInputs_;
    std::vector<Connection> inputs_;
    std::vector<AudioNode*> outputs_;

private:
    void removeInput(AudioNode* node);
    void removeOutput(AudioNode* node);

    uint64_t renderedQuantum_ = 0;
    uint64_t currentQuantum_ = 0;
    std::vector<float> renderBuffer_;
};

/**
 * AudioDestinationNode - final output
 */
class AudioDestinationNode : public AudioNode {
public:
    explicit AudioDestinationNode(AudioContext* context);

    int maxChannelCount() const { return 2; }
};

/**
 * GainNode - adjusts volume, per-frame automatable
 */
class GainNode : public AudioNode {
public:
    explicit GainNode(AudioContext* context);

    AudioParam& gain() { return gain_; }
    const AudioParam& gain() const { return gain_; }

protected:
    void process(float* output, size_t numFrames, int numChannels, double time) override;

private:
    AudioParam gain_;
};

/**
 * ChannelMergerNode - input N feeds output channel N (inputs downmixed to mono)
 */
class ChannelMergerNode : public AudioNode {
public:
    ChannelMergerNode(AudioContext* context, int numberOfInputs);

protected:
    void process(float* output, size_t numFrames, int numChannels, double time) override;

private:
    std::vector<float> scratch_;
};

/**
 * AudioBufferSourceNode - plays an AudioBuffer
 */
class AudioBufferSourceNode : public AudioNode {
public:
    explicit AudioBufferSourceNode(AudioContext* context);
    ~AudioBufferSourceNode() override;

    void setBuffer(std::shared_ptr<AudioBuffer> buffer);
    std::shared_ptr<AudioBuffer> buffer() const { return buffer_; }

    bool loop() const { return loop_; }
    void setLoop(bool loop) { loop_ = loop; }

    AudioParam& playbackRate() { return playbackRate_; }

    /**
     * Begin playback. Returns false if already started or no buffer is set.
     */
    bool start(double when = 0, double offset = 0);

    /**
     * Schedule the end of playback. Returns false if not playing.
     */
    bool stop(double when = 0);

    bool isPlaying() const { return isPlaying_; }
    bool hasEnded() const { return ended_; }

    // Delivered on the main thread by AudioContext::dispatchEndedEvents()
    std::function<void()> onended;

protected:
    void process(float* output, size_t numFrames, int numChannels, double time) override;

private:
    void finish();

    std::shared_ptr<AudioBuffer> buffer_;
    AudioParam playbackRate_;
    bool loop_ = false;
    bool started_ = false;
    bool isPlaying_ = false;
    bool ended_ = false;
    double position_ = 0;  // in buffer frames
    double startTime_ = 0;
    double stopTime_ = -1;
};

/**
 * AudioContext - owns the device stream and the destination
 */
class AudioContext {
public:
    struct Options {
        bool openDevice = true;
        float sampleRate = 44100.0f;
    };

    AudioContext();
    explicit AudioContext(const Options& options);
    ~AudioContext();

    enum class State { Suspended, Running, Closed };
    State state() const { return state_; }

    float sampleRate() const { return sampleRate_; }
    double currentTime() const;
    AudioDestinationNode* destination() { return destination_.get(); }

    bool hasDevice() const { return audioStream_ != nullptr; }

    std::shared_ptr<AudioBuffer> createBuffer(int numberOfChannels, size_t length, float sampleRate);
    std::unique_ptr<AudioBufferSourceNode> createBufferSource();
    std::unique_ptr<GainNode> createGain();
    std::unique_ptr<ChannelMergerNode> createChannelMerger(int numberOfInputs = 2);

    void resume();
    void suspend();
    void close();

    /**
     * Render interleaved stereo frames and advance the clock.
     * Called from the SDL audio thread; tests call it directly.
     */
    void render(float* output, size_t numFrames);

    /**
     * Invoke `onended` for sources that finished since the last call.
     * Main thread only. Returns the number of events delivered.
     */
    int dispatchEndedEvents();

    std::recursive_mutex& graphMutex() { return graphMutex_; }

    // Internal: sources report natural or scheduled end here
    void queueEnded(AudioBufferSourceNode* source);
    void forgetEnded(AudioBufferSourceNode* source);

    AudioContext(const AudioContext&) = delete;
    AudioContext& operator=(const AudioContext&) = delete;

private:
    static void sdlAudioCallback(void* userdata, SDL_AudioStream* stream, int additionalAmount, int totalAmount);

    State state_ = State::Suspended;
    float sampleRate_ = 44100.0f;
    std::atomic<uint64_t> sampleCount_{0};
    uint64_t quantum_ = 0;
    std::atomic<bool> shuttingDown_{false};

    std::recursive_mutex graphMutex_;
    std::unique_ptr<AudioDestinationNode> destination_;
    std::vector<AudioBufferSourceNode*> endedSources_;
    std::vector<float> mixBuffer_;

    SDL_AudioStream* audioStream_ = nullptr;
};

/**
 * Decode audio file data (WAV) and convert to float.
 * Safe to call from a worker thread. Returns nullptr and fills error on failure.
 */
std::shared_ptr<AudioBuffer> decodeAudioFile(const uint8_t* data, size_t length, std::string* error = nullptr);

}  // namespace audio
}  // namespace hostbridge
