#pragma once

#include <string>

namespace voice_orchestrator {

// Speech synthesis player of one call. Start/end of playback arrive as
// TtsStart/TtsEnd events on the call inbox.
class TtsEngine {
public:
    virtual ~TtsEngine() = default;

    virtual bool is_playing() const = 0;
    // Halts playback. Idempotent and bounded; returns false when the halt
    // could not be confirmed in time.
    virtual bool stop() = 0;
    // Returns false when the command could not be handed to the player.
    virtual bool speak(const std::string& text) = 0;
};

// Speech recognition stream. Partial and final transcripts arrive as events.
class AsrEngine {
public:
    virtual ~AsrEngine() = default;

    virtual void resume() = 0;
};

// Voice activity detector. Speech start/end and silence arrive as events;
// the audio quality hints are optional.
class VadEngine {
public:
    virtual ~VadEngine() = default;

    virtual void enable_aec() {}
    virtual void enable_ns() {}
    virtual void enable_agc() {}
};

}
