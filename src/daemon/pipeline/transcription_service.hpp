#pragma once

#include "audio/audio_loader.hpp"
#include "transcription_pipeline.hpp"

#include <functional>
#include <string>

// Resolves an audio reference and runs it through the pipeline. Shared by the
// synchronous request path and background jobs.
class TranscriptionService {
public:
    // Called once the audio is decoded, with its duration in seconds.
    using LoadedCallback = std::function<void(double)>;

    TranscriptionService(AudioLoader& loader, TranscriptionPipeline& pipeline,
                         std::string default_language);

    std::expected<TranscriptionResult, Error> transcribe(const std::string& audio_ref,
                                                         const std::string& language,
                                                         const LoadedCallback& on_loaded = {});

    const std::string& default_language() const { return default_language_; }

private:
    AudioLoader& loader_;
    TranscriptionPipeline& pipeline_;
    std::string default_language_;
};
