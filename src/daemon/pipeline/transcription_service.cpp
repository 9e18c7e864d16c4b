#include "transcription_service.hpp"

TranscriptionService::TranscriptionService(AudioLoader& loader, TranscriptionPipeline& pipeline,
                                           std::string default_language)
    : loader_(loader), pipeline_(pipeline), default_language_(std::move(default_language)) {}

std::expected<TranscriptionResult, Error>
TranscriptionService::transcribe(const std::string& audio_ref, const std::string& language,
                                 const LoadedCallback& on_loaded) {
    auto audio = loader_.load(audio_ref);
    if (!audio) return std::unexpected(audio.error());

    if (on_loaded) on_loaded(audio->duration());

    return pipeline_.run(*audio, language.empty() ? default_language_ : language);
}
