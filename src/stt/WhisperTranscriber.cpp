#include "stt/WhisperTranscriber.hpp"
#include <spdlog/spdlog.h>
#include <whisper.h>
#include <filesystem>

static constexpr int kWhisperSampleRate = 16000;

WhisperTranscriber::WhisperTranscriber(const WhisperConfig& config)
    : config_(config)
{
    if (!std::filesystem::exists(config_.modelPath)) {
        spdlog::error("whisper: model file not found: {}", config_.modelPath);
        return;
    }

    spdlog::info("whisper: loading {} ({} threads, language {})",
                 config_.modelPath, config_.threads,
                 config_.language.empty() ? "auto" : config_.language);

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(config_.modelPath.c_str(), cparams);
    if (!ctx_) {
        spdlog::error("whisper: failed to load model {}", config_.modelPath);
        return;
    }
    spdlog::info("whisper: model loaded");
}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) whisper_free(ctx_);
}

TranscriptionResult WhisperTranscriber::transcribe(const std::vector<float>& pcm,
                                                   int sampleRate) {
    if (pcm.empty())
        return {false, "", "no audio data"};
    if (!ctx_)
        return {false, "", "whisper model not loaded"};
    if (sampleRate != kWhisperSampleRate)
        return {false, "", "whisper expects 16000Hz audio, got " +
                           std::to_string(sampleRate) + "Hz"};

    std::lock_guard lock(mtx_);

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.n_threads        = config_.threads;
    params.print_realtime   = false;
    params.print_progress   = false;
    params.print_timestamps = false;
    params.print_special    = false;
    params.translate        = false;
    params.single_segment   = false;
    params.language         = config_.language.empty()
                                ? nullptr : config_.language.c_str();
    if (!config_.initialPrompt.empty())
        params.initial_prompt = config_.initialPrompt.c_str();

    spdlog::debug("whisper: transcribing {} samples", pcm.size());

    if (whisper_full(ctx_, params, pcm.data(), (int)pcm.size()) != 0)
        return {false, "", "whisper_full failed"};

    std::string text;
    int segments = whisper_full_n_segments(ctx_);
    for (int i = 0; i < segments; i++) {
        const char* seg = whisper_full_get_segment_text(ctx_, i);
        if (seg) text += seg;
    }

    // Trim the leading space whisper emits before each segment
    auto first = text.find_first_not_of(" \t\n");
    auto last  = text.find_last_not_of(" \t\n");
    text = first == std::string::npos ? "" : text.substr(first, last - first + 1);

    return {true, text, ""};
}
