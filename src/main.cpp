#include "audio/PortAudioSystem.hpp"
#include "audio/PortAudioCapture.hpp"
#include "audio/DeviceSelector.hpp"
#include "audio/FeedbackPlayer.hpp"
#include "audio/LoopbackRecorder.hpp"
#include "daemon/ControlServer.hpp"
#include "daemon/DaemonConfig.hpp"
#include "daemon/ProcessingPipeline.hpp"
#include "daemon/RecordingController.hpp"
#include "stt/NullTranscriber.hpp"
#ifdef HAS_WHISPER
#include "stt/WhisperTranscriber.hpp"
#endif
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

static constexpr const char* kVersion = "0.1.0";

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running = false;
}

static std::string getEnv(const std::string& key,
                          const std::string& defaultVal = "") {
    const char* val = std::getenv(key.c_str());
    return val ? val : defaultVal;
}

static void setupLogging(bool toFile) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (toFile) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            "voxd.log", 1048576 * 5, 3));  // 5MB, 3 files
    }

    auto logger = std::make_shared<spdlog::logger>("voxd", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    std::string logLevel = getEnv("VOXD_LOG_LEVEL", "info");
    if (logLevel == "debug")      spdlog::set_level(spdlog::level::debug);
    else if (logLevel == "warn")  spdlog::set_level(spdlog::level::warn);
    else if (logLevel == "error") spdlog::set_level(spdlog::level::err);
    else                          spdlog::set_level(spdlog::level::info);
}

static void printUsage() {
    std::cout <<
        "Usage: voxd [--config <path>] [command]\n"
        "\n"
        "Commands:\n"
        "  daemon    run the recording daemon (default)\n"
        "  start     start recording\n"
        "  stop      stop recording and transcribe\n"
        "  toggle    start or stop recording\n"
        "  status    print recording / processing / idle\n"
        "  devices   list capture devices\n"
        "  help      show this message\n"
        "  version   print the version\n";
}

// Pipes the transcript to `command`'s stdin
static void runTranscriptCommand(const std::string& command, const std::string& text) {
    FILE* pipe = ::popen(command.c_str(), "w");
    if (!pipe) {
        spdlog::error("Cannot run transcript command: {}", command);
        return;
    }
    size_t written = std::fwrite(text.data(), 1, text.size(), pipe);
    int status = ::pclose(pipe);
    if (written != text.size())
        spdlog::error("Transcript command: short write ({} of {} bytes)",
                      written, text.size());
    if (status != 0)
        spdlog::warn("Transcript command exited with status {}", status);
}

static std::shared_ptr<ITranscriber> makeTranscriber(const DaemonConfig& config) {
#ifdef HAS_WHISPER
    WhisperConfig wc;
    wc.modelPath     = config.modelPath();
    wc.threads       = config.threads;
    wc.language      = config.language;
    wc.initialPrompt = config.whisperPrompt;

    auto whisper = std::make_shared<WhisperTranscriber>(wc);
    if (whisper->isLoaded()) return whisper;
    return std::make_shared<NullTranscriber>("whisper model not loaded: " + wc.modelPath);
#else
    (void)config;
    return std::make_shared<NullTranscriber>("built without whisper.cpp");
#endif
}

static int listDevices(PortAudioSystem& audio) {
    PortAudioCapture capture(audio);
    auto devices = capture.listDevices();
    if (devices.empty()) {
        std::cout << "No capture devices found\n";
        return 1;
    }

    DeviceSelector selector;
    for (auto& dev : devices) {
        std::cout << "[" << dev.id << "] " << dev.name
                  << "  (" << dev.maxInputChannels << " ch, "
                  << dev.defaultSampleRate << " Hz)  "
                  << selector.classify(dev) << "\n";
    }
    return 0;
}

static int sendCommand(const DaemonConfig& config, const std::string& command) {
    std::string reply, error;
    if (!ControlClient::send(config.socketPath, command, reply, error)) {
        std::cerr << "voxd: " << error << " (is the daemon running?)\n";
        return 1;
    }
    std::cout << reply << "\n";
    return reply.rfind("ERROR", 0) == 0 ? 1 : 0;
}

static int runDaemon(const DaemonConfig& config, PortAudioSystem& audio) {
    spdlog::info("voxd v{} starting", kVersion);
    if (!audio.ok()) {
        spdlog::error("Audio backend unavailable");
        return 1;
    }

    auto factory = [&audio]() -> std::unique_ptr<IAudioCapture> {
        return std::make_unique<PortAudioCapture>(audio);
    };

    auto mic = std::make_unique<Recorder>(factory, config.recorderConfig());
    std::unique_ptr<LoopbackRecorder> loopback;
    std::unique_ptr<EchoCanceller> aec;
    if (config.echoCancellation) {
        loopback = std::make_unique<LoopbackRecorder>(factory, config.recorderConfig());
        aec      = std::make_unique<EchoCanceller>(config.aecConfig());
    }
    std::unique_ptr<VoiceActivityDetector> vad;
    if (config.voiceActivityDetection)
        vad = std::make_unique<VoiceActivityDetector>(config.vadConfig());

    PipelineConfig pc;
    pc.sampleRate            = config.sampleRate;
    pc.resetFilterPerSession = config.aecResetPerSession;

    auto transcriber = makeTranscriber(config);
    spdlog::info("Transcriber: {}", transcriber->engineName());
    spdlog::info("Echo cancellation: {}, voice activity detection: {}",
                 config.echoCancellation ? "on" : "off",
                 config.voiceActivityDetection ? "on" : "off");

    auto pipeline = std::make_shared<ProcessingPipeline>(
        pc, transcriber, std::move(aec), std::move(vad));

    std::string command = config.transcriptCommand;
    pipeline->setTranscriptSink([command](const std::string& text) {
        if (!command.empty()) runTranscriptCommand(command, text);
    });

    auto feedback = std::make_unique<FeedbackPlayer>(
        config.feedbackConfig(), std::make_unique<PortAudioSoundOutput>(audio));

    RecordingController controller(std::move(mic), std::move(loopback), pipeline,
                                   std::move(feedback));
    ControlServer server(controller);
    if (!server.start(config.socketPath))
        return 1;

    std::signal(SIGINT,  signalHandler);
    std::signal(SIGTERM, signalHandler);

    spdlog::info("Daemon running, press Ctrl+C to stop");
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    spdlog::info("Shutting down");
    server.stop();
    controller.shutdown();
    if (!controller.waitForProcessing(5000))
        spdlog::warn("Abandoning {} processing task(s)", pipeline->activeTasks());

    spdlog::info("voxd exited cleanly");
    return 0;
}

int main(int argc, char* argv[]) {
    std::string configPath = DaemonConfig::defaultPath();
    std::string command    = "daemon";

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
        else if (arg == "-h" || arg == "--help") command = "help";
        else command = arg;
    }

    if (command == "help") {
        printUsage();
        return 0;
    }
    if (command == "version") {
        std::cout << "voxd " << kVersion << "\n";
        return 0;
    }

    setupLogging(command == "daemon");
    // Keep client output to the reply line
    if (command != "daemon" && getEnv("VOXD_LOG_LEVEL").empty())
        spdlog::set_level(spdlog::level::warn);

    DaemonConfig config;
    try {
        config = DaemonConfig::load(configPath);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }

    if (command == "start" || command == "stop" ||
        command == "toggle" || command == "status")
        return sendCommand(config, command);

    if (command == "devices") {
        PortAudioSystem audio;
        return audio.ok() ? listDevices(audio) : 1;
    }

    if (command == "daemon") {
        PortAudioSystem audio;
        return runDaemon(config, audio);
    }

    std::cerr << "voxd: unknown command '" << command << "'\n\n";
    printUsage();
    return 1;
}
