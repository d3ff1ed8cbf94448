#include "app/errors.hpp"
#include "app/options.hpp"
#include "app/session.hpp"
#include "audio/capture_device.hpp"
#include "stt/whisper_process.hpp"
#include "stt/whisper_stt.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>

static std::atomic<bool> g_running{true};

static void onSignal(int) { g_running.store(false); }

int main(int argc, char** argv) {
    const std::string program = argc > 0 ? argv[0] : "vadscribe";

    try {
        const Options opts = parseOptions(argc, argv);

        if (opts.help) {
            std::cout << usage(program);
            return 0;
        }

        if (opts.list) {
            CaptureDevice capture;
            std::cerr << "[Main] [INFO] available audio devices:" << std::endl;
            for (const InputDeviceInfo& dev : capture.listInputDevices()) {
                std::cout << "- " << dev.name << std::endl;
            }
            return 0;
        }

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        // STT engine init
        std::unique_ptr<Transcriber> stt;
        if (!opts.whisperCpp.empty()) {
            stt = std::make_unique<WhisperProcess>(opts.whisperCpp, opts.model);
        } else {
            WhisperSTT::Config config;
            config.language = opts.language;
            config.translate = opts.translate;
            config.threads = opts.threads;
            config.verbose = opts.verbose;
            stt = std::make_unique<WhisperSTT>(opts.model, config);
        }

        auto print = [](const std::string& text) { std::cout << text << std::endl; };

        const SessionStats stats = opts.file.empty()
            ? runLiveSession(opts, *stt, g_running, print)
            : runFileSession(opts, *stt, g_running, print);

        std::cerr << "[Main] [INFO] " << stats.transcribed << " utterances transcribed, " << stats.skipped
                  << " too short, " << stats.failed << " failed";
        if (stats.droppedEvents > 0) std::cerr << ", " << stats.droppedEvents << " events dropped";
        std::cerr << std::endl;
        return 0;
    } catch (const ConfigError& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << " (see --help)" << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Main] [ERROR] " << e.what() << std::endl;
        return 1;
    }
}
