// main.cpp — A/B playback entry point
//
// This is the CLI entry point for the A/B player. It:
//   1. Parses command-line arguments (and the optional session file)
//   2. Loads and validates both WAV files into an AudioBufferPair
//   3. Creates the TransportState and RenderEngine
//   4. Opens the audio device through the Backend Adapter (AlloLib AudioIO)
//   5. Runs the ControlLoop on a curses terminal until the user quits
//   6. Stops the audio stream and exits
//
// Exit status: 0 after a user quit, 1 on any load, config or device failure.
//
// Usage:
//   ./abPlay --a original.wav --b filtered.wav [--normalize] [--device 2]

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

#include "PlaybackTypes.hpp"
#include "AudioBufferPair.hpp"
#include "TransportState.hpp"
#include "RenderEngine.hpp"
#include "ControlLoop.hpp"
#include "TerminalUI.hpp"
#include "SessionConfig.hpp"
#include "PlaybackBackend.hpp"

namespace fs = std::filesystem;

// ─────────────────────────────────────────────────────────────────────────────
// Signal handling for clean shutdown on Ctrl+C
// ─────────────────────────────────────────────────────────────────────────────
// The handler only flips an atomic. The ControlLoop turns it into a locked
// quit on its next tick.

static std::atomic<bool> g_interrupted{false};

void signalHandler(int) {
    g_interrupted.store(true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Usage / help
// ─────────────────────────────────────────────────────────────────────────────

static bool hasArg(int argc, char* argv[], const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static void printUsage(const char* progName) {
    std::cout << "\nabPlay — A/B WAV playback for comparing two renderings\n"
              << "───────────────────────────────────────────────────────\n"
              << "Usage: " << progName << " --a <file> --b <file> [options]\n\n"
              << "Required (here or in --config):\n"
              << "  --a <path>          WAV file A (usually the original)\n"
              << "  --b <path>          WAV file B (usually the filtered version)\n\n"
              << "Optional:\n"
              << "  --normalize         Peak-normalize both files to 0.95\n"
              << "  --device <int>      Output device index (default: system output)\n"
              << "  --blocksize <int>   Frames per audio callback (default: 1024)\n"
              << "  --config <path>     JSON session file; flags override its values\n"
              << "  --list-devices      Print audio devices and exit\n"
              << "  --help              Show this message\n\n"
              << "Controls:\n"
              << "  SPACE : play/pause\n"
              << "  TAB   : toggle A/B at current position\n"
              << "  ←/→   : seek -/+ 1 second\n"
              << "  H/L   : seek -/+ 5 seconds\n"
              << "  Q     : quit\n"
              << std::endl;
}

// ─────────────────────────────────────────────────────────────────────────────
// Main
// ─────────────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {

    if (hasArg(argc, argv, "--help") || hasArg(argc, argv, "-h")) {
        printUsage(argv[0]);
        return 0;
    }

    // ── Parse arguments ──────────────────────────────────────────────────

    PlaybackConfig config;
    try {
        config = SessionConfig::fromCommandLine(argc, argv);
        SessionConfig::validate(config);
    } catch (const ConfigError& e) {
        std::cerr << "[Main] ERROR: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 1;
    }

    if (config.listDevices) {
        PlaybackBackend::listDevices();
        return 0;
    }

    // ── Load both renderings ─────────────────────────────────────────────

    std::cout << "Loading: " << config.pathA << std::endl;
    std::cout << "Loading: " << config.pathB << std::endl;

    AudioBufferPair buffers;
    try {
        buffers = AudioBufferPair::load(config.pathA, config.pathB,
                                        config.normalize, config.normalizeTarget);
    } catch (const LoadError& e) {
        std::cerr << "[Main] FATAL: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "Sample rate: " << buffers.sampleRate() << " Hz, Channels: "
              << buffers.channelCount() << std::endl;
    std::cout << "Duration: " << std::fixed << std::setprecision(1)
              << buffers.durationSec() << "s" << std::endl;
    if (buffers.normalized()) {
        std::cout << "Normalized: yes" << std::endl;
    }

    // ── Transport + render engine + backend ──────────────────────────────

    TransportState transport(buffers.frameCount());
    RenderEngine   engine(buffers, transport);

    PlaybackBackend backend(config, engine, buffers.sampleRate(), buffers.channelCount());
    if (!backend.init()) {
        std::cerr << "[Main] FATAL: Audio device initialization failed." << std::endl;
        return 1;
    }
    if (!backend.start()) {
        std::cerr << "[Main] FATAL: Audio stream failed to start." << std::endl;
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "Starting playback UI..." << std::endl;

    // ── Control loop ─────────────────────────────────────────────────────
    // The TerminalUI scope is the only time curses owns the terminal.

    PlaybackInfo info;
    info.nameA      = fs::path(config.pathA).filename().string();
    info.nameB      = fs::path(config.pathB).filename().string();
    info.sampleRate = buffers.sampleRate();
    info.frameCount = buffers.frameCount();

    {
        TerminalUI ui(config.pollIntervalMs);
        ControlLoop loop(transport, ui, info, &g_interrupted);
        loop.run();
    }

    // ── Clean shutdown ───────────────────────────────────────────────────
    // Give the render thread up to a few blocks to see quit and ask for
    // teardown, then stop audio before the buffers and transport go out of
    // scope. shutdown() blocks until the device has stopped.

    const auto blockPeriod = std::chrono::microseconds(
        1000000LL * config.blockSize / buffers.sampleRate());
    for (int i = 0; i < 4 && !backend.stopRequested(); ++i) {
        std::this_thread::sleep_for(blockPeriod);
    }
    if (!backend.stopRequested()) {
        std::cout << "[Main] Render thread did not acknowledge quit, stopping stream anyway."
                  << std::endl;
    }

    // AudioIO gives no notice if the stream dies mid-playback, so exit 0
    // here only means open/start succeeded and the user quit.
    backend.shutdown();

    std::cout << "Done." << std::endl;
    return 0;
}
