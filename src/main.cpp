/**
 * @file main.cpp
 * @brief Overlay OCR - Main entry point
 *
 * Replays captured screens through the layout -> crop -> OCR -> column
 * clustering pipeline and prints the recognized item names.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "capture/image_file_source.h"
#include "ocr/dnn_ocr_engine.h"
#include "pipeline/overlay_session.h"
#include "types.h"
#include "utils/config_loader.h"
#include "utils/logger.h"

// Global flag for graceful shutdown
std::atomic<bool> g_running{true};

// Set by the stdin reader, consumed by the main loop
std::atomic<bool> g_ocrRequested{false};

using namespace overlay_ocr;
using json = nlohmann::json;

namespace {

json aabbToJson(const Aabb& box) {
    return json{{"min_x", box.minX}, {"min_y", box.minY}, {"max_x", box.maxX}, {"max_y", box.maxY}};
}

bool writeJsonResults(const std::string& path, const std::string& source,
                      const ItemBoard& board, const OcrCompletion& completion) {
    std::ofstream out(path);
    if (!out.good()) return false;

    auto now = std::chrono::system_clock::now();
    auto epoch = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    json doc;
    doc["timestamp"] = epoch;
    doc["source"] = source;
    doc["ok"] = completion.ok;
    doc["latency_ms"] = completion.elapsedMs;
    if (!completion.ok) {
        doc["error"] = errorKindName(completion.errorKind);
        doc["message"] = completion.errorMessage;
    }
    doc["detect_bounds"] = aabbToJson(board.detectBounds);

    json items = json::array();
    for (const auto& item : board.items) {
        items.push_back(json{{"name", item.name}, {"bounds", aabbToJson(item.bounds)}});
    }
    doc["items"] = items;

    out << doc.dump(2) << std::endl;
    return out.good();
}

void printItems(const ItemBoard& board, const OcrCompletion& completion) {
    if (!completion.ok) {
        std::cout << "OCR failed: " << errorKindName(completion.errorKind)
                  << " (" << completion.errorMessage << ")" << std::endl;
        return;
    }
    std::cout << "Items (" << std::fixed << std::setprecision(1) << completion.elapsedMs << " ms):" << std::endl;
    if (board.items.empty()) {
        std::cout << "  (none)" << std::endl;
    }
    for (size_t i = 0; i < board.items.size(); i++) {
        const auto& item = board.items[i];
        std::cout << "  [" << i << "] " << item.name
                  << "  (" << item.bounds.minX << ", " << item.bounds.minY << ") - ("
                  << item.bounds.maxX << ", " << item.bounds.maxY << ")" << std::endl;
    }
}

void listLayouts(const OverlayConfig& config) {
    std::cout << "Layouts (" << config.layouts.size() << "):" << std::endl;
    for (size_t i = 0; i < config.layouts.size(); i++) {
        const auto& option = config.layouts[i];
        const Layout& l = option.layout;
        std::cout << "  [" << i << "] " << formatAspectRatio(option.aspectRatio)
                  << "  offset=" << l.offset.x << "," << l.offset.y
                  << "  size=" << l.size.x << "x" << l.size.y
                  << "  reference=" << l.referenceResolution.x << "x" << l.referenceResolution.y
                  << "  text=" << formatHexColor(l.themeTextColor)
                  << "  checks=" << option.pixelChecks.size() << std::endl;
        for (const auto& check : option.pixelChecks) {
            std::cout << "        " << formatPixelCheck(check) << std::endl;
        }
    }
}

} // anonymous namespace

void signalHandler(int signal) {
    (void)signal;
    std::cout << "\nShutdown requested..." << std::endl;
    g_running = false;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [options]\n\n"
              << "Options:\n"
              << "  --config <path>    Path to config file (default: config/overlay_config.json)\n"
              << "  --image <path>     Capture source: an image file or a directory of images\n"
              << "  --fps <n>          Capture publish rate (default: 30)\n"
              << "  --once             Trigger one OCR pass, print the items and exit\n"
              << "  --json-output <file>  Write the last OCR result to a JSON file\n"
              << "  --list-layouts     List configured layouts and exit\n"
              << "  --verbose          Debug logging\n"
              << "  --help             Show this help\n\n"
              << "Interactive mode: press Enter to read the overlay, Ctrl+C to quit.\n";
}

int main(int argc, char* argv[]) {
    std::string configPath = "config/overlay_config.json";
    std::string imagePath;
    std::string jsonOutputPath;
    double fps = 30.0;
    bool once = false;
    bool listLayoutsOnly = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        try {
            if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--image" && i + 1 < argc) {
                imagePath = argv[++i];
            } else if (arg == "--fps" && i + 1 < argc) {
                fps = std::stod(argv[++i]);
            } else if (arg == "--once") {
                once = true;
            } else if (arg == "--json-output" && i + 1 < argc) {
                jsonOutputPath = argv[++i];
            } else if (arg == "--list-layouts") {
                listLayoutsOnly = true;
            } else if (arg == "--verbose" || arg == "-v") {
                verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return 1;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << std::endl;
            return 1;
        }
    }

    OverlayConfig config;
    std::string configError;
    if (!loadOverlayConfig(configPath, config, configError)) {
        logError(configError);
        return 1;
    }

    LogLevel level = LogLevel::INFO;
    if (parseLogLevel(config.logLevel, level)) {
        setLogLevel(level);
    }
    if (verbose) {
        setLogLevel(LogLevel::DEBUG);
    }

    if (listLayoutsOnly) {
        listLayouts(config);
        return 0;
    }

    if (imagePath.empty()) {
        logError("No capture source given; use --image <file|dir>");
        printUsage(argv[0]);
        return 1;
    }
    if (fps <= 0.0) {
        logError("--fps must be positive");
        return 1;
    }

    // OCR engine
    DnnOcrModelConfig modelConfig;
    modelConfig.detectionModel = config.detectionModel;
    modelConfig.recognitionModel = config.recognitionModel;
    modelConfig.vocabulary = config.vocabulary;

    auto dnnEngine = std::make_unique<DnnOcrEngine>();
    if (!dnnEngine->loadModels(modelConfig)) {
        logError("Failed to load OCR models");
        return 1;
    }
    auto engine = std::make_shared<GuardedOcrEngine>(std::move(dnnEngine));

    OverlaySession session(config, engine);

    ImageFileSource source;
    if (!source.open(imagePath)) {
        return 1;
    }
    if (!source.start(session.getCaptureLink(), fps)) {
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const auto tickInterval = std::chrono::duration_cast<OverlaySession::Clock::duration>(
        std::chrono::duration<double>(1.0 / config.tickHz));

    int exitCode = 0;

    if (once) {
        // Wait for the first usable frame, then for the pass it starts.
        bool started = false;
        while (g_running) {
            const auto now = OverlaySession::Clock::now();
            session.tick(now);
            if (!started) {
                const TriggerStatus status = session.requestOcr();
                if (status == TriggerStatus::Started) {
                    started = true;
                } else if (status != TriggerStatus::NoFrame) {
                    logError(std::string("Could not start OCR: ") + triggerStatusName(status));
                    exitCode = 1;
                    break;
                }
            } else if (!session.isOcrRunning() && session.getLastCompletion()) {
                break;
            }
            std::this_thread::sleep_for(tickInterval);
        }

        if (exitCode == 0) {
            if (const auto& completion = session.getLastCompletion()) {
                printItems(session.getItemBoard(), *completion);
                if (!jsonOutputPath.empty() &&
                    !writeJsonResults(jsonOutputPath, imagePath, session.getItemBoard(), *completion)) {
                    logError("Failed to write JSON output: " + jsonOutputPath);
                }
                exitCode = completion->ok ? 0 : 1;
            } else {
                exitCode = 1;
            }
        }
    } else {
        logInfo("Press Enter to read the overlay (Ctrl+C to quit)");

        // Blocking stdin reads cannot be interrupted; the reader is detached.
        std::thread([] {
            std::string line;
            while (g_running && std::getline(std::cin, line)) {
                g_ocrRequested = true;
            }
        }).detach();

        while (g_running) {
            const auto now = OverlaySession::Clock::now();
            if (g_ocrRequested.exchange(false)) {
                const TriggerStatus status = session.requestOcr();
                if (status == TriggerStatus::AlreadyRunning) {
                    logInfo("OCR already running");
                }
            }
            if (session.tick(now)) {
                printItems(session.getItemBoard(), *session.getLastCompletion());
                if (!jsonOutputPath.empty() &&
                    !writeJsonResults(jsonOutputPath, imagePath, session.getItemBoard(),
                                      *session.getLastCompletion())) {
                    logError("Failed to write JSON output: " + jsonOutputPath);
                }
            }
            std::this_thread::sleep_for(tickInterval);
        }
    }

    source.stop();

    const CaptureStats stats = session.getCaptureLink().getStats();
    std::cout << "Frames published: " << stats.framesPublished
              << ", dropped: " << stats.framesDropped << std::endl;
    return exitCode;
}
