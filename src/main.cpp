#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include <signal.h>

#include "Classifier.hpp"
#include "ConfigParser.hpp"
#include "FolderOrganizer.hpp"
#include "WatchPipeline.hpp"

namespace {
volatile std::sig_atomic_t g_stopRequested = 0;

void onStopSignal(int) {
    g_stopRequested = 1;
}

void installSignals() {
    struct sigaction sa {};
    sa.sa_handler = &onStopSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <dir>] [--once] [--delay <ms>] [<folder>]" << std::endl;
}

// Directory of the running executable, or empty on failure.
std::filesystem::path getExecutableDirectory() {
    std::error_code ec;
    const std::filesystem::path executable = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return {};
    }
    return executable.parent_path();
}

struct Options {
    std::filesystem::path configRoot;
    std::string folder;
    bool once = false;
    long long delayMs = -1;
};

bool parseArguments(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto nextValue = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--config") {
            if (!nextValue(value)) {
                return false;
            }
            options.configRoot = value;
        } else if (arg == "--once") {
            options.once = true;
        } else if (arg == "--delay") {
            if (!nextValue(value)) {
                return false;
            }
            try {
                options.delayMs = std::stoll(value);
            } catch (const std::exception&) {
                options.delayMs = -1;
            }
            if (options.delayMs < 0) {
                std::cerr << "--delay expects a non-negative number of milliseconds." << std::endl;
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            return false;
        } else if (!arg.empty() && arg.front() == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (options.folder.empty()) {
            options.folder = arg;
        } else {
            std::cerr << "Only one folder may be given." << std::endl;
            return false;
        }
    }
    return true;
}
} // namespace

int main(int argc, char** argv) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 2;
    }

    // Use the executable location so a bundled config folder is found by default.
    if (options.configRoot.empty()) {
        const std::filesystem::path executableDir = getExecutableDirectory();
        options.configRoot = executableDir.empty() ? std::filesystem::current_path() : executableDir;
    }

    ConfigParser parser;
    std::error_code existsErr;
    if (std::filesystem::exists(ConfigParser::configPathFor(options.configRoot), existsErr)) {
        if (!parser.load(options.configRoot)) {
            std::cerr << "Failed to load configuration. Exiting." << std::endl;
            return EXIT_FAILURE;
        }
    } else {
        std::cout << "No configuration found under `" << options.configRoot.string()
                  << "`; using built-in categories." << std::endl;
    }

    std::string folder = options.folder;
    if (folder.empty()) {
        folder = parser.getWatchFolder();
    }
    if (folder.empty()) {
        std::cerr << "No folder to organize." << std::endl;
        printUsage(argv[0]);
        return 2;
    }
    const std::filesystem::path target(folder);

    const Classifier classifier(parser.getCategories());
    FolderOrganizer organizer(classifier);

    std::cout << "Organizing `" << target.string() << "`..." << std::endl;
    OrganizeReport report;
    if (auto ec = organizer.organize(target, report)) {
        std::cerr << "Cannot organize `" << target.string() << "`: " << ec.message() << std::endl;
        return EXIT_FAILURE;
    }

    const std::string summary = report.summaryLine();
    std::cout << "Organized: " << (summary.empty() ? "no files moved" : summary) << std::endl;
    for (const auto& failure : report.failures) {
        std::cerr << "Error moving " << failure.source.filename().string() << ": " << failure.describe() << std::endl;
    }

    if (options.once) {
        return report.failures.empty() ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    WatchOptions watchOptions = parser.getWatchOptions();
    if (options.delayMs >= 0) {
        watchOptions.settleDelay = std::chrono::milliseconds(options.delayMs);
    }

    installSignals();

    WatchPipeline pipeline(classifier, watchOptions);
    const auto onEvent = [](const WatchOutcome& outcome) {
        const std::string name = outcome.file.filename().string();
        if (outcome.kind == WatchOutcomeKind::Moved) {
            std::cout << "Auto-moved: " << name << " -> " << outcome.detail << "/" << std::endl;
        } else {
            std::cerr << "Error moving " << name << ": " << outcome.detail << std::endl;
        }
    };

    if (auto ec = pipeline.start(target, onEvent)) {
        std::cerr << "File monitoring could not start: " << ec.message() << std::endl;
        return EXIT_FAILURE;
    }

    while (!g_stopRequested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    pipeline.stop();
    return EXIT_SUCCESS;
}
