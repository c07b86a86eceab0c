// KnutGame Server - Session Validation Tool
// [SECURITY_AGENT] Runs the anti-cheat pipeline on a submitted session from JSON files

#include "security/AntiCheat.hpp"
#include "security/SessionIntegrity.hpp"
#include "serialization/SessionJson.hpp"
#include "Constants.hpp"
#include <iostream>
#include <optional>
#include <string>

using namespace KnutGame;
using namespace KnutGame::Security;

namespace {

constexpr int EXIT_VALID = 0;
constexpr int EXIT_INVALID = 1;
constexpr int EXIT_USAGE = 2;

void printUsage(std::ostream& out, const char* programName) {
    out << "KnutGame session validator v" << Constants::VERSION << "\n"
        << "Usage: " << programName << " --request <file> [options]\n"
        << "\nOptions:\n"
        << "  --request <file>      Submitted session (JSON, required)\n"
        << "  --context <file>      Performance context (JSON); enables adjustment\n"
        << "  --options <file>      Anti-cheat thresholds (JSON, missing keys keep defaults)\n"
        << "  --skip-integrity      Skip duration/bounds/duplicate checks\n"
        << "  --help, -h            Show this help\n"
        << "\nExit codes: 0 valid, 1 rejected, 2 usage or input error\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        std::string requestPath;
        std::string contextPath;
        std::string optionsPath;
        bool skipIntegrity = false;

        // Parse command line arguments
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                printUsage(std::cout, argv[0]);
                return EXIT_VALID;
            } else if (arg == "--request" && i + 1 < argc) {
                requestPath = argv[++i];
            } else if (arg == "--context" && i + 1 < argc) {
                contextPath = argv[++i];
            } else if (arg == "--options" && i + 1 < argc) {
                optionsPath = argv[++i];
            } else if (arg == "--skip-integrity") {
                skipIntegrity = true;
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                printUsage(std::cerr, argv[0]);
                return EXIT_USAGE;
            }
        }

        if (requestPath.empty()) {
            std::cerr << "Missing --request\n";
            printUsage(std::cerr, argv[0]);
            return EXIT_USAGE;
        }

        const std::optional<SubmitSessionRequest> request =
            Serialization::loadSessionRequest(requestPath);
        if (!request) {
            return EXIT_USAGE;
        }

        std::optional<PerformanceContext> context;
        if (!contextPath.empty()) {
            context = Serialization::loadPerformanceContext(contextPath);
            if (!context) {
                return EXIT_USAGE;
            }
        }

        SmartAntiCheat antiCheat;
        if (!optionsPath.empty()) {
            const std::optional<AntiCheatOptions> options =
                Serialization::loadAntiCheatOptions(optionsPath);
            if (!options) {
                return EXIT_USAGE;
            }
            antiCheat.setPerformanceThresholds(*options);
        }

        if (!antiCheat.initialize()) {
            std::cerr << "[VALIDATE] Failed to initialize anti-cheat\n";
            return EXIT_USAGE;
        }

        if (!skipIntegrity) {
            const IntegrityResult integrity = SessionIntegrityChecker::check(*request);
            if (!integrity.ok()) {
                std::cerr << "[VALIDATE] Session " << request->sessionId
                          << " failed integrity check [" << integrity.reason() << "]\n";
                nlohmann::json out = {
                    {"isValid", false},
                    {"reason", integrity.reason()},
                    {"confidence", nullptr},
                    {"performanceAdjusted", false},
                    {"adjustmentDetails", nullptr}
                };
                std::cout << out.dump(2) << "\n";
                return EXIT_INVALID;
            }
        }

        const ValidationResult result = context
            ? antiCheat.validateWithContext(*request, *context)
            : antiCheat.validate(*request);

        const nlohmann::json out = result;
        std::cout << out.dump(2) << "\n";

        antiCheat.shutdown();
        return result.isValid ? EXIT_VALID : EXIT_INVALID;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << "\n";
        return EXIT_USAGE;
    }
}
