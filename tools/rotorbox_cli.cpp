// ==============================================================================
// Rotorbox command-line tool
// ==============================================================================
// Configures a RotorMachine from command-line options and transforms standard
// input line by line to standard output. Running the output back through the
// tool with the same options restores the input.
//
// Usage:
//   rotorbox_cli [--demo] [--rotors I-II-III] [--reflector B]
//                [--window AAA] [--rings AAA] [--plugboard "AB CD"]
//                [--random-key [seed]]
//
//   echo "QMJIDO MZWZJFJR" | rotorbox_cli --demo
// ==============================================================================

#include <rotorbox/cipher/core/alphabet.h>
#include <rotorbox/cipher/core/random.h>
#include <rotorbox/cipher/core/wheel_catalog.h>
#include <rotorbox/cipher/core/wiring.h>
#include <rotorbox/cipher/systems/machine_settings.h>
#include <rotorbox/cipher/systems/rotor_machine.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace Rotorbox::Cipher;

namespace {

// ==============================================================================
// Demo Settings
// ==============================================================================

// Rotors I-II-III at window MCK with the catalog triggers. "QMJIDO MZWZJFJR"
// decrypts to "ENIGMA REVEALED".
MachineSettings demoSettings() {
    MachineSettings settings = defaultMachineSettings();
    settings.left.position = 12;    // M
    settings.middle.position = 2;   // C
    settings.right.position = 10;   // K
    return settings;
}

void printUsage() {
    std::cerr
        << "usage: rotorbox_cli [--demo] [--rotors L-M-R] [--reflector B|C]\n"
        << "                    [--window XYZ] [--rings XYZ] [--plugboard \"AB CD\"]\n"
        << "                    [--random-key [seed]]\n"
        << "Reads text from stdin, writes the transformed text to stdout.\n"
        << "Only uppercase A-Z are enciphered; everything else passes through.\n";
}

// "I-II-III" -> three catalog rotors, left to right
bool parseRotorOrder(std::string_view order, MachineSettings& settings) {
    const WheelSpec* specs[3] = {nullptr, nullptr, nullptr};
    size_t start = 0;
    for (int i = 0; i < 3; ++i) {
        size_t end = order.find('-', start);
        if (end == std::string_view::npos) {
            end = order.size();
        } else if (i == 2) {
            return false;  // more than three rotors
        }
        if (start > order.size()) {
            return false;
        }
        specs[i] = findRotor(order.substr(start, end - start));
        if (specs[i] == nullptr) {
            return false;
        }
        start = end + 1;
    }

    settings.left = makeRotorSettings(*specs[0], settings.left.position, settings.left.ring);
    settings.middle = makeRotorSettings(*specs[1], settings.middle.position, settings.middle.ring);
    settings.right = makeRotorSettings(*specs[2], settings.right.position, settings.right.ring);
    return true;
}

}  // namespace

// ==============================================================================
// Main
// ==============================================================================

int main(int argc, char* argv[]) {
    MachineSettings settings = defaultMachineSettings();

    // Rotor order first so that --window/--rings apply to the chosen rotors
    // regardless of option order.
    std::string_view rotorOrder;
    std::string_view window;
    std::string_view rings;
    std::string_view plugboardPairs;
    bool randomKey = false;
    uint32_t seed = 0;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else if (arg == "--demo") {
            settings = demoSettings();
        } else if (arg == "--rotors" && hasValue) {
            rotorOrder = argv[++i];
        } else if (arg == "--reflector" && hasValue) {
            const WheelSpec* reflector = findReflector(argv[++i]);
            if (reflector == nullptr) {
                std::cerr << "Error: unknown reflector '" << argv[i] << "'\n";
                return 1;
            }
            settings.reflector = std::string(reflector->wiring);
        } else if (arg == "--window" && hasValue) {
            window = argv[++i];
        } else if (arg == "--rings" && hasValue) {
            rings = argv[++i];
        } else if (arg == "--plugboard" && hasValue) {
            plugboardPairs = argv[++i];
        } else if (arg == "--random-key") {
            randomKey = true;
            if (hasValue && argv[i + 1][0] != '-') {
                seed = static_cast<uint32_t>(std::strtoul(argv[++i], nullptr, 10));
            }
        } else {
            std::cerr << "Error: unrecognised option '" << arg << "'\n";
            printUsage();
            return 1;
        }
    }

    if (!rotorOrder.empty() && !parseRotorOrder(rotorOrder, settings)) {
        std::cerr << "Error: rotor order must be three of I-V, e.g. I-II-III\n";
        return 1;
    }

    if (!window.empty() &&
        !parseWindowLetters(window, settings.left.position,
                            settings.middle.position, settings.right.position)) {
        std::cerr << "Error: window must be three uppercase letters, e.g. MCK\n";
        return 1;
    }

    if (!rings.empty() &&
        !parseWindowLetters(rings, settings.left.ring,
                            settings.middle.ring, settings.right.ring)) {
        std::cerr << "Error: rings must be three uppercase letters, e.g. AAA\n";
        return 1;
    }

    if (!plugboardPairs.empty()) {
        const WiringStatus status = makePlugboardWiring(plugboardPairs, settings.plugboard);
        if (status != WiringStatus::Valid) {
            std::cerr << "Error: plugboard: " << wiringStatusName(status) << "\n";
            return 1;
        }
    }

    if (randomKey) {
        if (seed == 0) {
            seed = static_cast<uint32_t>(
                std::chrono::steady_clock::now().time_since_epoch().count());
        }
        Xorshift32 rng(seed);
        settings.left.position = rng.nextPosition();
        settings.middle.position = rng.nextPosition();
        settings.right.position = rng.nextPosition();
        std::cerr << "Message key: "
                  << positionToLetter(settings.left.position)
                  << positionToLetter(settings.middle.position)
                  << positionToLetter(settings.right.position) << "\n";
    }

    if (!isReflectorWiring(settings.reflector)) {
        std::cerr << "Warning: reflector is not a fixed-point-free involution; "
                     "the machine will not be self-inverse\n";
    }

    RotorMachine machine;
    const ConfigureResult result = machine.configure(settings);
    if (!result.ok()) {
        std::cerr << "Error: " << wheelRoleName(result.role) << " wiring: "
                  << wiringStatusName(result.status) << "\n";
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line)) {
        std::cout << machine.transformMessage(line) << "\n";
    }
    std::cout.flush();

    return 0;
}
