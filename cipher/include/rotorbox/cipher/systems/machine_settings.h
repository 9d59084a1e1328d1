// ==============================================================================
// Machine Settings
// ==============================================================================
// Plain parameter structs describing a complete machine: five wirings,
// starting positions, ring settings and turnover triggers. RotorMachine reads
// these in configure(); nothing here is validated until then.
//
// All numeric values are zero-based alphabet positions and are reduced
// mod 26 when applied.
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>
#include <rotorbox/cipher/core/wheel_catalog.h>

#include <string>
#include <vector>

namespace Rotorbox::Cipher {

// ==============================================================================
// Parameter Storage
// ==============================================================================

struct RotorSettings {
    std::string wiring{kIdentityWiring};
    int position = 0;            // 0-25, starting rotor position
    int ring = 0;                // 0-25, ring setting
    std::vector<int> triggers;   // positions that step the next rotor
};

struct MachineSettings {
    std::string plugboard{kIdentityWiring};
    RotorSettings right;
    RotorSettings middle;
    RotorSettings left;
    std::string reflector{kReflectors[0].wiring};
};

// ==============================================================================
// Builders
// ==============================================================================

/// @brief Rotor settings for a catalogued wheel.
[[nodiscard]] inline RotorSettings makeRotorSettings(const WheelSpec& spec,
                                                     int position = 0,
                                                     int ring = 0) {
    RotorSettings settings;
    settings.wiring = std::string(spec.wiring);
    settings.position = position;
    settings.ring = ring;
    settings.triggers = triggerPositions(spec);
    return settings;
}

/// @brief Rotors I-II-III (left to right), reflector B, empty plugboard,
/// window AAA, rings AAA.
[[nodiscard]] inline MachineSettings defaultMachineSettings() {
    MachineSettings settings;
    settings.left = makeRotorSettings(kRotors[0]);
    settings.middle = makeRotorSettings(kRotors[1]);
    settings.right = makeRotorSettings(kRotors[2]);
    settings.reflector = std::string(kReflectors[0].wiring);
    return settings;
}

}  // namespace Rotorbox::Cipher
