// ==============================================================================
// Layer 0: Core Utility - Wheel Catalog
// ==============================================================================
// Wirings of the historical Enigma I rotors and reflectors.
//
// Turnover letters are stored as the position a rotor LANDS ON when it
// carries into its neighbour, i.e. one past the notch letter engraved on
// the ring (rotor I has its notch at Q, so it carries when it steps onto
// R). This matches Wheel::rotate(), which checks the position after the
// step.
//
// Layer 0: depends only on the standard library and alphabet.h.
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>

#include <array>
#include <string_view>
#include <vector>

namespace Rotorbox::Cipher {

/// @brief A catalogued wheel: its name, wiring and turnover letters.
struct WheelSpec {
    std::string_view name;
    std::string_view wiring;
    std::string_view turnovers;  ///< Empty for reflectors
};

// =============================================================================
// Catalog
// =============================================================================

inline constexpr std::array<WheelSpec, 5> kRotors{{
    {"I",   "EKMFLGDQVZNTOWYHXUSPAIBRCJ", "R"},
    {"II",  "AJDKSIRUXBLHWTMCQGZNPYFVOE", "F"},
    {"III", "BDFHJLCPRTXVZNYEIWGAKMUSQO", "W"},
    {"IV",  "ESOVPZJAYQUIRHXLNFTGKDCMWB", "K"},
    {"V",   "VZBRGITYUPSDNHLXAWMJQOFEKC", "A"},
}};

inline constexpr std::array<WheelSpec, 2> kReflectors{{
    {"B", "YRUHQSLDPXNGOKMIEBFZCWVJAT", ""},
    {"C", "FVPJIAOYEDRZXWGCTKUQSBNMHL", ""},
}};

// =============================================================================
// Lookup
// =============================================================================

/// @brief Find a rotor by its roman numeral ("I" .. "V").
/// @return nullptr for an unknown name
[[nodiscard]] constexpr const WheelSpec* findRotor(std::string_view name) noexcept {
    for (const auto& spec : kRotors) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

/// @brief Find a reflector by its letter ("B" or "C").
/// @return nullptr for an unknown name
[[nodiscard]] constexpr const WheelSpec* findReflector(std::string_view name) noexcept {
    for (const auto& spec : kReflectors) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

/// @brief Turnover letters of @p spec as zero-based trigger positions.
[[nodiscard]] inline std::vector<int> triggerPositions(const WheelSpec& spec) {
    std::vector<int> positions;
    positions.reserve(spec.turnovers.size());
    for (const char c : spec.turnovers) {
        if (isAlphabetic(c)) {
            positions.push_back(letterToPosition(c));
        }
    }
    return positions;
}

}  // namespace Rotorbox::Cipher
