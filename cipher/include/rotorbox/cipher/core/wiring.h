// ==============================================================================
// Layer 0: Core Utility - Wiring Validation
// ==============================================================================
// Checks that a wiring string is a permutation of the alphabet, recognises
// reflector wirings, and builds plugboard wirings from letter pairs.
//
// A malformed wiring is a configuration error. It is caught here, once,
// when a wheel is configured; nothing downstream re-checks per character.
//
// Layer 0: depends only on the standard library and alphabet.h.
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace Rotorbox::Cipher {

// =============================================================================
// WiringStatus
// =============================================================================

/// @brief Result of validating a wiring or a plugboard pair list.
enum class WiringStatus : uint8_t {
    Valid = 0,        ///< Permutation of A-Z
    WrongLength,      ///< Not exactly 26 characters
    InvalidLetter,    ///< Contains a character outside A-Z
    DuplicateLetter,  ///< A letter appears twice (so another one is missing)
    MalformedPair     ///< Plugboard token that is not two distinct letters
};

/// @brief Human-readable name for diagnostics.
[[nodiscard]] constexpr const char* wiringStatusName(WiringStatus status) noexcept {
    switch (status) {
        case WiringStatus::Valid:           return "valid";
        case WiringStatus::WrongLength:     return "wrong length";
        case WiringStatus::InvalidLetter:   return "invalid letter";
        case WiringStatus::DuplicateLetter: return "duplicate letter";
        case WiringStatus::MalformedPair:   return "malformed pair";
    }
    return "unknown";
}

// =============================================================================
// Validation
// =============================================================================

/// @brief Validate that @p wiring is a permutation of the alphabet.
///
/// Length is checked first, then each character in order, so the status
/// describes the first problem found.
[[nodiscard]] constexpr WiringStatus validateWiring(std::string_view wiring) noexcept {
    if (wiring.size() != static_cast<size_t>(kAlphabetSize)) {
        return WiringStatus::WrongLength;
    }

    std::array<bool, kAlphabetSize> seen{};
    for (const char c : wiring) {
        if (!isAlphabetic(c)) {
            return WiringStatus::InvalidLetter;
        }
        const int position = letterToPosition(c);
        if (seen[static_cast<size_t>(position)]) {
            return WiringStatus::DuplicateLetter;
        }
        seen[static_cast<size_t>(position)] = true;
    }
    return WiringStatus::Valid;
}

[[nodiscard]] constexpr bool isPermutation(std::string_view wiring) noexcept {
    return validateWiring(wiring) == WiringStatus::Valid;
}

/// @brief Check the properties a reflector wiring is expected to have.
///
/// A reflector must be a fixed-point-free involution: no letter maps to
/// itself and applying the wiring twice gives the original letter. Wheels
/// do not enforce this; a machine built with a non-reflecting wiring still
/// runs but is no longer self-inverse.
[[nodiscard]] constexpr bool isReflectorWiring(std::string_view wiring) noexcept {
    if (!isPermutation(wiring)) {
        return false;
    }
    for (int i = 0; i < kAlphabetSize; ++i) {
        const int image = letterToPosition(wiring[static_cast<size_t>(i)]);
        if (image == i) {
            return false;
        }
        if (letterToPosition(wiring[static_cast<size_t>(image)]) != i) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// Plugboard
// =============================================================================

/// @brief Build a plugboard wiring from space-separated letter pairs.
///
/// Each pair ("AB") swaps both letters; unpaired letters map to themselves.
/// An empty list yields the identity wiring.
///
/// @param pairs  Pairs separated by one or more spaces, e.g. "AB CD EF"
/// @param wiring Receives the wiring; only written on WiringStatus::Valid
/// @return MalformedPair for a token that is not two distinct letters,
///         InvalidLetter for a non A-Z character, DuplicateLetter when a
///         letter is plugged twice
[[nodiscard]] inline WiringStatus makePlugboardWiring(std::string_view pairs,
                                                      std::string& wiring) {
    std::string result(kIdentityWiring);
    std::array<bool, kAlphabetSize> plugged{};

    size_t i = 0;
    while (i < pairs.size()) {
        if (pairs[i] == ' ') {
            ++i;
            continue;
        }

        size_t end = pairs.find(' ', i);
        if (end == std::string_view::npos) {
            end = pairs.size();
        }
        const std::string_view token = pairs.substr(i, end - i);
        i = end;

        if (token.size() != 2) {
            return WiringStatus::MalformedPair;
        }
        if (!isAlphabetic(token[0]) || !isAlphabetic(token[1])) {
            return WiringStatus::InvalidLetter;
        }
        if (token[0] == token[1]) {
            return WiringStatus::MalformedPair;
        }

        const auto a = static_cast<size_t>(letterToPosition(token[0]));
        const auto b = static_cast<size_t>(letterToPosition(token[1]));
        if (plugged[a] || plugged[b]) {
            return WiringStatus::DuplicateLetter;
        }
        plugged[a] = true;
        plugged[b] = true;
        result[a] = token[1];
        result[b] = token[0];
    }

    wiring = std::move(result);
    return WiringStatus::Valid;
}

}  // namespace Rotorbox::Cipher
