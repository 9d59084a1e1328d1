// ==============================================================================
// Layer 0: Core Utility - Alphabet Positions
// ==============================================================================
// Conversions between uppercase Latin letters and alphabet positions, plus
// the modular arithmetic shared by every wheel.
//
// Design decisions:
// - An alphabet position is ALWAYS zero-based: 'A' = 0 ... 'Z' = 25. Wheel
//   tables and the signal values passed between machine stages both use it.
//   Letters only appear at the outer API boundary.
// - Only 'A'..'Z' are alphabetic. Lowercase and everything else is passed
//   through untouched by the layers above (no case folding).
// - wrapPosition() accepts any int (including negatives) so callers can add
//   and subtract offsets freely before reducing.
//
// Layer 0: depends only on the standard library.
// ==============================================================================

#pragma once

#include <string_view>

namespace Rotorbox::Cipher {

// =============================================================================
// Constants
// =============================================================================

/// Number of letters on every wheel.
inline constexpr int kAlphabetSize = 26;

/// The plain alphabet in position order.
inline constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";

/// Wiring that maps every letter to itself (empty plugboard).
inline constexpr std::string_view kIdentityWiring = kAlphabet;

// =============================================================================
// Position Arithmetic
// =============================================================================

/// @brief Check whether a character takes part in enciphering.
/// @return true only for uppercase 'A'..'Z'
[[nodiscard]] constexpr bool isAlphabetic(char c) noexcept {
    return c >= 'A' && c <= 'Z';
}

/// @brief Reduce any integer into [0, kAlphabetSize).
///
/// @example
/// @code
/// wrapPosition(27);   // 1
/// wrapPosition(-1);   // 25
/// @endcode
[[nodiscard]] constexpr int wrapPosition(int value) noexcept {
    const int r = value % kAlphabetSize;
    return r < 0 ? r + kAlphabetSize : r;
}

/// @brief Convert an alphabetic character to its zero-based position.
/// @pre isAlphabetic(letter)
[[nodiscard]] constexpr int letterToPosition(char letter) noexcept {
    return letter - 'A';
}

/// @brief Convert a position to its letter. The position is wrapped first.
[[nodiscard]] constexpr char positionToLetter(int position) noexcept {
    return static_cast<char>('A' + wrapPosition(position));
}

// =============================================================================
// Rotor Window
// =============================================================================

/// @brief Parse the three letters visible in the rotor windows.
///
/// The window reads left to right as on the machine ("MCK" means left = M,
/// middle = C, right = K). Outputs are only written on success.
///
/// @return false unless @p window is exactly three uppercase letters
[[nodiscard]] constexpr bool parseWindowLetters(std::string_view window,
                                                int& left, int& middle,
                                                int& right) noexcept {
    if (window.size() != 3) {
        return false;
    }
    for (const char c : window) {
        if (!isAlphabetic(c)) {
            return false;
        }
    }
    left = letterToPosition(window[0]);
    middle = letterToPosition(window[1]);
    right = letterToPosition(window[2]);
    return true;
}

}  // namespace Rotorbox::Cipher
