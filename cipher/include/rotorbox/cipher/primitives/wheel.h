// ==============================================================================
// Wheel - Substitution wheel with optional rotation (Layer 1 Primitive)
// ==============================================================================
// One wheel type covers every role in the machine:
// - Fixed:    static substitution (plugboard, reflector). Never moves,
//             position and ring setting are always 0.
// - Rotating: substitution whose input side is shifted by the rotor position
//             and whose output side is shifted by the ring setting. Steps by
//             one position per rotate() and reports turnover.
//
// Two APIs over the same tables:
// - encipher()/decipher() work on letters (and whole strings) and apply the
//   rotor and ring offsets as described on each method.
// - rightToLeft()/leftToRight() work on zero-based contact positions for use
//   inside a multi-wheel signal chain. Positions in and out are expressed in
//   the frame of the neighbouring component, so wheels compose directly.
//   Only the rotor position shifts the contacts; the ring setting is a
//   letter-API offset and plays no part in the signal chain.
//
// The inverse table is built when the wheel is configured. A wiring that
// fails validation never replaces the tables, so lookups cannot miss.
//
// Layer 1: depends on Layer 0 (alphabet.h, wiring.h) and the standard library.
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>
#include <rotorbox/cipher/core/wiring.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

namespace Rotorbox::Cipher {

/// @brief Whether a wheel steps.
enum class WheelMotion : uint8_t {
    Fixed = 0,  ///< Plugboard, reflector
    Rotating    ///< Right, middle, left rotors
};

/// @brief Substitution wheel with optional rotation, ring setting and
/// turnover triggers.
///
/// @par Usage
/// @code
/// Wheel rotor;
/// if (rotor.configure("EKMFLGDQVZNTOWYHXUSPAIBRCJ", 0, 1) != WiringStatus::Valid) {
///     // reject the configuration
/// }
/// rotor.setTriggers({17});
///
/// const bool carry = rotor.rotate();   // position 0 -> 1
/// char c = rotor.encipher('A');        // 'K'
/// @endcode
class Wheel {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    /// Identity wiring, fixed.
    Wheel() noexcept {
        for (int i = 0; i < kAlphabetSize; ++i) {
            forward_[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
            inverse_[static_cast<size_t>(i)] = static_cast<uint8_t>(i);
        }
    }

    // =========================================================================
    // Configuration
    // =========================================================================

    /// @brief Load a wiring and the initial rotor state.
    ///
    /// Clears the triggers. For WheelMotion::Fixed the position and ring
    /// setting are forced to 0.
    ///
    /// @param wiring        Permutation of A-Z; position i is the image of letter i
    /// @param rotorPosition Initial rotor position (reduced mod 26)
    /// @param ringSetting   Ring setting (reduced mod 26)
    /// @param motion        Fixed or Rotating
    /// @return WiringStatus::Valid on success. Anything else leaves the wheel
    ///         exactly as it was.
    [[nodiscard]] WiringStatus configure(std::string_view wiring,
                                         int rotorPosition = 0,
                                         int ringSetting = 0,
                                         WheelMotion motion = WheelMotion::Rotating) noexcept {
        const WiringStatus status = validateWiring(wiring);
        if (status != WiringStatus::Valid) {
            return status;
        }

        for (int i = 0; i < kAlphabetSize; ++i) {
            const int image = letterToPosition(wiring[static_cast<size_t>(i)]);
            forward_[static_cast<size_t>(i)] = static_cast<uint8_t>(image);
            inverse_[static_cast<size_t>(image)] = static_cast<uint8_t>(i);
        }

        motion_ = motion;
        if (motion_ == WheelMotion::Fixed) {
            rotorPosition_ = 0;
            ringSetting_ = 0;
        } else {
            rotorPosition_ = wrapPosition(rotorPosition);
            ringSetting_ = wrapPosition(ringSetting);
        }
        triggers_.fill(false);
        return WiringStatus::Valid;
    }

    /// @brief Set the rotor position (mod 26). No effect on a fixed wheel.
    void setRotorPosition(int position) noexcept {
        if (motion_ == WheelMotion::Rotating) {
            rotorPosition_ = wrapPosition(position);
        }
    }

    /// @brief Replace the trigger set. Each value is reduced mod 26.
    /// No effect on a fixed wheel.
    void setTriggers(std::span<const int> positions) noexcept {
        if (motion_ != WheelMotion::Rotating) {
            return;
        }
        triggers_.fill(false);
        for (const int p : positions) {
            triggers_[static_cast<size_t>(wrapPosition(p))] = true;
        }
    }

    void setTriggers(std::initializer_list<int> positions) noexcept {
        setTriggers(std::span<const int>(positions.begin(), positions.size()));
    }

    void clearTriggers() noexcept { triggers_.fill(false); }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] int rotorPosition() const noexcept { return rotorPosition_; }
    [[nodiscard]] int ringSetting() const noexcept { return ringSetting_; }
    [[nodiscard]] WheelMotion motion() const noexcept { return motion_; }
    [[nodiscard]] bool isRotating() const noexcept {
        return motion_ == WheelMotion::Rotating;
    }

    /// @brief Whether reaching @p position by rotate() signals turnover.
    [[nodiscard]] bool isTrigger(int position) const noexcept {
        return triggers_[static_cast<size_t>(wrapPosition(position))];
    }

    /// @brief Letter showing in the rotor window.
    [[nodiscard]] char windowLetter() const noexcept {
        return positionToLetter(rotorPosition_);
    }

    /// @brief The wiring as a 26-letter string.
    [[nodiscard]] std::string wiring() const {
        std::string result(static_cast<size_t>(kAlphabetSize), 'A');
        for (int i = 0; i < kAlphabetSize; ++i) {
            result[static_cast<size_t>(i)] = positionToLetter(forward_[static_cast<size_t>(i)]);
        }
        return result;
    }

    // =========================================================================
    // Stepping
    // =========================================================================

    /// @brief Advance the rotor by one position.
    /// @return true if the new position is a trigger (the next wheel steps).
    ///         A fixed wheel does not move and returns false.
    bool rotate() noexcept {
        if (motion_ != WheelMotion::Rotating) {
            return false;
        }
        rotorPosition_ = wrapPosition(rotorPosition_ + 1);
        return triggers_[static_cast<size_t>(rotorPosition_)];
    }

    // =========================================================================
    // Letter Substitution
    // =========================================================================

    /// @brief Encipher one letter.
    ///
    /// The input index is shifted back by the rotor position, looked up in
    /// the wiring, and the result shifted forward by the ring setting.
    /// Non-alphabetic characters are returned unchanged.
    [[nodiscard]] char encipher(char letter) const noexcept {
        if (!isAlphabetic(letter)) {
            return letter;
        }
        const int shifted = wrapPosition(letterToPosition(letter) - rotorPosition_);
        const int image = forward_[static_cast<size_t>(shifted)];
        return positionToLetter(image + ringSetting_);
    }

    /// @brief Exact inverse of encipher(char) for the same rotor state.
    [[nodiscard]] char decipher(char letter) const noexcept {
        if (!isAlphabetic(letter)) {
            return letter;
        }
        const int image = wrapPosition(letterToPosition(letter) - ringSetting_);
        const int source = inverse_[static_cast<size_t>(image)];
        return positionToLetter(source + rotorPosition_);
    }

    /// @brief Encipher every character with the rotor held still.
    [[nodiscard]] std::string encipher(std::string_view message) const {
        std::string result(message);
        for (char& c : result) {
            c = encipher(c);
        }
        return result;
    }

    /// @brief Decipher every character with the rotor held still.
    [[nodiscard]] std::string decipher(std::string_view message) const {
        std::string result(message);
        for (char& c : result) {
            c = decipher(c);
        }
        return result;
    }

    // =========================================================================
    // Position-Space Translation
    // =========================================================================

    /// @brief Pass a signal through the wheel towards the reflector.
    ///
    /// @param position Contact position on the right-hand side, in [0, 26)
    ///                 (other values are wrapped)
    /// @return Contact position on the left-hand side. Independent of the
    ///         ring setting.
    [[nodiscard]] int rightToLeft(int position) const noexcept {
        const int contact = wrapPosition(position + rotorPosition_);
        return wrapPosition(forward_[static_cast<size_t>(contact)] - rotorPosition_);
    }

    /// @brief Pass a signal back through the wheel from the reflector side.
    /// Inverse of rightToLeft() for the same rotor position.
    [[nodiscard]] int leftToRight(int position) const noexcept {
        const int contact = wrapPosition(position + rotorPosition_);
        return wrapPosition(inverse_[static_cast<size_t>(contact)] - rotorPosition_);
    }

private:
    std::array<uint8_t, kAlphabetSize> forward_{};   ///< letter i -> image
    std::array<uint8_t, kAlphabetSize> inverse_{};   ///< image -> letter i
    std::array<bool, kAlphabetSize> triggers_{};     ///< turnover positions
    int rotorPosition_{0};                           ///< [0, 26)
    int ringSetting_{0};                             ///< [0, 26)
    WheelMotion motion_{WheelMotion::Fixed};
};

}  // namespace Rotorbox::Cipher
