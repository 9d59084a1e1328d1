// ==============================================================================
// Layer 3: System Component - RotorMachine
// ==============================================================================
// Three-rotor cipher machine: plugboard, right, middle and left rotors and a
// reflector, composed into one signal path.
//
// Layer: 3 (System Component)
// Dependencies:
//   - Layer 1: Wheel
//   - Layer 0: alphabet, wiring
//
// Per keystroke (alphabetic characters only):
//   1. Step: right rotor always; middle when the right one reports turnover;
//      left when the middle one reports turnover.
//   2. Route the position forward through plugboard, right, middle, left and
//      reflector (rightToLeft), then back through left, middle, right and
//      plugboard (leftToRight).
// Any other character passes through without stepping.
//
// With a reflector that is a fixed-point-free involution the whole
// transformation is self-inverse: reset to the same starting positions and
// the ciphertext transforms back into the plaintext.
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>
#include <rotorbox/cipher/core/wiring.h>
#include <rotorbox/cipher/primitives/wheel.h>
#include <rotorbox/cipher/systems/machine_settings.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

// DEBUG: per-letter signal path tracing to stderr
#ifndef ROTORBOX_SIGNAL_TRACE
#define ROTORBOX_SIGNAL_TRACE 0
#endif
#if ROTORBOX_SIGNAL_TRACE
#include <cstdio>
#endif

namespace Rotorbox::Cipher {

/// @brief Structural role of each wheel, in forward signal order.
enum class WheelRole : uint8_t {
    Plugboard = 0,
    Right,
    Middle,
    Left,
    Reflector
};

inline constexpr size_t kNumWheels = 5;

[[nodiscard]] constexpr const char* wheelRoleName(WheelRole role) noexcept {
    switch (role) {
        case WheelRole::Plugboard: return "plugboard";
        case WheelRole::Right:     return "right rotor";
        case WheelRole::Middle:    return "middle rotor";
        case WheelRole::Left:      return "left rotor";
        case WheelRole::Reflector: return "reflector";
    }
    return "unknown";
}

/// @brief Outcome of RotorMachine::configure().
struct ConfigureResult {
    WiringStatus status = WiringStatus::Valid;
    WheelRole role = WheelRole::Plugboard;  ///< First wheel that failed

    [[nodiscard]] bool ok() const noexcept { return status == WiringStatus::Valid; }
};

/// @brief Layer 3 System Component - three-rotor cipher machine.
///
/// @par Usage
/// @code
/// RotorMachine machine;
/// if (!machine.configure(defaultMachineSettings()).ok()) {
///     return;  // fatal configuration error
/// }
/// const std::string cipher = machine.transformMessage("HELLO WORLD");
/// machine.reset();
/// const std::string plain = machine.transformMessage(cipher);  // "HELLO WORLD"
/// @endcode
///
/// @note Not thread-safe. Confine an instance to one owner at a time;
///       separate instances share nothing.
class RotorMachine {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    RotorMachine() noexcept = default;
    ~RotorMachine() = default;

    RotorMachine(const RotorMachine&) = default;
    RotorMachine& operator=(const RotorMachine&) = default;
    RotorMachine(RotorMachine&&) noexcept = default;
    RotorMachine& operator=(RotorMachine&&) noexcept = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// @brief Build all five wheels from @p settings.
    ///
    /// Plugboard and reflector are fixed (position 0, ring 0). The rotor
    /// positions become the starting positions that reset() restores.
    /// On failure the machine is left unconfigured and passes text through.
    [[nodiscard]] ConfigureResult configure(const MachineSettings& settings) noexcept {
        configured_ = false;

        std::array<Wheel, kNumWheels> wheels{};
        ConfigureResult result;

        const auto fail = [&result](WheelRole role, WiringStatus status) {
            result.role = role;
            result.status = status;
            return result;
        };

        WiringStatus status = wheelAt(wheels, WheelRole::Plugboard)
            .configure(settings.plugboard, 0, 0, WheelMotion::Fixed);
        if (status != WiringStatus::Valid) return fail(WheelRole::Plugboard, status);

        status = configureRotor(wheelAt(wheels, WheelRole::Right), settings.right);
        if (status != WiringStatus::Valid) return fail(WheelRole::Right, status);

        status = configureRotor(wheelAt(wheels, WheelRole::Middle), settings.middle);
        if (status != WiringStatus::Valid) return fail(WheelRole::Middle, status);

        status = configureRotor(wheelAt(wheels, WheelRole::Left), settings.left);
        if (status != WiringStatus::Valid) return fail(WheelRole::Left, status);

        status = wheelAt(wheels, WheelRole::Reflector)
            .configure(settings.reflector, 0, 0, WheelMotion::Fixed);
        if (status != WiringStatus::Valid) return fail(WheelRole::Reflector, status);

        wheels_ = wheels;
        startRight_ = wheel(WheelRole::Right).rotorPosition();
        startMiddle_ = wheel(WheelRole::Middle).rotorPosition();
        startLeft_ = wheel(WheelRole::Left).rotorPosition();
        configured_ = true;
        return result;
    }

    /// @brief Return the rotors to the starting positions.
    void reset() noexcept {
        mutableWheel(WheelRole::Right).setRotorPosition(startRight_);
        mutableWheel(WheelRole::Middle).setRotorPosition(startMiddle_);
        mutableWheel(WheelRole::Left).setRotorPosition(startLeft_);
    }

    [[nodiscard]] bool isConfigured() const noexcept { return configured_; }

    // =========================================================================
    // Settings
    // =========================================================================

    /// @brief Replace the turnover triggers of the three rotors.
    void setTriggers(std::span<const int> right,
                     std::span<const int> middle,
                     std::span<const int> left) noexcept {
        mutableWheel(WheelRole::Right).setTriggers(right);
        mutableWheel(WheelRole::Middle).setTriggers(middle);
        mutableWheel(WheelRole::Left).setTriggers(left);
    }

    /// @brief Move the rotors without touching wiring, rings or triggers.
    ///
    /// The new positions also become the starting positions for reset(), so
    /// a message can be re-run or decrypted from a known message key.
    void setRotorPositions(int right, int middle, int left) noexcept {
        startRight_ = wrapPosition(right);
        startMiddle_ = wrapPosition(middle);
        startLeft_ = wrapPosition(left);
        reset();
    }

    [[nodiscard]] int rotorPosition(WheelRole role) const noexcept {
        return wheel(role).rotorPosition();
    }

    /// @brief Rotor window letters, left to right (e.g. "MCK").
    [[nodiscard]] std::string windowLetters() const {
        return {wheel(WheelRole::Left).windowLetter(),
                wheel(WheelRole::Middle).windowLetter(),
                wheel(WheelRole::Right).windowLetter()};
    }

    [[nodiscard]] const Wheel& wheel(WheelRole role) const noexcept {
        return wheels_[static_cast<size_t>(role)];
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// @brief Step the rotor assembly once (carry propagates right to left).
    void step() noexcept {
        if (mutableWheel(WheelRole::Right).rotate()) {
            if (mutableWheel(WheelRole::Middle).rotate()) {
                mutableWheel(WheelRole::Left).rotate();
            }
        }
    }

    /// @brief Transform one character, stepping first if it is a letter.
    [[nodiscard]] char transformLetter(char c) noexcept {
        if (!configured_ || !isAlphabetic(c)) {
            return c;
        }

        step();

        int position = letterToPosition(c);
        for (const WheelRole role : kForwardPath) {
            position = wheel(role).rightToLeft(position);
            traceStage(wheelRoleName(role), position);
        }
        for (const WheelRole role : kReturnPath) {
            position = wheel(role).leftToRight(position);
            traceStage(wheelRoleName(role), position);
        }

#if ROTORBOX_SIGNAL_TRACE
        std::fprintf(stderr, "[rotorbox] %c -> %c window=%c%c%c\n", c,
                     positionToLetter(position),
                     wheel(WheelRole::Left).windowLetter(),
                     wheel(WheelRole::Middle).windowLetter(),
                     wheel(WheelRole::Right).windowLetter());
#endif
        return positionToLetter(position);
    }

    /// @brief Transform a buffer in place.
    void process(char* buffer, size_t length) noexcept {
        if (buffer == nullptr || !configured_) return;

        for (size_t i = 0; i < length; ++i) {
            buffer[i] = transformLetter(buffer[i]);
        }
    }

    /// @brief Transform a whole message. Rotor state carries over between
    /// calls until reset() or setRotorPositions().
    [[nodiscard]] std::string transformMessage(std::string_view text) {
        std::string result(text);
        process(result.data(), result.size());
        return result;
    }

private:
    static constexpr std::array<WheelRole, kNumWheels> kForwardPath{
        WheelRole::Plugboard, WheelRole::Right, WheelRole::Middle,
        WheelRole::Left, WheelRole::Reflector};

    static constexpr std::array<WheelRole, 4> kReturnPath{
        WheelRole::Left, WheelRole::Middle, WheelRole::Right,
        WheelRole::Plugboard};

    static Wheel& wheelAt(std::array<Wheel, kNumWheels>& wheels, WheelRole role) noexcept {
        return wheels[static_cast<size_t>(role)];
    }

    static WiringStatus configureRotor(Wheel& rotor, const RotorSettings& settings) noexcept {
        const WiringStatus status = rotor.configure(settings.wiring, settings.position,
                                                   settings.ring, WheelMotion::Rotating);
        if (status == WiringStatus::Valid) {
            rotor.setTriggers(settings.triggers);
        }
        return status;
    }

    Wheel& mutableWheel(WheelRole role) noexcept {
        return wheels_[static_cast<size_t>(role)];
    }

#if ROTORBOX_SIGNAL_TRACE
    static void traceStage(const char* stage, int position) noexcept {
        std::fprintf(stderr, "[rotorbox]   %-12s %c\n", stage, positionToLetter(position));
    }
#else
    static void traceStage(const char* /*stage*/, int /*position*/) noexcept {}
#endif

    std::array<Wheel, kNumWheels> wheels_{};
    int startRight_ = 0;
    int startMiddle_ = 0;
    int startLeft_ = 0;
    bool configured_ = false;
};

}  // namespace Rotorbox::Cipher
