// ==============================================================================
// Layer 0: Core Utilities
// random.h - Fast Pseudo-Random Number Generation
// ==============================================================================
// Draws random message keys (starting rotor positions) and random test text.
//
// - No allocation, no exceptions, no I/O
// - constexpr where possible, value semantics
// - Layer 0: NO dependencies on higher layers
// ==============================================================================

#pragma once

#include <rotorbox/cipher/core/alphabet.h>

#include <cstdint>

namespace Rotorbox::Cipher {

// ==============================================================================
// Xorshift32 PRNG
// ==============================================================================

/// Fast 32-bit pseudo-random number generator using xorshift algorithm.
///
/// Period of 2^32-1. Good enough to pick rotor positions for a message key;
/// the key itself is what protects a message, not the generator.
///
/// Algorithm: Marsaglia's xorshift with shifts 13, 17, 5
///
/// @note NOT cryptographically secure
///
/// @example Basic usage:
///     Xorshift32 rng(12345);
///     int position = rng.nextPosition();  // [0, 26)
///     char letter = rng.nextLetter();     // 'A' .. 'Z'
///
class Xorshift32 {
public:
    /// Construct with seed value.
    /// @param seedValue Initial seed (0 is automatically replaced with default)
    explicit constexpr Xorshift32(uint32_t seedValue = 1) noexcept
        : state_(seedValue != 0 ? seedValue : kDefaultSeed) {}

    /// Generate next 32-bit unsigned integer.
    /// @return Random uint32_t in range [1, 2^32-1]
    [[nodiscard]] constexpr uint32_t next() noexcept {
        state_ ^= state_ << 13;
        state_ ^= state_ >> 17;
        state_ ^= state_ << 5;
        return state_;
    }

    /// Generate next alphabet position.
    /// @return Random position in range [0, kAlphabetSize)
    [[nodiscard]] constexpr int nextPosition() noexcept {
        // High bits of xorshift are better mixed than the low ones
        return static_cast<int>((next() >> 8) % static_cast<uint32_t>(kAlphabetSize));
    }

    /// Generate next uppercase letter.
    [[nodiscard]] constexpr char nextLetter() noexcept {
        return positionToLetter(nextPosition());
    }

    /// Reseed the generator.
    /// @param seedValue New seed (0 is automatically replaced with default)
    constexpr void seed(uint32_t seedValue) noexcept {
        state_ = (seedValue != 0) ? seedValue : kDefaultSeed;
    }

    /// Get current state (for debugging/serialization).
    [[nodiscard]] constexpr uint32_t state() const noexcept {
        return state_;
    }

private:
    /// Default seed used when 0 is passed (0 would cause generator to output only zeros)
    static constexpr uint32_t kDefaultSeed = 2463534242u;

    uint32_t state_;
};

}  // namespace Rotorbox::Cipher
