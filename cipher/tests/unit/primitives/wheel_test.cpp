// ==============================================================================
// Unit Tests: Wheel (Layer 1 Primitive)
// ==============================================================================
// Tests: Default identity, configuration and rejection, fixed wheels,
//        letter encipher/decipher with rotor position and ring setting,
//        rotate/turnover, position-space translation and wheel chaining
// ==============================================================================

#include <rotorbox/cipher/primitives/wheel.h>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <set>
#include <string>
#include <vector>

using namespace Rotorbox::Cipher;

namespace {

constexpr std::string_view kRotorI = "EKMFLGDQVZNTOWYHXUSPAIBRCJ";
constexpr std::string_view kCaesar3 = "DEFGHIJKLMNOPQRSTUVWXYZABC";

Wheel makeRotor(std::string_view wiring, int position = 0, int ring = 0) {
    Wheel wheel;
    const WiringStatus status = wheel.configure(wiring, position, ring);
    REQUIRE(status == WiringStatus::Valid);
    return wheel;
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

TEST_CASE("Wheel: default construction is a fixed identity wheel", "[wheel][primitives]") {
    Wheel wheel;
    REQUIRE(wheel.motion() == WheelMotion::Fixed);
    REQUIRE(wheel.rotorPosition() == 0);
    REQUIRE(wheel.ringSetting() == 0);
    REQUIRE(wheel.wiring() == kIdentityWiring);
    REQUIRE(wheel.encipher(std::string_view{"HELLO"}) == "HELLO");
}

TEST_CASE("Wheel: configure reduces position and ring mod 26", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 27, -1);
    REQUIRE(wheel.isRotating());
    REQUIRE(wheel.rotorPosition() == 1);
    REQUIRE(wheel.ringSetting() == 25);
    REQUIRE(wheel.wiring() == kRotorI);
    REQUIRE(wheel.windowLetter() == 'B');
}

TEST_CASE("Wheel: rejected wiring leaves the wheel unchanged", "[wheel][primitives][edge]") {
    Wheel wheel = makeRotor(kRotorI, 5, 3);
    wheel.setTriggers({9});

    SECTION("wrong length") {
        REQUIRE(wheel.configure("ABC", 1, 1) == WiringStatus::WrongLength);
    }
    SECTION("duplicate letter") {
        REQUIRE(wheel.configure("EEMFLGDQVZNTOWYHXUSPAIBRCJ", 1, 1) ==
                WiringStatus::DuplicateLetter);
    }
    SECTION("invalid letter") {
        REQUIRE(wheel.configure("ekmflgdqvzntowyhxuspaibrcj", 1, 1) ==
                WiringStatus::InvalidLetter);
    }

    REQUIRE(wheel.wiring() == kRotorI);
    REQUIRE(wheel.rotorPosition() == 5);
    REQUIRE(wheel.ringSetting() == 3);
    REQUIRE(wheel.isTrigger(9));
    REQUIRE(wheel.isRotating());
}

TEST_CASE("Wheel: reconfiguring clears triggers", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI);
    wheel.setTriggers({3});
    REQUIRE(wheel.configure(kRotorI) == WiringStatus::Valid);
    REQUIRE_FALSE(wheel.isTrigger(3));
}

// =============================================================================
// Fixed Wheels
// =============================================================================

TEST_CASE("Wheel: fixed wheel never moves", "[wheel][primitives]") {
    Wheel reflector;
    REQUIRE(reflector.configure("YRUHQSLDPXNGOKMIEBFZCWVJAT", 7, 4, WheelMotion::Fixed) ==
            WiringStatus::Valid);

    // Position and ring forced to 0
    REQUIRE(reflector.rotorPosition() == 0);
    REQUIRE(reflector.ringSetting() == 0);

    reflector.setTriggers({1});
    REQUIRE_FALSE(reflector.isTrigger(1));

    for (int i = 0; i < 30; ++i) {
        REQUIRE_FALSE(reflector.rotate());
    }
    REQUIRE(reflector.rotorPosition() == 0);

    reflector.setRotorPosition(9);
    REQUIRE(reflector.rotorPosition() == 0);
}

// =============================================================================
// Static Substitution
// =============================================================================

TEST_CASE("Wheel: static substitution enciphers the alphabet to the wiring", "[wheel][primitives]") {
    Wheel wheel;
    REQUIRE(wheel.configure(kCaesar3, 0, 0, WheelMotion::Fixed) == WiringStatus::Valid);

    REQUIRE(wheel.encipher(kAlphabet) == kCaesar3);
    REQUIRE(wheel.decipher(kCaesar3) == kAlphabet);
}

TEST_CASE("Wheel: static substitution of a message", "[wheel][primitives]") {
    Wheel qwerty;
    REQUIRE(qwerty.configure("QWERTYUIOPASDFGHJKLZXCVBNM", 0, 0, WheelMotion::Fixed) ==
            WiringStatus::Valid);
    REQUIRE(qwerty.encipher(std::string_view{"TESTING ENCIPHERING THIS MESSAGE"}) ==
            "ZTLZOFU TFEOHITKOFU ZIOL DTLLQUT");
    REQUIRE(qwerty.decipher(std::string_view{"ZTLZOFU TFEOHITKOFU ZIOL DTLLQUT"}) ==
            "TESTING ENCIPHERING THIS MESSAGE");

    Wheel swaps;
    REQUIRE(swaps.configure("BADCFEHGJILKNMPORQTSVUXWZY", 0, 0, WheelMotion::Fixed) ==
            WiringStatus::Valid);
    REQUIRE(swaps.encipher(std::string_view{"TESTING ENCIPHERING THIS MESSAGE"}) ==
            "SFTSJMH FMDJOGFQJMH SGJT NFTTBHF");
    REQUIRE(swaps.decipher(std::string_view{"SFTSJMH FMDJOGFQJMH SGJT NFTTBHF"}) ==
            "TESTING ENCIPHERING THIS MESSAGE");
}

TEST_CASE("Wheel: non-alphabetic characters pass through", "[wheel][primitives][edge]") {
    Wheel wheel = makeRotor(kRotorI, 4, 7);
    for (const char c : std::string_view{" !?.,0129az\t\n"}) {
        REQUIRE(wheel.encipher(c) == c);
        REQUIRE(wheel.decipher(c) == c);
    }
}

// =============================================================================
// Rotor Position
// =============================================================================

TEST_CASE("Wheel: rotor position shifts the input backwards", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kIdentityWiring, 23);
    REQUIRE(wheel.encipher(kAlphabet) == kCaesar3);
    REQUIRE(wheel.decipher(kCaesar3) == kAlphabet);
}

TEST_CASE("Wheel: rotating identity wheel enciphers the alphabet to one letter", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kIdentityWiring, 23);

    std::string enciphered;
    for (const char c : kAlphabet) {
        wheel.rotate();
        enciphered.push_back(wheel.encipher(c));
    }
    REQUIRE(enciphered == std::string(26, 'C'));
}

TEST_CASE("Wheel: rotating identity wheel deciphers one letter to the alphabet", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kIdentityWiring, 23);

    std::string deciphered;
    for (int i = 0; i < kAlphabetSize; ++i) {
        wheel.rotate();
        deciphered.push_back(wheel.decipher('C'));
    }
    REQUIRE(deciphered == kAlphabet);
}

// =============================================================================
// Ring Setting
// =============================================================================

TEST_CASE("Wheel: ring setting shifts the output forwards", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 0, 1);
    wheel.rotate();

    REQUIRE(wheel.encipher(kAlphabet) == "KFLNGMHERWAOUPXZIYVTQBJCSD");
    REQUIRE(wheel.decipher(std::string_view{"KFLNGMHERWAOUPXZIYVTQBJCSD"}) == kAlphabet);
}

TEST_CASE("Wheel: rotating wheel with ring setting", "[wheel][primitives]") {
    SECTION("encipher") {
        Wheel wheel = makeRotor(kRotorI, 0, 2);
        std::string enciphered;
        for (const char c : kAlphabet) {
            wheel.rotate();
            enciphered.push_back(wheel.encipher(c));
        }
        REQUIRE(enciphered == std::string(26, 'L'));
    }

    SECTION("decipher") {
        Wheel wheel = makeRotor(kRotorI, 0, 2);
        std::string deciphered;
        for (int i = 0; i < kAlphabetSize; ++i) {
            wheel.rotate();
            deciphered.push_back(wheel.decipher('L'));
        }
        REQUIRE(deciphered == kAlphabet);
    }
}

TEST_CASE("Wheel: decipher inverts encipher for every rotor state", "[wheel][primitives]") {
    Wheel wheel;
    for (int position = 0; position < kAlphabetSize; ++position) {
        for (int ring = 0; ring < kAlphabetSize; ++ring) {
            REQUIRE(wheel.configure(kRotorI, position, ring) == WiringStatus::Valid);
            for (const char c : kAlphabet) {
                INFO("position " << position << " ring " << ring << " letter " << c);
                REQUIRE(wheel.decipher(wheel.encipher(c)) == c);
                REQUIRE(wheel.encipher(wheel.decipher(c)) == c);
            }
        }
    }
}

TEST_CASE("Wheel: every rotor state is a permutation", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 0, 5);
    for (int step = 0; step < kAlphabetSize; ++step) {
        const std::string out = wheel.encipher(kAlphabet);
        const std::set<char> letters(out.begin(), out.end());
        REQUIRE(letters.size() == static_cast<size_t>(kAlphabetSize));
        wheel.rotate();
    }
}

// =============================================================================
// Stepping
// =============================================================================

TEST_CASE("Wheel: 26 rotations return to the start", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI);
    for (int i = 1; i <= kAlphabetSize; ++i) {
        REQUIRE_FALSE(wheel.rotate());  // no triggers configured
        REQUIRE(wheel.rotorPosition() == i % kAlphabetSize);
    }
    REQUIRE(wheel.rotorPosition() == 0);
}

TEST_CASE("Wheel: each trigger fires once per revolution", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 3);
    wheel.setTriggers({0, 17, 25});

    int fired = 0;
    std::vector<int> firedAt;
    for (int i = 0; i < kAlphabetSize; ++i) {
        if (wheel.rotate()) {
            ++fired;
            firedAt.push_back(wheel.rotorPosition());
        }
    }
    REQUIRE(fired == 3);
    REQUIRE(firedAt == std::vector<int>{17, 25, 0});
}

TEST_CASE("Wheel: turnover follows the trigger pattern", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 0, 2);
    wheel.setTriggers({6, 13, 20});

    for (int i = 1; i <= kAlphabetSize; ++i) {
        const bool carry = wheel.rotate();
        INFO("step " << i);
        REQUIRE(carry == (i % 7 == 6));
    }
}

TEST_CASE("Wheel: turnover is reported on the new position", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 16);
    wheel.setTriggers({17});
    REQUIRE(wheel.rotate());          // 16 -> 17
    REQUIRE_FALSE(wheel.rotate());    // 17 -> 18
}

TEST_CASE("Wheel: setTriggers replaces and wraps", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI);

    wheel.setTriggers({1, 2});
    REQUIRE(wheel.isTrigger(1));
    REQUIRE(wheel.isTrigger(2));

    const std::vector<int> replacement{27, -1};
    wheel.setTriggers(replacement);
    REQUIRE_FALSE(wheel.isTrigger(2));
    REQUIRE(wheel.isTrigger(1));
    REQUIRE(wheel.isTrigger(25));

    wheel.clearTriggers();
    for (int p = 0; p < kAlphabetSize; ++p) {
        REQUIRE_FALSE(wheel.isTrigger(p));
    }
}

TEST_CASE("Wheel: setRotorPosition replaces the position", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI, 4);
    wheel.setRotorPosition(30);
    REQUIRE(wheel.rotorPosition() == 4);
    wheel.setRotorPosition(-2);
    REQUIRE(wheel.rotorPosition() == 24);
}

// =============================================================================
// Position-Space Translation
// =============================================================================

TEST_CASE("Wheel: rightToLeft at rest matches the wiring", "[wheel][primitives]") {
    Wheel wheel = makeRotor(kRotorI);
    for (int p = 0; p < kAlphabetSize; ++p) {
        REQUIRE(positionToLetter(wheel.rightToLeft(p)) == kRotorI[static_cast<size_t>(p)]);
        REQUIRE(positionToLetter(wheel.rightToLeft(p)) == wheel.encipher(positionToLetter(p)));
    }
}

TEST_CASE("Wheel: rightToLeft with rotor advanced", "[wheel][primitives]") {
    // Rotor I at B: contact A enters wiring position B ('K'), leaves at K-1 = J
    Wheel wheel = makeRotor(kRotorI, 1);
    REQUIRE(wheel.rightToLeft(0) == letterToPosition('J'));
    REQUIRE(wheel.leftToRight(letterToPosition('J')) == 0);
}

TEST_CASE("Wheel: leftToRight inverts rightToLeft for every rotor state", "[wheel][primitives]") {
    Wheel wheel;
    for (int position = 0; position < kAlphabetSize; ++position) {
        for (int ring = 0; ring < kAlphabetSize; ring += 5) {
            REQUIRE(wheel.configure(kRotorI, position, ring) == WiringStatus::Valid);
            for (int p = 0; p < kAlphabetSize; ++p) {
                INFO("position " << position << " ring " << ring << " p " << p);
                const int out = wheel.rightToLeft(p);
                REQUIRE(out >= 0);
                REQUIRE(out < kAlphabetSize);
                REQUIRE(wheel.leftToRight(out) == p);
                REQUIRE(wheel.rightToLeft(wheel.leftToRight(p)) == p);
            }
        }
    }
}

TEST_CASE("Wheel: position-space inputs are wrapped", "[wheel][primitives][edge]") {
    Wheel wheel = makeRotor(kRotorI, 6, 2);
    REQUIRE(wheel.rightToLeft(26 + 4) == wheel.rightToLeft(4));
    REQUIRE(wheel.rightToLeft(-1) == wheel.rightToLeft(25));
    REQUIRE(wheel.leftToRight(-26) == wheel.leftToRight(0));
}

TEST_CASE("Wheel: ring setting does not affect position space", "[wheel][primitives]") {
    for (int position = 0; position < kAlphabetSize; ++position) {
        const Wheel plain = makeRotor(kRotorI, position, 0);
        for (int ring = 1; ring < kAlphabetSize; ++ring) {
            const Wheel ringed = makeRotor(kRotorI, position, ring);
            REQUIRE(ringed.ringSetting() == ring);
            for (int p = 0; p < kAlphabetSize; ++p) {
                INFO("position " << position << " ring " << ring << " p " << p);
                REQUIRE(ringed.rightToLeft(p) == plain.rightToLeft(p));
                REQUIRE(ringed.leftToRight(p) == plain.leftToRight(p));
            }
        }
    }
}

TEST_CASE("Wheel: ring setting still shifts the letter API", "[wheel][primitives]") {
    // Same rotor position, different ring: letters differ, contacts do not
    const Wheel plain = makeRotor(kRotorI, 1, 0);
    const Wheel ringed = makeRotor(kRotorI, 1, 1);
    REQUIRE(plain.encipher('A') == 'J');
    REQUIRE(ringed.encipher('A') == 'K');
    REQUIRE(ringed.rightToLeft(0) == plain.rightToLeft(0));
}

TEST_CASE("Wheel: chained wheels return along the same path", "[wheel][primitives]") {
    const Wheel first = makeRotor("BDFHJLCPRTXVZNYEIWGAKMUSQO", 10, 3);
    const Wheel second = makeRotor("AJDKSIRUXBLHWTMCQGZNPYFVOE", 2, 0);
    const Wheel third = makeRotor(kRotorI, 12, 20);

    std::set<int> outputs;
    for (int p = 0; p < kAlphabetSize; ++p) {
        const int forward = third.rightToLeft(second.rightToLeft(first.rightToLeft(p)));
        outputs.insert(forward);
        const int back = first.leftToRight(second.leftToRight(third.leftToRight(forward)));
        REQUIRE(back == p);
    }
    // The chain is itself a permutation
    REQUIRE(outputs.size() == static_cast<size_t>(kAlphabetSize));
}
