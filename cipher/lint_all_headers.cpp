// ==============================================================================
// Rotorbox Lint Stub - Compile every public header on its own
// ==============================================================================
// This file exists solely to give static analysis a .cpp translation unit
// that includes every public cipher header. It is not part of the library;
// it is compiled as a separate OBJECT target (rotorbox_cipher_lint_stub) so
// that each header must be self-contained.
// ==============================================================================

// Layer 0: Core
#include <rotorbox/cipher/core/alphabet.h>
#include <rotorbox/cipher/core/random.h>
#include <rotorbox/cipher/core/wheel_catalog.h>
#include <rotorbox/cipher/core/wiring.h>

// Layer 1: Primitives
#include <rotorbox/cipher/primitives/wheel.h>

// Layer 3: Systems
#include <rotorbox/cipher/systems/machine_settings.h>
#include <rotorbox/cipher/systems/rotor_machine.h>
