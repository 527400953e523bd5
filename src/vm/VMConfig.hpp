//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VMConfig.hpp
// Purpose: Compile-time knobs of the interpreter.
// Key invariants: Every macro can be overridden with -D.
// Ownership/Lifetime: Not applicable.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

// -----------------------------------------------------------------------------
// Maximum interpreter call depth before a StackOverflow trap.
// -----------------------------------------------------------------------------
#ifndef HOTSWAP_VM_MAX_CALL_DEPTH
#define HOTSWAP_VM_MAX_CALL_DEPTH 512
#endif

// -----------------------------------------------------------------------------
// Upper bound on redirect chain length followed per call.  Chains longer than
// this are treated as a cycle.
// -----------------------------------------------------------------------------
#ifndef HOTSWAP_VM_MAX_REDIRECT_CHAIN
#define HOTSWAP_VM_MAX_REDIRECT_CHAIN 64
#endif

// -----------------------------------------------------------------------------
// Dispatch hook invoked before each instruction (compiled away by default).
// -----------------------------------------------------------------------------
#ifndef HOTSWAP_VM_DISPATCH_BEFORE
#define HOTSWAP_VM_DISPATCH_BEFORE(FRAME, INSTR)                                                   \
    do                                                                                             \
    {                                                                                              \
    } while (0)
#endif
