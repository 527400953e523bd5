//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trap.hpp
// Purpose: Defines trap classification for runtime failures of the live VM.
// Key invariants: A Trap never crosses Runtime's public API; invoke() turns it
//                 into a Diagnostic.
// Ownership/Lifetime: Traps are thrown by value.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace hotswap::vm
{

/// @brief Categorises runtime traps for diagnostic reporting.
enum class TrapKind : int32_t
{
    DivideByZero = 0,     ///< Integer division or remainder by zero.
    NullReference = 1,    ///< Member access through null.
    InvalidCast = 2,      ///< castclass or operand kind mismatch.
    MissingMember = 3,    ///< Type, method or field failed to resolve.
    Visibility = 4,       ///< Access to a member the caller may not see.
    StackOverflow = 5,    ///< Call depth exceeded HOTSWAP_VM_MAX_CALL_DEPTH.
    InvalidOperation = 6, ///< Malformed bytecode or stack underflow.
    Unhandled = 7,        ///< Managed exception escaped the outermost frame.
};

/// @brief Convert trap kind to canonical diagnostic string.
constexpr std::string_view toString(TrapKind kind) noexcept
{
    switch (kind)
    {
        case TrapKind::DivideByZero:
            return "DivideByZero";
        case TrapKind::NullReference:
            return "NullReference";
        case TrapKind::InvalidCast:
            return "InvalidCast";
        case TrapKind::MissingMember:
            return "MissingMember";
        case TrapKind::Visibility:
            return "Visibility";
        case TrapKind::StackOverflow:
            return "StackOverflow";
        case TrapKind::InvalidOperation:
            return "InvalidOperation";
        case TrapKind::Unhandled:
            return "Unhandled";
    }
    return "InvalidOperation";
}

/// @brief Runtime failure raised by the interpreter.
class Trap : public std::runtime_error
{
  public:
    Trap(TrapKind kind, std::string message, std::string method = {});

    TrapKind kind() const
    {
        return kind_;
    }

    /// @brief Signature of the method executing when the trap fired.
    const std::string &method() const
    {
        return method_;
    }

    /// @brief "Trap @<method>: <Kind> (<message>)".
    std::string format() const;

  private:
    TrapKind kind_;
    std::string method_;
};

/// @brief Throw a Trap of @p kind.
[[noreturn]] void raise(TrapKind kind, std::string message, std::string method = {});

} // namespace hotswap::vm
