//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Opcode metadata tables generated from Opcode.def.  The tables are indexed by
// the enumeration value, so lookups from opcode to mnemonic or operand kind
// are constant time; the reverse lookup builds a map on first use.
//
//===----------------------------------------------------------------------===//

#include "il/core/Opcode.hpp"

#include <array>
#include <string>
#include <unordered_map>

namespace hotswap::core
{
namespace
{
constexpr std::array<std::string_view, kNumOpcodes> kOpcodeNames = {
#define HS_OPCODE(NAME, MNEMONIC, KIND) MNEMONIC,
#include "il/core/Opcode.def"
#undef HS_OPCODE
};

constexpr std::array<OperandKind, kNumOpcodes> kOperandKinds = {
#define HS_OPCODE(NAME, MNEMONIC, KIND) OperandKind::KIND,
#include "il/core/Opcode.def"
#undef HS_OPCODE
};

static_assert(kOpcodeNames.size() == kNumOpcodes, "Opcode name table must match enum count");

const std::unordered_map<std::string, Opcode> &mnemonicTable()
{
    static const std::unordered_map<std::string, Opcode> table = []
    {
        std::unordered_map<std::string, Opcode> t;
        for (size_t i = 0; i < kNumOpcodes; ++i)
            t.emplace(std::string(kOpcodeNames[i]), static_cast<Opcode>(i));
        return t;
    }();
    return table;
}
} // namespace

std::string_view toString(Opcode op)
{
    const auto index = static_cast<size_t>(op);
    if (index < kOpcodeNames.size())
        return kOpcodeNames[index];
    return "";
}

OperandKind operandKind(Opcode op)
{
    const auto index = static_cast<size_t>(op);
    if (index < kOperandKinds.size())
        return kOperandKinds[index];
    return OperandKind::None;
}

std::optional<Opcode> opcodeFromMnemonic(std::string_view mnemonic)
{
    const auto &table = mnemonicTable();
    auto it = table.find(std::string(mnemonic));
    if (it == table.end())
        return std::nullopt;
    return it->second;
}

bool isBranch(Opcode op)
{
    const OperandKind kind = operandKind(op);
    return kind == OperandKind::Target || kind == OperandKind::Targets;
}

bool isCallLike(Opcode op)
{
    return op == Opcode::Call || op == Opcode::Callvirt || op == Opcode::Newobj;
}

} // namespace hotswap::core
