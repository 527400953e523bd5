//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/reload/PatchSynthesizer.cpp
// Purpose: Wrapper synthesis, reference rewriting and field indirection.
//
// Every reference copied into the patch goes through Rewriter, which maps a
// name of the freshly compiled module onto the entity the live process
// already knows:
//   - runtime library names, primitives and generic parameters stay as is;
//   - types introduced by this compile are copied in and referenced locally;
//   - compiler-generated types are copied in on first use (memoized);
//   - types of the loaded module are scoped to it;
//   - types introduced by an earlier patch are scoped to that patch.
// Method references additionally prefer the wrapper of a member patched in
// the same diff, then the current wrapper of a member added earlier.  Loads,
// stores and address-of of fields the loaded type lacks become calls into
// core.FieldResolver.
//
// Each wrapper and each introduced type is a unit that fails on its own.
// Units record the wrappers and introduced types they reference, and a unit
// depending on a failed one fails too.
//
//===----------------------------------------------------------------------===//

#include "reload/PatchSynthesizer.hpp"

#include "il/io/Serializer.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <set>

namespace fs = std::filesystem;

namespace hotswap::reload
{

using hotswap::core::ExceptionHandler;
using hotswap::core::FieldDef;
using hotswap::core::FieldRef;
using hotswap::core::Instr;
using hotswap::core::MethodDef;
using hotswap::core::MethodRef;
using hotswap::core::Module;
using hotswap::core::Opcode;
using hotswap::core::Operand;
using hotswap::core::OperandKind;
using hotswap::core::Param;
using hotswap::core::TypeDef;
using hotswap::core::TypeRef;
using hotswap::core::Visibility;
using hotswap::support::Diag;
using hotswap::support::Expected;
using hotswap::support::makeError;

namespace
{

constexpr const char *kFieldResolver = "core.FieldResolver";
constexpr const char *kTypeUnit = "type:";

Diag fail(std::string msg)
{
    return makeError({}, std::move(msg));
}

/// @brief `A`, `A/B`, `A/B/C` for `A/B/C`.
std::vector<std::string> prefixesOf(const std::string &name)
{
    std::vector<std::string> out;
    for (size_t pos = name.find('/'); pos != std::string::npos; pos = name.find('/', pos + 1))
        out.push_back(name.substr(0, pos));
    out.push_back(name);
    return out;
}

bool isConstLoad(Opcode op)
{
    switch (op)
    {
        case Opcode::LdcI4:
        case Opcode::LdcI8:
        case Opcode::LdcR4:
        case Opcode::LdcR8:
        case Opcode::Ldstr:
        case Opcode::Ldnull:
            return true;
        default:
            return false;
    }
}

/// @brief core.FieldResolver entry point replacing field access @p op.
MethodRef resolverCall(Opcode op, const TypeRef &owner)
{
    MethodRef ref;
    ref.declaringType = TypeRef{kFieldResolver};
    ref.genericParams = {"TOwner"};
    ref.genericArgs = {owner};
    ref.returnType = TypeRef{"object"};
    switch (op)
    {
        case Opcode::Ldfld:
            ref.name = "Get";
            ref.paramTypes = {TypeRef{"object"}, TypeRef{"string"}};
            break;
        case Opcode::Stfld:
            ref.name = "Store";
            ref.returnType = TypeRef{"void"};
            ref.paramTypes = {TypeRef{"object"}, TypeRef{"object"}, TypeRef{"string"}};
            break;
        case Opcode::Ldflda:
            ref.name = "GetRef";
            ref.paramTypes = {TypeRef{"object"}, TypeRef{"string"}};
            break;
        case Opcode::Ldsfld:
            ref.name = "GetStatic";
            ref.paramTypes = {TypeRef{"string"}};
            break;
        case Opcode::Stsfld:
            ref.name = "StoreStatic";
            ref.returnType = TypeRef{"void"};
            ref.paramTypes = {TypeRef{"object"}, TypeRef{"string"}};
            break;
        default:
            ref.name = "GetStaticRef";
            ref.paramTypes = {TypeRef{"string"}};
            break;
    }
    return ref;
}

/// @brief Independently failing piece of the patch: one wrapper, or one
///        introduced type with everything nested in it.
struct Unit
{
    std::string key; ///< Member signature, or kTypeUnit + type name
    std::string type;
    std::optional<MethodDef> wrapper;
    std::optional<TypeDef> copy;
    std::vector<PatchedMember> members;
    std::vector<IntroducedType> introduced;
    std::set<std::string> deps;
    std::string failure;

    bool failed() const
    {
        return !failure.empty();
    }
};

class Rewriter
{
  public:
    Rewriter(const DiffResult &diff,
             const HookRecordSet &records,
             const ReloadConfig &config,
             Module &patch,
             std::set<std::string> introducedRoots)
        : diff_(diff), records_(records), config_(config), patch_(patch),
          introducedRoots_(std::move(introducedRoots))
    {
    }

    Expected<TypeRef> type(const TypeRef &t);
    Expected<MethodRef> method(const MethodRef &r, Opcode &op);
    Expected<void> body(const MethodDef &src, MethodDef &dst);
    Expected<TypeDef> copyType(const TypeDef &src);
    Expected<MethodDef> wrapper(const std::string &typeName, const MethodDef &src);

    /// @brief The loaded identity of a type the patch cannot define itself.
    Expected<TypeRef> loadedType(const std::string &typeName);

    /// @brief Units referenced since the last call.
    std::set<std::string> takeDeps()
    {
        std::set<std::string> out;
        out.swap(deps_);
        return out;
    }

    const std::set<std::string> &references() const
    {
        return references_;
    }

  private:
    /// @brief Generic parameter names visible while rewriting.
    class GenericScope
    {
      public:
        GenericScope(Rewriter &rw, const std::vector<std::string> &names) : rw_(rw)
        {
            rw_.generics_.push_back(names);
        }

        ~GenericScope()
        {
            rw_.generics_.pop_back();
        }

      private:
        Rewriter &rw_;
    };

    struct Extraction
    {
        bool ok = true;
        std::string reason;
        std::set<std::string> deps;
    };

    bool isLocal(const TypeRef &t) const
    {
        return t.scope.empty() || t.scope == diff_.module;
    }

    bool isBuiltin(const std::string &name) const;
    bool isGenericParam(const std::string &name) const;
    std::optional<std::string> introducedRoot(const std::string &name) const;
    const TypeDef *generatedRoot(const std::string &name) const;
    const IntroducedType *earlier(const std::string &name);
    const MethodDef *diffMethod(const std::string &type,
                                const std::string &sig,
                                MemberState &state) const;
    bool isIndirect(const std::string &type, const std::string &field) const;
    bool loadedHasField(const std::string &type, const std::string &field) const;
    bool loadedHasMethod(const std::string &type, const std::string &sig) const;
    bool isVirtual(const std::string &type, const std::string &sig) const;

    Expected<MethodDef> copyMethod(const MethodDef &src);
    Expected<void> extract(const TypeDef &root);
    Expected<void> field(const Instr &in, std::vector<Instr> &out);
    Expected<MethodRef> recordRef(const MemberRecord &rec,
                                  const MethodRef &rewritten,
                                  bool stable,
                                  Opcode &op);
    static MethodRef wrapperRef(const TypeRef &holder,
                                const MethodRef &target,
                                bool self,
                                Opcode &op);

    const DiffResult &diff_;
    const HookRecordSet &records_;
    const ReloadConfig &config_;
    Module &patch_;
    std::set<std::string> introducedRoots_;
    std::map<std::string, Extraction> extracted_;
    std::vector<std::vector<std::string>> generics_;
    std::set<std::string> deps_;
    std::set<std::string> references_;
};

bool Rewriter::isBuiltin(const std::string &name) const
{
    for (const auto &prefix : config_.builtinNamespaces)
    {
        if (name.rfind(prefix, 0) == 0)
            return true;
    }
    return false;
}

bool Rewriter::isGenericParam(const std::string &name) const
{
    for (const auto &scope : generics_)
    {
        if (std::find(scope.begin(), scope.end(), name) != scope.end())
            return true;
    }
    return false;
}

std::optional<std::string> Rewriter::introducedRoot(const std::string &name) const
{
    for (const auto &p : prefixesOf(name))
    {
        if (introducedRoots_.count(p))
            return p;
    }
    return std::nullopt;
}

const TypeDef *Rewriter::generatedRoot(const std::string &name) const
{
    for (const auto &p : prefixesOf(name))
    {
        const TypeDef *t = diff_.candidate->findType(p);
        if (t && t->compilerGenerated)
            return t;
    }
    return nullptr;
}

const IntroducedType *Rewriter::earlier(const std::string &name)
{
    const IntroducedType *it = records_.findIntroduced(name);
    if (it)
        references_.insert(it->module);
    return it;
}

const MethodDef *Rewriter::diffMethod(const std::string &type,
                                      const std::string &sig,
                                      MemberState &state) const
{
    auto t = diff_.types.find(type);
    if (t == diff_.types.end())
        return nullptr;
    if (auto m = t->second.modifiedMethods.find(sig); m != t->second.modifiedMethods.end())
    {
        state = MemberState::Modified;
        return &m->second;
    }
    if (auto m = t->second.addedMethods.find(sig); m != t->second.addedMethods.end())
    {
        state = MemberState::Added;
        return &m->second;
    }
    return nullptr;
}

bool Rewriter::isIndirect(const std::string &type, const std::string &field) const
{
    auto t = diff_.types.find(type);
    if (t != diff_.types.end() && !t->second.introduced)
    {
        for (const auto &[sig, fd] : t->second.addedFields)
        {
            if (fd.name == field)
                return true;
        }
    }
    return records_.hasField(type, field);
}

bool Rewriter::loadedHasField(const std::string &type, const std::string &field) const
{
    const TypeDef *t = diff_.baseline->findType(type);
    while (t)
    {
        if (t->findField(field))
            return true;
        if (!t->base)
            return false;
        if (!isLocal(*t->base) || isBuiltin(t->base->name))
            return true;
        t = diff_.baseline->findType(t->base->name);
    }
    return false;
}

bool Rewriter::loadedHasMethod(const std::string &type, const std::string &sig) const
{
    const TypeDef *loaded = diff_.baseline->findType(type);
    if (!loaded)
        return false;
    if (loaded->findMethod(sig))
        return true;
    // Not declared by the type itself: inherited unless the new compile
    // declares it there.
    const TypeDef *next = diff_.candidate->findType(type);
    return !(next && next->findMethod(sig));
}

bool Rewriter::isVirtual(const std::string &type, const std::string &sig) const
{
    const TypeDef *t = diff_.candidate->findType(type);
    const MethodDef *m = t ? t->findMethod(sig) : nullptr;
    return m && m->isVirtual;
}

Expected<TypeRef> Rewriter::loadedType(const std::string &typeName)
{
    if (diff_.baseline->findType(typeName))
        return TypeRef{diff_.module, typeName};
    if (const IntroducedType *it = earlier(typeName))
        return TypeRef{it->module, typeName};
    return fail("type '" + typeName + "' is not loaded");
}

Expected<TypeRef> Rewriter::type(const TypeRef &t)
{
    TypeRef out{t.scope, t.name};
    for (const auto &arg : t.args)
    {
        auto r = type(arg);
        if (!r)
            return r.error();
        out.args.push_back(std::move(r.value()));
    }
    if (!isLocal(t))
        return out;
    if (t.scope.empty() &&
        (hotswap::core::isPrimitiveType(t.name) || isGenericParam(t.name) || isBuiltin(t.name)))
        return out;

    if (auto root = introducedRoot(t.name))
    {
        deps_.insert(kTypeUnit + *root);
        out.scope.clear();
        return out;
    }
    if (const TypeDef *gen = generatedRoot(t.name))
    {
        if (auto ok = extract(*gen); !ok)
            return ok.error();
        out.scope.clear();
        return out;
    }
    if (diff_.baseline->findType(t.name))
    {
        out.scope = diff_.module;
        return out;
    }
    if (const IntroducedType *it = earlier(t.name))
    {
        out.scope = it->module;
        return out;
    }
    return fail("type '" + t.name + "' is not defined by the loaded module '" + diff_.module +
                "'");
}

MethodRef Rewriter::wrapperRef(const TypeRef &holder, const MethodRef &target, bool self, Opcode &op)
{
    MethodRef w = target;
    w.declaringType = holder;
    w.name = PatchSynthesizer::wrapperName(target.name);
    w.hasThis = false;
    if (self)
        w.paramTypes.insert(w.paramTypes.begin(), target.declaringType);
    if (op == Opcode::Callvirt)
        op = Opcode::Call;
    return w;
}

Expected<MethodRef> Rewriter::recordRef(const MemberRecord &rec,
                                        const MethodRef &rewritten,
                                        bool stable,
                                        Opcode &op)
{
    // The copy inside the patch that introduced the type is a real member of
    // it: constructible, dispatchable and redirected along the chain.
    const WrapperRef &first = rec.history.front();
    const WrapperRef &cur = *rec.current();
    const WrapperRef &w = stable && first.declaringType == rewritten.declaringType.name ? first : cur;
    references_.insert(w.module);
    if (w.declaringType == rewritten.declaringType.name)
    {
        MethodRef r = rewritten;
        r.declaringType.scope = w.module;
        return r;
    }
    if (op == Opcode::Newobj)
        return fail("constructor " + rec.member +
                    " was added after the type was loaded and cannot be used with newobj");
    return wrapperRef(TypeRef{w.module, w.declaringType}, rewritten, w.selfParam, op);
}

Expected<MethodRef> Rewriter::method(const MethodRef &r, Opcode &op)
{
    MethodRef out = r;
    auto decl = type(r.declaringType);
    if (!decl)
        return decl.error();
    out.declaringType = std::move(decl.value());
    {
        GenericScope scope(*this, r.genericParams);
        auto ret = type(r.returnType);
        if (!ret)
            return ret.error();
        out.returnType = std::move(ret.value());
        for (size_t i = 0; i < r.paramTypes.size(); ++i)
        {
            auto p = type(r.paramTypes[i]);
            if (!p)
                return p.error();
            out.paramTypes[i] = std::move(p.value());
        }
    }
    for (size_t i = 0; i < r.genericArgs.size(); ++i)
    {
        auto a = type(r.genericArgs[i]);
        if (!a)
            return a.error();
        out.genericArgs[i] = std::move(a.value());
    }

    const std::string &owner = r.declaringType.name;
    if (!isLocal(r.declaringType) || (r.declaringType.scope.empty() && isBuiltin(owner)))
        return out;
    if (introducedRoot(owner) || generatedRoot(owner))
        return out;

    const std::string sig = r.elementSignature();
    const bool stable = op == Opcode::Newobj || op == Opcode::Ldftn ||
                        (op == Opcode::Callvirt && isVirtual(owner, sig));
    const MemberRecord *rec = records_.findMember(owner, sig);
    const bool hooked = rec && rec->current();

    MemberState state = MemberState::Modified;
    if (const MethodDef *target = diffMethod(owner, sig, state))
    {
        if (stable)
        {
            // Existing entry points follow the redirect this patch installs.
            if (state == MemberState::Modified && !target->isGenericDefinition())
                return out;
            if (hooked)
                return recordRef(*rec, out, stable, op);
            if (op == Opcode::Newobj)
                return fail("constructor " + sig +
                            " was added after the type was loaded and cannot be used with newobj");
        }
        deps_.insert(sig);
        return wrapperRef(TypeRef{PatchSynthesizer::holderName(owner)}, out, !target->isStatic, op);
    }
    if (hooked && rec->state == MemberState::Added)
        return recordRef(*rec, out, stable, op);
    if (out.declaringType.scope == diff_.module)
    {
        if (loadedHasMethod(owner, sig))
            return out;
        return fail("method '" + sig + "' is not part of the loaded module '" + diff_.module + "'");
    }
    return out;
}

Expected<void> Rewriter::field(const Instr &in, std::vector<Instr> &out)
{
    const FieldRef &f = *in.operand.field;
    const std::string &owner = f.declaringType.name;
    if (isLocal(f.declaringType) && !introducedRoot(owner) && isIndirect(owner, f.name))
    {
        auto ownerRef = loadedType(owner);
        if (!ownerRef)
            return fail("field '" + f.fullName() + "': " + ownerRef.error().message);
        out.emplace_back(Opcode::Ldstr, Operand::string(f.name));
        out.emplace_back(Opcode::Call, Operand::methodRef(resolverCall(in.op, ownerRef.value())));
        return {};
    }

    FieldRef nf = f;
    auto decl = type(f.declaringType);
    if (!decl)
        return decl.error();
    auto ftype = type(f.type);
    if (!ftype)
        return ftype.error();
    nf.declaringType = std::move(decl.value());
    nf.type = std::move(ftype.value());
    if (nf.declaringType.scope == diff_.module && !loadedHasField(owner, f.name))
        return fail("field '" + f.fullName() + "' is not part of the loaded type '" + owner + "'");
    out.emplace_back(in.op, Operand::fieldRef(std::move(nf)));
    return {};
}

Expected<void> Rewriter::body(const MethodDef &src, MethodDef &dst)
{
    dst.locals.clear();
    for (const auto &local : src.locals)
    {
        auto t = type(local);
        if (!t)
            return t.error();
        dst.locals.push_back(std::move(t.value()));
    }

    // at[i] is the index of the first rewritten instruction of src.body[i].
    std::vector<uint32_t> at(src.body.size() + 1, 0);
    std::vector<Instr> out;
    out.reserve(src.body.size());
    for (size_t i = 0; i < src.body.size(); ++i)
    {
        at[i] = static_cast<uint32_t>(out.size());
        const Instr &in = src.body[i];
        switch (in.operand.kind)
        {
            case OperandKind::Type:
            {
                auto t = type(*in.operand.type);
                if (!t)
                    return t.error();
                out.emplace_back(in.op, Operand::typeRef(std::move(t.value())));
                break;
            }
            case OperandKind::Method:
            {
                Opcode op = in.op;
                auto m = method(*in.operand.method, op);
                if (!m)
                    return m.error();
                out.emplace_back(op, Operand::methodRef(std::move(m.value())));
                break;
            }
            case OperandKind::Field:
                if (auto ok = field(in, out); !ok)
                    return ok;
                break;
            default:
                out.push_back(in);
                break;
        }
    }
    at[src.body.size()] = static_cast<uint32_t>(out.size());

    auto remap = [&](uint32_t old, uint32_t &into) -> bool
    {
        if (old >= at.size())
            return false;
        into = at[old];
        return true;
    };
    for (auto &in : out)
    {
        bool ok = true;
        if (in.operand.kind == OperandKind::Target)
        {
            uint32_t t = 0;
            ok = remap(static_cast<uint32_t>(in.operand.i64), t);
            in.operand.i64 = t;
        }
        else if (in.operand.kind == OperandKind::Targets)
        {
            for (auto &t : in.operand.targets)
                ok = ok && remap(t, t);
        }
        if (!ok)
            return fail("branch target out of range in '" + src.name + "'");
    }

    dst.handlers.clear();
    for (const auto &h : src.handlers)
    {
        ExceptionHandler c;
        auto t = type(h.catchType);
        if (!t)
            return t.error();
        c.catchType = std::move(t.value());
        if (!remap(h.tryStart, c.tryStart) || !remap(h.tryEnd, c.tryEnd) ||
            !remap(h.handlerStart, c.handlerStart) || !remap(h.handlerEnd, c.handlerEnd))
            return fail("handler bounds out of range in '" + src.name + "'");
        dst.handlers.push_back(std::move(c));
    }
    dst.body = std::move(out);
    return {};
}

Expected<MethodDef> Rewriter::copyMethod(const MethodDef &src)
{
    GenericScope scope(*this, src.genericParams);
    MethodDef dst = src;
    auto ret = type(src.returnType);
    if (!ret)
        return ret.error();
    dst.returnType = std::move(ret.value());
    for (auto &p : dst.params)
    {
        auto t = type(p.type);
        if (!t)
            return t.error();
        p.type = std::move(t.value());
    }
    if (auto ok = body(src, dst); !ok)
        return ok.error();
    return dst;
}

Expected<TypeDef> Rewriter::copyType(const TypeDef &src)
{
    TypeDef dst;
    dst.name = src.name;
    dst.visibility = src.visibility;
    dst.compilerGenerated = src.compilerGenerated;
    dst.isAbstract = src.isAbstract;
    if (src.base)
    {
        auto b = type(*src.base);
        if (!b)
            return b.error();
        dst.base = std::move(b.value());
    }
    for (const auto &iface : src.interfaces)
    {
        auto t = type(iface);
        if (!t)
            return t.error();
        dst.interfaces.push_back(std::move(t.value()));
    }
    for (const auto &f : src.fields)
    {
        FieldDef c = f;
        auto t = type(f.type);
        if (!t)
            return t.error();
        c.type = std::move(t.value());
        dst.fields.push_back(std::move(c));
    }
    for (const auto &m : src.methods)
    {
        auto c = copyMethod(m);
        if (!c)
            return fail(m.signature(src.name) + ": " + c.error().message);
        dst.methods.push_back(std::move(c.value()));
    }
    for (const auto &n : src.nested)
    {
        auto c = copyType(n);
        if (!c)
            return c.error();
        dst.nested.push_back(std::move(c.value()));
    }
    return dst;
}

Expected<void> Rewriter::extract(const TypeDef &root)
{
    auto [it, inserted] = extracted_.try_emplace(root.name);
    Extraction &e = it->second;
    if (!inserted)
    {
        if (!e.ok)
            return fail(e.reason);
        deps_.insert(e.deps.begin(), e.deps.end());
        return {};
    }

    std::set<std::string> outer;
    outer.swap(deps_);
    auto copy = copyType(root);
    e.deps = deps_;
    deps_.swap(outer);
    deps_.insert(e.deps.begin(), e.deps.end());
    if (!copy)
    {
        e.ok = false;
        e.reason = "cannot extract " + root.name + ": " + copy.error().message;
        return fail(e.reason);
    }
    patch_.types.push_back(std::move(copy.value()));
    return {};
}

Expected<MethodDef> Rewriter::wrapper(const std::string &typeName, const MethodDef &src)
{
    GenericScope scope(*this, src.genericParams);
    MethodDef w;
    w.name = PatchSynthesizer::wrapperName(src.name);
    w.genericParams = src.genericParams;
    w.visibility = Visibility::Public;
    w.isStatic = true;
    w.noInline = true;

    auto ret = type(src.returnType);
    if (!ret)
        return ret.error();
    w.returnType = std::move(ret.value());
    if (!src.isStatic)
    {
        auto self = loadedType(typeName);
        if (!self)
            return self.error();
        w.params.push_back(Param{"self", std::move(self.value())});
    }
    for (const auto &p : src.params)
    {
        auto t = type(p.type);
        if (!t)
            return t.error();
        w.params.push_back(Param{p.name, std::move(t.value())});
    }
    if (auto ok = body(src, w); !ok)
        return ok.error();
    return w;
}

/// @brief Constant an instance or static constructor of @p t stores into
///        @p field before anything else can observe it.
const Instr *literalInitializer(const TypeDef &t, const FieldDef &field)
{
    for (const auto &m : t.methods)
    {
        if (m.name != (field.isStatic ? ".cctor" : ".ctor"))
            continue;
        const auto &b = m.body;
        for (size_t i = 0; i + 1 < b.size(); ++i)
        {
            const Instr &store = b[i + 1];
            const bool storesField = store.op == (field.isStatic ? Opcode::Stsfld : Opcode::Stfld) &&
                                     store.operand.field->name == field.name &&
                                     store.operand.field->declaringType.name == t.name;
            if (!storesField || !isConstLoad(b[i].op))
                continue;
            if (field.isStatic)
                return &b[i];
            if (i > 0 && b[i - 1].op == Opcode::Ldarg && b[i - 1].operand.i64 == 0)
                return &b[i];
        }
    }
    return nullptr;
}

} // namespace

std::string PatchSynthesizer::holderName(const std::string &type)
{
    std::string out = type;
    std::replace(out.begin(), out.end(), '/', '$');
    return out + "$Patch";
}

std::string PatchSynthesizer::wrapperName(const std::string &name)
{
    if (name == ".ctor")
        return "$ctor";
    return name;
}

PatchResult PatchSynthesizer::synthesize(const DiffResult &diff,
                                         const HookRecordSet &records,
                                         const std::string &patchModule) const
{
    PatchResult result;
    result.sourceModule = diff.module;
    result.moduleName = patchModule;
    result.patch.name = patchModule;

    std::set<std::string> roots;
    for (const auto &[name, d] : diff.types)
    {
        if (!d.introduced)
            continue;
        for (const auto &p : prefixesOf(name))
        {
            auto it = diff.types.find(p);
            if (it != diff.types.end() && it->second.introduced)
            {
                roots.insert(p);
                break;
            }
        }
    }

    Rewriter rw(diff, records, config_, result.patch, roots);
    std::vector<Unit> units;

    for (const auto &root : roots)
    {
        const TypeDef *src = diff.candidate->findType(root);
        if (!src)
            continue;
        Unit u;
        u.key = kTypeUnit + root;
        u.type = root;
        std::function<void(const TypeDef &)> collect = [&](const TypeDef &t)
        {
            if (t.compilerGenerated)
                return;
            IntroducedType it{t.name, patchModule, {}, {}};
            for (const auto &f : t.fields)
                it.fields.push_back(f.name);
            u.introduced.push_back(std::move(it));
            for (const auto &m : t.methods)
            {
                if (m.isTypeInitializer() || m.isAbstract)
                    continue;
                const std::string sig = m.signature(t.name);
                u.members.push_back(PatchedMember{
                    t.name, sig, MemberState::Added, WrapperRef{patchModule, {}, t.name, sig, false}});
            }
            for (const auto &n : t.nested)
                collect(n);
        };
        collect(*src);

        auto copy = rw.copyType(*src);
        u.deps = rw.takeDeps();
        u.deps.erase(u.key);
        if (copy)
            u.copy = std::move(copy.value());
        else
            u.failure = copy.error().message;
        units.push_back(std::move(u));
    }

    for (const auto &[name, d] : diff.types)
    {
        if (d.introduced)
            continue;
        for (const auto *methods : {&d.modifiedMethods, &d.addedMethods})
        {
            const MemberState state =
                methods == &d.modifiedMethods ? MemberState::Modified : MemberState::Added;
            for (const auto &[sig, m] : *methods)
            {
                Unit u;
                u.key = sig;
                u.type = name;
                auto w = rw.wrapper(name, m);
                u.deps = rw.takeDeps();
                if (!w)
                {
                    u.failure = w.error().message;
                    units.push_back(std::move(u));
                    continue;
                }
                const std::string holder = holderName(name);
                u.members.push_back(PatchedMember{
                    name, sig, state,
                    WrapperRef{patchModule, {}, holder, w.value().signature(holder), !m.isStatic}});
                u.wrapper = std::move(w.value());
                units.push_back(std::move(u));
            }
        }
    }

    // Wrapper signatures must be unique within a holder: an instance method
    // gains `self`, which can collide with a static overload.
    std::map<std::string, std::string> wrapperOwner;
    for (auto &u : units)
    {
        if (!u.wrapper || u.failed())
            continue;
        const std::string holder = holderName(u.type);
        auto [it, inserted] = wrapperOwner.emplace(u.wrapper->signature(holder), u.key);
        if (!inserted)
            u.failure = "wrapper signature collides with the wrapper of " + it->second;
    }

    std::set<std::string> failed;
    for (const auto &u : units)
    {
        if (u.failed())
            failed.insert(u.key);
    }
    for (bool changed = true; changed;)
    {
        changed = false;
        for (auto &u : units)
        {
            if (u.failed())
                continue;
            for (const auto &dep : u.deps)
            {
                if (!failed.count(dep))
                    continue;
                const std::string what =
                    dep.rfind(kTypeUnit, 0) == 0 ? dep.substr(std::string(kTypeUnit).size()) : dep;
                u.failure = "depends on " + what + ", which could not be synthesized";
                failed.insert(u.key);
                changed = true;
                break;
            }
        }
    }

    std::map<std::string, TypeDef> holders;
    auto holderFor = [&](const std::string &type) -> TypeDef &
    {
        TypeDef &h = holders[holderName(type)];
        h.name = holderName(type);
        h.visibility = Visibility::Public;
        return h;
    };

    for (auto &u : units)
    {
        if (u.failed())
        {
            if (u.members.empty())
                result.failures.push_back(MemberFailure{u.type, u.key, u.failure});
            for (const auto &m : u.members)
                result.failures.push_back(MemberFailure{m.type, m.member, u.failure});
            log_.error("synth", u.key + ": " + u.failure);
            continue;
        }
        if (u.copy)
        {
            result.patch.types.push_back(std::move(*u.copy));
            log_.debug("synth", "introduced type " + u.type);
        }
        if (u.wrapper)
        {
            holderFor(u.type).methods.push_back(std::move(*u.wrapper));
            log_.debug("synth", "wrapper for " + u.key);
        }
        result.members.insert(result.members.end(), u.members.begin(), u.members.end());
        result.introduced.insert(result.introduced.end(), u.introduced.begin(), u.introduced.end());
    }

    for (const auto &[name, d] : diff.types)
    {
        if (d.introduced || d.addedFields.empty())
            continue;
        const TypeDef *t = diff.candidate->findType(name);
        for (const auto &[sig, f] : d.addedFields)
        {
            PatchedField pf;
            pf.type = name;
            pf.record.field = sig;
            pf.record.name = f.name;
            pf.record.typeName = f.type.fullName();
            pf.record.isStatic = f.isStatic;
            const Instr *literal = t ? literalInitializer(*t, f) : nullptr;
            if (literal)
            {
                auto fieldType = rw.type(f.type);
                rw.takeDeps();
                if (fieldType)
                {
                    MethodDef init;
                    init.name = "$init_" + f.name;
                    init.returnType = std::move(fieldType.value());
                    init.visibility = Visibility::Public;
                    init.isStatic = true;
                    init.noInline = true;
                    init.body = {*literal, Instr(Opcode::Ret)};
                    TypeDef &h = holderFor(name);
                    pf.record.initModule = patchModule;
                    pf.record.initSignature = init.signature(h.name);
                    h.methods.push_back(std::move(init));
                }
                else
                {
                    log_.debug("synth", "no initializer for " + sig + ": " +
                                            fieldType.error().message);
                }
            }
            log_.debug("synth", "indirected field " + sig);
            result.fields.push_back(std::move(pf));
        }
    }

    for (auto &[name, h] : holders)
        result.patch.types.push_back(std::move(h));

    std::set<std::string> refs(diff.candidate->references.begin(),
                               diff.candidate->references.end());
    refs.insert(diff.module);
    refs.insert(rw.references().begin(), rw.references().end());
    refs.erase(patchModule);
    result.patch.references.assign(refs.begin(), refs.end());
    return result;
}

std::string PatchWriter::nextModuleName(const std::string &module,
                                        const std::function<bool(const std::string &)> &inUse) const
{
    const std::string prefix = module + ".patch.";
    const std::string ext = ".hsil";
    unsigned long next = 1;
    std::error_code ec;
    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec))
    {
        const std::string file = it->path().filename().string();
        if (file.size() <= prefix.size() + ext.size() || file.rfind(prefix, 0) != 0 ||
            file.compare(file.size() - ext.size(), ext.size(), ext) != 0)
            continue;
        const std::string digits =
            file.substr(prefix.size(), file.size() - prefix.size() - ext.size());
        if (digits.find_first_not_of("0123456789") != std::string::npos)
            continue;
        next = std::max(next, std::strtoul(digits.c_str(), nullptr, 10) + 1);
    }
    for (;; ++next)
    {
        char buf[24];
        std::snprintf(buf, sizeof(buf), "%04lu", next);
        std::string name = prefix + buf;
        if (!inUse || !inUse(name))
            return name;
    }
}

Expected<void> PatchWriter::write(PatchResult &patch) const
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec)
        return makeError({}, "cannot create patch directory '" + dir_ + "': " + ec.message());
    const std::string path = (fs::path(dir_) / (patch.moduleName + ".hsil")).string();
    {
        std::ofstream os(path, std::ios::trunc);
        if (!os)
            return makeError({}, "cannot write patch module '" + path + "'");
        hotswap::io::Serializer::write(patch.patch, os);
        if (!os)
            return makeError({}, "failed writing patch module '" + path + "'");
    }
    patch.path = path;
    for (auto &m : patch.members)
        m.wrapper.path = path;
    for (auto &t : patch.introduced)
        t.path = path;
    return {};
}

} // namespace hotswap::reload
