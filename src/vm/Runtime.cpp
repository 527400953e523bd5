//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Module loading, reference resolution and entry-point redirection.  The
// interpreter loop itself lives in Interpreter.cpp.
//
// Loading happens in three passes over a module: create a RuntimeType per
// TypeDef, link bases and lay out fields (base classes first, possibly across
// modules), then create RuntimeMethods.  Type initializers run once the
// module is registered so they may reference each other's statics.
//
//===----------------------------------------------------------------------===//

#include "vm/Runtime.hpp"
#include "il/io/Parser.hpp"
#include "vm/Object.hpp"
#include "vm/Trap.hpp"
#include "vm/VMConfig.hpp"

#include <fstream>
#include <functional>
#include <iostream>
#include <unordered_set>

namespace hotswap::vm
{

using hotswap::core::Instr;
using hotswap::core::MethodRef;
using hotswap::core::Module;
using hotswap::core::TypeDef;
using hotswap::core::TypeRef;
using hotswap::core::Visibility;
using hotswap::support::Diag;
using hotswap::support::Expected;
using hotswap::support::makeError;

namespace
{

Diag fail(std::string msg)
{
    return makeError({}, std::move(msg));
}

/// @brief `Name(p1,p2)` part of a full method signature.
std::string slotKeyOfSignature(const std::string &sig)
{
    const auto colons = sig.find("::");
    if (colons == std::string::npos)
        return sig;
    std::string rest = sig.substr(colons + 2);
    const auto lt = rest.find('<');
    const auto paren = rest.find('(');
    if (lt != std::string::npos && lt < paren)
    {
        const auto gt = rest.find('>', lt);
        rest.erase(lt, gt - lt + 1);
    }
    return rest;
}

std::string describeException(const Value &v)
{
    if (v.kind == ValueKind::Obj && v.obj->type->isAssignableTo("core.Exception"))
    {
        auto it = v.obj->type->fieldIndex.find("message");
        if (it != v.obj->type->fieldIndex.end())
            return v.obj->type->name + ": " + v.obj->fields[it->second].toString();
    }
    return v.toString();
}

MethodRef siteFor(const RuntimeMethod *m)
{
    if (m->def)
        return m->def->makeRef(TypeRef{m->owner->name});
    MethodRef site;
    site.declaringType = TypeRef{m->owner->name};
    site.name = m->name();
    site.hasThis = !m->isStatic;
    return site;
}

} // namespace

Runtime::Runtime(std::ostream *out) : out_(out ? out : &std::cout)
{
    installCoreLibrary(*this);
}

Runtime::~Runtime() = default;

RuntimeMethod *Runtime::newMethod()
{
    methods_.emplace_back();
    RuntimeMethod *m = &methods_.back();
    m->id = static_cast<uint32_t>(methods_.size());
    return m;
}

RuntimeType *Runtime::defineBuiltinType(const std::string &name,
                                        const std::string &base,
                                        const std::vector<std::string> &fields)
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    auto &core = modules_[kCoreModule];
    if (!core)
    {
        core = std::make_unique<LoadedModule>();
        core->name = kCoreModule;
        core->builtin = true;
    }
    types_.emplace_back();
    RuntimeType *t = &types_.back();
    t->name = name;
    t->module = core.get();
    if (!base.empty())
    {
        auto it = core->types.find(base);
        if (it != core->types.end())
        {
            t->base = it->second;
            t->fieldIndex = t->base->fieldIndex;
            t->fieldVisibility = t->base->fieldVisibility;
            t->fieldCount = t->base->fieldCount;
            t->fieldDefaults = t->base->fieldDefaults;
        }
    }
    for (const auto &f : fields)
    {
        t->fieldIndex[f] = t->fieldCount++;
        t->fieldVisibility[f] = Visibility::Public;
        t->fieldDefaults.push_back(Value::null());
    }
    core->types[name] = t;
    return t;
}

RuntimeMethod *Runtime::defineNative(
    RuntimeType *owner, const std::string &signature, bool isStatic, int arity, NativeFn fn)
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    RuntimeMethod *m = newMethod();
    m->signature = signature;
    m->owner = owner;
    m->native = std::move(fn);
    m->isStatic = isStatic;
    m->arity = arity;
    owner->methods[signature] = m;
    owner->module->methods[signature] = m;
    if (!isStatic && m->name() != ".ctor")
        owner->slots[slotKeyOfSignature(signature)] = m;
    return m;
}

LoadedModule *Runtime::findModule(const std::string &name) const
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    auto it = modules_.find(name);
    return it == modules_.end() ? nullptr : it->second.get();
}

RuntimeType *Runtime::findType(const std::string &module, const std::string &type) const
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    LoadedModule *lm = findModule(module);
    if (!lm)
        return nullptr;
    auto it = lm->types.find(type);
    return it == lm->types.end() ? nullptr : it->second;
}

RuntimeMethod *Runtime::findMethod(const std::string &module, const std::string &signature) const
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    LoadedModule *lm = findModule(module);
    if (!lm)
        return nullptr;
    auto it = lm->methods.find(signature);
    return it == lm->methods.end() ? nullptr : it->second;
}

Expected<LoadedModule *> Runtime::loadFile(const std::string &path)
{
    std::ifstream is(path);
    if (!is)
        return fail("cannot open module file '" + path + "'");
    Module m;
    if (auto ok = hotswap::io::Parser::parse(is, m); !ok)
        return fail(path + ": " + ok.error().message);
    return load(std::move(m), path);
}

Expected<LoadedModule *> Runtime::load(Module module, std::string path)
{
    LoadedModule *registered = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(loadMutex_);
        if (module.name.empty())
            return fail("module has no name");
        if (modules_.count(module.name))
            return fail("module '" + module.name + "' is already loaded");
        for (const auto &ref : module.references)
        {
            if (!modules_.count(ref))
                return fail("module '" + module.name + "' references '" + ref +
                            "', which is not loaded");
        }

        auto lm = std::make_unique<LoadedModule>();
        lm->name = module.name;
        lm->path = std::move(path);
        lm->module = std::make_shared<const Module>(std::move(module));
        lm->module->forEachType(
            [&](const TypeDef &td)
            {
                types_.emplace_back();
                RuntimeType *t = &types_.back();
                t->name = td.name;
                t->module = lm.get();
                t->def = &td;
                for (const auto &iface : td.interfaces)
                    t->interfaces.push_back(iface.name);
                lm->types[td.name] = t;
            });
        if (auto ok = layout(*lm); !ok)
            return ok.error();
        registered = lm.get();
        modules_[registered->name] = std::move(lm);
    }

    std::vector<RuntimeMethod *> initializers;
    registered->module->forEachType(
        [&](const TypeDef &td)
        {
            for (const auto &md : td.methods)
            {
                if (md.isTypeInitializer() && md.isStatic)
                    initializers.push_back(registered->methods.at(md.signature(td.name)));
            }
        });
    for (RuntimeMethod *init : initializers)
    {
        if (auto r = invoke(init, {}); !r)
            return fail("type initializer " + init->signature + " failed: " + r.error().message);
    }
    return registered;
}

Expected<void> Runtime::layout(LoadedModule &lm)
{
    RuntimeType *object = nullptr;
    if (LoadedModule *core = findModule(kCoreModule))
    {
        auto it = core->types.find("core.Object");
        if (it != core->types.end())
            object = it->second;
    }

    for (auto &[name, t] : lm.types)
    {
        if (t->def->base)
        {
            t->base = resolveType(*t->def->base, lm);
            if (!t->base)
                return fail("base type '" + t->def->base->scopedName() + "' of '" + name +
                            "' not found");
        }
        else
        {
            t->base = object;
        }
    }

    std::unordered_set<RuntimeType *> placed;
    std::unordered_set<RuntimeType *> visiting;
    std::function<Expected<void>(RuntimeType *)> place = [&](RuntimeType *t) -> Expected<void>
    {
        if (!t->def || placed.count(t))
            return {};
        if (!visiting.insert(t).second)
            return fail("type '" + t->name + "' inherits from itself");
        if (t->base)
        {
            if (auto ok = place(t->base); !ok)
                return ok;
            t->fieldIndex = t->base->fieldIndex;
            t->fieldVisibility = t->base->fieldVisibility;
            t->fieldCount = t->base->fieldCount;
            t->fieldDefaults = t->base->fieldDefaults;
        }
        for (const auto &fd : t->def->fields)
        {
            if (t->fieldVisibility.count(fd.name))
                return fail("field '" + fd.name + "' of '" + t->name +
                            "' is declared twice or hides an inherited field");
            t->fieldVisibility[fd.name] = fd.visibility;
            if (fd.isStatic)
            {
                t->staticIndex[fd.name] = static_cast<uint32_t>(t->statics.size());
                t->statics.push_back(defaultValueFor(fd.type.name));
            }
            else
            {
                t->fieldIndex[fd.name] = t->fieldCount++;
                t->fieldDefaults.push_back(defaultValueFor(fd.type.name));
            }
        }
        visiting.erase(t);
        placed.insert(t);
        return {};
    };
    for (auto &[name, t] : lm.types)
    {
        if (auto ok = place(t); !ok)
            return ok;
    }

    for (auto &[name, t] : lm.types)
    {
        for (const auto &md : t->def->methods)
        {
            const std::string sig = md.signature(t->name);
            if (t->methods.count(sig))
                return fail("duplicate method '" + sig + "'");
            RuntimeMethod *m = newMethod();
            m->signature = sig;
            m->owner = t;
            m->def = &md;
            m->visibility = md.visibility;
            m->isStatic = md.isStatic;
            m->isAbstract = md.isAbstract;
            m->arity = static_cast<int>(md.params.size()) + (md.isStatic ? 0 : 1);
            t->methods[sig] = m;
            lm.methods[sig] = m;
            if (!md.isStatic && !md.isConstructor())
                t->slots[md.slotKey()] = m;
        }
    }
    return {};
}

RuntimeType *Runtime::resolveType(const TypeRef &ref, LoadedModule &from) const
{
    std::lock_guard<std::recursive_mutex> lock(loadMutex_);
    const LoadedModule *mod = &from;
    if (!ref.scope.empty())
    {
        auto it = modules_.find(ref.scope);
        if (it == modules_.end())
            return nullptr;
        mod = it->second.get();
    }
    auto it = mod->types.find(ref.name);
    if (it != mod->types.end())
        return it->second;
    if (ref.scope.empty())
    {
        auto core = modules_.find(kCoreModule);
        if (core != modules_.end())
        {
            auto cit = core->second->types.find(ref.name);
            if (cit != core->second->types.end())
                return cit->second;
        }
    }
    return nullptr;
}

RuntimeMethod *Runtime::resolveMethod(const Instr &in, LoadedModule &from)
{
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = methodCache_.find(&in);
        if (it != methodCache_.end())
            return it->second;
    }
    const MethodRef &ref = *in.operand.method;
    RuntimeType *t = resolveType(ref.declaringType, from);
    if (!t)
        raise(TrapKind::MissingMember, "type '" + ref.declaringType.scopedName() + "' not found");
    RuntimeMethod *m = t->findMethod(ref);
    if (!m)
        raise(TrapKind::MissingMember, "method '" + ref.scopedName() + "' not found");
    std::lock_guard<std::mutex> lock(cacheMutex_);
    methodCache_[&in] = m;
    return m;
}

FieldBinding Runtime::resolveField(const Instr &in, LoadedModule &from)
{
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = fieldCache_.find(&in);
        if (it != fieldCache_.end())
            return it->second;
    }
    const auto &ref = *in.operand.field;
    RuntimeType *t = resolveType(ref.declaringType, from);
    if (!t)
        raise(TrapKind::MissingMember, "type '" + ref.declaringType.scopedName() + "' not found");
    FieldBinding fb;
    for (RuntimeType *cur = t; cur && !fb.owner; cur = cur->base)
    {
        auto &index = ref.isStatic ? cur->staticIndex : cur->fieldIndex;
        auto it = index.find(ref.name);
        if (it == index.end())
            continue;
        fb.owner = cur;
        fb.index = it->second;
        fb.isStatic = ref.isStatic;
        fb.visibility = cur->fieldVisibility[ref.name];
    }
    if (!fb.owner)
        raise(TrapKind::MissingMember, "field '" + ref.scopedName() + "' not found");
    std::lock_guard<std::mutex> lock(cacheMutex_);
    fieldCache_[&in] = fb;
    return fb;
}

void Runtime::checkAccess(const RuntimeMethod *caller,
                          const RuntimeType *owner,
                          Visibility vis,
                          const std::string &member) const
{
    if (!caller || caller->skipVisibility.load(std::memory_order_acquire))
        return;
    const RuntimeType *from = caller->owner;
    switch (vis)
    {
        case Visibility::Public:
        case Visibility::Protected:
            return;
        case Visibility::Internal:
            if (from->module == owner->module)
                return;
            break;
        case Visibility::Private:
            if (from->module == owner->module &&
                (from == owner || from->name.rfind(owner->name + "/", 0) == 0))
                return;
            break;
    }
    raise(TrapKind::Visibility, member + " is not accessible from " + from->name,
          caller->signature);
}

RuntimeMethod *Runtime::resolveEntry(RuntimeMethod *m) const
{
    RuntimeMethod *cur = m;
    for (int i = 0; i < HOTSWAP_VM_MAX_REDIRECT_CHAIN; ++i)
    {
        RuntimeMethod *next = cur->entry.load(std::memory_order_acquire);
        if (!next)
            return cur;
        cur = next;
    }
    raise(TrapKind::InvalidOperation, "redirect chain does not terminate", m->signature);
}

Expected<void> Runtime::redirect(RuntimeMethod *original, RuntimeMethod *replacement)
{
    if (!original || !replacement)
        return fail("cannot redirect a null method");
    if (original == replacement)
        return fail("cannot redirect " + original->signature + " to itself");
    if (original->isNative())
        return fail("cannot redirect native method " + original->signature);
    if (original->isAbstract || replacement->isAbstract)
        return fail("cannot redirect abstract method " +
                    (original->isAbstract ? original : replacement)->signature);
    if (original->arity != replacement->arity)
        return fail("arity mismatch: " + original->signature + " takes " +
                    std::to_string(original->arity) + " arguments, " + replacement->signature +
                    " takes " + std::to_string(replacement->arity));
    RuntimeMethod *cur = replacement;
    for (int i = 0; cur; ++i)
    {
        if (cur == original || i >= HOTSWAP_VM_MAX_REDIRECT_CHAIN)
            return fail("redirecting " + original->signature + " to " + replacement->signature +
                        " would create a cycle");
        cur = cur->entry.load(std::memory_order_acquire);
    }
    original->entry.store(replacement, std::memory_order_release);
    return {};
}

void Runtime::disableVisibilityChecks(RuntimeMethod *m)
{
    if (m)
        m->skipVisibility.store(true, std::memory_order_release);
}

void Runtime::write(const std::string &text)
{
    std::lock_guard<std::mutex> lock(outMutex_);
    *out_ << text;
    out_->flush();
}

Expected<Value> Runtime::invoke(RuntimeMethod *m, std::vector<Value> args)
{
    if (!m)
        return fail("cannot invoke a null method");
    try
    {
        const MethodRef site = siteFor(m);
        return call(m, args, site);
    }
    catch (const Trap &t)
    {
        return fail(t.format());
    }
    catch (const ManagedException &ex)
    {
        return fail("unhandled exception in " + m->signature + ": " +
                    describeException(ex.value));
    }
}

Expected<Value> Runtime::invoke(const std::string &module,
                                const std::string &signature,
                                std::vector<Value> args)
{
    RuntimeMethod *m = findMethod(module, signature);
    if (!m)
        return fail("method '" + signature + "' not found in module '" + module + "'");
    return invoke(m, std::move(args));
}

Expected<Value> Runtime::invokeHandle(const Value &handle, std::vector<Value> args)
{
    if (handle.kind != ValueKind::Method)
        return fail("value is not a method handle");
    return invoke(handle.method, std::move(args));
}

Expected<Value> Runtime::newObject(const std::string &module,
                                   const std::string &type,
                                   std::vector<Value> args)
{
    RuntimeType *t = findType(module, type);
    if (!t)
        return fail("type '" + type + "' not found in module '" + module + "'");
    RuntimeMethod *ctor = nullptr;
    for (const auto &[sig, m] : t->methods)
    {
        if (!m->isStatic && m->name() == ".ctor" &&
            m->arity == static_cast<int>(args.size()) + 1)
        {
            ctor = m;
            break;
        }
    }
    auto obj = std::make_shared<Object>(t);
    if (!ctor)
    {
        if (!args.empty())
            return fail("type '" + type + "' has no constructor taking " +
                        std::to_string(args.size()) + " arguments");
        return Value::object(obj);
    }
    args.insert(args.begin(), Value::object(obj));
    if (auto r = invoke(ctor, std::move(args)); !r)
        return r.error();
    return Value::object(obj);
}

Value Runtime::call(RuntimeMethod *m, std::vector<Value> &args, const MethodRef &site)
{
    RuntimeMethod *target = resolveEntry(m);
    if (target->arity >= 0 && args.size() != static_cast<size_t>(target->arity))
        raise(TrapKind::InvalidOperation,
              target->signature + " expects " + std::to_string(target->arity) +
                  " arguments, got " + std::to_string(args.size()));
    if (target->isNative())
        return target->native(*this, site, args);
    if (target->isAbstract)
        raise(TrapKind::InvalidOperation, "call to abstract method " + target->signature);
    return execute(target, args);
}

Value Runtime::callHandle(const Value &handle, std::vector<Value> &args)
{
    if (handle.kind != ValueKind::Method)
        raise(TrapKind::InvalidCast, "value is not a method handle");
    const MethodRef site = siteFor(handle.method);
    return call(handle.method, args, site);
}

Value Runtime::callSlot(const Value &receiver, const std::string &slotKey, std::vector<Value> &args)
{
    if (receiver.kind != ValueKind::Obj)
        raise(TrapKind::NullReference, "virtual call to " + slotKey + " on a non-object");
    RuntimeMethod *m = receiver.obj->type->findSlot(slotKey);
    if (!m)
        raise(TrapKind::MissingMember,
              "type '" + receiver.obj->type->name + "' has no method " + slotKey);
    args.insert(args.begin(), receiver);
    const MethodRef site = siteFor(m);
    return call(m, args, site);
}

} // namespace hotswap::vm
