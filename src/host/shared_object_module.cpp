#include "host/shared_object_module.hpp"

#include "util/logger.hpp"

#include <dlfcn.h>

namespace hotswap {

namespace {

using UnitEntryFn = int (*)();

std::string DlError(const char* fallback) {
    const char* em = dlerror();
    return em ? std::string(em) : std::string(fallback);
}

} // namespace

Result SharedObjectModule::Load(std::string path, std::unique_ptr<SharedObjectModule>& out) {
    std::unique_ptr<SharedObjectModule> unit(new SharedObjectModule(std::move(path)));
    auto res = unit->Open();
    if (!res.is_ok())
        return res;
    out = std::move(unit);
    return Result::Ok();
}

SharedObjectModule::~SharedObjectModule() { Close(); }

Result SharedObjectModule::Open() {
    (void)dlerror();
    handle_ = dlopen(path_.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle_)
        return Result::Fail(-1, DlError("dlopen failed") + ": " + path_);

    auto init = CallEntry(kUnitInitSymbol, false);
    if (!init.is_ok()) {
        Close();
        return init;
    }
    return Result::Ok();
}

void SharedObjectModule::Close() {
    if (handle_) {
        if (dlclose(handle_) != 0) {
            LogWarn("dlclose %s: %s", path_.c_str(), DlError("dlclose failed").c_str());
        }
        handle_ = nullptr;
    }
}

Result SharedObjectModule::CallEntry(const char* symbol, bool required) const {
    if (!handle_)
        return Result::Fail(-1, "not loaded: " + path_);

    (void)dlerror();
    void* sym = dlsym(handle_, symbol);
    if (!sym) {
        if (required)
            return Result::Fail(-1, DlError("dlsym failed") + ": " + symbol);
        return Result::Ok();
    }

    const int rc = reinterpret_cast<UnitEntryFn>(sym)();
    if (rc != 0)
        return Result::Fail(rc, std::string(symbol) + " returned " + std::to_string(rc) + ": " + path_);
    return Result::Ok();
}

Result SharedObjectModule::Reload() {
    Close();
    return Open();
}

Result SharedObjectModule::Configure() {
    return CallEntry(kUnitConfigureSymbol, false);
}

} // namespace hotswap
