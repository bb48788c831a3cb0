#pragma once

#include "host/module_registry.hpp"

#include <memory>
#include <string>

namespace hotswap {

// Optional C entry points a unit may export; both return 0 on success.
inline constexpr char kUnitInitSymbol[] = "hotswap_unit_init";
inline constexpr char kUnitConfigureSymbol[] = "hotswap_unit_configure";

// A shared object loaded with dlopen. Reloading closes the handle and maps
// the current file at the same path again.
class SharedObjectModule final : public ILoadedModule {
  public:
    static Result Load(std::string path, std::unique_ptr<SharedObjectModule>& out);

    SharedObjectModule(const SharedObjectModule&) = delete;
    SharedObjectModule& operator=(const SharedObjectModule&) = delete;
    ~SharedObjectModule() override;

    Result Reload() override;
    Result Configure() override;

  private:
    explicit SharedObjectModule(std::string path) : path_(std::move(path)) {}

    Result Open();
    void Close();
    Result CallEntry(const char* symbol, bool required) const;

    std::string path_;
    void* handle_ = nullptr;
};

} // namespace hotswap
