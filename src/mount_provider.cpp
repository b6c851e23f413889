#include "mount_provider.h"
#include <iostream>

namespace gaprun {

void MountProviderRegistry::register_provider(const std::string& app_name,
                                              std::shared_ptr<MountProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[app_name] = std::move(provider);
    std::cout << "[Sandbox] Registered mount provider: " << app_name << std::endl;
}

void MountProviderRegistry::unregister_provider(const std::string& app_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.erase(app_name);
}

std::shared_ptr<MountProvider> MountProviderRegistry::find(const std::string& app_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(app_name);
    if (it == providers_.end()) {
        return nullptr;
    }
    return it->second;
}

} // namespace gaprun
