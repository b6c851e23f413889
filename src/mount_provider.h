#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "job_config.h"
#include "runtime.h"

namespace gaprun {

// Contributes extra container mounts for jobs of one application
class MountProvider {
public:
    virtual ~MountProvider() = default;
    virtual std::vector<ContainerMount> get_mounts(const JobConfig& config) = 0;
};

// Providers keyed on ContainerConfig::app_name
class MountProviderRegistry {
public:
    void register_provider(const std::string& app_name, std::shared_ptr<MountProvider> provider);
    void unregister_provider(const std::string& app_name);

    // nullptr when nothing is registered under app_name
    std::shared_ptr<MountProvider> find(const std::string& app_name) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<MountProvider>> providers_;
};

} // namespace gaprun
