#include "VirtualMachineManager.hpp"
#include "ConnectionPool.hpp"
#include "InventoryCache.hpp"
#include "ErrorHandler.hpp"
#include "Logging.hpp"
#include "virt/DomainXmlBuilder.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <system_error>
#include <utility>

namespace kvmrpc {

namespace {

// Characters rejected in VM names
constexpr const char* kInvalidNameChars = "!@#$%^&*()+={}[]|\\:;\"'<>?/";

constexpr unsigned long kMinMemoryMiB = 256;
constexpr unsigned long kMaxMemoryMiB = 1024 * 1024;  // 1 TB
constexpr unsigned int kMaxVcpus = 128;

// Connection-level failures surface generically, domain-level ones with libvirt's text
template<typename Func>
OperationResult runVerb(const std::string& verb, const std::string& name, Func&& operation) {
    try {
        return operation();
    } catch (const ConnectionError& e) {
        spdlog::error("Cannot {} VM {}: {}", verb, name, e.what());
        return OperationResult::failure("Failed to connect to hypervisor");
    } catch (const HypervisorException& e) {
        spdlog::warn("Failed to {} VM {}: {}", verb, name, e.what());
        return OperationResult::failure("Failed to " + verb + " VM: " + e.what());
    }
}

VmSummary toSummary(const DomainInfo& info) {
    VmSummary vm;
    vm.name = info.name;
    vm.id = info.id;
    vm.state = domainStateToString(info.state);
    vm.autostart = info.autostart;
    vm.persistent = info.persistent;
    return vm;
}

VmDetails toDetails(const DomainInfo& info) {
    VmDetails vm;
    vm.name = info.name;
    vm.id = info.id;
    vm.uuid = info.uuid;
    vm.state = domainStateToString(info.state);
    vm.active = info.active;
    vm.autostart = info.autostart;
    vm.persistent = info.persistent;
    vm.memoryKiB = info.memoryKiB;
    vm.maxMemoryKiB = info.maxMemoryKiB;
    vm.vcpus = info.vcpus;
    return vm;
}

}  // namespace

// ============================================================================
// Result types
// ============================================================================

OperationResult OperationResult::ok(std::string message) {
    OperationResult result;
    result.success = true;
    result.message = std::move(message);
    return result;
}

OperationResult OperationResult::failure(std::string error) {
    OperationResult result;
    result.success = false;
    result.error = std::move(error);
    return result;
}

void to_json(nlohmann::json& j, const VmSummary& vm) {
    j = nlohmann::json{
        {"name", vm.name},
        {"id", vm.id},
        {"state", vm.state},
        {"autostart", vm.autostart},
        {"persistent", vm.persistent}
    };
}

void from_json(const nlohmann::json& j, VmSummary& vm) {
    j.at("name").get_to(vm.name);
    j.at("id").get_to(vm.id);
    j.at("state").get_to(vm.state);
    j.at("autostart").get_to(vm.autostart);
    j.at("persistent").get_to(vm.persistent);
}

void to_json(nlohmann::json& j, const VmDetails& vm) {
    j = nlohmann::json{
        {"name", vm.name},
        {"id", vm.id},
        {"uuid", vm.uuid},
        {"state", vm.state},
        {"active", vm.active},
        {"autostart", vm.autostart},
        {"persistent", vm.persistent},
        {"memory_kib", vm.memoryKiB},
        {"max_memory_kib", vm.maxMemoryKiB},
        {"vcpus", vm.vcpus}
    };
}

void from_json(const nlohmann::json& j, VmDetails& vm) {
    j.at("name").get_to(vm.name);
    j.at("id").get_to(vm.id);
    j.at("uuid").get_to(vm.uuid);
    j.at("state").get_to(vm.state);
    j.at("active").get_to(vm.active);
    j.at("autostart").get_to(vm.autostart);
    j.at("persistent").get_to(vm.persistent);
    j.at("memory_kib").get_to(vm.memoryKiB);
    j.at("max_memory_kib").get_to(vm.maxMemoryKiB);
    j.at("vcpus").get_to(vm.vcpus);
}

void to_json(nlohmann::json& j, const OperationResult& result) {
    j = nlohmann::json{{"success", result.success}};
    if (result.success) {
        j["message"] = result.message;
    } else {
        j["error"] = result.error;
    }
}

// ============================================================================
// Construction
// ============================================================================

VirtualMachineManager::VirtualMachineManager(ConnectionPool& pool, InventoryCache& cache,
                                             const VmConfig& config)
    : m_pool(pool), m_cache(cache), m_config(config) {
}

// ============================================================================
// Queries
// ============================================================================

std::vector<VmSummary> VirtualMachineManager::listVms(bool useCache) {
    OperationTimer timer("list_vms");

    if (useCache) {
        if (auto cached = m_cache.get(InventoryCache::kAllVmsKey)) {
            try {
                spdlog::debug("Returning cached VM list");
                return cached->get<std::vector<VmSummary>>();
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Discarding unreadable cached VM list: {}", e.what());
                m_cache.invalidate(InventoryCache::kAllVmsKey);
            }
        }
    }

    spdlog::info("Fetching VM list from hypervisor");
    std::vector<VmSummary> result;
    {
        auto conn = m_pool.acquire();
        for (const auto& info : conn->listAllDomains()) {
            result.push_back(toSummary(info));
        }
    }

    if (useCache) {
        m_cache.set(InventoryCache::kAllVmsKey, result);
    }
    return result;
}

VmDetails VirtualMachineManager::getVmInfo(const std::string& name, bool useCache) {
    OperationTimer timer("get_vm_info");

    if (useCache) {
        if (auto cached = m_cache.get(name)) {
            try {
                return cached->get<VmDetails>();
            } catch (const nlohmann::json::exception& e) {
                spdlog::warn("Discarding unreadable cache entry for {}: {}", name, e.what());
                m_cache.invalidate(name);
            }
        }
    }

    VmDetails details;
    {
        auto conn = m_pool.acquire();
        details = toDetails(conn->lookupByName(name));
    }

    if (useCache) {
        m_cache.set(name, details);
    }
    return details;
}

std::map<std::string, int> VirtualMachineManager::getVncPorts() {
    OperationTimer timer("get_vnc_ports");

    std::map<std::string, int> ports;
    auto conn = m_pool.acquire();

    for (const auto& info : conn->listAllDomains()) {
        if (!info.active) {
            continue;
        }
        try {
            if (auto port = DomainXmlBuilder::parseVncPort(conn->xmlDesc(info.name))) {
                ports[info.name] = *port;
            }
        } catch (const HypervisorException& e) {
            // Domain went away between listing and lookup
            spdlog::warn("Cannot read display of {}: {}", info.name, e.what());
        }
    }

    return ports;
}

std::optional<std::string> VirtualMachineManager::getVmIp(const std::string& name) {
    OperationTimer timer("get_vm_ip");

    auto conn = m_pool.acquire();
    if (!conn->lookupByName(name).active) {
        return std::nullopt;
    }

    std::vector<InterfaceAddress> addresses;
    try {
        addresses = conn->interfaceAddresses(name);
    } catch (const HypervisorException& e) {
        if (e.isNotFound()) {
            throw;
        }
        spdlog::warn("Cannot read addresses of {}: {}", name, e.what());
        return std::nullopt;
    }

    for (const auto& entry : addresses) {
        if (entry.family != InterfaceAddress::Family::IPv4 || entry.address.empty()) {
            continue;
        }
        return entry.address.substr(0, entry.address.find('/'));
    }

    spdlog::debug("No IPv4 address reported for {}", name);
    return std::nullopt;
}

// ============================================================================
// Mutations
// ============================================================================

OperationResult VirtualMachineManager::startVm(const std::string& name) {
    OperationTimer timer("start_vm");

    return runVerb("start", name, [&]() {
        {
            auto conn = m_pool.acquire();
            if (conn->lookupByName(name).active) {
                return OperationResult::failure("VM is already running");
            }
            conn->create(name);
        }
        invalidate(name);
        return OperationResult::ok("VM " + name + " started successfully");
    });
}

OperationResult VirtualMachineManager::stopVm(const std::string& name, bool force) {
    OperationTimer timer("stop_vm");

    return runVerb("stop", name, [&]() {
        {
            auto conn = m_pool.acquire();
            if (!conn->lookupByName(name).active) {
                return OperationResult::failure("VM is not running");
            }
            if (force) {
                conn->destroy(name);
            } else {
                conn->shutdown(name);
            }
        }
        invalidate(name);
        return OperationResult::ok("VM " + name + (force ? " destroyed" : " shutdown") + " successfully");
    });
}

OperationResult VirtualMachineManager::rebootVm(const std::string& name) {
    OperationTimer timer("reboot_vm");

    return runVerb("reboot", name, [&]() {
        {
            auto conn = m_pool.acquire();
            if (!conn->lookupByName(name).active) {
                return OperationResult::failure("VM is not running");
            }
            conn->reboot(name);
        }
        invalidate(name);
        return OperationResult::ok("VM " + name + " rebooted successfully");
    });
}

OperationResult VirtualMachineManager::createVm(const CreateVmRequest& request) {
    OperationTimer timer("create_vm");

    std::string invalid = validateCreateRequest(request);
    if (!invalid.empty()) {
        return OperationResult::failure(invalid);
    }

    std::string xml = DomainXmlBuilder()
        .setName(request.name)
        .setMemoryMiB(request.memoryMiB)
        .setVcpus(request.vcpus)
        .setArchitecture(m_config.arch)
        .setDisk(request.diskPath)
        .setNetwork(request.network.empty() ? m_config.network : request.network,
                    m_config.network_mode)
        .setVncListen(m_config.vnc_listen)
        .setEmulator(m_config.emulator)
        .build();

    return runVerb("create", request.name, [&]() {
        auto conn = m_pool.acquire();
        std::string defined = conn->defineXML(xml);
        // The domain exists from here on, even if starting it fails
        invalidate(request.name);
        spdlog::info("Defined domain {}", defined);

        if (request.start) {
            conn->create(defined);
            invalidate(request.name);
            return OperationResult::ok("VM " + defined + " created and started successfully");
        }
        return OperationResult::ok("VM " + defined + " created successfully");
    });
}

std::string VirtualMachineManager::validateCreateRequest(const CreateVmRequest& request) const {
    if (request.name.empty()) {
        return "Invalid VM name";
    }
    if (request.name.find_first_of(kInvalidNameChars) != std::string::npos) {
        return "VM name contains invalid characters";
    }
    if (request.name == InventoryCache::kAllVmsKey) {
        return "VM name is reserved";
    }
    if (request.memoryMiB < kMinMemoryMiB) {
        return "Memory must be at least 256MB";
    }
    if (request.memoryMiB > kMaxMemoryMiB) {
        return "Memory exceeds maximum limit of 1TB";
    }
    if (request.vcpus < 1) {
        return "Must have at least 1 vCPU";
    }
    if (request.vcpus > kMaxVcpus) {
        return "vCPUs exceed maximum limit of 128";
    }
    if (request.network.empty() && m_config.network.empty()) {
        return "Invalid network name";
    }

    std::error_code ec;
    if (request.diskPath.empty() || !std::filesystem::exists(request.diskPath, ec)) {
        return "Disk image " + request.diskPath + " does not exist";
    }

    return "";
}

// ============================================================================
// Lifecycle
// ============================================================================

void VirtualMachineManager::shutdown() {
    spdlog::info("Shutting down VM manager");
    m_pool.closeAll();
    m_cache.invalidate();
}

void VirtualMachineManager::invalidate(const std::string& name) {
    m_cache.invalidate(name);
    m_cache.invalidate(InventoryCache::kAllVmsKey);
}

}  // namespace kvmrpc
