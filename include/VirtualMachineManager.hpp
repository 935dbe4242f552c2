#pragma once

#include "Config.hpp"
#include "HypervisorConnection.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace kvmrpc {

// Forward declarations
class ConnectionPool;
class InventoryCache;

struct VmSummary {
    std::string name;
    int id = -1;
    std::string state;
    bool autostart = false;
    bool persistent = false;
};

struct VmDetails {
    std::string name;
    int id = -1;
    std::string uuid;
    std::string state;
    bool active = false;
    bool autostart = false;
    bool persistent = false;
    uint64_t memoryKiB = 0;
    uint64_t maxMemoryKiB = 0;
    unsigned int vcpus = 0;
};

struct CreateVmRequest {
    std::string name;
    unsigned long memoryMiB = 0;
    unsigned int vcpus = 0;
    std::string diskPath;  // existing qcow2 image
    std::string network;   // empty: VmConfig::network
    bool start = true;
};

struct OperationResult {
    bool success = false;
    std::string message;
    std::string error;

    static OperationResult ok(std::string message);
    static OperationResult failure(std::string error);
};

void to_json(nlohmann::json& j, const VmSummary& vm);
void from_json(const nlohmann::json& j, VmSummary& vm);
void to_json(nlohmann::json& j, const VmDetails& vm);
void from_json(const nlohmann::json& j, VmDetails& vm);
void to_json(nlohmann::json& j, const OperationResult& result);

/**
 * @class VirtualMachineManager
 * @brief VM lifecycle operations over a connection pool and an inventory cache.
 *
 * Read operations consult the cache first and lease a pooled connection only
 * on a miss. Every successful mutation invalidates the VM's own entry and the
 * full inventory snapshot, so the next listing reflects it.
 *
 * The pool and cache are owned by the caller and must outlive the manager.
 */
class VirtualMachineManager {
public:
    VirtualMachineManager(ConnectionPool& pool, InventoryCache& cache, const VmConfig& config);

    // Non-copyable
    VirtualMachineManager(const VirtualMachineManager&) = delete;
    VirtualMachineManager& operator=(const VirtualMachineManager&) = delete;

    /**
     * @brief List all VMs.
     * @throws ConnectionError, HypervisorException
     */
    std::vector<VmSummary> listVms(bool useCache = true);

    /**
     * @brief Details of one VM.
     * @throws ConnectionError, HypervisorException (not found included)
     */
    VmDetails getVmInfo(const std::string& name, bool useCache = true);

    OperationResult startVm(const std::string& name);
    OperationResult stopVm(const std::string& name, bool force = false);
    OperationResult rebootVm(const std::string& name);
    OperationResult createVm(const CreateVmRequest& request);

    /**
     * @brief VNC display port of every running VM that has one assigned.
     * @throws ConnectionError, HypervisorException
     */
    std::map<std::string, int> getVncPorts();

    /**
     * @brief First IPv4 address leased to a VM, without prefix length.
     * @return nullopt when the VM is not running or has no IPv4 address yet.
     * @throws ConnectionError, HypervisorException (not found)
     */
    std::optional<std::string> getVmIp(const std::string& name);

    // Close the pool and clear the cache
    void shutdown();

    // Validation rules applied by createVm(); empty string when valid
    std::string validateCreateRequest(const CreateVmRequest& request) const;

private:
    void invalidate(const std::string& name);

    ConnectionPool& m_pool;
    InventoryCache& m_cache;
    VmConfig m_config;
};

}  // namespace kvmrpc
