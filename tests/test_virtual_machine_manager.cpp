#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "VirtualMachineManager.hpp"
#include "ConnectionPool.hpp"
#include "InventoryCache.hpp"
#include "ErrorHandler.hpp"
#include "FakeHypervisor.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>

using namespace kvmrpc;
using namespace kvmrpc::fake;
using namespace std::chrono_literals;
using ::testing::HasSubstr;

class VirtualMachineManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<FakeHypervisorState>();
        state_->addDomain("web01", DomainState::Running);
        state_->addDomain("db01", DomainState::Shutoff);

        connConfig_.uri = "qemu:///test";
        connConfig_.max_connections = 2;
        connConfig_.checkout_timeout = 100ms;

        tempDir_ = std::filesystem::temp_directory_path() / "kvm_rpc_manager_test";
        std::filesystem::create_directories(tempDir_);
    }

    void TearDown() override {
        manager_.reset();
        pool_.reset();
        std::filesystem::remove_all(tempDir_);
    }

    VirtualMachineManager& manager() {
        if (!manager_) {
            pool_ = std::make_unique<ConnectionPool>(
                std::make_shared<FakeConnectionFactory>(state_), connConfig_);
            manager_ = std::make_unique<VirtualMachineManager>(*pool_, cache_, vmConfig_);
        }
        return *manager_;
    }

    std::string makeDisk(const std::string& name) {
        auto path = tempDir_ / (name + ".qcow2");
        std::ofstream(path) << "qcow";
        return path.string();
    }

    std::shared_ptr<FakeHypervisorState> state_;
    ConnectionConfig connConfig_;
    VmConfig vmConfig_;
    InventoryCache cache_{CacheConfig{.max_entries = 50, .ttl = std::chrono::seconds{60}}};
    std::unique_ptr<ConnectionPool> pool_;
    std::unique_ptr<VirtualMachineManager> manager_;
    std::filesystem::path tempDir_;
};

// Listing
TEST_F(VirtualMachineManagerTest, ListVmsReturnsAllDomains) {
    auto vms = manager().listVms();

    ASSERT_EQ(vms.size(), 2u);
    EXPECT_EQ(vms[0].name, "db01");
    EXPECT_EQ(vms[0].state, "shutoff");
    EXPECT_EQ(vms[0].id, -1);
    EXPECT_EQ(vms[1].name, "web01");
    EXPECT_EQ(vms[1].state, "running");
    EXPECT_TRUE(vms[1].persistent);
}

TEST_F(VirtualMachineManagerTest, RepeatedListingEnumeratesOnce) {
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(manager().listVms().size(), 2u);
    }

    EXPECT_EQ(state_->listCalls.load(), 1);
    EXPECT_TRUE(cache_.contains(InventoryCache::kAllVmsKey));
}

TEST_F(VirtualMachineManagerTest, ListingWithoutCacheAlwaysEnumerates) {
    manager().listVms(false);
    manager().listVms(false);

    EXPECT_EQ(state_->listCalls.load(), 2);
    EXPECT_FALSE(cache_.contains(InventoryCache::kAllVmsKey));
}

TEST_F(VirtualMachineManagerTest, EmptyInventoryIsCached) {
    state_->domains.clear();

    EXPECT_TRUE(manager().listVms().empty());
    EXPECT_TRUE(manager().listVms().empty());
    EXPECT_EQ(state_->listCalls.load(), 1);
}

TEST_F(VirtualMachineManagerTest, UnreadableCachedListIsRefetched) {
    cache_.set(InventoryCache::kAllVmsKey, "garbage");

    auto vms = manager().listVms();

    EXPECT_EQ(vms.size(), 2u);
    EXPECT_EQ(state_->listCalls.load(), 1);
}

TEST_F(VirtualMachineManagerTest, ListingFailsWhenHypervisorUnreachable) {
    state_->refuseOpen = true;

    EXPECT_THROW(manager().listVms(), ConnectionError);
}

// Details
TEST_F(VirtualMachineManagerTest, GetVmInfo) {
    auto vm = manager().getVmInfo("web01");

    EXPECT_EQ(vm.name, "web01");
    EXPECT_EQ(vm.uuid, "uuid-web01");
    EXPECT_EQ(vm.state, "running");
    EXPECT_TRUE(vm.active);
    EXPECT_EQ(vm.memoryKiB, 1024u * 1024u);
    EXPECT_EQ(vm.vcpus, 1u);
    EXPECT_TRUE(cache_.contains("web01"));
}

TEST_F(VirtualMachineManagerTest, GetVmInfoServedFromCache) {
    manager().getVmInfo("db01");
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->domains["db01"].vcpus = 8;
    }

    EXPECT_EQ(manager().getVmInfo("db01").vcpus, 1u);
    EXPECT_EQ(manager().getVmInfo("db01", false).vcpus, 8u);
}

TEST_F(VirtualMachineManagerTest, GetVmInfoUnknownDomainThrows) {
    try {
        manager().getVmInfo("missing");
        FAIL() << "expected HypervisorException";
    } catch (const HypervisorException& e) {
        EXPECT_TRUE(e.isNotFound());
        EXPECT_THAT(e.what(), HasSubstr("missing"));
    }
    EXPECT_FALSE(cache_.contains("missing"));
}

TEST_F(VirtualMachineManagerTest, VmDetailsJsonKeys) {
    nlohmann::json j = manager().getVmInfo("web01");

    EXPECT_EQ(j["name"], "web01");
    EXPECT_EQ(j["memory_kib"], 1024 * 1024);
    EXPECT_EQ(j["max_memory_kib"], 1024 * 1024);
    EXPECT_EQ(j["state"], "running");
}

// Start
TEST_F(VirtualMachineManagerTest, StartInvalidatesCache) {
    manager().listVms();
    manager().getVmInfo("db01");

    auto result = manager().startVm("db01");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "VM db01 started successfully");
    EXPECT_FALSE(cache_.contains("db01"));
    EXPECT_FALSE(cache_.contains(InventoryCache::kAllVmsKey));

    auto vms = manager().listVms();
    EXPECT_EQ(vms[0].state, "running");
    EXPECT_EQ(state_->listCalls.load(), 2);
}

TEST_F(VirtualMachineManagerTest, StartRunningVmFails) {
    manager().listVms();

    auto result = manager().startVm("web01");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "VM is already running");
    EXPECT_TRUE(cache_.contains(InventoryCache::kAllVmsKey));
}

TEST_F(VirtualMachineManagerTest, StartUnknownVmReportsNotFound) {
    auto result = manager().startVm("missing");

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("Failed to start VM: "));
    EXPECT_THAT(result.error, HasSubstr("Domain not found"));
}

TEST_F(VirtualMachineManagerTest, MutationReportsConnectionFailure) {
    state_->refuseOpen = true;

    auto result = manager().startVm("db01");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "Failed to connect to hypervisor");
}

// Stop
TEST_F(VirtualMachineManagerTest, GracefulStop) {
    auto result = manager().stopVm("web01");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "VM web01 shutdown successfully");
    EXPECT_EQ(state_->shutdowns.load(), 1);
    EXPECT_EQ(state_->destroys.load(), 0);
}

TEST_F(VirtualMachineManagerTest, ForcedStop) {
    manager().getVmInfo("web01");

    auto result = manager().stopVm("web01", true);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "VM web01 destroyed successfully");
    EXPECT_EQ(state_->destroys.load(), 1);
    EXPECT_EQ(state_->shutdowns.load(), 0);
    EXPECT_FALSE(cache_.contains("web01"));
}

TEST_F(VirtualMachineManagerTest, StopInactiveVmFails) {
    auto result = manager().stopVm("db01");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "VM is not running");
    EXPECT_EQ(state_->shutdowns.load(), 0);
}

// Reboot
TEST_F(VirtualMachineManagerTest, Reboot) {
    manager().listVms();

    auto result = manager().rebootVm("web01");

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.message, "VM web01 rebooted successfully");
    EXPECT_EQ(state_->reboots.load(), 1);
    EXPECT_FALSE(cache_.contains(InventoryCache::kAllVmsKey));
}

TEST_F(VirtualMachineManagerTest, RebootInactiveVmFails) {
    auto result = manager().rebootVm("db01");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "VM is not running");
}

// Creation
TEST_F(VirtualMachineManagerTest, CreateAndStart) {
    manager().listVms();

    CreateVmRequest request;
    request.name = "app01";
    request.memoryMiB = 2048;
    request.vcpus = 2;
    request.diskPath = makeDisk("app01");

    auto result = manager().createVm(request);

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.message, "VM app01 created and started successfully");
    EXPECT_FALSE(cache_.contains(InventoryCache::kAllVmsKey));

    auto vm = manager().getVmInfo("app01");
    EXPECT_TRUE(vm.active);

    std::lock_guard<std::mutex> lock(state_->mutex);
    const std::string& xml = state_->xml["app01"];
    EXPECT_THAT(xml, HasSubstr("<memory unit=\"MiB\">2048</memory>"));
    EXPECT_THAT(xml, HasSubstr(request.diskPath));
    EXPECT_THAT(xml, HasSubstr("network=\"default\""));
}

TEST_F(VirtualMachineManagerTest, CreateWithoutStart) {
    CreateVmRequest request;
    request.name = "app02";
    request.memoryMiB = 512;
    request.vcpus = 1;
    request.diskPath = makeDisk("app02");
    request.start = false;

    auto result = manager().createVm(request);

    EXPECT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.message, "VM app02 created successfully");
    EXPECT_FALSE(manager().getVmInfo("app02").active);
}

TEST_F(VirtualMachineManagerTest, CreateDuplicateReportsHypervisorError) {
    CreateVmRequest request;
    request.name = "web01";
    request.memoryMiB = 512;
    request.vcpus = 1;
    request.diskPath = makeDisk("web01");

    auto result = manager().createVm(request);

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.error, HasSubstr("Failed to create VM: "));
    EXPECT_THAT(result.error, HasSubstr("already exists"));
}

TEST_F(VirtualMachineManagerTest, CreateValidation) {
    CreateVmRequest valid;
    valid.name = "ok";
    valid.memoryMiB = 1024;
    valid.vcpus = 1;
    valid.diskPath = makeDisk("ok");
    EXPECT_EQ(manager().validateCreateRequest(valid), "");

    auto check = [&](auto mutate, const std::string& expected) {
        CreateVmRequest request = valid;
        mutate(request);
        auto result = manager().createVm(request);
        EXPECT_FALSE(result.success);
        EXPECT_EQ(result.error, expected);
    };

    check([](CreateVmRequest& r) { r.name = ""; }, "Invalid VM name");
    check([](CreateVmRequest& r) { r.name = "bad/name"; }, "VM name contains invalid characters");
    check([](CreateVmRequest& r) { r.name = "a b;"; }, "VM name contains invalid characters");
    check([](CreateVmRequest& r) { r.name = InventoryCache::kAllVmsKey; }, "VM name is reserved");
    check([](CreateVmRequest& r) { r.memoryMiB = 255; }, "Memory must be at least 256MB");
    check([](CreateVmRequest& r) { r.memoryMiB = 1024 * 1024 + 1; }, "Memory exceeds maximum limit of 1TB");
    check([](CreateVmRequest& r) { r.vcpus = 0; }, "Must have at least 1 vCPU");
    check([](CreateVmRequest& r) { r.vcpus = 129; }, "vCPUs exceed maximum limit of 128");
    check([](CreateVmRequest& r) { r.diskPath = "/nonexistent/disk.qcow2"; },
          "Disk image /nonexistent/disk.qcow2 does not exist");

    EXPECT_EQ(state_->opens.load(), 2);  // pre-opened only
    EXPECT_EQ(state_->domains.size(), 2u);
}

TEST_F(VirtualMachineManagerTest, CreateBoundaryValuesAccepted) {
    CreateVmRequest request;
    request.name = "edge";
    request.memoryMiB = 256;
    request.vcpus = 128;
    request.diskPath = makeDisk("edge");

    EXPECT_EQ(manager().validateCreateRequest(request), "");

    request.memoryMiB = 1024 * 1024;
    EXPECT_EQ(manager().validateCreateRequest(request), "");
}

TEST_F(VirtualMachineManagerTest, CreateWithoutAnyNetworkRejected) {
    vmConfig_.network = "";

    CreateVmRequest request;
    request.name = "nonet";
    request.memoryMiB = 512;
    request.vcpus = 1;
    request.diskPath = makeDisk("nonet");

    EXPECT_EQ(manager().createVm(request).error, "Invalid network name");
}

TEST_F(VirtualMachineManagerTest, BridgedNetworkFromConfig) {
    vmConfig_.network = "br0";
    vmConfig_.network_mode = "bridge";

    CreateVmRequest request;
    request.name = "bridged";
    request.memoryMiB = 512;
    request.vcpus = 1;
    request.diskPath = makeDisk("bridged");
    request.start = false;

    ASSERT_TRUE(manager().createVm(request).success);

    std::lock_guard<std::mutex> lock(state_->mutex);
    EXPECT_THAT(state_->xml["bridged"], HasSubstr("bridge=\"br0\""));
}

// IP lookup
namespace {

InterfaceAddress ipAddress(const std::string& iface, InterfaceAddress::Family family,
                           const std::string& address, unsigned int prefix = 24) {
    InterfaceAddress entry;
    entry.interface = iface;
    entry.family = family;
    entry.address = address;
    entry.prefix = prefix;
    return entry;
}

}  // namespace

TEST_F(VirtualMachineManagerTest, VmIpReturnsLeasedAddress) {
    state_->addresses["web01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv4, "192.168.122.100")
    };

    auto ip = manager().getVmIp("web01");

    ASSERT_TRUE(ip.has_value());
    EXPECT_EQ(*ip, "192.168.122.100");
}

TEST_F(VirtualMachineManagerTest, VmIpNoAddresses) {
    state_->addresses["web01"] = {};

    EXPECT_FALSE(manager().getVmIp("web01").has_value());
}

TEST_F(VirtualMachineManagerTest, VmIpFirstInterfaceWins) {
    state_->addresses["web01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv4, "192.168.1.100"),
        ipAddress("vnet1", InterfaceAddress::Family::IPv4, "10.0.0.100")
    };

    EXPECT_EQ(manager().getVmIp("web01"), "192.168.1.100");
}

TEST_F(VirtualMachineManagerTest, VmIpSkipsIpv6) {
    state_->addresses["web01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv6, "2001:db8::1", 64),
        ipAddress("vnet1", InterfaceAddress::Family::IPv4, "10.0.0.7")
    };

    EXPECT_EQ(manager().getVmIp("web01"), "10.0.0.7");

    state_->addresses["web01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv6, "2001:db8::1", 64)
    };
    EXPECT_FALSE(manager().getVmIp("web01").has_value());
}

TEST_F(VirtualMachineManagerTest, VmIpStripsPrefixLength) {
    state_->addresses["web01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv4, "172.16.0.5/16")
    };

    EXPECT_EQ(manager().getVmIp("web01"), "172.16.0.5");
}

TEST_F(VirtualMachineManagerTest, VmIpOfStoppedVm) {
    state_->addresses["db01"] = {
        ipAddress("vnet0", InterfaceAddress::Family::IPv4, "192.168.122.50")
    };

    EXPECT_FALSE(manager().getVmIp("db01").has_value());
}

TEST_F(VirtualMachineManagerTest, VmIpLookupFailureIsEmpty) {
    state_->addressLookupFails = true;

    EXPECT_FALSE(manager().getVmIp("web01").has_value());
}

TEST_F(VirtualMachineManagerTest, VmIpUnknownVmThrows) {
    EXPECT_THROW(manager().getVmIp("missing"), HypervisorException);
}

// VNC ports
TEST_F(VirtualMachineManagerTest, VncPortsOfRunningDomains) {
    state_->addDomain("web02", DomainState::Running);
    state_->addDomain("web03", DomainState::Running);
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->xml["web01"] =
            "<domain><devices><graphics type='vnc' port='5900'/></devices></domain>";
        state_->xml["web02"] =
            "<domain><devices><graphics type='spice' port='5930'/>"
            "<graphics type='vnc' port='5901'/></devices></domain>";
        state_->xml["web03"] =
            "<domain><devices><graphics type='vnc' port='-1' autoport='yes'/></devices></domain>";
        state_->xml["db01"] =
            "<domain><devices><graphics type='vnc' port='5999'/></devices></domain>";
    }

    auto ports = manager().getVncPorts();

    ASSERT_EQ(ports.size(), 2u);
    EXPECT_EQ(ports["web01"], 5900);
    EXPECT_EQ(ports["web02"], 5901);
}

// Shutdown
TEST_F(VirtualMachineManagerTest, ShutdownClosesPoolAndClearsCache) {
    manager().listVms();
    manager().getVmInfo("web01");

    manager().shutdown();

    EXPECT_TRUE(pool_->isClosed());
    EXPECT_EQ(cache_.size(), 0u);
    EXPECT_EQ(state_->closes.load(), 2);
    EXPECT_THROW(manager().listVms(false), ConnectionError);
}

// Result serialization
TEST_F(VirtualMachineManagerTest, OperationResultJson) {
    nlohmann::json ok = OperationResult::ok("done");
    nlohmann::json failed = OperationResult::failure("broken");

    EXPECT_EQ(ok, (nlohmann::json{{"success", true}, {"message", "done"}}));
    EXPECT_EQ(failed, (nlohmann::json{{"success", false}, {"error", "broken"}}));
}
