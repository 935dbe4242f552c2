#include "virt/DomainXmlBuilder.hpp"
#include <cstring>

namespace kvmrpc {

DomainXmlBuilder& DomainXmlBuilder::setName(const std::string& name) {
    m_name = name;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setMemoryMiB(unsigned long memory) {
    m_memoryMiB = memory;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setVcpus(unsigned int vcpus) {
    m_vcpus = vcpus;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setArchitecture(const std::string& arch) {
    m_arch = arch;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setDisk(const std::string& diskPath) {
    m_diskPath = diskPath;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setNetwork(const std::string& source, const std::string& mode) {
    m_networkSource = source;
    m_networkMode = mode;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setVncListen(const std::string& address) {
    m_vncListen = address;
    return *this;
}

DomainXmlBuilder& DomainXmlBuilder::setEmulator(const std::string& emulator) {
    m_emulator = emulator;
    return *this;
}

std::string DomainXmlBuilder::build() {
    m_doc.reset();

    auto domain = m_doc.append_child("domain");
    domain.append_attribute("type") = "kvm";
    domain.append_child("name").text() = m_name.c_str();

    auto memory = domain.append_child("memory");
    memory.append_attribute("unit") = "MiB";
    memory.text() = static_cast<unsigned long long>(m_memoryMiB);

    domain.append_child("vcpu").text() = m_vcpus;

    buildOsSection(domain);
    buildDevicesSection(domain);

    struct xml_string_writer : pugi::xml_writer {
        std::string result;
        void write(const void* data, size_t size) override {
            result.append(static_cast<const char*>(data), size);
        }
    };

    xml_string_writer writer;
    m_doc.save(writer, "  ", pugi::format_default | pugi::format_no_declaration);
    return writer.result;
}

void DomainXmlBuilder::buildOsSection(pugi::xml_node domain) {
    auto os = domain.append_child("os");
    auto type = os.append_child("type");
    type.append_attribute("arch") = m_arch.c_str();
    type.text() = "hvm";
    os.append_child("boot").append_attribute("dev") = "hd";
}

void DomainXmlBuilder::buildDevicesSection(pugi::xml_node domain) {
    auto devices = domain.append_child("devices");

    devices.append_child("emulator").text() = m_emulator.c_str();

    if (!m_diskPath.empty()) {
        auto disk = devices.append_child("disk");
        disk.append_attribute("type") = "file";
        disk.append_attribute("device") = "disk";

        auto driver = disk.append_child("driver");
        driver.append_attribute("name") = "qemu";
        driver.append_attribute("type") = "qcow2";

        disk.append_child("source").append_attribute("file") = m_diskPath.c_str();

        auto target = disk.append_child("target");
        target.append_attribute("dev") = "vda";
        target.append_attribute("bus") = "virtio";
    }

    auto iface = devices.append_child("interface");
    bool bridged = m_networkMode == "bridge";
    iface.append_attribute("type") = bridged ? "bridge" : "network";
    iface.append_child("source").append_attribute(bridged ? "bridge" : "network") = m_networkSource.c_str();
    iface.append_child("model").append_attribute("type") = "virtio";

    auto graphics = devices.append_child("graphics");
    graphics.append_attribute("type") = "vnc";
    graphics.append_attribute("port") = "-1";
    graphics.append_attribute("autoport") = "yes";
    graphics.append_attribute("listen") = m_vncListen.c_str();

    auto listen = graphics.append_child("listen");
    listen.append_attribute("type") = "address";
    listen.append_attribute("address") = m_vncListen.c_str();
}

std::optional<int> DomainXmlBuilder::parseVncPort(const std::string& xml) {
    pugi::xml_document doc;
    if (!doc.load_string(xml.c_str())) {
        return std::nullopt;
    }

    for (auto graphics : doc.child("domain").child("devices").children("graphics")) {
        if (std::strcmp(graphics.attribute("type").value(), "vnc") != 0) {
            continue;
        }
        int port = graphics.attribute("port").as_int(-1);
        if (port > 0) {
            return port;
        }
    }

    return std::nullopt;
}

}  // namespace kvmrpc
