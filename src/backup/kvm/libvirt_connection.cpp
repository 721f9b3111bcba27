#include "backup/kvm/libvirt_connection.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <libvirt/virterror.h>
#include <cstdlib>
#include <cstring>

std::string lastLibvirtError() {
    const char* message = virGetLastErrorMessage();
    return message ? std::string(message) : std::string("unknown libvirt error");
}

LibvirtDomain::LibvirtDomain(virDomainPtr dom)
    : dom_(dom) {
}

LibvirtDomain::~LibvirtDomain() {
    if (dom_) {
        virDomainFree(dom_);
    }
}

int LibvirtDomain::getId() const {
    unsigned int id = virDomainGetID(dom_);
    if (id == static_cast<unsigned int>(-1)) {
        return -1;
    }
    return static_cast<int>(id);
}

std::string LibvirtDomain::getUUID() const {
    char uuid[VIR_UUID_STRING_BUFLEN];
    if (virDomainGetUUIDString(dom_, uuid) < 0) {
        throw HypervisorError("Failed to get domain UUID: " + lastLibvirtError());
    }
    return uuid;
}

std::string LibvirtDomain::getName() const {
    const char* name = virDomainGetName(dom_);
    if (!name) {
        throw HypervisorError("Failed to get domain name: " + lastLibvirtError());
    }
    return name;
}

std::string LibvirtDomain::getXMLDesc() const {
    char* xml = virDomainGetXMLDesc(dom_, 0);
    if (!xml) {
        throw HypervisorError("Failed to get XML of domain " + getName() + ": " + lastLibvirtError());
    }
    std::string result(xml);
    free(xml);
    return result;
}

bool LibvirtDomain::isActive() const {
    int active = virDomainIsActive(dom_);
    if (active < 0) {
        throw HypervisorError("Failed to get state of domain " + getName() + ": " + lastLibvirtError());
    }
    return active == 1;
}

LibvirtConnection::LibvirtConnection()
    : conn_(nullptr) {
}

LibvirtConnection::~LibvirtConnection() {
    disconnect();
}

int LibvirtConnection::authCallback(virConnectCredentialPtr cred, unsigned int ncred, void* cbdata) {
    auto* self = static_cast<LibvirtConnection*>(cbdata);
    for (unsigned int i = 0; i < ncred; ++i) {
        const std::string* value = nullptr;
        if (cred[i].type == VIR_CRED_AUTHNAME) {
            value = &self->username_;
        } else if (cred[i].type == VIR_CRED_PASSPHRASE) {
            value = &self->password_;
        } else {
            return -1;
        }
        cred[i].result = strdup(value->c_str());
        if (!cred[i].result) {
            return -1;
        }
        cred[i].resultlen = static_cast<unsigned int>(value->size());
    }
    return 0;
}

bool LibvirtConnection::connect(const std::string& uri,
                                const std::string& username,
                                const std::string& password) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }

    uri_ = uri;
    username_ = username;
    password_ = password;

    if (username_.empty() && password_.empty()) {
        conn_ = virConnectOpenAuth(uri_.c_str(), virConnectAuthPtrDefault, 0);
    } else {
        int credTypes[] = {VIR_CRED_AUTHNAME, VIR_CRED_PASSPHRASE};
        virConnectAuth auth;
        auth.credtype = credTypes;
        auth.ncredtype = sizeof(credTypes) / sizeof(credTypes[0]);
        auth.cb = &LibvirtConnection::authCallback;
        auth.cbdata = this;
        conn_ = virConnectOpenAuth(uri_.c_str(), &auth, 0);
    }

    if (!conn_) {
        lastError_ = "Failed to connect to " + uri_ + ": " + lastLibvirtError();
        return false;
    }

    Logger::info("Connected to " + uri_);
    return true;
}

void LibvirtConnection::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conn_) {
        virConnectClose(conn_);
        conn_ = nullptr;
    }
}

bool LibvirtConnection::isConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return conn_ != nullptr;
}

std::shared_ptr<Domain> LibvirtConnection::lookupDomainByName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) {
        throw HypervisorError("Not connected to hypervisor");
    }

    virDomainPtr dom = virDomainLookupByName(conn_, name.c_str());
    if (!dom) {
        throw DomainNotFoundError(name);
    }
    return std::make_shared<LibvirtDomain>(dom);
}

std::set<std::string> LibvirtConnection::listAllDomainNames() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!conn_) {
        throw HypervisorError("Not connected to hypervisor");
    }

    virDomainPtr* domains = nullptr;
    int count = virConnectListAllDomains(conn_, &domains, 0);
    if (count < 0) {
        throw HypervisorError("Failed to list domains: " + lastLibvirtError());
    }

    std::set<std::string> names;
    for (int i = 0; i < count; ++i) {
        const char* name = virDomainGetName(domains[i]);
        if (name) {
            names.insert(name);
        }
        virDomainFree(domains[i]);
    }
    free(domains);
    return names;
}
