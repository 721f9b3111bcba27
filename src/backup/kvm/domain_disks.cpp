#include "backup/kvm/domain_disks.hpp"
#include "common/errors.hpp"
#include <libxml/parser.h>
#include <libxml/tree.h>
#include <libxml/xpath.h>
#include <memory>

namespace {

using XmlDocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;
using XPathContextPtr = std::unique_ptr<xmlXPathContext, decltype(&xmlXPathFreeContext)>;
using XPathObjectPtr = std::unique_ptr<xmlXPathObject, decltype(&xmlXPathFreeObject)>;

const xmlChar* const DISK_XPATH = BAD_CAST "/domain/devices/disk[@device='disk' or not(@device)]";

XmlDocPtr parseDomainXml(const std::string& domainXml) {
    xmlDocPtr doc = xmlReadMemory(domainXml.data(), static_cast<int>(domainXml.size()),
                                  "domain.xml", nullptr, XML_PARSE_NONET | XML_PARSE_NOBLANKS);
    if (!doc) {
        throw HypervisorError("Failed to parse domain XML");
    }
    return XmlDocPtr(doc, xmlFreeDoc);
}

std::string getAttribute(xmlNodePtr node, const char* name) {
    xmlChar* value = xmlGetProp(node, BAD_CAST name);
    if (!value) {
        return "";
    }
    std::string result(reinterpret_cast<const char*>(value));
    xmlFree(value);
    return result;
}

xmlNodePtr findChild(xmlNodePtr node, const char* name) {
    for (xmlNodePtr child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE && xmlStrEqual(child->name, BAD_CAST name)) {
            return child;
        }
    }
    return nullptr;
}

// Calls fn(diskNode, devName) for every backupable disk element.
template<typename F>
void forEachDiskNode(xmlDocPtr doc, F&& fn) {
    XPathContextPtr context(xmlXPathNewContext(doc), xmlXPathFreeContext);
    if (!context) {
        throw HypervisorError("Failed to create XPath context");
    }
    XPathObjectPtr result(xmlXPathEvalExpression(DISK_XPATH, context.get()), xmlXPathFreeObject);
    if (!result) {
        throw HypervisorError("Failed to evaluate disk XPath");
    }

    xmlNodeSetPtr nodes = result->nodesetval;
    if (!nodes) {
        return;
    }
    for (int i = 0; i < nodes->nodeNr; ++i) {
        xmlNodePtr disk = nodes->nodeTab[i];
        xmlNodePtr target = findChild(disk, "target");
        if (!target) {
            continue;
        }
        std::string dev = getAttribute(target, "dev");
        if (!dev.empty()) {
            fn(disk, dev);
        }
    }
}

const char* sourceAttributeName(xmlNodePtr source) {
    if (xmlHasProp(source, BAD_CAST "file")) {
        return "file";
    }
    if (xmlHasProp(source, BAD_CAST "dev")) {
        return "dev";
    }
    return nullptr;
}

} // namespace

DiskList getDomainDisks(const std::string& domainXml) {
    XmlDocPtr doc = parseDomainXml(domainXml);

    DiskList disks;
    forEachDiskNode(doc.get(), [&disks](xmlNodePtr disk, const std::string& dev) {
        xmlNodePtr source = findChild(disk, "source");
        const char* attr = source ? sourceAttributeName(source) : nullptr;
        if (!attr) {
            return;
        }

        DiskSelection selection;
        selection.devName = dev;
        selection.sourcePath = getAttribute(source, attr);

        xmlNodePtr driver = findChild(disk, "driver");
        selection.format = driver ? getAttribute(driver, "type") : "";
        if (selection.format.empty()) {
            selection.format = "raw";
        }
        disks.push_back(selection);
    });
    return disks;
}

std::string getDiskSource(const std::string& domainXml, const std::string& devName) {
    for (const auto& disk : getDomainDisks(domainXml)) {
        if (disk.devName == devName) {
            return disk.sourcePath;
        }
    }
    return "";
}

std::string setDiskSource(const std::string& domainXml,
                          const std::string& devName,
                          const std::string& sourcePath) {
    XmlDocPtr doc = parseDomainXml(domainXml);

    bool found = false;
    forEachDiskNode(doc.get(), [&](xmlNodePtr disk, const std::string& dev) {
        if (dev != devName) {
            return;
        }
        xmlNodePtr source = findChild(disk, "source");
        const char* attr = source ? sourceAttributeName(source) : nullptr;
        if (!attr) {
            return;
        }
        xmlSetProp(source, BAD_CAST attr, BAD_CAST sourcePath.c_str());
        // the snapshot overlay chain no longer applies once the source moves
        xmlNodePtr backingStore = findChild(disk, "backingStore");
        if (backingStore) {
            xmlUnlinkNode(backingStore);
            xmlFreeNode(backingStore);
        }
        found = true;
    });
    if (!found) {
        throw HypervisorError("Disk " + devName + " not found in domain XML");
    }

    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemory(doc.get(), &buffer, &size);
    if (!buffer) {
        throw HypervisorError("Failed to serialize domain XML");
    }
    std::string result(reinterpret_cast<const char*>(buffer), static_cast<size_t>(size));
    xmlFree(buffer);
    return result;
}
