#pragma once

#include "backup/vm_config.hpp"
#include <string>

// Disks of type "disk" declared in a libvirt domain XML, in document order.
// CD-ROMs, floppies and disks without a source are skipped. Throws
// HypervisorError if the XML cannot be parsed.
DiskList getDomainDisks(const std::string& domainXml);

// Source path currently configured for devName, or empty if not found.
std::string getDiskSource(const std::string& domainXml, const std::string& devName);

// Returns domainXml with the source of devName pointing to sourcePath.
std::string setDiskSource(const std::string& domainXml,
                          const std::string& devName,
                          const std::string& sourcePath);
