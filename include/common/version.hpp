#pragma once

// Set by the build from the project version.
#ifndef VIRTBACKUP_VERSION
#define VIRTBACKUP_VERSION "0.0.0"
#endif
