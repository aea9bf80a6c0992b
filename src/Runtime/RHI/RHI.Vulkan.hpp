#pragma once

// Enforce the configuration globally so no file forgets it.
#ifndef VK_NO_PROTOTYPES
    #define VK_NO_PROTOTYPES
#endif

// The render core only uses Vulkan's vocabulary types (formats, topologies,
// blend factors, sample counts). Function loading is the device backend's job.
#include <vulkan/vulkan.h>
