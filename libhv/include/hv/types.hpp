#pragma once

#include <stddef.h>
#include <stdint.h>

namespace hv {

using GuestAddress = uint64_t;
using SlotId = uint32_t;
using VcpuId = uint32_t;
using Gsi = uint32_t;

constexpr size_t kPageSize = 0x1000;

enum class HypervisorKind : uint32_t {
	kvm = 1,
	sim = 2
};

const char *hypervisorKindName(HypervisorKind kind);

// Optional capabilities of a backend. Operations that depend on a missing
// capability fail with ErrorKind::unsupported.
enum class VmCap {
	dirtyLog,
	readOnlyMemory,
	irqRouting,
	immediateExit,
	guestDebug,
	debugRegisters,
	ioEventFd,
	irqFd,
	protectedVm
};

enum class Protection {
	none,
	// Guest memory is inaccessible to the host after boot.
	protectedVm
};

struct VmConfig {
	HypervisorKind kind = HypervisorKind::kvm;

	// Number of vCPUs in the topology; vCPU IDs are [0, vcpuCount).
	uint32_t vcpuCount = 1;

	// If non-zero, anonymous RAM of this size is installed at guest
	// address 0 when the VM is created.
	uint64_t memorySize = 0;

	Protection protection = Protection::none;
};

} // namespace hv
