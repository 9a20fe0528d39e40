#pragma once

#include <stdint.h>
#include <memory>

#include <hv/error.hpp>
#include <hv/types.hpp>
#include <hv/vm.hpp>

namespace hv {

// Process-scoped state of one backend (device handles, signal setup,
// cached capabilities). Open it once and keep it alive for as long as any
// VM created from it exists.
struct Hypervisor {
	virtual ~Hypervisor() = default;

	virtual HypervisorKind kind() const = 0;

	virtual uint32_t maxVcpus() const = 0;

	virtual uint32_t maxMemorySlots() const = 0;

	virtual bool checkCapability(VmCap cap) const = 0;

	virtual Result<std::unique_ptr<Vm>> createVm(const VmConfig &config) = 0;
};

struct SimLimits {
	uint32_t maxVcpus = 64;
	uint32_t maxSlots = 32;
	uint32_t maxRoutes = 1024;
};

Result<std::unique_ptr<Hypervisor>> openKvm(const char *path = "/dev/kvm");

std::unique_ptr<Hypervisor> openSim(SimLimits limits = {});

Result<std::unique_ptr<Hypervisor>> openHypervisor(HypervisorKind kind);

} // namespace hv
