#include <iostream>

#include <hv/hypervisor.hpp>

namespace hv {

const char *hypervisorKindName(HypervisorKind kind) {
	switch(kind) {
	case HypervisorKind::kvm: return "kvm";
	case HypervisorKind::sim: return "sim";
	}
	return "unknown";
}

Result<std::unique_ptr<Hypervisor>> openHypervisor(HypervisorKind kind) {
	switch(kind) {
	case HypervisorKind::kvm:
		return openKvm();
	case HypervisorKind::sim:
		return openSim();
	}
	std::cout << "\e[31m" "hv: Unknown hypervisor kind "
			<< static_cast<uint32_t>(kind) << "\e[39m" << std::endl;
	return makeError(ErrorKind::unsupported, static_cast<uint32_t>(kind), "openHypervisor");
}

} // namespace hv
