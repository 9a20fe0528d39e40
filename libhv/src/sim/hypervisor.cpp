#include <iostream>

#include "sim.hpp"

namespace hv {

std::unique_ptr<Hypervisor> openSim(SimLimits limits) {
	return std::make_unique<sim::SimHypervisor>(limits);
}

} // namespace hv

namespace hv::sim {

VcpuExit decodeNativeExit(uint32_t code) {
	switch(code) {
	case nativeExitHlt: return exits::Hlt{};
	case nativeExitShutdown: return exits::Shutdown{};
	case nativeExitIrqWindowOpen: return exits::InterruptWindowOpen{};
	case nativeExitIntr: return exits::ImmediateExit{};
	case nativeExitFailEntry: return exits::FailEntry{0};
	case nativeExitSystemEvent: return exits::SystemEvent{exits::SystemEvent::Type::shutdown};
	default:
		std::cout << "\e[31m" "hv/sim: Unknown exit code " << code << "\e[39m" << std::endl;
		return exits::Unknown{code};
	}
}

SimHypervisor::SimHypervisor(SimLimits limits)
: limits_{limits} { }

bool SimHypervisor::checkCapability(VmCap cap) const {
	switch(cap) {
	case VmCap::dirtyLog:
	case VmCap::readOnlyMemory:
	case VmCap::irqRouting:
	case VmCap::immediateExit:
	case VmCap::guestDebug:
	case VmCap::ioEventFd:
		return true;
	case VmCap::debugRegisters:
	case VmCap::irqFd:
	case VmCap::protectedVm:
		return false;
	}
	return false;
}

Result<std::unique_ptr<Vm>> SimHypervisor::createVm(const VmConfig &config) {
	if(config.kind != HypervisorKind::sim)
		return makeError(ErrorKind::unsupported, static_cast<uint32_t>(config.kind), "createVm");
	if(config.protection != Protection::none)
		return makeError(ErrorKind::unsupported, 0, "createVm");
	if(!config.vcpuCount)
		return makeError(ErrorKind::illegalArgs, 0, "createVm");
	if(config.vcpuCount > limits_.maxVcpus)
		return makeError(ErrorKind::resourceExhausted, config.vcpuCount, "createVm");

	auto vm = std::make_unique<SimVm>(this, limits_, config);
	if(auto outcome = vm->initialize(); !outcome)
		return std::unexpected{outcome.error()};
	return vm;
}

} // namespace hv::sim
