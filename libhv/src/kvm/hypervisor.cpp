#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <string.h>
#include <sys/ioctl.h>
#include <iostream>
#include <mutex>

#include "kvm.hpp"

namespace hv {

Result<std::unique_ptr<Hypervisor>> openKvm(const char *path) {
	auto hypervisor = kvm::KvmHypervisor::open(path);
	if(!hypervisor)
		return std::unexpected{hypervisor.error()};
	return std::move(*hypervisor);
}

} // namespace hv

namespace hv::kvm {

namespace {

constexpr bool logProbe = false;

std::once_flag kickOnce;

void handleKick(int) {
	// Only interrupts KVM_RUN; immediate_exit tells the thread what happened.
}

Result<> installKickHandler() {
	int error = 0;
	std::call_once(kickOnce, [&] {
		struct sigaction sa;
		memset(&sa, 0, sizeof(struct sigaction));
		sa.sa_handler = handleKick;
		sigemptyset(&sa.sa_mask);
		// No SA_RESTART: KVM_RUN must return EINTR.
		if(sigaction(kickSignal(), &sa, nullptr))
			error = errno;
	});
	if(error)
		return backendFailure("sigaction", error);
	return {};
}

} // anonymous namespace

int kickSignal() {
	return SIGRTMIN;
}

Result<std::unique_ptr<KvmHypervisor>> KvmHypervisor::open(const char *path) {
	int fd = ::open(path, O_RDWR | O_CLOEXEC);
	if(fd < 0) {
		int error = errno;
		if(error == ENOENT || error == ENODEV || error == ENXIO)
			return makeError(ErrorKind::unsupported, 0, "open");
		std::cout << "\e[31m" "hv/kvm: Failed to open " << path << ": "
				<< strerror(error) << "\e[39m" << std::endl;
		return backendFailure("open", error);
	}

	auto hypervisor = std::make_unique<KvmHypervisor>(UniqueFd{fd});
	if(auto outcome = hypervisor->probe(); !outcome)
		return std::unexpected{outcome.error()};
	if(auto outcome = installKickHandler(); !outcome)
		return std::unexpected{outcome.error()};
	return hypervisor;
}

KvmHypervisor::KvmHypervisor(UniqueFd device)
: device_{std::move(device)} { }

Result<> KvmHypervisor::probe() {
	int version = ioctl(device_.get(), KVM_GET_API_VERSION, 0);
	if(version < 0)
		return backendFailure("KVM_GET_API_VERSION", errno);
	if(version != apiVersion) {
		std::cout << "\e[31m" "hv/kvm: Unexpected API version " << version << "\e[39m"
				<< std::endl;
		return makeError(ErrorKind::unsupported, version, "KVM_GET_API_VERSION");
	}

	// Cancellation relies on immediate_exit.
	if(!extension(KVM_CAP_IMMEDIATE_EXIT) || !extension(KVM_CAP_IRQ_ROUTING))
		return makeError(ErrorKind::unsupported, 0, "KVM_CHECK_EXTENSION");

	int size = ioctl(device_.get(), KVM_GET_VCPU_MMAP_SIZE, 0);
	if(size < 0)
		return backendFailure("KVM_GET_VCPU_MMAP_SIZE", errno);
	runSize_ = size;

	int maxVcpus = extension(KVM_CAP_MAX_VCPUS);
	if(maxVcpus <= 0)
		maxVcpus = extension(KVM_CAP_NR_VCPUS);
	maxVcpus_ = maxVcpus > 0 ? maxVcpus : 4;

	int maxSlots = extension(KVM_CAP_NR_MEMSLOTS);
	maxSlots_ = maxSlots > 0 ? maxSlots : 32;

	// The kernel fails with E2BIG until the buffer is large enough.
	size_t capacity = 64;
	while(true) {
		std::vector<uint8_t> buffer(sizeof(kvm_cpuid2) + capacity * sizeof(kvm_cpuid_entry2));
		auto cpuid = reinterpret_cast<kvm_cpuid2 *>(buffer.data());
		cpuid->nent = capacity;
		if(!ioctl(device_.get(), KVM_GET_SUPPORTED_CPUID, cpuid)) {
			cpuid_.assign(cpuid->entries, cpuid->entries + cpuid->nent);
			break;
		}
		if(errno != E2BIG)
			return backendFailure("KVM_GET_SUPPORTED_CPUID", errno);
		capacity *= 2;
	}

	if(logProbe)
		std::cout << "hv/kvm: " << maxVcpus_ << " vCPUs, " << maxSlots_ << " slots, "
				<< cpuid_.size() << " CPUID leaves" << std::endl;
	return {};
}

int KvmHypervisor::extension(long cap) const {
	int result = ioctl(device_.get(), KVM_CHECK_EXTENSION, cap);
	if(result < 0)
		return 0;
	return result;
}

bool KvmHypervisor::checkCapability(VmCap cap) const {
	switch(cap) {
	case VmCap::dirtyLog:
		return true;
	case VmCap::readOnlyMemory:
		return extension(KVM_CAP_READONLY_MEM);
	case VmCap::irqRouting:
		return extension(KVM_CAP_IRQ_ROUTING);
	case VmCap::immediateExit:
		return extension(KVM_CAP_IMMEDIATE_EXIT);
	case VmCap::guestDebug:
		return extension(KVM_CAP_SET_GUEST_DEBUG);
	case VmCap::debugRegisters:
		return extension(KVM_CAP_DEBUGREGS);
	case VmCap::ioEventFd:
		return extension(KVM_CAP_IOEVENTFD);
	case VmCap::irqFd:
		return extension(KVM_CAP_IRQFD);
	case VmCap::protectedVm:
		return false;
	}
	return false;
}

Result<std::unique_ptr<Vm>> KvmHypervisor::createVm(const VmConfig &config) {
	if(config.kind != HypervisorKind::kvm)
		return makeError(ErrorKind::unsupported, static_cast<uint32_t>(config.kind), "createVm");
	if(config.protection != Protection::none)
		return makeError(ErrorKind::unsupported, 0, "createVm");
	if(!config.vcpuCount)
		return makeError(ErrorKind::illegalArgs, 0, "createVm");
	if(config.vcpuCount > maxVcpus_)
		return makeError(ErrorKind::resourceExhausted, config.vcpuCount, "createVm");

	int fd;
	do {
		fd = ioctl(device_.get(), KVM_CREATE_VM, 0);
	} while(fd < 0 && errno == EINTR);
	if(fd < 0)
		return backendFailure("KVM_CREATE_VM", errno);

	auto vm = std::make_unique<KvmVm>(this, UniqueFd{fd}, config);
	if(auto outcome = vm->initialize(); !outcome)
		return std::unexpected{outcome.error()};
	return vm;
}

} // namespace hv::kvm
