#pragma once

#include <stdint.h>
#include <linux/kvm.h>
#include <pthread.h>
#include <functional>
#include <mutex>
#include <queue>
#include <shared_mutex>
#include <vector>

#include <hv/descriptor.hpp>
#include <hv/hypervisor.hpp>
#include <hv/irq.hpp>
#include <hv/mapping.hpp>
#include <hv/memory.hpp>
#include <hv/vcpu.hpp>
#include <hv/vm.hpp>

namespace hv::kvm {

constexpr int apiVersion = 12;

// Fixed addresses below 4 GiB that KVM needs on Intel hosts.
constexpr uint64_t tssAddress = 0xFFFB'D000;
constexpr uint64_t identityMapAddress = 0xFFFB'C000;

constexpr uint32_t vmStateVersion = 1;
constexpr uint32_t vcpuStateVersion = 1;

// Real-time signal that kicks vCPU threads out of KVM_RUN.
int kickSignal();

struct KvmHypervisor final : Hypervisor {
	static Result<std::unique_ptr<KvmHypervisor>> open(const char *path);

	explicit KvmHypervisor(UniqueFd device);

	HypervisorKind kind() const override { return HypervisorKind::kvm; }

	uint32_t maxVcpus() const override { return maxVcpus_; }

	uint32_t maxMemorySlots() const override { return maxSlots_; }

	bool checkCapability(VmCap cap) const override;

	Result<std::unique_ptr<Vm>> createVm(const VmConfig &config) override;

	// KVM_CHECK_EXTENSION on the device; 0 if absent.
	int extension(long cap) const;

	size_t runSize() const { return runSize_; }

	const std::vector<kvm_cpuid_entry2> &supportedCpuid() const { return cpuid_; }

private:
	Result<> probe();

	UniqueFd device_;
	size_t runSize_ = 0;
	uint32_t maxVcpus_ = 0;
	uint32_t maxSlots_ = 0;
	std::vector<kvm_cpuid_entry2> cpuid_;
};

struct KvmVm final : Vm {
	KvmVm(const KvmHypervisor *hypervisor, UniqueFd fd, VmConfig config);

	Result<> initialize();

	HypervisorKind kind() const override { return HypervisorKind::kvm; }

	const VmConfig &config() const override { return config_; }

	bool checkCapability(VmCap cap) const override;

	Result<std::unique_ptr<Vcpu>> createVcpu(VcpuId id) override;

	Result<SlotId> addMemoryRegion(MemoryRegion region) override;
	Result<MemoryRegion> removeMemoryRegion(SlotId slot) override;
	std::vector<SlotInfo> memoryRegions() const override;

	Result<DirtyBitmap> getDirtyLog(SlotId slot) override;
	Result<> mergeDirtyLog(SlotId slot, const DirtyBitmap &bitmap) override;

	Result<> setIrqRouting(std::span<const IrqRoute> routes) override;
	std::vector<IrqRoute> irqRouting() const override;

	Result<> injectIrq(Gsi gsi, bool level) override;
	Result<> signalMsi(uint64_t address, uint32_t data) override;

	Result<> registerIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) override;
	Result<> unregisterIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) override;

	Result<> registerIrqFd(Gsi gsi, int eventFd, int resampleFd) override;
	Result<> unregisterIrqFd(Gsi gsi, int eventFd) override;

	Result<VmSnapshot> snapshot() override;
	Result<> checkRestore(const VmSnapshot &snapshot) const override;
	Result<> restore(const VmSnapshot &snapshot) override;

	const KvmHypervisor &hypervisor() const { return *hypervisor_; }

private:
	Result<> checkRestoreLocked(const VmSnapshot &snapshot) const;

	// Installs a table into KVM. Caller holds the topology lock exclusively.
	Result<> pushRouting(const RoutingTable &table);

	Result<> setMemorySlot(uint32_t nativeSlot, uint32_t flags, GuestAddress address,
			uint64_t size, void *host);

	Result<> ioEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch, bool deassign);

	uint32_t allocateNativeSlot();
	void freeNativeSlot(uint32_t slot);

	const KvmHypervisor *hypervisor_;
	UniqueFd fd_;
	VmConfig config_;

	// Guards slots_ and the routing table pointer of router_.
	mutable std::shared_mutex topologyMutex_;
	SlotTable slots_;
	IrqRouter router_;

	// KVM slot numbers are reused; the lowest free one is handed out first.
	std::priority_queue<uint32_t, std::vector<uint32_t>, std::greater<uint32_t>> freeNativeSlots_;
	uint32_t nextNativeSlot_ = 0;

	std::mutex vcpuMutex_;
	std::vector<bool> vcpuCreated_;
};

struct KvmVcpu final : Vcpu {
	KvmVcpu(KvmVm *vm, VcpuId id, UniqueFd fd, HostMapping run);

	VcpuId id() const override { return id_; }

	RunState state() const override { return tracker_.load(); }

	Result<VcpuExit> run() override;

	Result<> completeRead(std::span<const uint8_t> data) override;

	Result<GeneralRegs> getRegs() override;
	Result<> setRegs(const GeneralRegs &regs) override;

	Result<SpecialRegs> getSregs() override;
	Result<> setSregs(const SpecialRegs &sregs) override;

	Result<FpuRegs> getFpu() override;
	Result<> setFpu(const FpuRegs &fpu) override;

	Result<DebugRegs> getDebugRegs() override;
	Result<> setDebugRegs(const DebugRegs &regs) override;

	Result<> requestInterruptWindow() override;

	bool readyForInterrupt() override;

	Result<> injectNmi() override;

	void setImmediateExit(bool exit) override;

	void requestStop() override;

	Result<> debugAttach() override;
	Result<> debugDetach() override;

	Result<VcpuSnapshot> snapshot() override;
	Result<> checkRestore(const VcpuSnapshot &snapshot) const override;
	Result<> restore(const VcpuSnapshot &snapshot) override;

	Result<> setCpuid(const std::vector<kvm_cpuid_entry2> &entries);

private:
	enum class PendingRead {
		none,
		port,
		mmio
	};

	VcpuExit decodeExit();

	Result<> setGuestDebug(uint32_t control);

	bool hasDebugRegs() const;

	KvmVm *vm_;
	VcpuId id_;
	UniqueFd fd_;
	HostMapping runMapping_;
	kvm_run *run_;
	RunStateTracker tracker_;

	PendingRead pendingRead_ = PendingRead::none;
	uint32_t pendingSize_ = 0;

	// The thread inside KVM_RUN, if any.
	std::mutex kickMutex_;
	bool inRun_ = false;
	pthread_t thread_{};
};

} // namespace hv::kvm
