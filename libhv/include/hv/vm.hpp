#pragma once

#include <stdint.h>
#include <memory>
#include <optional>
#include <span>
#include <vector>

#include <hv/error.hpp>
#include <hv/irq.hpp>
#include <hv/memory.hpp>
#include <hv/snapshot.hpp>
#include <hv/types.hpp>
#include <hv/vcpu.hpp>

namespace hv {

struct IoEventAddress {
	enum class Space {
		pio,
		mmio
	};

	Space space;
	uint64_t address;
	// Access width in bytes; 0 matches any width (MMIO only).
	uint32_t length;

	bool operator== (const IoEventAddress &) const = default;
};

// One guest: its physical address space, its interrupt routing and the
// factory for its vCPUs.
//
// The slot table and the routing table are shared by every vCPU thread.
// Mutations (region add/remove, routing replacement, restore) hold the
// topology lock exclusively for the update itself; queries and injection
// hold it shared.
struct Vm {
	virtual ~Vm() = default;

	virtual HypervisorKind kind() const = 0;

	virtual const VmConfig &config() const = 0;

	virtual bool checkCapability(VmCap cap) const = 0;

	virtual Result<std::unique_ptr<Vcpu>> createVcpu(VcpuId id) = 0;

	// The region is visible to every vCPU when this returns.
	virtual Result<SlotId> addMemoryRegion(MemoryRegion region) = 0;

	// Hands the region back to the caller.
	//
	// Precondition: no vCPU executes guest code that may access the region.
	// The caller is responsible for pausing or otherwise synchronizing its
	// vCPUs; this is not checked. Violating it lets the guest access host
	// memory that may be reused after the caller unmaps it.
	virtual Result<MemoryRegion> removeMemoryRegion(SlotId slot) = 0;

	// Installed slots in guest address order.
	virtual std::vector<SlotInfo> memoryRegions() const = 0;

	// Pages written since the previous call for this slot (read and clear).
	// May over-report; never under-reports.
	virtual Result<DirtyBitmap> getDirtyLog(SlotId slot) = 0;

	// Adds pages to the log that the next getDirtyLog() reports.
	virtual Result<> mergeDirtyLog(SlotId slot, const DirtyBitmap &bitmap) = 0;

	// Replaces the whole routing table; the previous table stays in effect on failure.
	virtual Result<> setIrqRouting(std::span<const IrqRoute> routes) = 0;

	virtual std::vector<IrqRoute> irqRouting() const = 0;

	// Sets the level of a GSI. Edge sources pulse by asserting and deasserting.
	virtual Result<> injectIrq(Gsi gsi, bool level) = 0;

	virtual Result<> signalMsi(uint64_t address, uint32_t data) = 0;

	virtual Result<> registerIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) = 0;
	virtual Result<> unregisterIoEvent(int eventFd, IoEventAddress address,
			std::optional<uint64_t> datamatch) = 0;

	// resampleFd may be -1; otherwise the GSI is treated as level-triggered
	// and resampleFd is signalled when the guest acknowledges it.
	virtual Result<> registerIrqFd(Gsi gsi, int eventFd, int resampleFd) = 0;
	virtual Result<> unregisterIrqFd(Gsi gsi, int eventFd) = 0;

	virtual Result<VmSnapshot> snapshot() = 0;
	virtual Result<> checkRestore(const VmSnapshot &snapshot) const = 0;
	// Validation failures leave the VM untouched. After a backend failure the
	// VM is partially restored: the interrupt controller and clock are written
	// before the routing table, which is published only once it is accepted.
	virtual Result<> restore(const VmSnapshot &snapshot) = 0;
};

} // namespace hv
