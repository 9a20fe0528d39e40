#include <errno.h>
#include <string.h>
#include <sys/ioctl.h>
#include <iostream>

#include "kvm.hpp"

namespace hv::kvm {

namespace {

constexpr bool logMemory = false;

constexpr uint32_t irqchipCount = 3;

// Layout of the opaque VM state.
struct SavedVmState {
	kvm_clock_data clock;
	kvm_irqchip chips[irqchipCount];
};

} // anonymous namespace

KvmVm::KvmVm(const KvmHypervisor *hypervisor, UniqueFd fd, VmConfig config)
: hypervisor_{hypervisor}, fd_{std::move(fd)}, config_{config},
		slots_{hypervisor->maxMemorySlots()}, router_{IrqChipLayout{}},
		vcpuCreated_(config.vcpuCount, false) { }

Result<> KvmVm::initialize() {
	if(ioctl(fd_.get(), KVM_SET_TSS_ADDR, tssAddress))
		return backendFailure("KVM_SET_TSS_ADDR", errno);

	if(hypervisor_->extension(KVM_CAP_SET_IDENTITY_MAP_ADDR)) {
		uint64_t address = identityMapAddress;
		if(ioctl(fd_.get(), KVM_SET_IDENTITY_MAP_ADDR, &address))
			return backendFailure("KVM_SET_IDENTITY_MAP_ADDR", errno);
	}

	if(ioctl(fd_.get(), KVM_CREATE_IRQCHIP, 0))
		return backendFailure("KVM_CREATE_IRQCHIP", errno);

	auto routes = defaultX86Routing(router_.layout());
	if(auto outcome = setIrqRouting(routes); !outcome)
		return outcome;

	if(config_.memorySize) {
		auto mapping = HostMapping::allocateAnonymous(config_.memorySize);
		if(!mapping)
			return std::unexpected{mapping.error()};
		MemoryRegion ram;
		ram.guestAddress = 0;
		ram.size = config_.memorySize;
		ram.mapping = std::move(*mapping);
		if(auto slot = addMemoryRegion(std::move(ram)); !slot)
			return std::unexpected{slot.error()};
	}
	return {};
}

bool KvmVm::checkCapability(VmCap cap) const {
	return hypervisor_->checkCapability(cap);
}

Result<std::unique_ptr<Vcpu>> KvmVm::createVcpu(VcpuId id) {
	std::lock_guard lock{vcpuMutex_};
	if(id >= config_.vcpuCount || vcpuCreated_[id])
		return makeError(ErrorKind::resourceExhausted, id, "createVcpu");

	int fd = ioctl(fd_.get(), KVM_CREATE_VCPU, static_cast<unsigned long>(id));
	if(fd < 0)
		return backendFailure("KVM_CREATE_VCPU", errno, id);
	UniqueFd vcpuFd{fd};
	// KVM keeps the native vCPU alive with the VM; the ID is gone for good.
	vcpuCreated_[id] = true;

	auto run = HostMapping::mapFile(vcpuFd.get(), 0, hypervisor_->runSize(), true);
	if(!run)
		return std::unexpected{run.error()};

	auto vcpu = std::make_unique<KvmVcpu>(this, id, std::move(vcpuFd), std::move(*run));
	if(auto outcome = vcpu->setCpuid(hypervisor_->supportedCpuid()); !outcome)
		return std::unexpected{outcome.error()};
	return vcpu;
}

// ----------------------------------------------------------------------------
// Memory.
// ----------------------------------------------------------------------------

uint32_t KvmVm::allocateNativeSlot() {
	if(freeNativeSlots_.empty())
		return nextNativeSlot_++;
	auto slot = freeNativeSlots_.top();
	freeNativeSlots_.pop();
	return slot;
}

void KvmVm::freeNativeSlot(uint32_t slot) {
	freeNativeSlots_.push(slot);
}

Result<> KvmVm::setMemorySlot(uint32_t nativeSlot, uint32_t flags, GuestAddress address,
		uint64_t size, void *host) {
	kvm_userspace_memory_region region{};
	region.slot = nativeSlot;
	region.flags = flags;
	region.guest_phys_addr = address;
	region.memory_size = size;
	region.userspace_addr = reinterpret_cast<uintptr_t>(host);
	if(ioctl(fd_.get(), KVM_SET_USER_MEMORY_REGION, &region))
		return backendFailure("KVM_SET_USER_MEMORY_REGION", errno, address);
	return {};
}

Result<SlotId> KvmVm::addMemoryRegion(MemoryRegion region) {
	if(region.readOnly && !hypervisor_->extension(KVM_CAP_READONLY_MEM))
		return makeError(ErrorKind::unsupported, region.guestAddress, "addMemoryRegion");

	std::unique_lock lock{topologyMutex_};
	if(auto outcome = slots_.checkInsert(region); !outcome)
		return std::unexpected{outcome.error()};

	uint32_t flags = 0;
	if(region.logDirty)
		flags |= KVM_MEM_LOG_DIRTY_PAGES;
	if(region.readOnly)
		flags |= KVM_MEM_READONLY;

	auto nativeSlot = allocateNativeSlot();
	if(auto outcome = setMemorySlot(nativeSlot, flags, region.guestAddress, region.size,
			region.mapping.data()); !outcome) {
		freeNativeSlot(nativeSlot);
		return std::unexpected{outcome.error()};
	}

	if(logMemory)
		std::cout << "hv/kvm: Slot " << nativeSlot << " maps 0x" << std::hex
				<< region.guestAddress << " + 0x" << region.size << std::dec << std::endl;
	return slots_.insert(std::move(region), nativeSlot);
}

Result<MemoryRegion> KvmVm::removeMemoryRegion(SlotId slot) {
	std::unique_lock lock{topologyMutex_};
	auto entry = slots_.find(slot);
	if(!entry)
		return makeError(ErrorKind::notFound, slot, "removeMemoryRegion");

	// A zero size deletes the native slot.
	if(auto outcome = setMemorySlot(entry->nativeSlot, 0, entry->region.guestAddress, 0, nullptr);
			!outcome)
		return std::unexpected{outcome.error()};

	auto removed = slots_.remove(slot);
	if(!removed)
		return std::unexpected{removed.error()};
	freeNativeSlot(removed->nativeSlot);
	return std::move(removed->region);
}

std::vector<SlotInfo> KvmVm::memoryRegions() const {
	std::shared_lock lock{topologyMutex_};
	return slots_.list();
}

Result<DirtyBitmap> KvmVm::getDirtyLog(SlotId slot) {
	std::shared_lock lock{topologyMutex_};
	auto entry = slots_.find(slot);
	if(!entry)
		return makeError(ErrorKind::notFound, slot, "getDirtyLog");
	if(!entry->dirty)
		return makeError(ErrorKind::loggingDisabled, slot, "getDirtyLog");

	DirtyBitmap bitmap{entry->dirty->pages()};
	kvm_dirty_log log{};
	log.slot = entry->nativeSlot;
	log.dirty_bitmap = bitmap.words().data();
	if(ioctl(fd_.get(), KVM_GET_DIRTY_LOG, &log))
		return backendFailure("KVM_GET_DIRTY_LOG", errno, slot);

	// Pages merged back by a snapshot or restore.
	bitmap |= entry->dirty->drain();
	return bitmap;
}

Result<> KvmVm::mergeDirtyLog(SlotId slot, const DirtyBitmap &bitmap) {
	std::shared_lock lock{topologyMutex_};
	auto entry = slots_.find(slot);
	if(!entry)
		return makeError(ErrorKind::notFound, slot, "mergeDirtyLog");
	if(!entry->dirty)
		return makeError(ErrorKind::loggingDisabled, slot, "mergeDirtyLog");
	if(bitmap.pages() != entry->dirty->pages())
		return makeError(ErrorKind::illegalArgs, slot, "mergeDirtyLog");
	entry->dirty->merge(bitmap);
	return {};
}

// ----------------------------------------------------------------------------
// Interrupts.
// ----------------------------------------------------------------------------

Result<> KvmVm::pushRouting(const RoutingTable &table) {
	auto &entries = table.entries();
	std::vector<uint8_t> buffer(sizeof(kvm_irq_routing)
			+ entries.size() * sizeof(kvm_irq_routing_entry));
	auto routing = reinterpret_cast<kvm_irq_routing *>(buffer.data());
	routing->nr = entries.size();

	size_t n = 0;
	for(auto &[gsi, source] : entries) {
		auto &entry = routing->entries[n++];
		entry.gsi = gsi;
		if(auto pin = std::get_if<IrqchipPin>(&source)) {
			entry.type = KVM_IRQ_ROUTING_IRQCHIP;
			entry.u.irqchip.irqchip = static_cast<uint32_t>(pin->chip);
			entry.u.irqchip.pin = pin->pin;
		}else{
			auto &msi = std::get<MsiMessage>(source);
			entry.type = KVM_IRQ_ROUTING_MSI;
			entry.u.msi.address_lo = msi.address & 0xFFFF'FFFF;
			entry.u.msi.address_hi = msi.address >> 32;
			entry.u.msi.data = msi.data;
		}
	}

	if(ioctl(fd_.get(), KVM_SET_GSI_ROUTING, routing))
		return backendFailure("KVM_SET_GSI_ROUTING", errno, table.version());
	return {};
}

Result<> KvmVm::setIrqRouting(std::span<const IrqRoute> routes) {
	std::unique_lock lock{topologyMutex_};
	auto table = router_.prepare(routes);
	if(!table)
		return std::unexpected{table.error()};
	if(auto outcome = pushRouting(**table); !outcome)
		return outcome;
	router_.publish(std::move(*table));
	return {};
}

std::vector<IrqRoute> KvmVm::irqRouting() const {
	std::shared_lock lock{topologyMutex_};
	return router_.current()->routes();
}

Result<> KvmVm::injectIrq(Gsi gsi, bool level) {
	std::shared_lock lock{topologyMutex_};
	if(!router_.current()->lookup(gsi))
		return makeError(ErrorKind::invalidRoute, gsi, "injectIrq");

	kvm_irq_level line{};
	line.irq = gsi;
	line.level = level;
	if(ioctl(fd_.get(), KVM_IRQ_LINE, &line))
		return backendFailure("KVM_IRQ_LINE", errno, gsi);
	router_.setLevel(gsi, level);
	return {};
}

Result<> KvmVm::signalMsi(uint64_t address, uint32_t data) {
	if((address & 0xFFF0'0000) != 0xFEE0'0000)
		return makeError(ErrorKind::invalidRoute, address, "signalMsi");

	kvm_msi msi{};
	msi.address_lo = address & 0xFFFF'FFFF;
	msi.address_hi = address >> 32;
	msi.data = data;
	// Zero means the guest blocked the message; delivery is best-effort.
	if(ioctl(fd_.get(), KVM_SIGNAL_MSI, &msi) < 0)
		return backendFailure("KVM_SIGNAL_MSI", errno, address);
	return {};
}

// ----------------------------------------------------------------------------
// ioevents and irqfds.
// ----------------------------------------------------------------------------

Result<> KvmVm::ioEvent(int eventFd, IoEventAddress address,
		std::optional<uint64_t> datamatch, bool deassign) {
	if(!hypervisor_->extension(KVM_CAP_IOEVENTFD))
		return makeError(ErrorKind::unsupported, address.address, "KVM_IOEVENTFD");

	kvm_ioeventfd event{};
	event.addr = address.address;
	event.len = address.length;
	event.fd = eventFd;
	if(address.space == IoEventAddress::Space::pio)
		event.flags |= KVM_IOEVENTFD_FLAG_PIO;
	if(datamatch) {
		event.flags |= KVM_IOEVENTFD_FLAG_DATAMATCH;
		event.datamatch = *datamatch;
	}
	if(deassign)
		event.flags |= KVM_IOEVENTFD_FLAG_DEASSIGN;

	if(ioctl(fd_.get(), KVM_IOEVENTFD, &event)) {
		int error = errno;
		if(deassign && error == ENOENT)
			return makeError(ErrorKind::notFound, address.address, "KVM_IOEVENTFD");
		if(!deassign && error == EEXIST)
			return makeError(ErrorKind::overlap, address.address, "KVM_IOEVENTFD");
		return backendFailure("KVM_IOEVENTFD", error, address.address);
	}
	return {};
}

Result<> KvmVm::registerIoEvent(int eventFd, IoEventAddress address,
		std::optional<uint64_t> datamatch) {
	return ioEvent(eventFd, address, datamatch, false);
}

Result<> KvmVm::unregisterIoEvent(int eventFd, IoEventAddress address,
		std::optional<uint64_t> datamatch) {
	return ioEvent(eventFd, address, datamatch, true);
}

Result<> KvmVm::registerIrqFd(Gsi gsi, int eventFd, int resampleFd) {
	if(!hypervisor_->extension(KVM_CAP_IRQFD))
		return makeError(ErrorKind::unsupported, gsi, "KVM_IRQFD");
	if(resampleFd >= 0 && !hypervisor_->extension(KVM_CAP_IRQFD_RESAMPLE))
		return makeError(ErrorKind::unsupported, gsi, "KVM_IRQFD");

	kvm_irqfd irqfd{};
	irqfd.fd = eventFd;
	irqfd.gsi = gsi;
	if(resampleFd >= 0) {
		irqfd.flags = KVM_IRQFD_FLAG_RESAMPLE;
		irqfd.resamplefd = resampleFd;
	}
	if(ioctl(fd_.get(), KVM_IRQFD, &irqfd))
		return backendFailure("KVM_IRQFD", errno, gsi);
	return {};
}

Result<> KvmVm::unregisterIrqFd(Gsi gsi, int eventFd) {
	if(!hypervisor_->extension(KVM_CAP_IRQFD))
		return makeError(ErrorKind::unsupported, gsi, "KVM_IRQFD");

	kvm_irqfd irqfd{};
	irqfd.fd = eventFd;
	irqfd.gsi = gsi;
	irqfd.flags = KVM_IRQFD_FLAG_DEASSIGN;
	if(ioctl(fd_.get(), KVM_IRQFD, &irqfd))
		return backendFailure("KVM_IRQFD", errno, gsi);
	return {};
}

// ----------------------------------------------------------------------------
// Snapshot.
// ----------------------------------------------------------------------------

Result<VmSnapshot> KvmVm::snapshot() {
	std::shared_lock lock{topologyMutex_};

	SavedVmState saved;
	memset(&saved, 0, sizeof(SavedVmState));
	if(ioctl(fd_.get(), KVM_GET_CLOCK, &saved.clock))
		return backendFailure("KVM_GET_CLOCK", errno);
	for(uint32_t chip = 0; chip < irqchipCount; ++chip) {
		saved.chips[chip].chip_id = chip;
		if(ioctl(fd_.get(), KVM_GET_IRQCHIP, &saved.chips[chip]))
			return backendFailure("KVM_GET_IRQCHIP", errno, chip);
	}

	VmSnapshot snapshot;
	snapshot.vcpuCount = config_.vcpuCount;
	snapshot.memorySize = config_.memorySize;
	snapshot.regions = slots_.list();
	snapshot.routes = router_.current()->routes();
	snapshot.assertedLines = router_.assertedLines();
	snapshot.nextSlotId = slots_.nextId();
	snapshot.backendState.backend = HypervisorKind::kvm;
	snapshot.backendState.version = vmStateVersion;
	auto bytes = reinterpret_cast<const uint8_t *>(&saved);
	snapshot.backendState.data.assign(bytes, bytes + sizeof(SavedVmState));
	return snapshot;
}

Result<> KvmVm::checkRestore(const VmSnapshot &snapshot) const {
	std::shared_lock lock{topologyMutex_};
	return checkRestoreLocked(snapshot);
}

Result<> KvmVm::checkRestoreLocked(const VmSnapshot &snapshot) const {
	if(auto outcome = checkOpaque(snapshot.backendState, HypervisorKind::kvm, vmStateVersion);
			!outcome)
		return outcome;
	if(snapshot.backendState.data.size() != sizeof(SavedVmState))
		return makeError(ErrorKind::incompatibleSnapshot, 0, "restore");

	if(snapshot.vcpuCount != config_.vcpuCount)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.vcpuCount, "restore");
	if(snapshot.memorySize != config_.memorySize)
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.memorySize, "restore");

	auto current = slots_.list();
	if(current.size() != snapshot.regions.size())
		return makeError(ErrorKind::incompatibleSnapshot, snapshot.regions.size(), "restore");
	for(size_t i = 0; i < current.size(); ++i) {
		auto &ours = current[i];
		auto &theirs = snapshot.regions[i];
		if(ours.guestAddress != theirs.guestAddress || ours.size != theirs.size
				|| ours.readOnly != theirs.readOnly
				|| ours.dirtyLogEnabled != theirs.dirtyLogEnabled)
			return makeError(ErrorKind::incompatibleSnapshot, theirs.guestAddress, "restore");
	}

	if(auto table = router_.prepare(snapshot.routes); !table)
		return makeError(ErrorKind::incompatibleSnapshot, table.error().subject, "restore");
	return {};
}

Result<> KvmVm::restore(const VmSnapshot &snapshot) {
	std::unique_lock lock{topologyMutex_};
	if(auto outcome = checkRestoreLocked(snapshot); !outcome)
		return outcome;

	SavedVmState saved;
	memcpy(&saved, snapshot.backendState.data.data(), sizeof(SavedVmState));

	auto table = router_.prepare(snapshot.routes);
	if(!table)
		return makeError(ErrorKind::incompatibleSnapshot, table.error().subject, "restore");

	for(uint32_t chip = 0; chip < irqchipCount; ++chip) {
		if(ioctl(fd_.get(), KVM_SET_IRQCHIP, &saved.chips[chip]))
			return backendFailure("KVM_SET_IRQCHIP", errno, chip);
	}

	// Only the clock value itself can be set.
	saved.clock.flags = 0;
	if(ioctl(fd_.get(), KVM_SET_CLOCK, &saved.clock))
		return backendFailure("KVM_SET_CLOCK", errno);

	if(auto outcome = pushRouting(**table); !outcome)
		return outcome;
	router_.publish(std::move(*table));

	router_.restoreLevels(snapshot.assertedLines);
	for(auto gsi : snapshot.assertedLines) {
		kvm_irq_level line{};
		line.irq = gsi;
		line.level = 1;
		if(ioctl(fd_.get(), KVM_IRQ_LINE, &line))
			return backendFailure("KVM_IRQ_LINE", errno, gsi);
	}

	slots_.advanceNextId(snapshot.nextSlotId);
	return {};
}

} // namespace hv::kvm
