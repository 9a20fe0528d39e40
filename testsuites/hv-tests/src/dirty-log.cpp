#include <assert.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <vector>

#include <hv/sim.hpp>

#include "testsuite.hpp"

namespace actions = hv::sim::actions;

namespace {

constexpr hv::GuestAddress logBase = 0x100000;
constexpr uint64_t logPages = 16;

// Writes one byte into each page in turn, then halts.
hv::sim::GuestProgram touchPages(std::vector<uint64_t> pages) {
	size_t n = 0;
	return [pages, n] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		if(n == pages.size())
			return actions::Halt{};
		return actions::MmioWrite{logBase + pages[n++] * hv::kPageSize + 0x10, 1, 0xCC};
	};
}

uint64_t readCounter(int fd) {
	uint64_t value = 0;
	if(read(fd, &value, sizeof(value)) != sizeof(value))
		return 0;
	return value;
}

bool counterPending(int fd) {
	pollfd pfd{fd, POLLIN, 0};
	return poll(&pfd, 1, 0) == 1;
}

} // anonymous namespace

DEFINE_TEST(dirty_log_reports_written_pages, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto slot = vm.addMemoryRegion(make_region(logBase, logPages * hv::kPageSize, true));
	assert(slot);

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu, touchPages({1, 5, 7, 8})));
	auto exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));

	auto log = vm.getDirtyLog(*slot);
	assert(log);
	assert(log->pages() == logPages);
	for(uint64_t page : {1, 5, 7, 8})
		assert(log->test(page));

	// Reading the log clears it.
	auto second = vm.getDirtyLog(*slot);
	assert(second);
	assert(!second->count());
}))

DEFINE_TEST(dirty_log_multi_page_write, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto slot = vm.addMemoryRegion(make_region(logBase, logPages * hv::kPageSize, true));
	assert(slot);

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		// An 8-byte write across the boundary of pages 2 and 3.
		if(step++ == 0)
			return actions::MmioWrite{logBase + 3 * hv::kPageSize - 4, 8, ~uint64_t{0}};
		return actions::Halt{};
	}));
	assert((*vcpu)->run());

	auto log = vm.getDirtyLog(*slot);
	assert(log);
	assert(log->test(2) && log->test(3));
}))

DEFINE_TEST(dirty_log_errors, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto plain = vm.addMemoryRegion(make_region(0, 0x4000));
	assert(plain);
	auto logged = vm.addMemoryRegion(make_region(logBase, logPages * hv::kPageSize, true));
	assert(logged);

	assert_error(vm.getDirtyLog(*plain), hv::ErrorKind::loggingDisabled);
	assert_error(vm.getDirtyLog(1234), hv::ErrorKind::notFound);
	assert_error(vm.mergeDirtyLog(*plain, hv::DirtyBitmap{4}), hv::ErrorKind::loggingDisabled);
	assert_error(vm.mergeDirtyLog(*logged, hv::DirtyBitmap{logPages + 1}),
			hv::ErrorKind::illegalArgs);
}))

DEFINE_TEST(dirty_log_merge, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto slot = vm.addMemoryRegion(make_region(logBase, logPages * hv::kPageSize, true));
	assert(slot);

	hv::DirtyBitmap saved{logPages};
	saved.set(0);
	saved.set(15);
	assert(vm.mergeDirtyLog(*slot, saved));

	auto log = vm.getDirtyLog(*slot);
	assert(log);
	assert(log->covers(saved));
	assert(log->count() == 2);
}))

DEFINE_TEST(dirty_log_read_only_slot, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto rom = vm.addMemoryRegion(make_region(0xF0000, 0x10000, false, true));
	assert(rom);

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		switch(step++) {
		case 0: return actions::MmioRead{0xF0000, 4};
		case 1: return actions::MmioWrite{0xF0000, 4, 0xDEADBEEF};
		default: return actions::Halt{};
		}
	}));

	// Reads are served from the slot, writes exit.
	auto exit = (*vcpu)->run();
	assert(exit);
	auto write = std::get_if<hv::exits::MmioWrite>(&*exit);
	assert(write && write->address == 0xF0000 && write->size == 4);
	assert(write->data[0] == 0xEF);

	auto region = vm.removeMemoryRegion(*rom);
	assert(region);
	assert(region->mapping.bytes()[0] == 0);
}))

DEFINE_TEST(ioevent_signals_eventfd, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	int fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
	assert(fd >= 0);

	hv::IoEventAddress doorbell{hv::IoEventAddress::Space::pio, 0x510, 2};
	assert(vm.registerIoEvent(fd, doorbell, std::nullopt));
	assert_error(vm.registerIoEvent(fd, doorbell, std::nullopt), hv::ErrorKind::overlap);
	assert_error(vm.registerIoEvent(fd, hv::IoEventAddress{hv::IoEventAddress::Space::pio, 0x511, 0},
			std::nullopt), hv::ErrorKind::illegalArgs);
	assert_error(vm.registerIoEvent(-1, hv::IoEventAddress{hv::IoEventAddress::Space::mmio,
			0xD0000000, 4}, std::nullopt), hv::ErrorKind::illegalArgs);

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		switch(step++) {
		case 0: return actions::PortOut{0x510, 2, 7};
		case 1: return actions::Halt{};
		default: return actions::PortOut{0x510, 2, 7};
		}
	}));

	// The write is consumed by the eventfd without an exit.
	auto exit = (*vcpu)->run();
	assert(exit && std::holds_alternative<hv::exits::Hlt>(*exit));
	assert(counterPending(fd));
	assert(readCounter(fd) == 1);

	assert(vm.unregisterIoEvent(fd, doorbell, std::nullopt));
	assert_error(vm.unregisterIoEvent(fd, doorbell, std::nullopt), hv::ErrorKind::notFound);

	exit = (*vcpu)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x510);
	assert(!counterPending(fd));

	close(fd);
}))

DEFINE_TEST(ioevent_datamatch, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	int fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
	assert(fd >= 0);
	hv::IoEventAddress notify{hv::IoEventAddress::Space::mmio, 0xD0000000, 4};
	assert(vm.registerIoEvent(fd, notify, 3));

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu,
			[step] (hv::sim::GuestContext &) mutable -> hv::sim::GuestAction {
		switch(step++) {
		case 0: return actions::MmioWrite{0xD0000000, 4, 3};
		default: return actions::MmioWrite{0xD0000000, 4, 4};
		}
	}));

	// Only the non-matching value exits.
	auto exit = (*vcpu)->run();
	assert(exit);
	auto write = std::get_if<hv::exits::MmioWrite>(&*exit);
	assert(write && write->data[0] == 4);
	assert(readCounter(fd) == 1);

	close(fd);
}))

DEFINE_TEST(irqfd_unsupported, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	assert(!vm.checkCapability(hv::VmCap::irqFd));

	int fd = eventfd(0, EFD_CLOEXEC);
	assert(fd >= 0);
	assert_error(vm.registerIrqFd(4, fd, -1), hv::ErrorKind::unsupported);
	assert_error(vm.unregisterIrqFd(4, fd), hv::ErrorKind::unsupported);
	close(fd);
}))
