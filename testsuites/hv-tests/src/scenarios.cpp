#include <assert.h>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

#include <hv/sim.hpp>

#include "testsuite.hpp"

namespace actions = hv::sim::actions;

// vCPU 0 does port I/O and takes an interrupt while vCPU 1 idles on
// another thread until it is cancelled.
DEFINE_TEST(scenario_two_vcpus, ([] {
	auto machine = make_sim_machine(2);
	auto &vm = *machine.vm;

	auto ram = vm.addMemoryRegion(make_region(0, 0x10000));
	assert(ram);

	std::vector<hv::IrqRoute> routes{{4, hv::IrqchipPin{hv::IrqChip::ioapic, 4}}};
	assert(vm.setIrqRouting(routes));

	auto vcpu0 = vm.createVcpu(0);
	auto vcpu1 = vm.createVcpu(1);
	assert(vcpu0 && vcpu1);

	int step = 0;
	assert(hv::sim::loadGuestProgram(**vcpu0,
			[step] (hv::sim::GuestContext &ctx) mutable -> hv::sim::GuestAction {
		switch(step++) {
		case 0:
			ctx.regs().rflags |= hv::kRflagsInterrupt;
			return actions::PortOut{0x3F8, 1, 'A'};
		default:
			if(auto vector = ctx.acknowledgeInterrupt())
				return actions::PortOut{0x80, 1, *vector};
			return actions::WaitForInterrupt{};
		}
	}));
	assert(hv::sim::loadGuestProgram(**vcpu1, [] (hv::sim::GuestContext &) -> hv::sim::GuestAction {
		return actions::WaitForInterrupt{};
	}));

	std::optional<hv::Result<hv::VcpuExit>> blocked;
	std::thread runner{[&] {
		blocked = (*vcpu1)->run();
	}};

	auto exit = (*vcpu0)->run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x3F8 && out->data == std::vector<uint8_t>{'A'});

	assert(vm.injectIrq(4, true));
	assert(vm.injectIrq(4, false));
	exit = (*vcpu0)->run();
	assert(exit);
	out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out && out->port == 0x80 && out->data == std::vector<uint8_t>{0x34});

	while((*vcpu1)->state() != hv::RunState::running)
		std::this_thread::sleep_for(std::chrono::milliseconds(1));
	(*vcpu1)->setImmediateExit(true);
	runner.join();

	assert(blocked && *blocked);
	assert(std::holds_alternative<hv::exits::ImmediateExit>(**blocked));
	assert((*vcpu1)->state() == hv::RunState::exited);
}))

DEFINE_TEST(scenario_duplicate_region, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	auto first = vm.addMemoryRegion(make_region(0x100000, 0x10000, true));
	assert(first);
	assert_error(vm.addMemoryRegion(make_region(0x100000, 0x10000, true)),
			hv::ErrorKind::overlap);

	auto regions = vm.memoryRegions();
	assert(regions.size() == 1);
	assert(regions[0].id == *first);

	auto log = vm.getDirtyLog(*first);
	assert(log);
	assert(log->pages() == 0x10);
	assert(!log->count());
}))
