#include <assert.h>
#include <vector>

#include <hv/irq.hpp>
#include <hv/sim.hpp>

#include "testsuite.hpp"

namespace {

// Reports every acknowledged vector on port 0x80.
hv::sim::GuestAction reportVectors(hv::sim::GuestContext &ctx) {
	if(auto vector = ctx.acknowledgeInterrupt())
		return hv::sim::actions::PortOut{0x80, 1, *vector};
	return hv::sim::actions::WaitForInterrupt{};
}

void enableInterrupts(hv::Vcpu &vcpu) {
	auto regs = vcpu.getRegs();
	assert(regs);
	regs->rflags |= hv::kRflagsInterrupt;
	assert(vcpu.setRegs(*regs));
}

uint8_t nextVector(hv::Vcpu &vcpu) {
	auto exit = vcpu.run();
	assert(exit);
	auto out = std::get_if<hv::exits::IoOut>(&*exit);
	assert(out);
	assert(out->port == 0x80);
	return out->data[0];
}

} // anonymous namespace

DEFINE_TEST(irq_default_routing, ([] {
	auto machine = make_sim_machine();
	auto routes = machine.vm->irqRouting();
	assert(routes.size() == 24);
	for(uint32_t n = 0; n < 24; ++n) {
		assert(routes[n].gsi == n);
		assert((routes[n].source == hv::IrqSource{hv::IrqchipPin{hv::IrqChip::ioapic, n}}));
	}

	// Injection works before any table was installed by the caller.
	assert(machine.vm->injectIrq(9, true));
	assert(machine.vm->injectIrq(9, false));
}))

DEFINE_TEST(irq_invalid_route_keeps_table, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	auto before = vm.irqRouting();

	std::vector<hv::IrqRoute> badPin{
		{1, hv::IrqchipPin{hv::IrqChip::ioapic, 1}},
		{7, hv::IrqchipPin{hv::IrqChip::picPrimary, 8}}
	};
	auto outcome = vm.setIrqRouting(badPin);
	assert_error(outcome, hv::ErrorKind::invalidRoute);
	assert(outcome.error().subject == 7);

	std::vector<hv::IrqRoute> badMsi{
		{40, hv::MsiMessage{0x1000, 0x41}}
	};
	outcome = vm.setIrqRouting(badMsi);
	assert_error(outcome, hv::ErrorKind::invalidRoute);
	assert(outcome.error().subject == 40);

	assert(vm.irqRouting() == before);
}))

DEFINE_TEST(irq_route_capacity, ([] {
	hv::IrqRouter router{hv::IrqChipLayout{.maxRoutes = 4}};
	std::vector<hv::IrqRoute> routes;
	for(uint32_t n = 0; n < 5; ++n)
		routes.push_back({n, hv::IrqchipPin{hv::IrqChip::ioapic, n}});
	assert_error(router.prepare(routes), hv::ErrorKind::resourceExhausted);

	routes.pop_back();
	auto table = router.prepare(routes);
	assert(table);
	assert((*table)->version() == router.current()->version() + 1);
}))

DEFINE_TEST(irq_duplicate_gsi_last_wins, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	std::vector<hv::IrqRoute> routes{
		{4, hv::IrqchipPin{hv::IrqChip::ioapic, 4}},
		{4, hv::IrqchipPin{hv::IrqChip::picPrimary, 4}},
		{30, hv::MsiMessage{0xFEE00000, 0x50}}
	};
	assert(vm.setIrqRouting(routes));

	auto installed = vm.irqRouting();
	assert(installed.size() == 2);
	assert((installed[0] == hv::IrqRoute{4, hv::IrqchipPin{hv::IrqChip::picPrimary, 4}}));
	assert((installed[1] == hv::IrqRoute{30, hv::MsiMessage{0xFEE00000, 0x50}}));

	// GSI 5 lost its route with the replaced table.
	assert_error(vm.injectIrq(5, true), hv::ErrorKind::invalidRoute);
}))

DEFINE_TEST(irq_levels_stay_asserted, ([] {
	hv::IrqRouter router{hv::IrqChipLayout{}};
	assert(router.setLevel(4, true));
	assert(!router.setLevel(4, true));
	assert(router.isAsserted(4));
	assert(router.assertedLines() == std::vector<hv::Gsi>{4});
	assert(!router.setLevel(4, false));
	assert(!router.isAsserted(4));

	auto machine = make_sim_machine();
	auto &vm = *machine.vm;
	assert(vm.injectIrq(10, true));
	auto snapshot = vm.snapshot();
	assert(snapshot);
	assert(snapshot->assertedLines == std::vector<hv::Gsi>{10});

	// Replacing the table leaves line levels alone.
	assert(vm.setIrqRouting(hv::defaultX86Routing(hv::IrqChipLayout{})));
	snapshot = vm.snapshot();
	assert(snapshot->assertedLines == std::vector<hv::Gsi>{10});

	assert(vm.injectIrq(10, false));
	snapshot = vm.snapshot();
	assert(snapshot->assertedLines.empty());
}))

DEFINE_TEST(irq_delivery_vectors, ([] {
	auto machine = make_sim_machine(2);
	auto &vm = *machine.vm;

	std::vector<hv::IrqRoute> routes{
		{4, hv::IrqchipPin{hv::IrqChip::ioapic, 4}},
		{5, hv::IrqchipPin{hv::IrqChip::picPrimary, 3}},
		{6, hv::IrqchipPin{hv::IrqChip::picSecondary, 1}},
		{7, hv::MsiMessage{0xFEE00000, 0x61}}
	};
	assert(vm.setIrqRouting(routes));

	auto vcpu = vm.createVcpu(0);
	assert(vcpu);
	assert(hv::sim::loadGuestProgram(**vcpu, reportVectors));
	enableInterrupts(**vcpu);

	assert(vm.injectIrq(4, true));
	assert(nextVector(**vcpu) == 0x34);
	assert(vm.injectIrq(5, true));
	assert(nextVector(**vcpu) == 0x23);
	assert(vm.injectIrq(6, true));
	assert(nextVector(**vcpu) == 0x29);
	assert(vm.injectIrq(7, true));
	assert(nextVector(**vcpu) == 0x61);
	assert(vm.signalMsi(0xFEE00000, 0x45));
	assert(nextVector(**vcpu) == 0x45);

	// A level that is already high does not raise another interrupt;
	// the next test is the MSI that follows.
	assert(vm.injectIrq(4, true));
	assert(vm.signalMsi(0xFEE00000, 0x46));
	assert(nextVector(**vcpu) == 0x46);

	assert_error(vm.signalMsi(0xFED00000, 0x45), hv::ErrorKind::invalidRoute);
}))

DEFINE_TEST(irq_msi_destination, ([] {
	auto machine = make_sim_machine(2);
	auto &vm = *machine.vm;

	auto vcpu0 = vm.createVcpu(0);
	auto vcpu1 = vm.createVcpu(1);
	assert(vcpu0 && vcpu1);
	assert(hv::sim::loadGuestProgram(**vcpu0, reportVectors));
	assert(hv::sim::loadGuestProgram(**vcpu1, reportVectors));
	enableInterrupts(**vcpu0);
	enableInterrupts(**vcpu1);

	// Destination ID in address bits 12-19.
	assert(vm.signalMsi(0xFEE01000, 0x70));
	assert(nextVector(**vcpu1) == 0x70);

	// Nothing is pending on vCPU 0.
	auto sregs = (*vcpu0)->getSregs();
	assert(sregs);
	for(auto word : sregs->interruptBitmap)
		assert(!word);
}))
