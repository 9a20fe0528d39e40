#include <assert.h>

#include <hv/memory.hpp>

#include "testsuite.hpp"

DEFINE_TEST(slots_add_and_list, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	auto high = vm.addMemoryRegion(make_region(0x100000, 0x4000));
	assert(high);
	auto low = vm.addMemoryRegion(make_region(0, 0x10000, true));
	assert(low);
	assert(*high == 0);
	assert(*low == 1);

	// Listed in guest address order, not in insertion order.
	auto regions = vm.memoryRegions();
	assert(regions.size() == 2);
	assert((regions[0] == hv::SlotInfo{1, 0, 0x10000, false, true}));
	assert((regions[1] == hv::SlotInfo{0, 0x100000, 0x4000, false, false}));
}))

DEFINE_TEST(slots_overlap_rejected, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	assert(vm.addMemoryRegion(make_region(0x10000, 0x10000)));
	auto before = vm.memoryRegions();

	// Tail, head, containment and exact duplicates all intersect.
	assert_error(vm.addMemoryRegion(make_region(0x8000, 0x10000)), hv::ErrorKind::overlap);
	assert_error(vm.addMemoryRegion(make_region(0x1F000, 0x2000)), hv::ErrorKind::overlap);
	assert_error(vm.addMemoryRegion(make_region(0x12000, 0x1000)), hv::ErrorKind::overlap);
	assert_error(vm.addMemoryRegion(make_region(0x0, 0x40000)), hv::ErrorKind::overlap);
	assert_error(vm.addMemoryRegion(make_region(0x10000, 0x10000)), hv::ErrorKind::overlap);
	assert(vm.memoryRegions() == before);

	// Adjacent ranges do not.
	assert(vm.addMemoryRegion(make_region(0x0, 0x10000)));
	assert(vm.addMemoryRegion(make_region(0x20000, 0x1000)));
	assert(vm.memoryRegions().size() == 3);
}))

DEFINE_TEST(slots_alignment, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	assert_error(vm.addMemoryRegion(make_region(0x800, 0x1000)),
			hv::ErrorKind::invalidAlignment);

	auto odd = make_region(0, 0x2000);
	odd.size = 0x1800;
	assert_error(vm.addMemoryRegion(std::move(odd)), hv::ErrorKind::invalidAlignment);

	auto empty = make_region(0, 0x1000);
	empty.size = 0;
	assert_error(vm.addMemoryRegion(std::move(empty)), hv::ErrorKind::invalidAlignment);

	auto small = make_region(0, 0x1000);
	small.size = 0x2000;
	assert_error(vm.addMemoryRegion(std::move(small)), hv::ErrorKind::illegalArgs);

	assert(vm.memoryRegions().empty());
}))

DEFINE_TEST(slots_ids_never_reused, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	auto first = vm.addMemoryRegion(make_region(0, 0x1000));
	assert(first);
	assert(vm.removeMemoryRegion(*first));
	auto second = vm.addMemoryRegion(make_region(0, 0x1000));
	assert(second);
	assert(*second != *first);

	assert_error(vm.removeMemoryRegion(*first), hv::ErrorKind::notFound);
	assert_error(vm.removeMemoryRegion(1234), hv::ErrorKind::notFound);
}))

DEFINE_TEST(slots_remove_restores_table, ([] {
	auto machine = make_sim_machine();
	auto &vm = *machine.vm;

	assert(vm.addMemoryRegion(make_region(0, 0x10000)));
	auto before = vm.memoryRegions();

	auto region = make_region(0x40000, 0x3000, true);
	auto host = region.mapping.data();
	auto slot = vm.addMemoryRegion(std::move(region));
	assert(slot);
	assert(vm.memoryRegions().size() == 2);

	// The caller gets its mapping back, still mapped.
	auto removed = vm.removeMemoryRegion(*slot);
	assert(removed);
	assert(removed->mapping.data() == host);
	assert(removed->guestAddress == 0x40000);
	assert(removed->size == 0x3000);
	assert(removed->logDirty);
	assert(vm.memoryRegions() == before);
}))

DEFINE_TEST(slots_exhaustion, ([] {
	hv::SimLimits limits;
	limits.maxSlots = 2;
	auto machine = make_sim_machine(1, 0, limits);
	auto &vm = *machine.vm;

	assert(vm.addMemoryRegion(make_region(0, 0x1000)));
	assert(vm.addMemoryRegion(make_region(0x1000, 0x1000)));
	assert_error(vm.addMemoryRegion(make_region(0x2000, 0x1000)),
			hv::ErrorKind::resourceExhausted);
	assert(vm.memoryRegions().size() == 2);
}))

DEFINE_TEST(slots_ram_from_config, ([] {
	auto machine = make_sim_machine(1, 0x20000);
	auto regions = machine.vm->memoryRegions();
	assert(regions.size() == 1);
	assert(regions[0].guestAddress == 0);
	assert(regions[0].size == 0x20000);
	assert(!regions[0].readOnly);
	assert(!regions[0].dirtyLogEnabled);
}))

DEFINE_TEST(slot_table_lookup, ([] {
	hv::SlotTable table{4};

	auto a = make_region(0x1000, 0x2000);
	assert(table.checkInsert(a));
	auto id = table.insert(std::move(a), 7);

	assert(!table.findAddress(0xFFF));
	assert(table.findAddress(0x1000)->id == id);
	assert(table.findAddress(0x2FFF)->id == id);
	assert(!table.findAddress(0x3000));
	assert(table.find(id)->nativeSlot == 7);
	assert(!table.find(id)->dirty);

	table.advanceNextId(10);
	table.advanceNextId(3);
	assert(table.nextId() == 10);

	auto slot = table.remove(id);
	assert(slot);
	assert(!table.findAddress(0x1000));
	assert(table.count() == 0);
}))

DEFINE_TEST(dirty_bitmap_operations, ([] {
	hv::DirtyBitmap a{100};
	hv::DirtyBitmap b{100};
	a.set(0);
	a.set(64);
	b.set(64);
	b.set(99);
	assert(a.count() == 2);
	assert(!a.covers(b));

	a |= b;
	assert(a.count() == 3);
	assert(a.covers(b));
	assert(a.test(99));
	assert(!a.test(98));

	hv::DirtyTracker tracker{100};
	tracker.markRange(0x1FFF, 2);
	tracker.merge(b);
	auto drained = tracker.drain();
	assert(drained.count() == 4);
	assert(drained.test(1) && drained.test(2));
	assert(tracker.drain().count() == 0);
}))
