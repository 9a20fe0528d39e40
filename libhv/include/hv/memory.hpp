#pragma once

#include <stdint.h>
#include <atomic>
#include <map>
#include <memory>
#include <vector>

#include <hv/error.hpp>
#include <hv/mapping.hpp>
#include <hv/types.hpp>

namespace hv {

struct MemoryRegion {
	GuestAddress guestAddress = 0;
	HostMapping mapping;
	uint64_t size = 0;
	bool readOnly = false;
	bool logDirty = false;
};

// Mapping-free description of an installed slot.
struct SlotInfo {
	SlotId id;
	GuestAddress guestAddress;
	uint64_t size;
	bool readOnly;
	bool dirtyLogEnabled;

	bool operator== (const SlotInfo &) const = default;
};

// One bit per guest page of a slot.
struct DirtyBitmap {
	DirtyBitmap() = default;

	explicit DirtyBitmap(uint64_t pages)
	: pages_{pages}, words_((pages + 63) / 64) { }

	uint64_t pages() const { return pages_; }

	bool test(uint64_t page) const {
		return words_[page / 64] & (uint64_t{1} << (page % 64));
	}

	void set(uint64_t page) {
		words_[page / 64] |= uint64_t{1} << (page % 64);
	}

	size_t count() const;

	// True if every page set in other is also set in this bitmap.
	bool covers(const DirtyBitmap &other) const;

	std::vector<uint64_t> &words() { return words_; }
	const std::vector<uint64_t> &words() const { return words_; }

	DirtyBitmap &operator|= (const DirtyBitmap &other);

	bool operator== (const DirtyBitmap &) const = default;

private:
	uint64_t pages_ = 0;
	std::vector<uint64_t> words_;
};

// Software dirty log of a slot. Marked concurrently by vCPU threads that
// only hold the topology lock in shared mode, hence the atomic words.
struct DirtyTracker {
	explicit DirtyTracker(uint64_t pages);

	DirtyTracker(const DirtyTracker &) = delete;
	DirtyTracker &operator= (const DirtyTracker &) = delete;

	uint64_t pages() const { return pages_; }

	// Marks every page touched by [offset, offset + length) of the slot.
	void markRange(uint64_t offset, uint64_t length);

	void merge(const DirtyBitmap &bitmap);

	// Returns the accumulated bits and clears them.
	DirtyBitmap drain();

private:
	uint64_t pages_;
	size_t numWords_;
	std::unique_ptr<std::atomic<uint64_t>[]> words_;
};

struct Slot {
	SlotId id;
	MemoryRegion region;

	// The backend's own slot number; backends may recycle these.
	uint32_t nativeSlot = 0;

	// Present iff the region was installed with dirty logging.
	std::unique_ptr<DirtyTracker> dirty;

	bool contains(GuestAddress address) const {
		return address >= region.guestAddress
				&& address - region.guestAddress < region.size;
	}

	SlotInfo info() const {
		return SlotInfo{id, region.guestAddress, region.size,
				region.readOnly, static_cast<bool>(dirty)};
	}
};

// Tracks the installed slots of one VM in guest address order.
// Not synchronized; the owning VM guards it with its topology lock.
struct SlotTable {
	explicit SlotTable(size_t maxSlots, size_t alignment = kPageSize);

	SlotTable(const SlotTable &) = delete;
	SlotTable &operator= (const SlotTable &) = delete;

	// Checks alignment, overlap and capacity. Must succeed before the
	// backend is asked to map the region.
	Result<> checkInsert(const MemoryRegion &region) const;

	// Installs a region that passed checkInsert() and was accepted by the backend.
	SlotId insert(MemoryRegion region, uint32_t nativeSlot);

	Result<Slot> remove(SlotId id);

	Slot *find(SlotId id);
	const Slot *find(SlotId id) const;

	// Returns the slot whose range contains address, if any.
	Slot *findAddress(GuestAddress address);
	const Slot *findAddress(GuestAddress address) const;

	std::vector<SlotInfo> list() const;

	size_t count() const { return slots_.size(); }
	size_t maxSlots() const { return maxSlots_; }

	SlotId nextId() const { return nextId_; }

	// Never lowers the counter; used to carry slot numbering across a restore.
	void advanceNextId(SlotId id);

	template<typename F>
	void forEach(F functor) {
		for(auto &[address, id] : byAddress_)
			functor(slots_.at(id));
	}

private:
	size_t maxSlots_;
	size_t alignment_;
	SlotId nextId_ = 0;
	std::map<SlotId, Slot> slots_;
	std::map<GuestAddress, SlotId> byAddress_;
};

} // namespace hv
