#include <assert.h>
#include <bit>

#include <hv/memory.hpp>

namespace hv {

// ----------------------------------------------------------------------------
// DirtyBitmap.
// ----------------------------------------------------------------------------

size_t DirtyBitmap::count() const {
	size_t n = 0;
	for(auto word : words_)
		n += std::popcount(word);
	return n;
}

bool DirtyBitmap::covers(const DirtyBitmap &other) const {
	if(other.words_.size() > words_.size())
		return false;
	for(size_t i = 0; i < other.words_.size(); ++i)
		if(other.words_[i] & ~words_[i])
			return false;
	return true;
}

DirtyBitmap &DirtyBitmap::operator|= (const DirtyBitmap &other) {
	assert(other.pages_ == pages_);
	for(size_t i = 0; i < words_.size(); ++i)
		words_[i] |= other.words_[i];
	return *this;
}

// ----------------------------------------------------------------------------
// DirtyTracker.
// ----------------------------------------------------------------------------

DirtyTracker::DirtyTracker(uint64_t pages)
: pages_{pages}, numWords_{(pages + 63) / 64},
		words_{std::make_unique<std::atomic<uint64_t>[]>(numWords_)} { }

void DirtyTracker::markRange(uint64_t offset, uint64_t length) {
	if(!length)
		return;
	auto first = offset / kPageSize;
	auto last = (offset + length - 1) / kPageSize;
	assert(last < pages_);
	for(auto page = first; page <= last; ++page)
		words_[page / 64].fetch_or(uint64_t{1} << (page % 64), std::memory_order_relaxed);
}

void DirtyTracker::merge(const DirtyBitmap &bitmap) {
	assert(bitmap.pages() == pages_);
	auto &words = bitmap.words();
	for(size_t i = 0; i < numWords_; ++i)
		if(words[i])
			words_[i].fetch_or(words[i], std::memory_order_relaxed);
}

DirtyBitmap DirtyTracker::drain() {
	DirtyBitmap bitmap{pages_};
	auto &words = bitmap.words();
	for(size_t i = 0; i < numWords_; ++i)
		words[i] = words_[i].exchange(0, std::memory_order_acq_rel);
	return bitmap;
}

// ----------------------------------------------------------------------------
// SlotTable.
// ----------------------------------------------------------------------------

SlotTable::SlotTable(size_t maxSlots, size_t alignment)
: maxSlots_{maxSlots}, alignment_{alignment} { }

Result<> SlotTable::checkInsert(const MemoryRegion &region) const {
	auto address = region.guestAddress;
	if(!region.size || (address & (alignment_ - 1)) || (region.size & (alignment_ - 1)))
		return makeError(ErrorKind::invalidAlignment, address, "addMemoryRegion");
	if(address + region.size < address)
		return makeError(ErrorKind::illegalArgs, address, "addMemoryRegion");
	if(region.mapping.size() < region.size)
		return makeError(ErrorKind::illegalArgs, address, "addMemoryRegion");

	// Only the neighbours in address order can intersect the new range.
	auto it = byAddress_.lower_bound(address);
	if(it != byAddress_.end() && it->first < address + region.size)
		return makeError(ErrorKind::overlap, address, "addMemoryRegion");
	if(it != byAddress_.begin()) {
		auto &pred = slots_.at(std::prev(it)->second);
		if(pred.region.guestAddress + pred.region.size > address)
			return makeError(ErrorKind::overlap, address, "addMemoryRegion");
	}

	if(slots_.size() >= maxSlots_)
		return makeError(ErrorKind::resourceExhausted, address, "addMemoryRegion");
	return {};
}

SlotId SlotTable::insert(MemoryRegion region, uint32_t nativeSlot) {
	auto id = nextId_++;
	auto address = region.guestAddress;

	Slot slot;
	slot.id = id;
	slot.nativeSlot = nativeSlot;
	if(region.logDirty)
		slot.dirty = std::make_unique<DirtyTracker>(region.size / kPageSize);
	slot.region = std::move(region);

	auto [it, inserted] = slots_.emplace(id, std::move(slot));
	assert(inserted);
	byAddress_.emplace(address, id);
	return id;
}

Result<Slot> SlotTable::remove(SlotId id) {
	auto it = slots_.find(id);
	if(it == slots_.end())
		return makeError(ErrorKind::notFound, id, "removeMemoryRegion");

	Slot slot = std::move(it->second);
	byAddress_.erase(slot.region.guestAddress);
	slots_.erase(it);
	return slot;
}

Slot *SlotTable::find(SlotId id) {
	auto it = slots_.find(id);
	if(it == slots_.end())
		return nullptr;
	return &it->second;
}

const Slot *SlotTable::find(SlotId id) const {
	auto it = slots_.find(id);
	if(it == slots_.end())
		return nullptr;
	return &it->second;
}

Slot *SlotTable::findAddress(GuestAddress address) {
	auto it = byAddress_.upper_bound(address);
	if(it == byAddress_.begin())
		return nullptr;
	auto &slot = slots_.at(std::prev(it)->second);
	if(!slot.contains(address))
		return nullptr;
	return &slot;
}

const Slot *SlotTable::findAddress(GuestAddress address) const {
	return const_cast<SlotTable *>(this)->findAddress(address);
}

std::vector<SlotInfo> SlotTable::list() const {
	std::vector<SlotInfo> infos;
	infos.reserve(slots_.size());
	for(auto &[address, id] : byAddress_)
		infos.push_back(slots_.at(id).info());
	return infos;
}

void SlotTable::advanceNextId(SlotId id) {
	if(id > nextId_)
		nextId_ = id;
}

} // namespace hv
