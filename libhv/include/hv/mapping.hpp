#pragma once

#include <stddef.h>
#include <stdint.h>
#include <sys/types.h>
#include <span>
#include <utility>

#include <hv/error.hpp>

namespace hv {

// Owns a window of host virtual memory that can back guest physical memory.
// The window is unmapped when the HostMapping is destroyed; installing it
// into a VM moves it into the VM so that it stays mapped while installed.
struct HostMapping {
	static constexpr size_t pageSize = 0x1000;

	friend void swap(HostMapping &x, HostMapping &y) {
		using std::swap;
		swap(x.window_, y.window_);
		swap(x.size_, y.size_);
	}

	// Private, zero-filled anonymous memory.
	static Result<HostMapping> allocateAnonymous(size_t size);

	// Shared mapping of a file (e.g. a memfd that also backs a device).
	static Result<HostMapping> mapFile(int fd, off_t offset, size_t size, bool writable);

	HostMapping()
	: window_{nullptr}, size_{0} { }

	HostMapping(const HostMapping &) = delete;

	HostMapping(HostMapping &&other)
	: HostMapping() {
		swap(*this, other);
	}

	~HostMapping();

	HostMapping &operator= (HostMapping other) {
		swap(*this, other);
		return *this;
	}

	explicit operator bool () const {
		return window_;
	}

	void *data() const { return window_; }
	size_t size() const { return size_; }

	std::span<uint8_t> bytes() const {
		return {static_cast<uint8_t *>(window_), size_};
	}

private:
	HostMapping(void *window, size_t size)
	: window_{window}, size_{size} { }

	void *window_;
	size_t size_;
};

} // namespace hv
