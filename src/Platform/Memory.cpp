#include <VisMatch/Platform/Memory.h>

#include <cstdlib>
#include <cstring>
#include <new>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Vis::Match::Platform {

namespace {

void FreeAligned(uint8_t* ptr) {
#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

} // anonymous namespace

std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t size) {
    if (size == 0) {
        return nullptr;
    }

    void* raw = nullptr;
#ifdef _MSC_VER
    raw = _aligned_malloc(size, MEMORY_ALIGNMENT);
#else
    if (posix_memalign(&raw, MEMORY_ALIGNMENT, size) != 0) {
        raw = nullptr;
    }
#endif
    if (!raw) {
        throw std::bad_alloc();
    }

    std::memset(raw, 0, size);
    return std::shared_ptr<uint8_t>(static_cast<uint8_t*>(raw), FreeAligned);
}

} // namespace Vis::Match::Platform
