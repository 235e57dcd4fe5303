#include <ChtVision/Platform/Memory.h>

#include <cstdlib>
#include <cstring>
#include <new>

#ifdef _MSC_VER
#include <malloc.h>
#endif

namespace Cht::Vision::Platform {

namespace {

void FreeAligned(uint8_t* ptr) {
#ifdef _MSC_VER
    _aligned_free(ptr);
#else
    std::free(ptr);
#endif
}

} // anonymous namespace

std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t size, size_t alignment) {
    // Zero-sized requests still get a unique, freeable block
    size_t bytes = (size == 0) ? alignment : size;

    void* ptr = nullptr;
#ifdef _MSC_VER
    ptr = _aligned_malloc(bytes, alignment);
#else
    if (posix_memalign(&ptr, alignment, bytes) != 0) ptr = nullptr;
#endif
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }

    std::memset(ptr, 0, bytes);
    return std::shared_ptr<uint8_t>(static_cast<uint8_t*>(ptr), FreeAligned);
}

} // namespace Cht::Vision::Platform
