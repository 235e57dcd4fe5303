#pragma once

/**
 * @file Memory.h
 * @brief Aligned, zero-initialized pixel buffers
 *
 * Image rows start on MEMORY_ALIGNMENT boundaries so that the row loops of
 * the filters can be vectorized by the compiler.
 */

#include <ChtVision/Core/Constants.h>

#include <cstddef>
#include <cstdint>
#include <memory>

namespace Cht::Vision::Platform {

/**
 * @brief Row stride in bytes: rowBytes rounded up to a multiple of alignment
 *
 * alignment must be a power of two.
 */
inline size_t AlignedStride(size_t rowBytes, size_t alignment = MEMORY_ALIGNMENT) {
    return (rowBytes + alignment - 1) & ~(alignment - 1);
}

/**
 * @brief Allocate a zero-filled buffer of size bytes, aligned to alignment
 *
 * The returned pointer releases the memory with the matching aligned free.
 *
 * @throws std::bad_alloc if the allocation fails
 */
std::shared_ptr<uint8_t> AllocatePixelBuffer(size_t size,
                                             size_t alignment = MEMORY_ALIGNMENT);

} // namespace Cht::Vision::Platform
