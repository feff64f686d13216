/*
 * Copyright (C) 2024 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <ticoff/memory_image.h>

#include <inttypes.h>

#include <android-base/stringprintf.h>

#include "utility.h"

using android::base::Error;
using android::base::Result;
using android::base::StringPrintf;

namespace ticoff {

uint64_t AlignUp(uint64_t value, uint64_t alignment) {
    if (alignment == 0) {
        return value;
    }
    uint64_t remainder = value % alignment;
    if (remainder == 0) {
        return value;
    }
    return value + alignment - remainder;
}

void ExtendTo(std::vector<uint8_t>* data, size_t size, uint8_t pad) {
    if (size > data->size()) {
        data->resize(size, pad);
    }
}

Result<MemoryImage> BuildMemoryImage(const Image& image, const MemoryImageOptions& options,
                                     const IByteOperations& ops) {
    uint64_t size = options.size;
    if (size == 0) {
        auto range = image.AllocatedRange();
        if (!range.ok()) {
            return range.error();
        }
        if (options.base_address > range->start) {
            return Error() << StringPrintf(
                           "base address 0x%" PRIx64 " is above the lowest section at 0x%" PRIx64,
                           options.base_address, range->start);
        }
        size = AlignUp(range->end - options.base_address, 2);
    }
    if (size > kMaxMemoryImageSize) {
        return Error() << StringPrintf("memory image of %" PRIu64
                                       " bytes exceeds the limit of %" PRIu64 " bytes",
                                       size, kMaxMemoryImageSize);
    }

    MemoryImage result;
    ExtendTo(&result.data, size, options.fill);

    auto rv = image.CopySections(options.base_address, &result.data);
    if (!rv.ok()) {
        return rv.error();
    }
    if (options.swap_words) {
        rv = ops.ReverseWords(result.data.data(), result.data.size());
        if (!rv.ok()) {
            return rv.error();
        }
    }
    result.checksum = ops.Checksum(result.data.data(), result.data.size());

    LVERBOSE << StringPrintf("built %zu byte memory image at 0x%" PRIx64 ", crc32 0x%08x",
                             result.data.size(), options.base_address, result.checksum);
    return result;
}

}  // namespace ticoff
