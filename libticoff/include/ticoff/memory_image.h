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

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

#include <android-base/result.h>

#include <ticoff/byte_operations.h>
#include <ticoff/coff_image.h>

namespace ticoff {

// Largest memory image BuildMemoryImage() will allocate. Covers the full
// 22-bit word address space of the C2800 family.
static constexpr uint64_t kMaxMemoryImageSize = 16 * 1024 * 1024;

struct MemoryImageOptions {
    // Target address of the first byte of the memory image.
    uint64_t base_address = 0;
    // Size of the memory image in bytes. If 0, the image extends to the end of
    // the highest allocated section, rounded up to a whole 16-bit word.
    size_t size = 0;
    // Value of bytes not covered by any section.
    uint8_t fill = 0xff;
    // Swap the bytes of every 16-bit word after the sections are copied.
    bool swap_words = false;
};

struct MemoryImage {
    std::vector<uint8_t> data;
    uint32_t checksum;
};

// Flattens the allocated sections of |image| into a memory image, then
// applies |ops| to it. Fails if the image would exceed kMaxMemoryImageSize.
android::base::Result<MemoryImage> BuildMemoryImage(const Image& image,
                                                    const MemoryImageOptions& options,
                                                    const IByteOperations& ops);

// Rounds |value| up to a multiple of |alignment|. An alignment of 0 leaves
// |value| unchanged.
uint64_t AlignUp(uint64_t value, uint64_t alignment);

// Appends |pad| bytes to |data| until it is |size| bytes long. Does nothing
// if |data| is already at least that long.
void ExtendTo(std::vector<uint8_t>* data, size_t size, uint8_t pad = 0xff);

}  // namespace ticoff
