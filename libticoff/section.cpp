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

#include <ticoff/coff_image.h>

#include "utility.h"

using android::base::Error;
using android::base::Result;

namespace ticoff {

Section::Section(uint32_t index, std::string name, uint32_t paddr, uint32_t vaddr, uint64_t daddr,
                 uint64_t dlen, SectionFlags flags)
    : index_(index),
      name_(std::move(name)),
      paddr_(paddr),
      vaddr_(vaddr),
      daddr_(daddr),
      dlen_(dlen),
      flags_(flags) {}

Result<Section> Section::Decode(uint32_t index, const CoffSectionHeader& entry,
                                std::optional<std::string> name, uint64_t image_size,
                                uint32_t byte_length) {
    if (!name) {
        return Error() << "section at index " << index << " does not have a valid name";
    }

    SectionFlags flags(entry.flags);
    uint64_t daddr = entry.data_offset;
    uint64_t dlen = entry.size;

    // Allocated sections are sized in target-addressable units.
    if (flags.IsAllocated()) {
        dlen *= byte_length;
    }

    if (!IsValidExtent(image_size, daddr, dlen)) {
        return Error() << "section at index " << index << " does not contain valid data";
    }

    return Section(index, std::move(*name), entry.paddr, entry.vaddr, daddr, dlen, flags);
}

}  // namespace ticoff
