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

#include "utility.h"

#include <endian.h>
#include <string.h>

#include "section_name_utils-inl.h"

using android::base::Error;
using android::base::Result;

namespace ticoff {

bool IsValidExtent(uint64_t base_len, uint64_t offset, uint64_t length) {
    if (offset > base_len) {
        return false;
    }
    return length <= base_len - offset;
}

uint32_t GetByteLength(uint16_t target_id) {
    switch (target_id) {
        case TICOFF_TARGET_C5400:
        case TICOFF_TARGET_C2800:
            return 2;
        default:
            return 1;
    }
}

CoffSectionHeader ReadSectionHeader(const uint8_t* data, uint64_t offset) {
    CoffSectionHeader entry;
    memcpy(&entry, data + offset, sizeof(entry));

    entry.name.long_name.zeroes = le32toh(entry.name.long_name.zeroes);
    entry.name.long_name.offset = le32toh(entry.name.long_name.offset);
    entry.paddr = le32toh(entry.paddr);
    entry.vaddr = le32toh(entry.vaddr);
    entry.size = le32toh(entry.size);
    entry.data_offset = le32toh(entry.data_offset);
    entry.reloc_offset = le32toh(entry.reloc_offset);
    entry.lineno_offset = le32toh(entry.lineno_offset);
    entry.num_relocs = le32toh(entry.num_relocs);
    entry.num_linenos = le32toh(entry.num_linenos);
    entry.flags = le32toh(entry.flags);
    entry.reserved = le16toh(entry.reserved);
    entry.mem_page = le16toh(entry.mem_page);
    return entry;
}

Result<std::optional<std::string>> ReadSectionName(const uint8_t* data, size_t size,
                                                   uint64_t entry_offset, bool inline_name,
                                                   uint32_t string_offset,
                                                   uint64_t strtab_offset) {
    uint64_t start = entry_offset;
    uint64_t max_length = TICOFF_NAME_SIZE;
    if (!inline_name) {
        start = strtab_offset + string_offset;
        if (start >= size) {
            return std::optional<std::string>();
        }
        max_length = size - start;
    }
    if (!IsValidExtent(size, start, max_length)) {
        return std::optional<std::string>();
    }

    const uint8_t* name = data + start;
    size_t length = 0;
    while (length < max_length && name[length] != 0) {
        length++;
    }
    if (!IsValidSectionName(name, length)) {
        return Error() << "section name at offset " << start << " is not valid UTF-8";
    }
    return std::make_optional<std::string>(reinterpret_cast<const char*>(name), length);
}

}  // namespace ticoff
