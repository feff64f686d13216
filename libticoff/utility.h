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

#include <optional>
#include <string>

#include <android-base/logging.h>
#include <android-base/result.h>

#include <ticoff/coff_format.h>

#define TICOFF_TAG "[libticoff] "
#define LVERBOSE LOG(VERBOSE) << TICOFF_TAG

namespace ticoff {

// Returns true if [offset, offset + length) lies inside a buffer of
// |base_len| bytes.
bool IsValidExtent(uint64_t base_len, uint64_t offset, uint64_t length);

// Number of bytes in one target-addressable unit for |target_id|.
uint32_t GetByteLength(uint16_t target_id);

// Decodes the little-endian section table entry at |offset|. The caller must
// have validated the extent.
CoffSectionHeader ReadSectionHeader(const uint8_t* data, uint64_t offset);

// Resolves the name of the section table entry at |entry_offset|. When
// |inline_name| is set the name is the NUL-padded 8-byte field at the start of
// the entry; otherwise it is the NUL-terminated string at
// |strtab_offset| + |string_offset|. Yields no value when that position is at
// or past the end of |data|, and fails when the bytes are not valid UTF-8.
android::base::Result<std::optional<std::string>> ReadSectionName(
        const uint8_t* data, size_t size, uint64_t entry_offset, bool inline_name,
        uint32_t string_offset, uint64_t strtab_offset);

}  // namespace ticoff
