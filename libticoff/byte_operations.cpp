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

#include <ticoff/byte_operations.h>

#include <limits.h>

#include <algorithm>
#include <utility>

#include <zlib.h>

using android::base::Error;
using android::base::Result;

namespace ticoff {

Result<void> ByteOperations::ReverseWords(uint8_t* data, size_t size) const {
    if (data == nullptr && size != 0) {
        return Error() << "expected a mutable byte buffer";
    }
    if ((size & 0x1) != 0) {
        return Error() << "buffer length " << size << " is not 2 byte aligned";
    }
    for (size_t i = 0; i < size; i += 2) {
        std::swap(data[i], data[i + 1]);
    }
    return {};
}

uint32_t ByteOperations::Checksum(const uint8_t* data, size_t size) const {
    uLong crc = crc32(0L, Z_NULL, 0);
    // zlib takes the length as a uInt.
    while (size > 0) {
        uInt chunk = static_cast<uInt>(std::min<size_t>(size, UINT_MAX));
        crc = crc32(crc, data, chunk);
        data += chunk;
        size -= chunk;
    }
    return static_cast<uint32_t>(crc);
}

}  // namespace ticoff
