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

#include <android-base/result.h>

namespace ticoff {

// Operations applied to buffers produced from an image, such as a flattened
// memory image, before they are handed to a flashing or boot tool.
class IByteOperations {
  public:
    virtual ~IByteOperations() = default;

    // Swaps the two bytes of every 16-bit word in |data| in place. Fails, and
    // leaves |data| untouched, if |size| is odd or |data| is null.
    virtual android::base::Result<void> ReverseWords(uint8_t* data, size_t size) const = 0;

    // CRC-32 (IEEE 802.3) of |data|.
    virtual uint32_t Checksum(const uint8_t* data, size_t size) const = 0;
};

class ByteOperations : public IByteOperations {
  public:
    android::base::Result<void> ReverseWords(uint8_t* data, size_t size) const override;
    uint32_t Checksum(const uint8_t* data, size_t size) const override;
};

}  // namespace ticoff
