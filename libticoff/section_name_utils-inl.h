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

#ifndef LIBTICOFF_SECTION_NAME_UTILS_INL_H_
#define LIBTICOFF_SECTION_NAME_UTILS_INL_H_

#include <stddef.h>
#include <stdint.h>

namespace ticoff {

// Returns true if |name| is well-formed UTF-8. The terminating NUL has
// already been stripped, so an embedded NUL is rejected. Overlong forms,
// surrogates and code points above U+10FFFF are rejected as well.
inline bool IsValidSectionName(const uint8_t* name, const size_t length) {
    for (size_t i = 0; i < length; ++i) {
        const uint8_t byte = name[i];
        if (byte == 0) {
            return false;
        } else if ((byte & 0x80) == 0) {
            // Single byte sequence.
            continue;
        }

        // Number of continuation bytes, and the range allowed for the first.
        size_t count;
        uint8_t lower = 0x80;
        uint8_t upper = 0xbf;
        if (byte >= 0xc2 && byte <= 0xdf) {
            count = 1;
        } else if (byte >= 0xe0 && byte <= 0xef) {
            count = 2;
            if (byte == 0xe0) {
                lower = 0xa0;
            } else if (byte == 0xed) {
                upper = 0x9f;
            }
        } else if (byte >= 0xf0 && byte <= 0xf4) {
            count = 3;
            if (byte == 0xf0) {
                lower = 0x90;
            } else if (byte == 0xf4) {
                upper = 0x8f;
            }
        } else {
            // Stray continuation byte, overlong lead byte (C0, C1), or a lead
            // byte past U+10FFFF.
            return false;
        }

        for (size_t j = 0; j < count; ++j) {
            ++i;

            // Missing continuation byte.
            if (i == length) {
                return false;
            }

            const uint8_t continuation_byte = name[i];
            if (continuation_byte < lower || continuation_byte > upper) {
                return false;
            }
            lower = 0x80;
            upper = 0xbf;
        }
    }

    return true;
}

}  // namespace ticoff

#endif  // LIBTICOFF_SECTION_NAME_UTILS_INL_H_
