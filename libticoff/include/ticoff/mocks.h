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

#include <gmock/gmock.h>

#include <ticoff/byte_operations.h>

namespace ticoff {
namespace testing {

class MockByteOperations : public IByteOperations {
  public:
    MOCK_CONST_METHOD2(ReverseWords, android::base::Result<void>(uint8_t*, size_t));
    MOCK_CONST_METHOD2(Checksum, uint32_t(const uint8_t*, size_t));
};

}  // namespace testing
}  // namespace ticoff
