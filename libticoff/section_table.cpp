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

using android::base::Error;
using android::base::Result;

namespace ticoff {

SectionTable::SectionTable(std::vector<Section> sections,
                           std::map<std::string, size_t> index_by_name)
    : sections_(std::move(sections)), index_by_name_(std::move(index_by_name)) {}

Result<SectionTable> SectionTable::Build(std::vector<Section> sections) {
    std::map<std::string, size_t> index_by_name;
    for (size_t i = 0; i < sections.size(); i++) {
        const std::string& name = sections[i].name();
        if (!index_by_name.emplace(name, i).second) {
            return Error() << "image contains a duplicate section named " << name;
        }
    }
    return SectionTable(std::move(sections), std::move(index_by_name));
}

Result<Section> SectionTable::GetByIndex(size_t index) const {
    if (index >= sections_.size()) {
        return Error() << "no section at index " << index << " (table has " << sections_.size()
                       << " sections)";
    }
    return sections_[index];
}

Result<Section> SectionTable::GetByName(const std::string& name) const {
    auto iter = index_by_name_.find(name);
    if (iter == index_by_name_.end()) {
        return Error() << "no section named " << name;
    }
    return sections_[iter->second];
}

}  // namespace ticoff
