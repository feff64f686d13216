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

#include <endian.h>
#include <string.h>

#include <algorithm>

#include <android-base/file.h>
#include <android-base/stringprintf.h>

#include "utility.h"

using android::base::ErrnoError;
using android::base::Error;
using android::base::Result;
using android::base::StringPrintf;

namespace ticoff {

static bool FitsWindow(uint64_t addr, uint64_t length, uint64_t window, uint64_t window_size) {
    return addr >= window && IsValidExtent(window_size, addr - window, length);
}

Image::Image(std::vector<uint8_t> data)
    : data_(std::move(data)),
      target_id_(0),
      entry_(0),
      num_sections_(0),
      symtab_offset_(0),
      num_symbols_(0),
      strtab_offset_(0),
      byte_length_(1),
      loading_section_table_(false) {}

Result<std::unique_ptr<Image>> Image::Parse(std::vector<uint8_t> data) {
    std::unique_ptr<Image> image(new Image(std::move(data)));
    auto rv = image->LoadHeader();
    if (!rv.ok()) {
        return rv.error();
    }
    return std::move(image);
}

Result<std::unique_ptr<Image>> Image::OpenFile(const std::string& path) {
    std::string content;
    if (!android::base::ReadFileToString(path, &content)) {
        return ErrnoError() << "failed to read " << path;
    }
    return Parse(std::vector<uint8_t>(content.begin(), content.end()));
}

Result<void> Image::LoadHeader() {
    const uint64_t size = data_.size();
    if (size < TICOFF_HEADER_SIZE) {
        return Error() << "data does not represent a valid coff image";
    }

    CoffFileHeader header;
    memcpy(&header, data_.data(), sizeof(header));

    const uint16_t num_sections = le16toh(header.num_sections);
    const uint32_t symtab_offset = le32toh(header.symtab_offset);
    const uint32_t num_symbols = le32toh(header.num_symbols);
    const uint16_t target_id = le16toh(header.target_id);
    const uint16_t magic = le16toh(header.magic);
    const uint32_t entry = le32toh(header.entry);

    const uint64_t sectab_end =
            TICOFF_HEADER_SIZE + uint64_t(num_sections) * TICOFF_SECTION_HEADER_SIZE;
    const uint64_t strtab_offset =
            uint64_t(symtab_offset) + uint64_t(num_symbols) * TICOFF_SYMBOL_SIZE;

    if (magic != TICOFF_MAGIC) {
        return Error() << StringPrintf(
                       "expected a magic value of 0x%x within the image but read 0x%x",
                       TICOFF_MAGIC, magic);
    }
    if (target_id == 0) {
        return Error() << "target chipset for the image is not valid";
    }
    if (!IsValidExtent(size, 0, sectab_end)) {
        return Error() << "image does not contain a valid section table";
    }
    if (sectab_end > symtab_offset || strtab_offset > size) {
        return Error() << "image does not contain a valid symbol table";
    }
    // The string table runs to the end of the image and must not be empty.
    if (strtab_offset >= size || !IsValidExtent(size, strtab_offset, size - strtab_offset)) {
        return Error() << "image does not contain a valid string table";
    }

    target_id_ = target_id;
    entry_ = entry;
    num_sections_ = num_sections;
    symtab_offset_ = symtab_offset;
    num_symbols_ = num_symbols;
    strtab_offset_ = strtab_offset;
    byte_length_ = GetByteLength(target_id);
    if (byte_length_ == 1) {
        LVERBOSE << StringPrintf("target 0x%x uses byte addressing", target_id);
    }
    return {};
}

Result<SectionTable> Image::LoadSectionTable() const {
    std::vector<Section> sections;
    sections.reserve(num_sections_);

    uint64_t offset = TICOFF_HEADER_SIZE;
    for (uint32_t i = 0; i < num_sections_; i++, offset += TICOFF_SECTION_HEADER_SIZE) {
        CoffSectionHeader entry = ReadSectionHeader(data_.data(), offset);
        bool inline_name = entry.name.long_name.zeroes != 0;

        auto name = ReadSectionName(data_.data(), data_.size(), offset, inline_name,
                                    entry.name.long_name.offset, strtab_offset_);
        if (!name.ok()) {
            return name.error();
        }
        auto section = Section::Decode(i, entry, std::move(*name), data_.size(), byte_length_);
        if (!section.ok()) {
            return section.error();
        }
        sections.emplace_back(std::move(*section));
    }
    return SectionTable::Build(std::move(sections));
}

Result<const SectionTable*> Image::ReadSectionTable() const {
    if (!section_table_) {
        if (loading_section_table_) {
            return Error() << "section table is already being loaded";
        }
        loading_section_table_ = true;
        auto table = LoadSectionTable();
        loading_section_table_ = false;
        if (!table.ok()) {
            return table.error();
        }
        section_table_.emplace(std::move(*table));
        LVERBOSE << "loaded " << section_table_->size() << " sections";
    }
    const SectionTable* table = &*section_table_;
    return table;
}

SectionData Image::GetSectionData(const Section& section) {
    if (!IsValidExtent(data_.size(), section.daddr(), section.dlen())) {
        return SectionData();
    }
    return SectionData(data_.data() + section.daddr(), section.dlen());
}

ConstSectionData Image::GetSectionData(const Section& section) const {
    if (!IsValidExtent(data_.size(), section.daddr(), section.dlen())) {
        return ConstSectionData();
    }
    return ConstSectionData(data_.data() + section.daddr(), section.dlen());
}

Result<void> Image::CopySections(uint64_t address, uint8_t* dst, size_t size) const {
    if (dst == nullptr && size != 0) {
        return Error() << "destination buffer is null";
    }
    auto table = ReadSectionTable();
    if (!table.ok()) {
        return table.error();
    }

    for (const Section& section : **table) {
        if (!section.flags().IsAllocated()) {
            continue;
        }

        uint64_t offset;
        if (FitsWindow(section.paddr(), section.dlen(), address, size)) {
            offset = section.paddr() - address;
        } else if (FitsWindow(section.vaddr(), section.dlen(), address, size)) {
            offset = section.vaddr() - address;
        } else {
            LVERBOSE << "section " << section.name() << " is outside the window";
            continue;
        }

        ConstSectionData src = GetSectionData(section);
        if (!src.Valid()) {
            return Error() << "section " << section.name() << " does not contain valid data";
        }
        if (src.size != 0) {
            memcpy(dst + offset, src.data, src.size);
        }
    }
    return {};
}

Result<AddressRange> Image::AllocatedRange() const {
    auto table = ReadSectionTable();
    if (!table.ok()) {
        return table.error();
    }

    bool found = false;
    AddressRange range = {UINT64_MAX, 0};
    for (const Section& section : **table) {
        if (!section.flags().IsAllocated()) {
            continue;
        }
        range.start = std::min<uint64_t>(range.start, section.paddr());
        range.end = std::max<uint64_t>(range.end, section.paddr() + section.dlen());
        found = true;
    }
    if (!found) {
        return Error() << "image does not contain any allocated sections";
    }
    return range;
}

}  // namespace ticoff
