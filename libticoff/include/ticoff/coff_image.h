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

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <android-base/macros.h>
#include <android-base/result.h>

#include <ticoff/coff_format.h>

namespace ticoff {

class SectionFlags {
  public:
    SectionFlags() : bits_(0) {}
    explicit SectionFlags(uint32_t bits) : bits_(bits) {}

    uint32_t bits() const { return bits_; }
    bool IsText() const { return (bits_ & TICOFF_STYP_TEXT) != 0; }
    bool IsData() const { return (bits_ & TICOFF_STYP_DATA) != 0; }
    bool IsBss() const { return (bits_ & TICOFF_STYP_BSS) != 0; }

    // True if the section occupies space in target memory.
    bool IsAllocated() const { return (bits_ & TICOFF_STYP_ALLOC_MASK) != 0; }

  private:
    uint32_t bits_;
};

// A view of a section's bytes inside the buffer of the Image it came from.
// Only valid while that Image is alive.
template <typename T>
struct BasicSectionData {
    T* data;
    size_t size;

    BasicSectionData() : data(nullptr), size(0) {}
    BasicSectionData(T* data, size_t size) : data(data), size(size) {}

    bool Valid() const { return data != nullptr; }
};

using SectionData = BasicSectionData<uint8_t>;
using ConstSectionData = BasicSectionData<const uint8_t>;

// One entry of the section table. Holds the location of its data as an
// (offset, length) pair into the image buffer rather than a pointer, so it
// can be copied around freely.
class Section {
  public:
    // Builds a section from a decoded table entry. |name| is the result of
    // ReadSectionName() and must hold a value. |byte_length| scales the raw
    // length of allocated sections into bytes.
    static android::base::Result<Section> Decode(uint32_t index, const CoffSectionHeader& entry,
                                                 std::optional<std::string> name,
                                                 uint64_t image_size, uint32_t byte_length);

    uint32_t index() const { return index_; }
    const std::string& name() const { return name_; }
    uint32_t paddr() const { return paddr_; }
    uint32_t vaddr() const { return vaddr_; }
    uint64_t daddr() const { return daddr_; }
    uint64_t dlen() const { return dlen_; }
    SectionFlags flags() const { return flags_; }

  private:
    Section(uint32_t index, std::string name, uint32_t paddr, uint32_t vaddr, uint64_t daddr,
            uint64_t dlen, SectionFlags flags);

    uint32_t index_;
    std::string name_;
    uint32_t paddr_;
    uint32_t vaddr_;
    uint64_t daddr_;
    uint64_t dlen_;
    SectionFlags flags_;
};

class SectionTable {
  public:
    using const_iterator = std::vector<Section>::const_iterator;

    // Fails if two sections share a name.
    static android::base::Result<SectionTable> Build(std::vector<Section> sections);

    android::base::Result<Section> GetByIndex(size_t index) const;
    android::base::Result<Section> GetByName(const std::string& name) const;

    size_t size() const { return sections_.size(); }
    bool empty() const { return sections_.empty(); }
    const_iterator begin() const { return sections_.begin(); }
    const_iterator end() const { return sections_.end(); }

  private:
    SectionTable(std::vector<Section> sections, std::map<std::string, size_t> index_by_name);

    std::vector<Section> sections_;
    std::map<std::string, size_t> index_by_name_;
};

struct AddressRange {
    uint64_t start;
    uint64_t end;
};

// A TI COFF image held in memory. The header is validated by Parse(); the
// section table is decoded on the first call to ReadSectionTable() and cached.
class Image {
  public:
    // Takes ownership of |data|. Fails if the header, section table, symbol
    // table or string table extents do not fit in |data|.
    static android::base::Result<std::unique_ptr<Image>> Parse(std::vector<uint8_t> data);

    // Reads the whole file at |path| and parses it.
    static android::base::Result<std::unique_ptr<Image>> OpenFile(const std::string& path);

    uint16_t target_id() const { return target_id_; }
    uint32_t entry() const { return entry_; }
    uint16_t num_sections() const { return num_sections_; }
    uint64_t symtab_offset() const { return symtab_offset_; }
    uint32_t num_symbols() const { return num_symbols_; }
    uint64_t strtab_offset() const { return strtab_offset_; }
    uint32_t byte_length() const { return byte_length_; }

    size_t size() const { return data_.size(); }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* mutable_data() { return data_.data(); }

    android::base::Result<const SectionTable*> ReadSectionTable() const;

    SectionData GetSectionData(const Section& section);
    ConstSectionData GetSectionData(const Section& section) const;

    // Copies every allocated section whose physical, or failing that virtual,
    // address range lies within [address, address + size) into |dst| at the
    // matching offset. Sections that fit neither are skipped.
    android::base::Result<void> CopySections(uint64_t address, uint8_t* dst, size_t size) const;

    template <typename Collection>
    android::base::Result<void> CopySections(uint64_t address, Collection* dst) const {
        static_assert(sizeof(typename Collection::value_type) == 1, "wrong collection");
        return CopySections(address, reinterpret_cast<uint8_t*>(dst->data()), dst->size());
    }

    // Lowest physical start and highest physical end of the allocated sections.
    android::base::Result<AddressRange> AllocatedRange() const;

  private:
    explicit Image(std::vector<uint8_t> data);

    android::base::Result<void> LoadHeader();
    android::base::Result<SectionTable> LoadSectionTable() const;

    std::vector<uint8_t> data_;

    uint16_t target_id_;
    uint32_t entry_;
    uint16_t num_sections_;
    uint64_t symtab_offset_;
    uint32_t num_symbols_;
    uint64_t strtab_offset_;
    uint32_t byte_length_;

    mutable std::optional<SectionTable> section_table_;
    mutable bool loading_section_table_;

    DISALLOW_COPY_AND_ASSIGN(Image);
};

}  // namespace ticoff
