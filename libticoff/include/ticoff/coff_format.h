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

#include <stdint.h>

/* All multi-byte fields are little-endian on disk. */

/* Magic value of the optional file header. */
#define TICOFF_MAGIC 0x0108

/* Record sizes. */
#define TICOFF_HEADER_SIZE 50
#define TICOFF_SECTION_HEADER_SIZE 48
#define TICOFF_SYMBOL_SIZE 18
#define TICOFF_NAME_SIZE 8

/* Target chipset ids. */
#define TICOFF_TARGET_C5400 0x98
#define TICOFF_TARGET_C2800 0x9D

/* Section flags. */
#define TICOFF_STYP_TEXT 0x20
#define TICOFF_STYP_DATA 0x40
#define TICOFF_STYP_BSS 0x80
#define TICOFF_STYP_ALLOC_MASK (TICOFF_STYP_TEXT | TICOFF_STYP_DATA | TICOFF_STYP_BSS)

/* File header followed by the optional header, as one fixed record. */
struct CoffFileHeader {
    uint16_t version;
    uint16_t num_sections;
    uint32_t timestamp;
    uint32_t symtab_offset;
    uint32_t num_symbols;
    uint16_t opthdr_size;
    uint16_t flags;
    uint16_t target_id;
    /* Optional header. */
    uint16_t magic;
    uint16_t version_stamp;
    uint32_t text_size;
    uint32_t data_size;
    uint32_t bss_size;
    uint32_t entry;
    uint32_t text_start;
    uint32_t data_start;
} __attribute__((packed));

struct CoffSectionHeader {
    /*
     * Either an inline name padded with NULs, or zero in the first word
     * followed by an offset into the string table.
     */
    union {
        char short_name[TICOFF_NAME_SIZE];
        struct {
            uint32_t zeroes;
            uint32_t offset;
        } __attribute__((packed)) long_name;
    } name;
    uint32_t paddr;
    uint32_t vaddr;
    uint32_t size;
    uint32_t data_offset;
    uint32_t reloc_offset;
    uint32_t lineno_offset;
    uint32_t num_relocs;
    uint32_t num_linenos;
    uint32_t flags;
    uint16_t reserved;
    uint16_t mem_page;
} __attribute__((packed));

static_assert(sizeof(CoffFileHeader) == TICOFF_HEADER_SIZE, "bad CoffFileHeader size");
static_assert(sizeof(CoffSectionHeader) == TICOFF_SECTION_HEADER_SIZE,
              "bad CoffSectionHeader size");
