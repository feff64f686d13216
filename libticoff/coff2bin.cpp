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

#include <getopt.h>
#include <sysexits.h>

#include <iostream>
#include <string>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/parseint.h>
#include <android-base/stringprintf.h>
#include <ticoff/byte_operations.h>
#include <ticoff/coff_image.h>
#include <ticoff/memory_image.h>

using android::base::ParseUint;
using android::base::StringPrintf;

static int Usage() {
    std::cerr << "coff2bin: Flatten the allocated sections of a TI COFF image.\n"
                 "Usage: coff2bin [flags] <coff_file> <bin_file> <base_address> [<size>]\n"
                 "  <size> defaults to the end of the highest allocated section.\n"
                 "Flags:\n"
                 "  -s, --swap         Swap the bytes of every 16-bit word.\n"
                 "  -f, --fill <byte>  Value of bytes not covered by a section (default 0xff).\n";
    return EX_USAGE;
}

int main(int argc, char** argv) {
    android::base::InitLogging(argv, &android::base::StderrLogger);

    ticoff::MemoryImageOptions options;

    struct option long_options[] = {
            {"swap", no_argument, nullptr, 's'},
            {"fill", required_argument, nullptr, 'f'},
            {nullptr, 0, nullptr, 0},
    };
    int rv;
    while ((rv = getopt_long(argc, argv, "sf:", long_options, nullptr)) != -1) {
        switch (rv) {
            case 's':
                options.swap_words = true;
                break;
            case 'f':
                if (!ParseUint(optarg, &options.fill)) {
                    std::cerr << "Invalid fill byte: " << optarg << "\n";
                    return Usage();
                }
                break;
            default:
                return Usage();
        }
    }

    if (argc - optind < 3 || argc - optind > 4) {
        return Usage();
    }
    std::string input = argv[optind];
    std::string output = argv[optind + 1];
    if (!ParseUint(argv[optind + 2], &options.base_address)) {
        std::cerr << "Invalid base address: " << argv[optind + 2] << "\n";
        return Usage();
    }
    if (argc - optind == 4 && !ParseUint(argv[optind + 3], &options.size)) {
        std::cerr << "Invalid size: " << argv[optind + 3] << "\n";
        return Usage();
    }

    auto image = ticoff::Image::OpenFile(input);
    if (!image.ok()) {
        LOG(ERROR) << input << ": " << image.error().message();
        return EX_DATAERR;
    }

    ticoff::ByteOperations ops;
    auto memory_image = ticoff::BuildMemoryImage(**image, options, ops);
    if (!memory_image.ok()) {
        LOG(ERROR) << input << ": " << memory_image.error().message();
        return EX_DATAERR;
    }

    std::string content(memory_image->data.begin(), memory_image->data.end());
    if (!android::base::WriteStringToFile(content, output)) {
        PLOG(ERROR) << "Failed to write " << output;
        return EX_CANTCREAT;
    }

    LOG(INFO) << StringPrintf("Wrote %zu bytes to %s, crc32 0x%08x", content.size(),
                              output.c_str(), memory_image->checksum);
    return EX_OK;
}
