// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Runs a fuzz target over corpus files when libFuzzer is not available

#ifdef STANDALONE_FUZZ_TARGET_DRIVER

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <sys/types.h>
#include <fstream>
#include <vector>

// Forward declare the fuzzer entry point
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size);

int main(int argc, char** argv) {
    if (argc < 2) {
        fprintf(stderr, "Usage: %s <input_file>...\n", argv[0]);
        fprintf(stderr, "Configure with -DSPVPROOF_LIBFUZZER=ON for coverage-guided fuzzing\n");
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::ifstream file(argv[i], std::ios::binary | std::ios::ate);
        if (!file) {
            fprintf(stderr, "Error: Cannot open file '%s'\n", argv[i]);
            return 1;
        }

        std::streamsize size = file.tellg();
        file.seekg(0, std::ios::beg);

        std::vector<uint8_t> buffer(static_cast<size_t>(size));
        if (size > 0 && !file.read(reinterpret_cast<char*>(buffer.data()), size)) {
            fprintf(stderr, "Error: Cannot read file '%s'\n", argv[i]);
            return 1;
        }

        LLVMFuzzerTestOneInput(buffer.data(), buffer.size());
        printf("%s: ok (%zd bytes)\n", argv[i], static_cast<ssize_t>(size));
    }
    return 0;
}

#endif // STANDALONE_FUZZ_TARGET_DRIVER
