#pragma once
#define BRISK_PROGRAM_MAX 65536
#define BRISK_TAPE_SIZE 30000
#define BRISK_DEFAULT_EOF_BEHAVIOUR 1
#define BRISK_READ_CHUNK 4096
// Hard limit to prevent uncontrolled memory allocation from user inputs.
// Requests exceeding this limit are rejected by the CLI.
#define BRISK_TAPE_MAX_BYTES (1ull << 31)  // 2 GiB
