#pragma once

#include <istream>
#include <string>

namespace brisk {
class Sanitizer;

// Reads raw source from a stream in chunks of BRISK_READ_CHUNK bytes until the
// stream is exhausted or an instruction arrives after the sanitizer is full.
// Non-instruction bytes after a full program, and the rest of the chunk holding
// the first surplus instruction, are consumed and dropped.
void readProgram(std::istream& in, Sanitizer& sanitizer);

// Reads and sanitizes a file, memory-mapped when it is a regular file.
// Returns true on success; on error, 'err' is set.
bool readProgramFile(const std::string& filename, Sanitizer& sanitizer, std::string& err);
}  // namespace brisk
