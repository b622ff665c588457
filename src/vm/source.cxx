/*
    Brisk - A direct brainfuck interpreter
    Program source acquisition
    Published under the GNU AGPL-3.0-or-later license
*/
// SPDX-License-Identifier: AGPL-3.0-or-later
#include "vm/source.hxx"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <fstream>
#include <string_view>
#include <utility>

#include "vm.hxx"

namespace {
// Read-only file mapping, unmapped on destruction
struct MappedFile {
    const char* data = nullptr;
    size_t size = 0;
    int fd = -1;

    MappedFile() = default;
    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;
    ~MappedFile() { close(); }

    // Only regular files are mapped. Pipes and FIFOs report a zero size and are
    // left for the stream reader, without being opened here.
    bool open(const std::string& path) {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return false;
        fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) return false;
        if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
            close();
            return false;
        }
        if (st.st_size == 0) return true;
        void* view = mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
        if (view == MAP_FAILED) {
            close();
            return false;
        }
        data = static_cast<const char*>(view);
        size = static_cast<size_t>(st.st_size);
        return true;
    }

    void close() {
        if (data && size) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
            munmap(const_cast<char*>(data), size);
        }
        if (fd >= 0) ::close(fd);
        data = nullptr;
        size = 0;
        fd = -1;
    }
};
}  // namespace

void brisk::readProgram(std::istream& in, Sanitizer& sanitizer) {
    std::array<char, BRISK_READ_CHUNK> buf{};
    // A full program keeps reading until a further instruction or the end of the
    // stream tells whether it was truncated.
    while (!sanitizer.truncated() && in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto got = in.gcount();
        if (got <= 0) break;
        sanitizer.feed(std::string_view(buf.data(), static_cast<size_t>(got)));
    }
}

bool brisk::readProgramFile(const std::string& filename, Sanitizer& sanitizer, std::string& err) {
    {
        MappedFile mf;
        if (mf.open(filename)) {
            if (mf.size) sanitizer.feed(std::string_view(mf.data, mf.size));
            return true;
        }
    }
    // Fallback: stream and compact
    std::ifstream in(filename, std::ios::binary);
    if (!in.is_open()) {
        err = "File could not be opened";
        return false;
    }
    readProgram(in, sanitizer);
    if (in.bad()) {
        err = "Error while reading file";
        return false;
    }
    return true;
}
