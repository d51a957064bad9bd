// residue_file.cpp

#include "residue_file.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>

namespace graham {

static std::runtime_error io_error(const std::string& what, const std::string& path) {
    return std::runtime_error(what + " '" + path + "': " + std::strerror(errno));
}

void write_residue_file(const std::string& path, const ResidueTable& r) {
    std::FILE* f = std::fopen(path.c_str(), "wb");
    if (!f) throw io_error("cannot open for writing", path);

    // Skip the unused R[0]
    size_t n = r.empty() ? 0 : r.size() - 1;
    size_t written = n ? std::fwrite(r.data() + 1, sizeof(uint32_t), n, f) : 0;

    if (written != n) {
        auto err = io_error("short write to", path);
        std::fclose(f);
        throw err;
    }
    if (std::fclose(f) != 0)
        throw io_error("cannot close", path);
}

ResidueTable read_residue_file(const std::string& path) {
    std::FILE* f = std::fopen(path.c_str(), "rb");
    if (!f) throw io_error("cannot open for reading", path);

    long size = -1;
    if (std::fseek(f, 0, SEEK_END) == 0)
        size = std::ftell(f);
    if (size < 0 || std::fseek(f, 0, SEEK_SET) != 0) {
        auto err = io_error("cannot determine size of", path);
        std::fclose(f);
        throw err;
    }
    if (size % sizeof(uint32_t) != 0) {
        std::fclose(f);
        throw std::runtime_error("'" + path + "' is " + std::to_string(size)
                                 + " bytes, not a whole number of uint32 values");
    }

    size_t n = (size_t)size / sizeof(uint32_t);
    ResidueTable r(n + 1, 0);
    size_t got = n ? std::fread(r.data() + 1, sizeof(uint32_t), n, f) : 0;
    std::fclose(f);

    if (got != n)
        throw std::runtime_error("short read from '" + path + "'");
    return r;
}

} // namespace graham
