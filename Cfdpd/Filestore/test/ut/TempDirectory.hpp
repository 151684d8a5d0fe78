// ======================================================================
// \title  TempDirectory.hpp
// \author campuzan
// \brief  hpp file for a scratch directory used by unit tests
// ======================================================================

#ifndef Cfdpd_Filestore_TempDirectory_HPP
#define Cfdpd_Filestore_TempDirectory_HPP

#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>

#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {

//! A directory under /tmp that is removed with everything in it on destruction
class TempDirectory {
  public:
    TempDirectory() {
        char pattern[] = "/tmp/cfdpd_test_XXXXXX";
        const char* created = ::mkdtemp(pattern);
        if (created != nullptr) {
            this->m_path = created;
        }
    }

    ~TempDirectory() {
        if (!this->m_path.empty()) {
            (void)::nftw(this->m_path.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
        }
    }

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    bool isValid() const { return !this->m_path.empty(); }

    const std::string& path() const { return this->m_path; }

    //! Native path of a name inside the directory
    std::string join(const std::string& name) const { return this->m_path + "/" + name; }

    //! Create a subdirectory and return its native path
    std::string makeDirectory(const std::string& name) const {
        const std::string native = this->join(name);
        (void)::mkdir(native.c_str(), 0755);
        return native;
    }

    //! Write a file with the given contents
    static bool writeFile(const std::string& nativePath, const std::vector<U8>& contents) {
        std::ofstream out(nativePath.c_str(), std::ios::binary | std::ios::trunc);
        if (!out) {
            return false;
        }
        out.write(reinterpret_cast<const char*>(contents.data()), static_cast<std::streamsize>(contents.size()));
        return static_cast<bool>(out);
    }

    //! Read a whole file; empty when it does not exist
    static std::vector<U8> readFile(const std::string& nativePath) {
        std::ifstream in(nativePath.c_str(), std::ios::binary);
        return std::vector<U8>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    //! Deterministic file contents of the given size
    static std::vector<U8> pattern(FwSizeType size, U32 seed = 1) {
        std::vector<U8> contents(size);
        U32 state = seed;
        for (FwSizeType i = 0; i < size; ++i) {
            state = (state * 1103515245U) + 12345U;
            contents[i] = static_cast<U8>(state >> 16);
        }
        return contents;
    }

  private:
    static int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
        return ::remove(path);
    }

    std::string m_path;
};

}  // namespace Cfdpd

#endif  // Cfdpd_Filestore_TempDirectory_HPP
