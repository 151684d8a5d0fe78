// ======================================================================
// \title  NativeFilestore.cpp
// \author campuzan
// \brief  cpp file for the POSIX filestore rooted at a directory
// ======================================================================

#include <Cfdpd/Filestore/NativeFilestore.hpp>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>

namespace Cfdpd {

const char* Filestore::statusName(Status status) {
    switch (status) {
        case OP_OK:
            return "OP_OK";
        case DOESNT_EXIST:
            return "DOESNT_EXIST";
        case NO_SPACE:
            return "NO_SPACE";
        case NO_PERMISSION:
            return "NO_PERMISSION";
        case BAD_SIZE:
            return "BAD_SIZE";
        case NOT_OPENED:
            return "NOT_OPENED";
        case INVALID_PATH:
            return "INVALID_PATH";
        case IS_DIRECTORY:
            return "IS_DIRECTORY";
        default:
            return "OTHER_ERROR";
    }
}

namespace {

class PosixFile : public Filestore::File {
  public:
    explicit PosixFile(int fd) : m_fd(fd) {}

    ~PosixFile() override {
        if (this->m_fd >= 0) {
            (void)::close(this->m_fd);
        }
    }

    PosixFile(const PosixFile&) = delete;
    PosixFile& operator=(const PosixFile&) = delete;

    Filestore::Status readAt(U64 offset, U8* buffer, FwSizeType& size) override {
        FwSizeType total = 0;
        while (total < size) {
            const ssize_t got = ::pread(this->m_fd, buffer + total, static_cast<size_t>(size - total),
                                        static_cast<off_t>(offset + total));
            if (got < 0) {
                if (errno == EINTR) {
                    continue;
                }
                size = total;
                return NativeFilestore::errnoToStatus(errno);
            }
            if (got == 0) {
                break;  // end of file
            }
            total += static_cast<FwSizeType>(got);
        }
        size = total;
        return Filestore::OP_OK;
    }

    Filestore::Status writeAt(U64 offset, const U8* buffer, FwSizeType size) override {
        FwSizeType total = 0;
        while (total < size) {
            const ssize_t put = ::pwrite(this->m_fd, buffer + total, static_cast<size_t>(size - total),
                                         static_cast<off_t>(offset + total));
            if (put < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return NativeFilestore::errnoToStatus(errno);
            }
            if (put == 0) {
                return Filestore::BAD_SIZE;
            }
            total += static_cast<FwSizeType>(put);
        }
        return Filestore::OP_OK;
    }

    Filestore::Status flush() override {
        if (::fsync(this->m_fd) != 0) {
            return NativeFilestore::errnoToStatus(errno);
        }
        return Filestore::OP_OK;
    }

  private:
    int m_fd;
};

}  // namespace

NativeFilestore::NativeFilestore(const std::string& rootDirectory) : m_root(rootDirectory) {
    // Keep the root without a trailing separator so that joins are uniform
    while (this->m_root.size() > 1 && this->m_root[this->m_root.size() - 1] == '/') {
        this->m_root.erase(this->m_root.size() - 1);
    }
}

Filestore::Status NativeFilestore::errnoToStatus(int errorNumber) {
    switch (errorNumber) {
        case ENOENT:
        case ENOTDIR:
            return DOESNT_EXIST;
        case ENOSPC:
        case EDQUOT:
            return NO_SPACE;
        case EACCES:
        case EPERM:
        case EROFS:
            return NO_PERMISSION;
        case EISDIR:
            return IS_DIRECTORY;
        case EFBIG:
        case EOVERFLOW:
            return BAD_SIZE;
        case EBADF:
            return NOT_OPENED;
        case ENAMETOOLONG:
            return INVALID_PATH;
        default:
            return OTHER_ERROR;
    }
}

Filestore::Status NativeFilestore::mapPath(const std::string& path, std::string& nativePath) const {
    std::string relative;
    std::string::size_type pos = 0;

    while (pos <= path.size()) {
        std::string::size_type next = path.find('/', pos);
        if (next == std::string::npos) {
            next = path.size();
        }
        const std::string component = path.substr(pos, next - pos);
        if (component == "..") {
            return INVALID_PATH;
        }
        if (!component.empty() && component != ".") {
            if (!relative.empty()) {
                relative += '/';
            }
            relative += component;
        }
        pos = next + 1;
    }

    if (relative.empty()) {
        // Only directory operations may name the root itself
        nativePath = this->m_root;
        return OP_OK;
    }

    nativePath = (this->m_root == "/") ? ("/" + relative) : (this->m_root + "/" + relative);
    return OP_OK;
}

Filestore::Status NativeFilestore::makeParents(const std::string& nativePath) const {
    std::string::size_type pos = this->m_root.size() + 1;
    while (true) {
        const std::string::size_type next = nativePath.find('/', pos);
        if (next == std::string::npos) {
            return OP_OK;
        }
        const std::string dir = nativePath.substr(0, next);
        if (::mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) {
            return errnoToStatus(errno);
        }
        pos = next + 1;
    }
}

Filestore::Status NativeFilestore::openRead(const std::string& path, std::unique_ptr<File>& file, U64& size) {
    std::string nativePath;
    Status status = this->mapPath(path, nativePath);
    if (status != OP_OK) {
        return status;
    }
    if (nativePath == this->m_root) {
        return INVALID_PATH;
    }

    const int fd = ::open(nativePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return errnoToStatus(errno);
    }

    struct stat info;
    if (::fstat(fd, &info) != 0) {
        status = errnoToStatus(errno);
        (void)::close(fd);
        return status;
    }
    if (S_ISDIR(info.st_mode)) {
        (void)::close(fd);
        return IS_DIRECTORY;
    }

    size = static_cast<U64>(info.st_size);
    file.reset(new PosixFile(fd));
    return OP_OK;
}

Filestore::Status NativeFilestore::createWrite(const std::string& path, std::unique_ptr<File>& file) {
    std::string nativePath;
    Status status = this->mapPath(path, nativePath);
    if (status != OP_OK) {
        return status;
    }
    if (nativePath == this->m_root) {
        return INVALID_PATH;
    }

    status = this->makeParents(nativePath);
    if (status != OP_OK) {
        return status;
    }

    const int fd = ::open(nativePath.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errnoToStatus(errno);
    }

    file.reset(new PosixFile(fd));
    return OP_OK;
}

Filestore::Status NativeFilestore::enumerate(const std::string& path, std::vector<std::string>& entries) {
    std::string nativePath;
    const Status status = this->mapPath(path, nativePath);
    if (status != OP_OK) {
        return status;
    }

    DIR* dir = ::opendir(nativePath.c_str());
    if (dir == nullptr) {
        return errnoToStatus(errno);
    }

    entries.clear();
    errno = 0;
    struct dirent* entry;
    while ((entry = ::readdir(dir)) != nullptr) {
        const std::string name(entry->d_name);
        if (name != "." && name != "..") {
            entries.push_back(name);
        }
    }
    const int readError = errno;
    (void)::closedir(dir);

    if (readError != 0) {
        return errnoToStatus(readError);
    }

    std::sort(entries.begin(), entries.end());
    return OP_OK;
}

}  // namespace Cfdpd
