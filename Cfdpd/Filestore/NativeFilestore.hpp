// ======================================================================
// \title  NativeFilestore.hpp
// \author campuzan
// \brief  hpp file for the POSIX filestore rooted at a directory
// ======================================================================

#ifndef Cfdpd_Filestore_NativeFilestore_HPP
#define Cfdpd_Filestore_NativeFilestore_HPP

#include <Cfdpd/Filestore/Filestore.hpp>

namespace Cfdpd {

//! Filestore over the local file system. Virtual paths are relative to
//! the root directory; a leading '/' is ignored and ".." is rejected.
class NativeFilestore : public Filestore {
  public:
    explicit NativeFilestore(const std::string& rootDirectory);

    Status openRead(const std::string& path, std::unique_ptr<File>& file, U64& size) override;
    Status createWrite(const std::string& path, std::unique_ptr<File>& file) override;
    Status enumerate(const std::string& path, std::vector<std::string>& entries) override;
    Status mapPath(const std::string& path, std::string& nativePath) const override;

    const std::string& getRoot() const { return this->m_root; }

    //! Translate an errno value to a status
    static Status errnoToStatus(int errorNumber);

  private:
    //! Create every missing parent directory of a native path
    Status makeParents(const std::string& nativePath) const;

    std::string m_root;
};

}  // namespace Cfdpd

#endif  // Cfdpd_Filestore_NativeFilestore_HPP
