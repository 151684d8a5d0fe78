// ======================================================================
// \title  Filestore.hpp
// \author campuzan
// \brief  hpp file for the filestore capability used by transactions
//
// Transactions never touch the native file system directly. Every path
// they see is a virtual path that the filestore maps under its root.
// ======================================================================

#ifndef Cfdpd_Filestore_Filestore_HPP
#define Cfdpd_Filestore_Filestore_HPP

#include <memory>
#include <string>
#include <vector>

#include <Cfdpd/Types/BasicTypes.hpp>

namespace Cfdpd {

class Filestore {
  public:
    enum Status {
        OP_OK,          //!< Operation was successful
        DOESNT_EXIST,   //!< File or directory doesn't exist
        NO_SPACE,       //!< No space left
        NO_PERMISSION,  //!< No permission to access the file
        BAD_SIZE,       //!< Short read or write, or a file too large to transfer
        NOT_OPENED,     //!< File hasn't been opened yet
        INVALID_PATH,   //!< Path escapes the filestore root or is empty
        IS_DIRECTORY,   //!< Path names a directory where a file was expected
        OTHER_ERROR     //!< A catch-all for other errors
    };

    //! An open file. Reads and writes are positioned, never sequential.
    class File {
      public:
        virtual ~File() {}

        //! Read up to size bytes at offset
        //! \param size In: bytes wanted. Out: bytes read, less at end of file
        virtual Status readAt(U64 offset, U8* buffer, FwSizeType& size) = 0;

        //! Write all of size bytes at offset, extending the file as needed
        virtual Status writeAt(U64 offset, const U8* buffer, FwSizeType size) = 0;

        //! Flush written data to the medium
        virtual Status flush() = 0;
    };

    virtual ~Filestore() {}

    //! Open an existing file for reading and report its size
    virtual Status openRead(const std::string& path, std::unique_ptr<File>& file, U64& size) = 0;

    //! Create a file for writing, truncating any existing file. The file
    //! can be read back through the same handle.
    virtual Status createWrite(const std::string& path, std::unique_ptr<File>& file) = 0;

    //! List the entries of a directory, sorted, without "." and ".."
    virtual Status enumerate(const std::string& path, std::vector<std::string>& entries) = 0;

    //! Map a virtual path to the native path it refers to
    virtual Status mapPath(const std::string& path, std::string& nativePath) const = 0;

    //! Name of a status for logging
    static const char* statusName(Status status);
};

}  // namespace Cfdpd

#endif  // Cfdpd_Filestore_Filestore_HPP
