#ifndef _GDTEXCEPTION_H_
#define _GDTEXCEPTION_H_

#include <cstdint>
#include <exception>
#include <string>
#include <vector>

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)
#define HERE() (std::string(__FILE__) + " at line " + TOSTRING(__LINE__))

class GDTException : public std::exception {
public:
    enum class Code
    {
        NONE = 0,
        FILE_OPEN,
        FILE_READ,
        FILE_WRITE,
        FILE_SEEK,
        FS_MKDIR,
        FS_REMOVE,
        IMAGE_INVALID,
        EXE_NOT_FOUND,
        EXE_INVALID,
        HASH_INVALID,
        STR_ENCODING,
        MISC,
        UNK
    };

    // Failure classes a caller can act on
    enum class Kind
    {
        NONE = 0,
        IMAGE,
        METADATA,
        LAYOUT,
        IO,
        FORMAT,
        INTERNAL
    };

    struct ErrorMap {
        Code code;
        Kind kind;
        std::string message;
    };

    static const ErrorMap error_map[];

    GDTException(Code code, const std::string& info, const std::string& message = "");

    const char* what() const noexcept override 
    {
        return full_message_.c_str();
    }

    Code code() const noexcept 
    {
        return code_;
    }

    Kind kind() const noexcept;

    std::string file_line() const noexcept 
    {
        return file_line_;
    }

    std::string message() const noexcept 
    {
        return message_;
    }

    const std::vector<std::string>& context() const noexcept 
    {
        return context_;
    }

    // Prepends a description of the step that was running, what() renders outermost first
    GDTException& add_context(const std::string& context);

    static const char* kind_name(Kind kind);

private:
    Code code_;
    std::string file_line_;
    std::string message_;
    std::vector<std::string> context_;
    std::string full_message_;

    void build_message();
    void log_error() const;
};

using ErrCode = GDTException::Code;
using ErrKind = GDTException::Kind;

#endif // _GDTEXCEPTION_H_
