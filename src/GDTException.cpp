#include "GDTLog.h"
#include "GDTException.h"

const GDTException::ErrorMap GDTException::error_map[] = {
    { Code::NONE,          Kind::NONE,     "No error" },
    { Code::FILE_OPEN,     Kind::IO,       "File open error" },
    { Code::FILE_READ,     Kind::IO,       "File read error" },
    { Code::FILE_WRITE,    Kind::IO,       "File write error" },
    { Code::FILE_SEEK,     Kind::IO,       "File seek error" },
    { Code::FS_MKDIR,      Kind::LAYOUT,   "Directory creation error" },
    { Code::FS_REMOVE,     Kind::LAYOUT,   "Directory removal error" },
    { Code::IMAGE_INVALID, Kind::IMAGE,    "Invalid image error" },
    { Code::EXE_NOT_FOUND, Kind::METADATA, "Executable not found error" },
    { Code::EXE_INVALID,   Kind::METADATA, "Invalid executable error" },
    { Code::HASH_INVALID,  Kind::FORMAT,   "Invalid hash table error" },
    { Code::STR_ENCODING,  Kind::METADATA, "String encoding error" },
    { Code::MISC,          Kind::INTERNAL, "Miscellaneous error" },
    { Code::UNK,           Kind::INTERNAL, "Unknown error" }
};

GDTException::GDTException(Code code, const std::string& info, const std::string& message)
    : code_(code), file_line_(info), message_(message) 
{
    build_message();
    log_error();
}

GDTException::Kind GDTException::kind() const noexcept
{
    for (const auto& error : error_map) 
    {
        if (error.code == code_) 
        {
            return error.kind;
        }
    }
    return Kind::INTERNAL;
}

GDTException& GDTException::add_context(const std::string& context)
{
    context_.insert(context_.begin(), context);
    build_message();
    return *this;
}

const char* GDTException::kind_name(Kind kind)
{
    switch (kind) 
    {
        case Kind::NONE:     return "None";
        case Kind::IMAGE:    return "ImageError";
        case Kind::METADATA: return "MetadataError";
        case Kind::LAYOUT:   return "LayoutError";
        case Kind::IO:       return "IoError";
        case Kind::FORMAT:   return "FormatError";
        default:             return "InternalError";
    }
}

void GDTException::build_message() 
{
    std::string error_message = "Unknown error";

    for (const auto& error : error_map) 
    {
        if (error.code == code_) 
        {
            error_message = error.message;
            break;
        }
    }

    if (!message_.empty()) 
    {
        error_message += ": " + message_;
    }

    full_message_.clear();

    for (const auto& context : context_) 
    {
        full_message_ += context + ": ";
    }

    full_message_ += error_message;
}

void GDTException::log_error() const 
{
    GDTLog(Debug) << full_message_ << " (" << file_line_ << ")" << GDTLog::Endl;
}
