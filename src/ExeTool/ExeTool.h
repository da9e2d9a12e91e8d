#ifndef _EXE_TOOL_H_
#define _EXE_TOOL_H_

#include <cstdint>

#include "Formats/GoD.h"
#include "Formats/Xex.h"
#include "Formats/Xbe.h"
#include "Formats/Xiso.h"
#include "ImageReader/ImageReader.h"

class ExeTool {
public:
    ExeTool(ImageReader& image_reader, const Xiso::DirectoryEntry& exe_entry);

    ~ExeTool() {};

    GoD::ContentType content_type() { return content_type_; };

    const Xex::ExecutionInfo& xex_cert() { return xex_cert_; }; // Will return constructed Xex cert for Xbe
    const Xbe::Cert& xbe_cert() { return xbe_cert_; }; // Only valid for Xbe

    uint32_t title_id() { return xex_cert_.title_id; };

    uint64_t exe_offset() { return exe_offset_; }; // Relative to the image's root offset
    uint64_t cert_offset() { return cert_offset_; }; // Relative to exe_offset

private:
    GoD::ContentType content_type_{GoD::ContentType::GAMES_ON_DEMAND};

    uint64_t exe_offset_{0};
    uint64_t exe_size_{0};
    uint64_t cert_offset_{0};
    Xex::ExecutionInfo xex_cert_;
    Xbe::Cert xbe_cert_;

    void get_xex_cert_from_reader(ImageReader& image_reader);
    void get_xbe_cert_from_reader(ImageReader& image_reader);
    void create_xex_cert_from_xbe();
};

#endif // _EXE_TOOL_H_
