#include "Common/EndianUtils.h"
#include "Formats/Xiso.h"

Xiso::DirectoryEntry::Header Xiso::DirectoryEntry::parse_header(const uint8_t* data)
{
    Header header;
    header.left_offset  = EndianUtils::load_little_16(data);
    header.right_offset = EndianUtils::load_little_16(data + 2);
    header.start_sector = EndianUtils::load_little_32(data + 4);
    header.file_size    = EndianUtils::load_little_32(data + 8);
    header.attributes   = data[12];
    header.name_length  = data[13];
    return header;
}
