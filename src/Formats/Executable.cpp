#include "Common/EndianUtils.h"
#include "Formats/Xex.h"
#include "Formats/Xbe.h"

Xex::ExecutionInfo Xex::ExecutionInfo::parse(const uint8_t* data)
{
    ExecutionInfo info;
    for (int i = 0; i < 4; ++i) 
    {
        info.media_id[i] = data[i];
    }
    info.version         = EndianUtils::load_big_32(data + 0x04);
    info.base_version    = EndianUtils::load_big_32(data + 0x08);
    info.title_id        = EndianUtils::load_big_32(data + 0x0C);
    info.platform        = data[0x10];
    info.executable_type = data[0x11];
    info.disc_number     = data[0x12];
    info.disc_count      = data[0x13];
    info.savegame_id     = EndianUtils::load_big_32(data + 0x14);
    return info;
}

Xbe::Cert Xbe::Cert::parse(const uint8_t* data)
{
    Cert cert;
    cert.title_id     = EndianUtils::load_little_32(data + CERT_TITLE_ID);
    cert.cert_version = EndianUtils::load_little_32(data + CERT_VERSION);
    return cert;
}
