#ifndef _XBE_H_
#define _XBE_H_

#include <cstdint>

namespace Xbe {
    
// https://github.com/GerbilSoft/rom-properties/blob/fcb6fc09ec7bfbd8b7c6f728aff4308dfa047e2a/src/libromdata/Console/xbox_xbe_structs.h
// XBE fields are little endian.

    constexpr char     MAGIC[]    = "XBEH";
    constexpr uint64_t MAGIC_LEN  = 4;

    constexpr uint64_t HEADER_SIZE          = 0x178;
    constexpr uint64_t BASE_ADDRESS_OFFSET  = 0x104; // Base address (usually 0x00010000)
    constexpr uint64_t CERT_ADDRESS_OFFSET  = 0x118; // Certificate address (in memory)

    constexpr uint64_t CERT_SIZE            = 0x1D0;
    constexpr uint64_t CERT_TITLE_ID        = 0x008;
    constexpr uint64_t CERT_VERSION         = 0x0AC;

    struct Cert {
        uint32_t title_id{0};
        uint32_t cert_version{0};

        static Cert parse(const uint8_t* data);
    };

};

#endif // _XBE_H_
