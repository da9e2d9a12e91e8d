#ifndef _XEX_H_
#define _XEX_H_

#include <cstdint>

// https://github.com/emoose/idaxex
// All XEX2 header fields are big endian.

namespace Xex {

    constexpr char     MAGIC[]    = "XEX2";
    constexpr uint64_t MAGIC_LEN  = 4;

    constexpr uint64_t HEADER_SIZE          = 0x18;
    constexpr uint64_t HEADER_COUNT_OFFSET  = 0x14;
    constexpr uint64_t DIRECTORY_ENTRY_SIZE = 8;
    constexpr uint32_t MAX_HEADER_COUNT     = 0x100; // Real executables carry a few dozen at most

    struct ExecutionInfo {
        uint8_t media_id[4]{};
        uint32_t version{0};
        uint32_t base_version{0};
        uint32_t title_id{0};
        uint8_t platform{0};
        uint8_t executable_type{0};
        uint8_t disc_number{0};
        uint8_t disc_count{0};
        uint32_t savegame_id{0};

        static constexpr uint64_t SIZE = 24;

        static ExecutionInfo parse(const uint8_t* data);
    };

    namespace KeyValue {
        constexpr uint32_t ENTRY_POINT                   = 0x00010100;
        constexpr uint32_t EXECUTION_INFO                = 0x00040006;
    };

}; // namespace Xex

#endif // _XEX_H_
