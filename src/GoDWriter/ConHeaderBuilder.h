#ifndef _CON_HEADER_BUILDER_H_
#define _CON_HEADER_BUILDER_H_

#include <cstdint>
#include <string>
#include <vector>

#include "Formats/GoD.h"
#include "Formats/Xex.h"
#include "GoDWriter/HashList.h"

/*  Accumulates the fields of a LIVE content header. finalize() stamps the 
    header digest and hands the buffer over, the builder is spent afterwards. */
class ConHeaderBuilder 
{
public:
    ConHeaderBuilder();
    ~ConHeaderBuilder() = default;

    ConHeaderBuilder& with_execution_info(const Xex::ExecutionInfo& exe_info);
    ConHeaderBuilder& with_block_counts(const uint32_t block_count, const uint16_t secondary_count);

    // parts_size is the combined size of all data files in bytes
    ConHeaderBuilder& with_data_parts_info(const uint32_t part_count, const uint64_t parts_size);

    ConHeaderBuilder& with_content_type(const GoD::ContentType content_type);
    ConHeaderBuilder& with_mht_hash(const HashList::Digest& mht_hash);

    // Stored as UTF-16BE truncated to 40 code units, never splitting a surrogate pair
    ConHeaderBuilder& with_game_title(const std::vector<char16_t>& game_title);
    ConHeaderBuilder& with_game_title(const std::string& game_title);

    // PNG data, throws MISC if larger than the header's icon slot
    ConHeaderBuilder& with_game_icon(const std::vector<uint8_t>& icon_data);

    std::vector<uint8_t> finalize();

private:
    std::vector<uint8_t> buffer_;
};

#endif // _CON_HEADER_BUILDER_H_
