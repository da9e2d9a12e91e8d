#include <algorithm>
#include <cstring>

#include <openssl/sha.h>

#include "GDT.h"
#include "Common/EndianUtils.h"
#include "Common/StringUtils.h"
#include "GoDWriter/ConHeaderBuilder.h"

using namespace GoD::ConHeader;

ConHeaderBuilder::ConHeaderBuilder() 
    : buffer_(SIZE, 0)
{
    std::memcpy(buffer_.data() + MAGIC, "LIVE", 4);
    EndianUtils::store_big_64(buffer_.data() + LICENSE_ENTRIES, 0xFFFFFFFFFFFFFFFF);
    EndianUtils::store_big_32(buffer_.data() + HEADER_SIZE, HEADER_SIZE_VALUE);
    EndianUtils::store_big_32(buffer_.data() + METADATA_VERSION, METADATA_VERSION_VALUE);
    buffer_[DESCRIPTOR_SIZE] = DESCRIPTOR_SIZE_VALUE;
    buffer_[DESCRIPTOR_TYPE] = DESCRIPTOR_TYPE_SVOD;
}

ConHeaderBuilder& ConHeaderBuilder::with_execution_info(const Xex::ExecutionInfo& exe_info) 
{
    std::memcpy(buffer_.data() + MEDIA_ID, exe_info.media_id, sizeof(exe_info.media_id));
    EndianUtils::store_big_32(buffer_.data() + VERSION, exe_info.version);
    EndianUtils::store_big_32(buffer_.data() + BASE_VERSION, exe_info.base_version);
    EndianUtils::store_big_32(buffer_.data() + TITLE_ID, exe_info.title_id);
    buffer_[PLATFORM] = exe_info.platform;
    buffer_[EXECUTABLE_TYPE] = exe_info.executable_type;
    buffer_[DISC_NUMBER] = exe_info.disc_number;
    buffer_[DISC_COUNT] = exe_info.disc_count;
    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_block_counts(const uint32_t block_count, const uint16_t secondary_count) 
{
    EndianUtils::store_little_32(buffer_.data() + BLOCK_COUNT, block_count);
    EndianUtils::store_big_16(buffer_.data() + SECONDARY_COUNT, secondary_count);
    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_data_parts_info(const uint32_t part_count, const uint64_t parts_size) 
{
    EndianUtils::store_little_32(buffer_.data() + DATA_PART_COUNT, part_count);
    EndianUtils::store_big_32(buffer_.data() + DATA_PARTS_SIZE, static_cast<uint32_t>(parts_size / PARTS_SIZE_UNIT));
    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_content_type(const GoD::ContentType content_type) 
{
    EndianUtils::store_big_32(buffer_.data() + CONTENT_TYPE, static_cast<uint32_t>(content_type));
    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_mht_hash(const HashList::Digest& mht_hash) 
{
    std::memcpy(buffer_.data() + MHT_HASH, mht_hash.data(), mht_hash.size());
    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_game_title(const std::string& game_title) 
{
    return with_game_title(StringUtils::utf8_to_utf16(game_title));
}

ConHeaderBuilder& ConHeaderBuilder::with_game_title(const std::vector<char16_t>& game_title) 
{
    std::vector<char16_t> utf16_title = game_title;
    if (utf16_title.size() > MAX_TITLE_CHARS) 
    {
        utf16_title.resize(MAX_TITLE_CHARS);

        // Lone high surrogate left by the cut
        if (utf16_title.back() >= 0xD800 && utf16_title.back() <= 0xDBFF) 
        {
            utf16_title.pop_back();
        }
    }

    for (uint32_t offset : { DISPLAY_NAME, TITLE_NAME }) 
    {
        std::memset(buffer_.data() + offset, 0, MAX_TITLE_CHARS * sizeof(char16_t));

        for (size_t i = 0; i < utf16_title.size(); ++i) 
        {
            EndianUtils::store_big_16(buffer_.data() + offset + (i * sizeof(char16_t)), static_cast<uint16_t>(utf16_title[i]));
        }
    }

    return *this;
}

ConHeaderBuilder& ConHeaderBuilder::with_game_icon(const std::vector<uint8_t>& icon_data) 
{
    if (icon_data.size() > MAX_ICON_SIZE) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "Icon is larger than " + std::to_string(MAX_ICON_SIZE) + " bytes");
    }

    uint32_t icon_size = static_cast<uint32_t>(icon_data.size());
    EndianUtils::store_big_32(buffer_.data() + ICON_SIZE, icon_size);
    EndianUtils::store_big_32(buffer_.data() + TITLE_ICON_SIZE, icon_size);

    for (uint32_t offset : { ICON, TITLE_ICON }) 
    {
        std::memset(buffer_.data() + offset, 0, MAX_ICON_SIZE);
        std::copy(icon_data.begin(), icon_data.end(), buffer_.begin() + offset);
    }

    return *this;
}

std::vector<uint8_t> ConHeaderBuilder::finalize() 
{
    unsigned char header_hash[SHA_DIGEST_LENGTH];
    SHA1(buffer_.data() + HASHED_START, buffer_.size() - HASHED_START, header_hash);
    std::memcpy(buffer_.data() + HEADER_HASH, header_hash, SHA_DIGEST_LENGTH);

    return std::move(buffer_);
}
