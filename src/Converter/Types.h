#ifndef _CONVERTER_TYPES_H_
#define _CONVERTER_TYPES_H_

#include <cstdint>
#include <string>
#include <memory>
#include <optional>
#include <filesystem>

#include "GDTException.h"
#include "ImageSource/ImageSource.h"

enum class TrimMode 
{
    FROM_END,   // Image size minus the root offset
    USED_DATA,  // Up to the last byte referenced by the filesystem
};

struct ConversionRequest 
{
    std::filesystem::path source_path;
    std::shared_ptr<ImageSource> source{nullptr}; // Used instead of source_path when set
    std::filesystem::path dest_path;
    std::optional<std::string> game_title;
    TrimMode trim_mode{TrimMode::FROM_END};
    uint32_t num_threads{0}; // 0 = hardware concurrency
    bool dry_run{false};
    std::optional<std::filesystem::path> icon_path;
};

struct ConversionResult 
{
    bool success{false};
    std::string message;
    std::optional<std::filesystem::path> god_path;
    std::optional<ErrCode> error_code;
    std::optional<ErrKind> error_kind;
};

#endif // _CONVERTER_TYPES_H_
