#ifndef _TITLE_HELPER_H_
#define _TITLE_HELPER_H_

#include <cstdint>
#include <string>
#include <optional>

#include "Formats/GoD.h"
#include "Formats/Xex.h"
#include "ImageReader/ImageReader.h"
#include "TitleCatalog/TitleCatalog.h"

struct TitleInfo 
{
    Xex::ExecutionInfo execution_info;
    GoD::ContentType content_type{GoD::ContentType::GAMES_ON_DEMAND};
    std::string executable_name;
};

class TitleHelper 
{
public:
    static constexpr char XEX_NAME[] = "default.xex";
    static constexpr char XBE_NAME[] = "default.xbe";

    // game_title overrides the catalog name when set
    TitleHelper(ImageReader& image_reader, const TitleCatalog& title_catalog, const std::optional<std::string>& game_title = std::nullopt);

    ~TitleHelper() = default;

    // Finds default.xex (Games on Demand) or default.xbe (Xbox Original) in the root directory
    static TitleInfo extract(ImageReader& image_reader);

    const TitleInfo& title_info() const { return title_info_; };
    const Xex::ExecutionInfo& xex_cert() const { return title_info_.execution_info; };
    GoD::ContentType content_type() const { return title_info_.content_type; };
    uint32_t title_id() const { return title_info_.execution_info.title_id; };
    std::string title_id_string() const;

    const std::optional<std::string>& title_name() const { return title_name_; };
    std::string display_name() const { return title_name_ ? *title_name_ : "(unknown)"; };

    std::string summary() const;

    static std::string content_type_name(GoD::ContentType content_type);

private:
    TitleInfo title_info_;
    std::optional<std::string> title_name_;
};

#endif // _TITLE_HELPER_H_
