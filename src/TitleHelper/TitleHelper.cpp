#include <sstream>

#include "GDT.h"
#include "Common/StringUtils.h"
#include "ExeTool/ExeTool.h"
#include "TitleHelper/TitleHelper.h"

TitleHelper::TitleHelper(ImageReader& image_reader, const TitleCatalog& title_catalog, const std::optional<std::string>& game_title) 
    : title_info_(extract(image_reader))
{
    if (game_title && !game_title->empty()) 
    {
        title_name_ = game_title;
    }
    else 
    {
        title_name_ = title_catalog.lookup(title_id());
    }

    GDTLog(Debug) << "Title information retrieved for: " << title_id_string() << " " << display_name() << GDTLog::Endl;
}

TitleInfo TitleHelper::extract(ImageReader& image_reader) 
{
    std::optional<Xiso::DirectoryEntry> exe_entry = image_reader.find_root_entry(XEX_NAME);

    if (!exe_entry) 
    {
        exe_entry = image_reader.find_root_entry(XBE_NAME);
    }

    if (!exe_entry) 
    {
        throw GDTException(ErrCode::EXE_NOT_FOUND, HERE(), std::string("No ") + XEX_NAME + " or " + XBE_NAME + " in " + image_reader.name());
    }

    ExeTool exe_tool(image_reader, *exe_entry);

    TitleInfo title_info;
    title_info.execution_info = exe_tool.xex_cert();
    title_info.content_type = exe_tool.content_type();
    title_info.executable_name = exe_entry->filename;
    return title_info;
}

std::string TitleHelper::title_id_string() const 
{
    return StringUtils::uint32_to_hex_string(title_id());
}

std::string TitleHelper::content_type_name(GoD::ContentType content_type) 
{
    switch (content_type) 
    {
        case GoD::ContentType::GAMES_ON_DEMAND:
            return "Games on Demand";
        case GoD::ContentType::ORIGINAL_XBOX:
            return "Xbox Original";
        default:
            return "Unknown";
    }
}

std::string TitleHelper::summary() const 
{
    std::ostringstream ss;
    ss << "Title ID: " << title_id_string() << "\n";
    ss << "    Name: " << display_name() << "\n";
    ss << "    Type: " << content_type_name(content_type()) << "\n";
    return ss.str();
}
