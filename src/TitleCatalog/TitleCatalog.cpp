#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

#include "GDT.h"
#include "TitleCatalog/TitleCatalog.h"

namespace {

    struct BuiltinTitle {
        uint32_t title_id;
        const char* title_name;
    };

    const BuiltinTitle BUILTIN_TITLES[] = {
        { 0x4D5307E6, "Halo 3" },
        { 0x4D530877, "Halo 3: ODST" },
        { 0x4D53085B, "Halo: Reach" },
        { 0x4D5307D5, "Gears of War" },
        { 0x545408A7, "Grand Theft Auto V" },
        { 0x5454082B, "Red Dead Redemption" },
        { 0x545407F2, "Grand Theft Auto IV" },
        { 0x425307E6, "The Elder Scrolls V: Skyrim" },
        { 0x584111F7, "Minecraft: Xbox 360 Edition" },
    };

};

TitleCatalog::TitleCatalog() 
{
    for (const auto& title : BUILTIN_TITLES) 
    {
        titles_[title.title_id] = title.title_name;
    }
}

std::optional<std::string> TitleCatalog::lookup(const uint32_t title_id) const 
{
    auto it = titles_.find(title_id);
    if (it == titles_.end()) 
    {
        return std::nullopt;
    }
    return it->second;
}

void TitleCatalog::add(const uint32_t title_id, const std::string& title_name) 
{
    titles_[title_id] = title_name;
}

void TitleCatalog::load_json(const std::filesystem::path& json_path) 
{
    std::ifstream in_file(json_path);
    if (!in_file.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), json_path.string());
    }

    std::stringstream json_string;
    json_string << in_file.rdbuf();
    if (in_file.bad()) 
    {
        throw GDTException(ErrCode::FILE_READ, HERE(), json_path.string());
    }

    load_json_string(json_string.str());
}

void TitleCatalog::load_json_string(const std::string& json_string) 
{
    nlohmann::json json = nlohmann::json::parse(json_string, nullptr, false);

    if (json.is_discarded() || !json.is_array()) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "Title list is not a JSON array");
    }

    size_t loaded = 0;

    for (const auto& entry : json) 
    {
        if (!entry.is_object() || !entry.contains("Title ID") || !entry.contains("Title Name") ||
            !entry["Title ID"].is_string() || !entry["Title Name"].is_string()) 
        {
            continue;
        }

        const std::string title_id_str = entry["Title ID"].get<std::string>();
        size_t parsed_chars = 0;
        unsigned long title_id = 0;

        try 
        {
            title_id = std::stoul(title_id_str, &parsed_chars, 16);
        } 
        catch (const std::exception&) 
        {
            GDTLog(Debug) << "Skipping title list entry with invalid ID: " << title_id_str << GDTLog::Endl;
            continue;
        }

        if (parsed_chars != title_id_str.size() || title_id > UINT32_MAX) 
        {
            GDTLog(Debug) << "Skipping title list entry with invalid ID: " << title_id_str << GDTLog::Endl;
            continue;
        }

        titles_[static_cast<uint32_t>(title_id)] = entry["Title Name"].get<std::string>();
        loaded++;
    }

    GDTLog(Debug) << "Loaded " << loaded << " titles from title list" << GDTLog::Endl;
}
