#include <algorithm>
#include <cctype>
#include <system_error>

#include "GDT.h"
#include "Common/StringUtils.h"
#include "InputHelper/InputHelper.h"

std::vector<InputHelper::IsoFile> InputHelper::list_isos(const std::filesystem::path& in_directory) 
{
    std::vector<IsoFile> iso_files;
    std::error_code ec;

    if (!std::filesystem::is_directory(in_directory, ec)) 
    {
        return iso_files;
    }

    auto options = std::filesystem::directory_options::follow_directory_symlink | std::filesystem::directory_options::skip_permission_denied;
    std::filesystem::recursive_directory_iterator it(in_directory, options, ec);

    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) 
    {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || !has_extension(it->path(), ".iso")) 
        {
            continue;
        }

        uint64_t file_size = it->file_size(entry_ec);
        if (entry_ec) 
        {
            GDTLog(Debug) << "Skipping " << it->path().string() << ": " << entry_ec.message() << GDTLog::Endl;
            continue;
        }

        iso_files.push_back({ it->path().filename().string(), it->path(), file_size });
    }

    if (ec) 
    {
        GDTLog(Error) << "Stopped listing " << in_directory.string() << ": " << ec.message() << GDTLog::Endl;
    }

    std::sort(iso_files.begin(), iso_files.end(), [](const IsoFile& a, const IsoFile& b) 
    {
        return a.name < b.name;
    });

    return iso_files;
}

std::vector<InputHelper::ConvertedGame> InputHelper::list_converted(const std::filesystem::path& out_directory, const TitleCatalog& title_catalog) 
{
    std::vector<ConvertedGame> games;
    std::error_code ec;

    if (!std::filesystem::is_directory(out_directory, ec)) 
    {
        return games;
    }

    for (const auto& entry : std::filesystem::directory_iterator(out_directory, ec)) 
    {
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || !is_god_dir(entry.path())) 
        {
            continue;
        }

        std::string title_id = entry.path().filename().string();

        ConvertedGame game;
        game.name = "Title ID: " + title_id;
        game.path = entry.path();

        if (title_id.size() == 8 && std::all_of(title_id.begin(), title_id.end(), [](unsigned char c) { return std::isxdigit(c); })) 
        {
            game.title_name = title_catalog.lookup(static_cast<uint32_t>(std::stoul(title_id, nullptr, 16)));
        }

        games.push_back(game);
    }

    std::sort(games.begin(), games.end(), [](const ConvertedGame& a, const ConvertedGame& b) 
    {
        return a.name < b.name;
    });

    return games;
}

bool InputHelper::has_extension(const std::filesystem::path& path, const std::string& extension) 
{
    return StringUtils::case_insensitive_equals(path.extension().string(), extension);
}

bool InputHelper::is_god_dir_helper(const std::filesystem::path& path, int current_depth, int max_depth) 
{
    if (current_depth > max_depth) 
    {
        return false;
    }

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(path, ec)) 
    {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec) && entry.path().filename().string().rfind("Data", 0) == 0) 
        {
            if (entry.path().parent_path().extension() == ".data") 
            {
                return true;
            }
        } 
        else if (entry.is_directory(entry_ec)) 
        {
            if (is_god_dir_helper(entry.path(), current_depth + 1, max_depth)) 
            {
                return true;
            }
        }
    }
    return false;
}

bool InputHelper::is_god_dir(const std::filesystem::path& path) 
{
    return is_god_dir_helper(path, 0, 3);
}
