#ifndef _INPUT_HELPER_H_
#define _INPUT_HELPER_H_

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

#include "TitleCatalog/TitleCatalog.h"

// Finds conversion inputs and previously converted packages on disk
class InputHelper
{
public:
    struct IsoFile 
    {
        std::string name;
        std::filesystem::path path;
        uint64_t size{0};
    };

    struct ConvertedGame 
    {
        std::string name; // "Title ID: XXXXXXXX"
        std::filesystem::path path;
        std::optional<std::string> title_name;
    };

    // Every *.iso below in_directory, sorted by file name. A missing directory yields an empty list.
    static std::vector<IsoFile> list_isos(const std::filesystem::path& in_directory);

    // Title directories directly below out_directory that hold a GoD package, sorted by name
    static std::vector<ConvertedGame> list_converted(const std::filesystem::path& out_directory, const TitleCatalog& title_catalog);

    static bool is_god_dir(const std::filesystem::path& path);

private:
    static bool has_extension(const std::filesystem::path& path, const std::string& extension);
    static bool is_god_dir_helper(const std::filesystem::path& path, int current_depth, int max_depth);
};

#endif // _INPUT_HELPER_H_
