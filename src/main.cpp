#include <cstdint>
#include <iostream>
#include <filesystem>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "GDT.h"
#include "Converter/Converter.h"
#include "InputHelper/InputHelper.h"
#include "TitleCatalog/TitleCatalog.h"
#include "WorkerPool/WorkerPool.h"

namespace {

nlohmann::json result_to_json(const ConversionResult& result)
{
    nlohmann::json out_json;
    out_json["success"] = result.success;
    out_json["message"] = result.message;
    out_json["god_path"] = result.god_path ? nlohmann::json(result.god_path->string()) : nlohmann::json(nullptr);

    if (result.error_kind) 
    {
        out_json["error_kind"] = GDTException::kind_name(*result.error_kind);
    }
    if (result.error_code) 
    {
        out_json["error_code"] = static_cast<int>(*result.error_code);
    }
    return out_json;
}

int list_isos(const std::filesystem::path& in_directory, const bool json_output)
{
    std::vector<InputHelper::IsoFile> iso_files = InputHelper::list_isos(in_directory);

    if (json_output) 
    {
        nlohmann::json out_json = nlohmann::json::array();
        for (const auto& iso_file : iso_files) 
        {
            out_json.push_back({ { "name", iso_file.name }, { "path", iso_file.path.string() }, { "size", iso_file.size } });
        }
        std::cout << out_json.dump(4) << std::endl;
        return 0;
    }

    for (const auto& iso_file : iso_files) 
    {
        std::cout << iso_file.name << "\t" << iso_file.size << "\t" << iso_file.path.string() << "\n";
    }
    return 0;
}

int list_converted(const std::filesystem::path& out_directory, const TitleCatalog& title_catalog, const bool json_output)
{
    std::vector<InputHelper::ConvertedGame> games = InputHelper::list_converted(out_directory, title_catalog);

    if (json_output) 
    {
        nlohmann::json out_json = nlohmann::json::array();
        for (const auto& game : games) 
        {
            nlohmann::json game_json = { { "name", game.name }, { "path", game.path.string() } };
            if (game.title_name) 
            {
                game_json["title_name"] = *game.title_name;
            }
            out_json.push_back(game_json);
        }
        std::cout << out_json.dump(4) << std::endl;
        return 0;
    }

    for (const auto& game : games) 
    {
        std::cout << game.name << "\t" << (game.title_name ? *game.title_name : "(unknown)") << "\t" << game.path.string() << "\n";
    }
    return 0;
}

}; // namespace

int main(int argc, char** argv)
{
    CLI::App app{"GoDTool, converts Xbox 360 and Xbox ISO images to Games on Demand packages"};
    argv = app.ensure_utf8(argv);

    ConversionRequest request;
    std::string trim_mode = "from-end";
    std::string num_threads = "auto";
    std::string game_title;
    std::filesystem::path icon_path;
    std::filesystem::path title_list_path;
    std::filesystem::path list_isos_dir;
    std::filesystem::path list_converted_dir;
    bool json_output = false;

    app.set_version_flag("--version", GDT::VERSION);

    app.add_option("source_iso", request.source_path, "Xbox 360 or Xbox ISO image to convert");
    app.add_option("dest_dir", request.dest_path, "Directory the GoD package is written to");

    auto* settings_group = app.add_option_group("Settings");

    settings_group->add_option("--game-title", game_title, "Display title written to the package, overrides the title list");
    settings_group->add_option("--trim", trim_mode, "Payload size: from-end (whole image) or used-data (last byte used by the filesystem)")
                  ->check(CLI::IsMember({ "from-end", "used-data" }));
    settings_group->add_option("-j,--num-threads", num_threads, "Worker threads for writing part files, or auto")
                  ->check(CLI::IsMember({ "auto" }) | CLI::Range(1u, WorkerPool::MAX_THREADS));
    settings_group->add_option("--icon", icon_path, "PNG icon embedded in the package header")->check(CLI::ExistingFile);
    settings_group->add_option("--title-list", title_list_path, "JSON title list merged into the built-in one")->check(CLI::ExistingFile);
    settings_group->add_flag_function("--dry-run", [&](int64_t) { request.dry_run = true; }, "Print title information without writing anything");
    settings_group->add_flag("--json", json_output, "Print results as JSON");
    settings_group->add_flag_function("--debug",   [&](int64_t) { GDTLog().set_log_level(LogLevel::Debug); }, "Enable debug logging");
    settings_group->add_flag_function("--quiet",   [&](int64_t) { GDTLog().set_log_level(LogLevel::Error); }, "Disable all logging except for errors");

    auto* list_group = app.add_option_group("Listing");

    list_group->add_option("--list-isos", list_isos_dir, "List ISO images found below a directory");
    list_group->add_option("--list-converted", list_converted_dir, "List converted packages in an output directory");

    CLI11_PARSE(app, argc, argv);

    TitleCatalog title_catalog;

    if (!title_list_path.empty()) 
    {
        try 
        {
            title_catalog.load_json(title_list_path);
        } 
        catch (const GDTException& e) 
        {
            GDTLog(Error) << "Failed to load title list: " << e.what() << GDTLog::Endl;
            return 1;
        }
    }

    if (!list_isos_dir.empty()) 
    {
        return list_isos(list_isos_dir, json_output);
    }
    if (!list_converted_dir.empty()) 
    {
        return list_converted(list_converted_dir, title_catalog, json_output);
    }

    if (request.source_path.empty() || request.dest_path.empty()) 
    {
        GDTLog(Error) << "A source ISO and a destination directory are required, see --help" << GDTLog::Endl;
        return 1;
    }

    if (!std::filesystem::exists(request.source_path)) 
    {
        GDTLog(Error) << "Input path does not exist: " << request.source_path.string() << GDTLog::Endl;
        return 1;
    }

    request.trim_mode = (trim_mode == "used-data") ? TrimMode::USED_DATA : TrimMode::FROM_END;
    try 
    {
        request.num_threads = WorkerPool::parse_thread_count(num_threads);
    } 
    catch (const GDTException& e) 
    {
        GDTLog(Error) << e.what() << GDTLog::Endl;
        return 1;
    }

    if (!game_title.empty()) 
    {
        request.game_title = game_title;
    }
    if (!icon_path.empty()) 
    {
        request.icon_path = icon_path;
    }

    Converter converter(title_catalog);
    ConversionResult result = converter.convert_async(request).get();

    if (json_output) 
    {
        std::cout << result_to_json(result).dump(4) << std::endl;
    }
    else if (result.success) 
    {
        std::cout << result.message << "\n";
        if (result.god_path) 
        {
            std::cout << "GoD path: " << result.god_path->string() << "\n";
        }
    }
    else 
    {
        std::cerr << "Conversion failed: " << result.message << "\n";
    }

    return result.success ? 0 : 1;
}
