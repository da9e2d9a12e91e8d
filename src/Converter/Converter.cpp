#include <fstream>
#include <iterator>
#include <memory>
#include <system_error>

#include "GDT.h"
#include "ImageReader/ImageReader.h"
#include "TitleHelper/TitleHelper.h"
#include "GoDWriter/Geometry.h"
#include "GoDWriter/FileLayout.h"
#include "GoDWriter/GoDWriter.h"
#include "WorkerPool/WorkerPool.h"
#include "Converter/Converter.h"

namespace {

// Runs func, naming the pipeline step on any GDTException passing through
template <typename Func>
auto with_context(const std::string& context, Func&& func) -> decltype(func())
{
    try 
    {
        return func();
    } 
    catch (GDTException& e) 
    {
        e.add_context(context);
        throw;
    }
}

}; // namespace

Converter::Converter(const TitleCatalog& title_catalog) 
    : title_catalog_(title_catalog) {}

ConversionResult Converter::convert(const ConversionRequest& request) const 
{
    ConversionResult result;

    try 
    {
        result = run(request);
    } 
    catch (const GDTException& e) 
    {
        GDTLog(Error) << e.what() << GDTLog::Endl;
        result = ConversionResult();
        result.message = e.what();
        result.error_code = e.code();
        result.error_kind = e.kind();
    } 
    catch (const std::exception& e) 
    {
        GDTLog(Error) << "Unexpected error: " << e.what() << GDTLog::Endl;
        result = ConversionResult();
        result.message = e.what();
        result.error_code = ErrCode::UNK;
        result.error_kind = ErrKind::INTERNAL;
    }
    catch (...) 
    {
        GDTLog(Error) << "Unexpected non-standard exception" << GDTLog::Endl;
        result = ConversionResult();
        result.message = "Unexpected non-standard exception";
        result.error_code = ErrCode::UNK;
        result.error_kind = ErrKind::INTERNAL;
    }

    return result;
}

std::future<ConversionResult> Converter::convert_async(ConversionRequest request) const 
{
    const TitleCatalog* title_catalog = &title_catalog_;

    return std::async(std::launch::async, [title_catalog, request]() 
    { 
        return Converter(*title_catalog).convert(request); 
    });
}

ConversionResult Converter::run(const ConversionRequest& request) const 
{
    if (request.num_threads == 1) 
    {
        GDTLog() << "Writing part files sequentially with 1 thread. This is slower but safer on hard drives, "
                 << "use -j <N> to raise it on an SSD." << GDTLog::Endl;
    }

    std::shared_ptr<ImageSource> source = request.source;
    if (!source) 
    {
        source = with_context("error opening source ISO file", [&]() 
        { 
            return ImageSource::open_file(request.source_path); 
        });
    }

    std::unique_ptr<ImageReader> image_reader = with_context("error reading source ISO", [&]() 
    { 
        return std::make_unique<ImageReader>(source); 
    });

    std::unique_ptr<TitleHelper> title_helper = with_context("error reading image executable", [&]() 
    { 
        return std::make_unique<TitleHelper>(*image_reader, title_catalog_, request.game_title); 
    });

    std::string summary = title_helper->summary();
    GDTLog() << summary;

    ConversionResult result;

    if (request.dry_run) 
    {
        result.success = true;
        result.message = summary;
        return result;
    }

    uint64_t payload_size = (request.trim_mode == TrimMode::USED_DATA) ? image_reader->max_used_prefix_size() 
                                                                       : image_reader->payload_size();

    GoD::Geometry geometry = with_context("error sizing image payload", [&]() 
    { 
        return GoD::Geometry::from_payload_size(payload_size); 
    });

    GDTLog(Debug) << "Payload size: " << geometry.payload_size << " blocks: " << geometry.block_count 
                  << " parts: " << geometry.part_count << GDTLog::Endl;

    std::vector<uint8_t> game_icon;
    if (request.icon_path) 
    {
        game_icon = with_context("error reading icon file", [&]() 
        { 
            return read_icon(*request.icon_path); 
        });
    }

    FileLayout file_layout(request.dest_path, title_helper->xex_cert(), title_helper->content_type());

    // Everything that can fail without touching the destination goes before prepare()
    std::unique_ptr<WorkerPool> worker_pool = with_context("error starting worker threads", [&]() 
    { 
        return std::make_unique<WorkerPool>(request.num_threads); 
    });

    GoDWriter god_writer(*image_reader, title_helper->title_info(), file_layout, geometry);
    god_writer.set_game_icon(game_icon);

    with_context("error encoding game title", [&]() 
    { 
        god_writer.set_game_title(title_helper->title_name()); 
    });

    with_context("error clearing data directory", [&]() 
    { 
        file_layout.prepare(); 
    });

    with_context("error writing GoD package", [&]() 
    { 
        god_writer.write(*worker_pool); 
    });

    result.success = true;
    result.message = summary + "Conversion successful!";
    result.god_path = file_layout.title_dir_path();

    GDTLog() << "Conversion successful: " << file_layout.title_dir_path().string() << GDTLog::Endl;

    return result;
}

std::vector<uint8_t> Converter::read_icon(const std::filesystem::path& icon_path) 
{
    std::ifstream in_file(icon_path, std::ios::binary);
    if (!in_file.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), icon_path.string());
    }

    std::vector<uint8_t> icon_data((std::istreambuf_iterator<char>(in_file)), std::istreambuf_iterator<char>());
    if (in_file.bad()) 
    {
        throw GDTException(ErrCode::FILE_READ, HERE(), icon_path.string());
    }

    if (icon_data.empty() || icon_data.size() > GoD::ConHeader::MAX_ICON_SIZE) 
    {
        throw GDTException(ErrCode::MISC, HERE(), "Icon must be between 1 and " + std::to_string(GoD::ConHeader::MAX_ICON_SIZE) + " bytes");
    }

    return icon_data;
}
