#include <algorithm>
#include <atomic>
#include <cstring>
#include <fstream>
#include <future>
#include <system_error>

#include "GDT.h"
#include "Common/StringUtils.h"
#include "GoDWriter/ConHeaderBuilder.h"
#include "GoDWriter/GoDWriter.h"

GoDWriter::GoDWriter(ImageReader& image_reader, const TitleInfo& title_info, const FileLayout& file_layout, const GoD::Geometry& geometry)
    :   image_reader_(image_reader), 
        title_info_(title_info), 
        file_layout_(file_layout), 
        geometry_(geometry) {}

void GoDWriter::set_game_title(const std::optional<std::string>& game_title) 
{
    game_title_.clear();
    if (game_title) 
    {
        game_title_ = StringUtils::utf8_to_utf16(*game_title);
    }
}

void GoDWriter::write(WorkerPool& worker_pool) 
{
    write_parts(worker_pool);
    HashList::Digest mht_hash = stitch_hash_tables();
    write_con_header(mht_hash);
}

void GoDWriter::write_parts(WorkerPool& worker_pool) 
{
    const uint32_t part_count = static_cast<uint32_t>(geometry_.part_count);
    const uint64_t root_offset = image_reader_.root_offset();
    std::shared_ptr<ImageSource> source = image_reader_.source();

    std::atomic<bool> abort_flag{false};
    std::atomic<uint32_t> parts_done{0};
    std::vector<std::future<void>> futures;

    GDTLog() << "Writing " << part_count << " part file(s) with " << worker_pool.size() << " thread(s)" << GDTLog::Endl;

    auto part_task = [&](const uint64_t part_index) 
    {
        if (abort_flag.load()) 
        {
            return;
        }

        std::filesystem::path part_path = file_layout_.part_file_path(part_index);

        try 
        {
            std::unique_ptr<ImageSource> part_source = source->clone();
            write_part(*part_source, root_offset, geometry_, part_index, part_path);
        } 
        catch (GDTException& e) 
        {
            abort_flag = true;
            e.add_context("error writing part file " + part_path.filename().string());
            throw;
        } 
        catch (const std::exception& e) 
        {
            abort_flag = true;
            GDTException task_error(ErrCode::UNK, HERE(), e.what());
            task_error.add_context("error writing part file " + part_path.filename().string());
            throw task_error;
        }

        uint32_t done = parts_done.fetch_add(1, std::memory_order_relaxed) + 1;
        GDTLog(Debug) << "Wrote " << part_path.filename().string() << GDTLog::Endl;
        GDTLog().print_progress(done, part_count);
    };

    std::exception_ptr first_error;

    try 
    {
        for (uint64_t i = 0; i < part_count; ++i) 
        {
            futures.push_back(worker_pool.submit([&part_task, i]() { part_task(i); }));
        }
    } 
    catch (...) 
    {
        abort_flag = true;
        first_error = std::current_exception();
    }

    // Every queued task refers to this frame, all of them are joined before leaving
    for (auto& future : futures) 
    {
        try 
        {
            future.get();
        } 
        catch (...) 
        {
            if (!first_error) 
            {
                first_error = std::current_exception();
            }
        }
    }

    if (first_error) 
    {
        std::rethrow_exception(first_error);
    }
}

void GoDWriter::write_part(ImageSource& source, const uint64_t root_offset, const GoD::Geometry& geometry, 
                           const uint64_t part_index, const std::filesystem::path& part_path)
{
    std::ofstream out_file(part_path, std::ios::binary | std::ios::trunc);
    if (!out_file.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), part_path.string());
    }

    const uint64_t data_blocks = geometry.data_blocks_in_part(part_index);
    const uint64_t read_end = geometry.part_payload_offset(part_index) + geometry.part_payload_size(part_index);
    uint64_t read_position = geometry.part_payload_offset(part_index);
    uint64_t blocks_written = 0;

    HashList master_hashtable;
    std::vector<uint8_t> data_buffer(GoD::DATA_BLOCKS_PER_SHT * GoD::BLOCK_SIZE);

    // Master hashtable is filled in once every sub hashtable is known
    std::vector<char> empty_block(GoD::BLOCK_SIZE, 0);
    out_file.write(empty_block.data(), empty_block.size());

    while (blocks_written < data_blocks) 
    {
        uint64_t blocks_in_sht = std::min(static_cast<uint64_t>(GoD::DATA_BLOCKS_PER_SHT), data_blocks - blocks_written);
        uint64_t buffer_size = blocks_in_sht * GoD::BLOCK_SIZE;
        uint64_t read_size = std::min(buffer_size, read_end - read_position);

        if (read_size > 0) 
        {
            source.read_bytes(root_offset + read_position, read_size, reinterpret_cast<char*>(data_buffer.data()));
        }
        if (read_size < buffer_size) 
        {
            std::memset(data_buffer.data() + read_size, 0, buffer_size - read_size);
        }

        HashList sub_hashtable;
        for (uint64_t i = 0; i < blocks_in_sht; ++i) 
        {
            sub_hashtable.add_block_hash(data_buffer.data() + (i * GoD::BLOCK_SIZE), GoD::BLOCK_SIZE);
        }

        std::vector<uint8_t> sub_hashtable_block = sub_hashtable.to_block();
        master_hashtable.add_hash(HashList::sha1(sub_hashtable_block.data(), sub_hashtable_block.size()));

        out_file.write(reinterpret_cast<const char*>(sub_hashtable_block.data()), sub_hashtable_block.size());
        out_file.write(reinterpret_cast<const char*>(data_buffer.data()), buffer_size);
        if (out_file.fail()) 
        {
            throw GDTException(ErrCode::FILE_WRITE, HERE(), part_path.string());
        }

        read_position += read_size;
        blocks_written += blocks_in_sht;
    }

    master_hashtable.write(out_file);

    out_file.close();
    if (out_file.fail()) 
    {
        throw GDTException(ErrCode::FILE_WRITE, HERE(), part_path.string());
    }
}

HashList::Digest GoDWriter::stitch_hash_tables() 
{
    /*  Each Data file's master hashtable block is hashed, then that's 
        appended to the previous Data file's master hashtable, last to first. 
        The first Data file's master hashtable hash goes into the Live header */

    GDTLog() << "Writing hash tables" << GDTLog::Endl;

    const uint64_t part_count = geometry_.part_count;
    HashList mht;

    try 
    {
        mht = read_part_mht(file_layout_.part_file_path(part_count - 1));
    } 
    catch (GDTException& e) 
    {
        e.add_context("error reading part file MHT");
        throw;
    }

    for (uint64_t prev_part_index = part_count - 1; prev_part_index-- > 0;) 
    {
        std::filesystem::path prev_part_path = file_layout_.part_file_path(prev_part_index);
        HashList prev_mht;

        try 
        {
            prev_mht = read_part_mht(prev_part_path);
        } 
        catch (GDTException& e) 
        {
            e.add_context("error reading part file MHT");
            throw;
        }

        prev_mht.add_hash(mht.digest());

        try 
        {
            write_part_mht(prev_part_path, prev_mht);
        } 
        catch (GDTException& e) 
        {
            e.add_context("error writing part file MHT");
            throw;
        }

        mht = std::move(prev_mht);
    }

    return mht.digest();
}

void GoDWriter::write_con_header(const HashList::Digest& mht_hash) 
{
    GDTLog() << "Writing Live header" << GDTLog::Endl;

    const uint64_t part_count = geometry_.part_count;
    std::filesystem::path last_part_path = file_layout_.part_file_path(part_count - 1);

    std::error_code ec;
    uint64_t last_part_size = std::filesystem::file_size(last_part_path, ec);
    if (ec) 
    {
        GDTException e(ErrCode::FILE_READ, HERE(), last_part_path.string() + ": " + ec.message());
        e.add_context("error reading part file");
        throw e;
    }

    // The size field counts every part but the last as a full one
    uint64_t parts_size = last_part_size + ((part_count - 1) * GoD::BLOCK_SIZE * static_cast<uint64_t>(GoD::BLOCKS_PER_PART));

    ConHeaderBuilder con_header_builder;
    con_header_builder.with_execution_info(title_info_.execution_info)
                      .with_block_counts(static_cast<uint32_t>(geometry_.block_count), 0)
                      .with_data_parts_info(static_cast<uint32_t>(part_count), parts_size)
                      .with_content_type(title_info_.content_type)
                      .with_mht_hash(mht_hash);

    if (!game_title_.empty()) 
    {
        con_header_builder.with_game_title(game_title_);
    }
    if (!game_icon_.empty()) 
    {
        con_header_builder.with_game_icon(game_icon_);
    }

    std::vector<uint8_t> con_header = con_header_builder.finalize();
    std::filesystem::path con_header_path = file_layout_.con_header_file_path();

    std::ofstream out_file(con_header_path, std::ios::binary | std::ios::trunc);
    if (!out_file.is_open()) 
    {
        GDTException e(ErrCode::FILE_OPEN, HERE(), con_header_path.string());
        e.add_context("cannot open con header file");
        throw e;
    }

    out_file.write(reinterpret_cast<const char*>(con_header.data()), con_header.size());
    out_file.close();
    if (out_file.fail()) 
    {
        GDTException e(ErrCode::FILE_WRITE, HERE(), con_header_path.string());
        e.add_context("error writing con header file");
        throw e;
    }
}

uint64_t GoDWriter::expected_mht_entries(const uint64_t part_file_size) 
{
    uint64_t table_and_data_blocks = (part_file_size / GoD::BLOCK_SIZE) - 1;
    return (table_and_data_blocks / (GoD::DATA_BLOCKS_PER_SHT + 1)) + ((table_and_data_blocks % (GoD::DATA_BLOCKS_PER_SHT + 1)) ? 1 : 0);
}

HashList GoDWriter::read_part_mht(const std::filesystem::path& part_path) 
{
    std::ifstream in_file(part_path, std::ios::binary);
    if (!in_file.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), part_path.string());
    }

    HashList mht = HashList::read(in_file);

    std::error_code ec;
    uint64_t part_file_size = std::filesystem::file_size(part_path, ec);
    if (ec) 
    {
        throw GDTException(ErrCode::FILE_READ, HERE(), part_path.string() + ": " + ec.message());
    }

    if (part_file_size % GoD::BLOCK_SIZE != 0 || part_file_size < 3 * GoD::BLOCK_SIZE) 
    {
        throw GDTException(ErrCode::HASH_INVALID, HERE(), part_path.filename().string() + " is not a whole GoD part");
    }

    if (mht.size() != expected_mht_entries(part_file_size)) 
    {
        throw GDTException(ErrCode::HASH_INVALID, HERE(), part_path.filename().string() + " master hashtable has " + 
                                                          std::to_string(mht.size()) + " entries, expected " + 
                                                          std::to_string(expected_mht_entries(part_file_size)));
    }

    return mht;
}

void GoDWriter::write_part_mht(const std::filesystem::path& part_path, const HashList& mht) 
{
    std::fstream part_file(part_path, std::ios::binary | std::ios::in | std::ios::out);
    if (!part_file.is_open()) 
    {
        throw GDTException(ErrCode::FILE_OPEN, HERE(), part_path.string());
    }

    mht.write(part_file);
}
