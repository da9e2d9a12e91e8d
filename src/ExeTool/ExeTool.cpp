#include <cstring>
#include <vector>

#include "GDT.h"
#include "Common/EndianUtils.h"
#include "Common/StringUtils.h"
#include "ExeTool/ExeTool.h"

ExeTool::ExeTool(ImageReader& image_reader, const Xiso::DirectoryEntry& exe_entry) {
    exe_offset_ = static_cast<uint64_t>(exe_entry.header.start_sector) * Xiso::SECTOR_SIZE;
    exe_size_ = exe_entry.header.file_size;

    if (exe_entry.is_directory() || exe_offset_ + exe_size_ > image_reader.payload_size()) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), exe_entry.filename + " lies outside of the image");
    }

    if (StringUtils::case_insensitive_search(exe_entry.filename, ".xex")) {
        content_type_ = GoD::ContentType::GAMES_ON_DEMAND;
        get_xex_cert_from_reader(image_reader);
    } else if (StringUtils::case_insensitive_search(exe_entry.filename, ".xbe")) {
        content_type_ = GoD::ContentType::ORIGINAL_XBOX;
        get_xbe_cert_from_reader(image_reader);
        create_xex_cert_from_xbe();
    } else {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "Invalid executable file extension: " + exe_entry.filename);
    }
}

void ExeTool::get_xbe_cert_from_reader(ImageReader& reader) {
    if (exe_size_ < Xbe::HEADER_SIZE) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "XBE is smaller than its header");
    }

    std::vector<uint8_t> xbe_header(Xbe::HEADER_SIZE);
    reader.read_bytes(exe_offset_, xbe_header.size(), reinterpret_cast<char*>(xbe_header.data()));

    if (std::memcmp(xbe_header.data(), Xbe::MAGIC, Xbe::MAGIC_LEN) != 0) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "Invalid XBE header magic.");
    }

    uint32_t base_address = EndianUtils::load_little_32(xbe_header.data() + Xbe::BASE_ADDRESS_OFFSET);
    uint32_t cert_address = EndianUtils::load_little_32(xbe_header.data() + Xbe::CERT_ADDRESS_OFFSET);

    if (cert_address < base_address) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "XBE certificate address is below the base address");
    }

    cert_offset_ = cert_address - base_address;

    if (cert_offset_ + Xbe::CERT_SIZE > exe_size_) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "XBE certificate lies outside of the executable");
    }

    std::vector<uint8_t> cert(Xbe::CERT_SIZE);
    reader.read_bytes(exe_offset_ + cert_offset_, cert.size(), reinterpret_cast<char*>(cert.data()));
    xbe_cert_ = Xbe::Cert::parse(cert.data());
}

void ExeTool::get_xex_cert_from_reader(ImageReader& reader) {
    if (exe_size_ < Xex::HEADER_SIZE) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "XEX is smaller than its header");
    }

    std::vector<uint8_t> xex_header(Xex::HEADER_SIZE);
    reader.read_bytes(exe_offset_, xex_header.size(), reinterpret_cast<char*>(xex_header.data()));

    if (std::memcmp(xex_header.data(), Xex::MAGIC, Xex::MAGIC_LEN) != 0) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "Invalid XEX header magic.");
    }

    uint32_t header_count = EndianUtils::load_big_32(xex_header.data() + Xex::HEADER_COUNT_OFFSET);
    uint64_t directory_size = static_cast<uint64_t>(header_count) * Xex::DIRECTORY_ENTRY_SIZE;

    if (header_count > Xex::MAX_HEADER_COUNT || Xex::HEADER_SIZE + directory_size > exe_size_) {
        throw GDTException(ErrCode::EXE_INVALID, HERE(), "Invalid XEX optional header count: " + std::to_string(header_count));
    }

    std::vector<uint8_t> directory(static_cast<size_t>(directory_size));
    reader.read_bytes(exe_offset_ + Xex::HEADER_SIZE, directory.size(), reinterpret_cast<char*>(directory.data()));

    for (uint32_t i = 0; i < header_count; ++i) {
        uint32_t key = EndianUtils::load_big_32(directory.data() + (i * Xex::DIRECTORY_ENTRY_SIZE));
        uint32_t value = EndianUtils::load_big_32(directory.data() + (i * Xex::DIRECTORY_ENTRY_SIZE) + 4);

        if (key != Xex::KeyValue::EXECUTION_INFO) {
            continue;
        }

        if (static_cast<uint64_t>(value) + Xex::ExecutionInfo::SIZE > exe_size_) {
            throw GDTException(ErrCode::EXE_INVALID, HERE(), "XEX execution info lies outside of the executable");
        }

        std::vector<uint8_t> execution_info(Xex::ExecutionInfo::SIZE);
        reader.read_bytes(exe_offset_ + value, execution_info.size(), reinterpret_cast<char*>(execution_info.data()));
        xex_cert_ = Xex::ExecutionInfo::parse(execution_info.data());
        return;
    }

    throw GDTException(ErrCode::EXE_INVALID, HERE(), "XEX has no execution info header");
}

// For use in GoD live header
void ExeTool::create_xex_cert_from_xbe() {
    xex_cert_ = Xex::ExecutionInfo();
    xex_cert_.title_id = xbe_cert_.title_id;
    xex_cert_.version = xbe_cert_.cert_version;
    xex_cert_.disc_count = 1;
    xex_cert_.disc_number = 1;
}
