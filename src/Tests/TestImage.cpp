#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include <openssl/sha.h>

#include "Formats/Xiso.h"
#include "Formats/Xbe.h"
#include "Common/EndianUtils.h"
#include "Common/StringUtils.h"
#include "Tests/TestImage.h"

namespace Tests {

namespace {

constexpr uint32_t ROOT_SECTOR = static_cast<uint32_t>((Xiso::MAGIC_OFFSET + Xiso::SECTOR_SIZE) / Xiso::SECTOR_SIZE);

uint64_t align4(uint64_t value) {
    return (value + 3) & ~static_cast<uint64_t>(3);
}

uint32_t sectors_for(uint64_t num_bytes) {
    return static_cast<uint32_t>(std::max<uint64_t>(1, (num_bytes + Xiso::SECTOR_SIZE - 1) / Xiso::SECTOR_SIZE));
}

uint64_t table_bytes(const std::vector<ImageBuilder::Entry>& entries) {
    uint64_t size = 0;
    for (const auto& entry : entries) {
        size = align4(size + Xiso::DirectoryEntry::HEADER_SIZE + entry.name.size());
    }
    return size;
}

void put(std::vector<char>& image, uint64_t offset, const void* data, uint64_t size) {
    if (image.size() < offset + size) {
        image.resize(offset + size, 0);
    }
    std::memcpy(image.data() + offset, data, size);
}

void layout_directory(const std::vector<ImageBuilder::Entry>& entries, uint32_t table_sector, uint32_t& next_sector, 
                      std::vector<char>* image, uint64_t base) {
    std::vector<uint8_t> table(static_cast<size_t>(sectors_for(table_bytes(entries))) * Xiso::SECTOR_SIZE, 0xFF);
    uint64_t position = 0;

    for (size_t i = 0; i < entries.size(); ++i) {
        const ImageBuilder::Entry& entry = entries[i];
        uint32_t start_sector = 0;
        uint32_t file_size = 0;
        uint8_t attributes = Xiso::ATTRIBUTE_FILE;

        if (entry.raw) {
            start_sector = entry.raw_sector;
            file_size = entry.raw_size;
            attributes = Xiso::ATTRIBUTE_DIRECTORY;
        } else if (entry.directory) {
            file_size = sectors_for(table_bytes(entry.children)) * static_cast<uint32_t>(Xiso::SECTOR_SIZE);
            start_sector = next_sector;
            next_sector += file_size / Xiso::SECTOR_SIZE;
            attributes = Xiso::ATTRIBUTE_DIRECTORY;
            layout_directory(entry.children, start_sector, next_sector, image, base);
        } else {
            file_size = static_cast<uint32_t>(entry.data.size());
            start_sector = next_sector;
            if (file_size > 0) {
                next_sector += sectors_for(file_size);
                if (image) {
                    put(*image, base + static_cast<uint64_t>(start_sector) * Xiso::SECTOR_SIZE, entry.data.data(), entry.data.size());
                }
            }
        }

        uint64_t next_position = align4(position + Xiso::DirectoryEntry::HEADER_SIZE + entry.name.size());
        uint16_t right_offset = (i + 1 < entries.size()) ? static_cast<uint16_t>(next_position / 4) : 0;

        uint8_t* header = table.data() + position;
        header[0] = 0;
        header[1] = 0;
        header[2] = static_cast<uint8_t>(right_offset);
        header[3] = static_cast<uint8_t>(right_offset >> 8);
        EndianUtils::store_little_32(header + 4, start_sector);
        EndianUtils::store_little_32(header + 8, file_size);
        header[12] = attributes;
        header[13] = static_cast<uint8_t>(entry.name.size());
        std::memcpy(header + Xiso::DirectoryEntry::HEADER_SIZE, entry.name.data(), entry.name.size());

        // Alignment padding inside the table is zero
        std::fill(table.begin() + position + Xiso::DirectoryEntry::HEADER_SIZE + entry.name.size(), table.begin() + next_position, 0);

        position = next_position;
    }

    if (image) {
        put(*image, base + static_cast<uint64_t>(table_sector) * Xiso::SECTOR_SIZE, table.data(), table.size());
    }
}

std::atomic<uint32_t> temp_dir_counter{0};

}; // namespace

ImageBuilder::Entry ImageBuilder::file(const std::string& name, const std::vector<char>& data) {
    Entry entry;
    entry.name = name;
    entry.data = data;
    return entry;
}

ImageBuilder::Entry ImageBuilder::directory(const std::string& name, const std::vector<Entry>& children) {
    Entry entry;
    entry.name = name;
    entry.children = children;
    entry.directory = true;
    return entry;
}

ImageBuilder::Entry ImageBuilder::raw_directory(const std::string& name, uint32_t start_sector, uint32_t size) {
    Entry entry;
    entry.name = name;
    entry.raw = true;
    entry.raw_sector = start_sector;
    entry.raw_size = size;
    return entry;
}

ImageBuilder& ImageBuilder::root_offset(uint64_t offset) {
    root_offset_ = offset;
    return *this;
}

ImageBuilder& ImageBuilder::add(const Entry& entry) {
    root_.push_back(entry);
    return *this;
}

ImageBuilder& ImageBuilder::payload_size(uint64_t size, char pad_byte) {
    payload_size_ = size;
    pad_byte_ = pad_byte;
    return *this;
}

uint64_t ImageBuilder::used_size() const {
    uint32_t next_sector = ROOT_SECTOR + sectors_for(table_bytes(root_));
    layout_directory(root_, ROOT_SECTOR, next_sector, nullptr, 0);
    return static_cast<uint64_t>(next_sector) * Xiso::SECTOR_SIZE;
}

std::vector<char> ImageBuilder::build() const {
    std::vector<char> image(static_cast<size_t>(root_offset_ + Xiso::MAGIC_OFFSET), 0);

    uint32_t root_size = sectors_for(table_bytes(root_)) * static_cast<uint32_t>(Xiso::SECTOR_SIZE);
    uint32_t next_sector = ROOT_SECTOR + root_size / Xiso::SECTOR_SIZE;
    layout_directory(root_, ROOT_SECTOR, next_sector, &image, root_offset_);

    std::vector<uint8_t> descriptor(Xiso::VolumeDescriptor::SIZE, 0);
    std::memcpy(descriptor.data(), Xiso::MAGIC_DATA, Xiso::MAGIC_DATA_LEN);
    EndianUtils::store_little_32(descriptor.data() + Xiso::MAGIC_DATA_LEN, ROOT_SECTOR);
    EndianUtils::store_little_32(descriptor.data() + Xiso::MAGIC_DATA_LEN + 4, root_size);
    std::memcpy(descriptor.data() + Xiso::VolumeDescriptor::SIZE - Xiso::MAGIC_DATA_LEN, Xiso::MAGIC_DATA, Xiso::MAGIC_DATA_LEN);
    put(image, root_offset_ + Xiso::MAGIC_OFFSET, descriptor.data(), descriptor.size());

    uint64_t used_end = root_offset_ + static_cast<uint64_t>(next_sector) * Xiso::SECTOR_SIZE;
    if (image.size() < used_end) {
        image.resize(static_cast<size_t>(used_end), 0);
    }

    if (payload_size_ > image.size() - root_offset_) {
        image.resize(static_cast<size_t>(root_offset_ + payload_size_), pad_byte_);
    }

    return image;
}

std::vector<char> make_xex(const Xex::ExecutionInfo& info) {
    std::vector<uint8_t> xex(0x200, 0);
    std::memcpy(xex.data(), Xex::MAGIC, Xex::MAGIC_LEN);
    EndianUtils::store_big_32(xex.data() + Xex::HEADER_COUNT_OFFSET, 2);

    uint8_t* directory = xex.data() + Xex::HEADER_SIZE;
    EndianUtils::store_big_32(directory, Xex::KeyValue::ENTRY_POINT);
    EndianUtils::store_big_32(directory + 4, 0x82000000);
    EndianUtils::store_big_32(directory + 8, Xex::KeyValue::EXECUTION_INFO);
    EndianUtils::store_big_32(directory + 12, 0x100);

    uint8_t* exec = xex.data() + 0x100;
    std::memcpy(exec, info.media_id, 4);
    EndianUtils::store_big_32(exec + 0x04, info.version);
    EndianUtils::store_big_32(exec + 0x08, info.base_version);
    EndianUtils::store_big_32(exec + 0x0C, info.title_id);
    exec[0x10] = info.platform;
    exec[0x11] = info.executable_type;
    exec[0x12] = info.disc_number;
    exec[0x13] = info.disc_count;
    EndianUtils::store_big_32(exec + 0x14, info.savegame_id);

    return std::vector<char>(xex.begin(), xex.end());
}

std::vector<char> make_xbe(uint32_t title_id, uint32_t cert_version) {
    const uint32_t base_address = 0x00010000;
    const uint32_t cert_offset = 0x180;

    std::vector<uint8_t> xbe(cert_offset + Xbe::CERT_SIZE, 0);
    std::memcpy(xbe.data(), Xbe::MAGIC, Xbe::MAGIC_LEN);
    EndianUtils::store_little_32(xbe.data() + Xbe::BASE_ADDRESS_OFFSET, base_address);
    EndianUtils::store_little_32(xbe.data() + Xbe::CERT_ADDRESS_OFFSET, base_address + cert_offset);

    uint8_t* cert = xbe.data() + cert_offset;
    EndianUtils::store_little_32(cert + Xbe::CERT_TITLE_ID, title_id);
    EndianUtils::store_little_32(cert + Xbe::CERT_VERSION, cert_version);

    return std::vector<char>(xbe.begin(), xbe.end());
}

Xex::ExecutionInfo make_execution_info(uint32_t title_id) {
    Xex::ExecutionInfo info;
    info.media_id[0] = 0x12;
    info.media_id[1] = 0x34;
    info.media_id[2] = 0x56;
    info.media_id[3] = 0x78;
    info.version = 0x00010002;
    info.base_version = 0x00010000;
    info.title_id = title_id;
    info.platform = 0;
    info.executable_type = 0;
    info.disc_number = 1;
    info.disc_count = 1;
    info.savegame_id = 0;
    return info;
}

std::vector<char> make_xex_image(uint32_t title_id, uint64_t payload_size) {
    std::vector<char> media(3 * Xiso::SECTOR_SIZE + 100);
    for (size_t i = 0; i < media.size(); ++i) {
        media[i] = static_cast<char>(i * 7);
    }

    ImageBuilder builder;
    builder.add(ImageBuilder::file("default.xex", make_xex(make_execution_info(title_id))))
           .add(ImageBuilder::directory("media", { ImageBuilder::file("intro.bik", media) }))
           .add(ImageBuilder::file("data.bin", std::vector<char>(5000, 0x42)));

    if (payload_size > 0) {
        builder.payload_size(payload_size);
    }
    return builder.build();
}

PatternSource::PatternSource(std::vector<char> prefix, uint64_t total_size)
    : prefix_(std::make_shared<const std::vector<char>>(std::move(prefix))), total_size_(total_size) {}

char PatternSource::pattern_byte(uint64_t offset) {
    return static_cast<char>((offset * 31) ^ (offset >> 12));
}

uint64_t PatternSource::read_some(const uint64_t offset, const uint64_t size, char* out_buffer) {
    if (offset >= total_size_) {
        return 0;
    }

    uint64_t read_size = std::min(size, total_size_ - offset);

    for (uint64_t i = 0; i < read_size; ++i) {
        uint64_t position = offset + i;
        out_buffer[i] = (position < prefix_->size()) ? (*prefix_)[static_cast<size_t>(position)] : pattern_byte(position);
    }

    return read_size;
}

std::unique_ptr<ImageSource> PatternSource::clone() {
    auto source = std::make_unique<PatternSource>(std::vector<char>(), total_size_);
    source->prefix_ = prefix_;
    return source;
}

TempDir::TempDir() {
    auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() / 
            ("godtool_test_" + std::to_string(ticks) + "_" + std::to_string(temp_dir_counter.fetch_add(1)));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in_file(path, std::ios::binary);
    if (!in_file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in_file)), std::istreambuf_iterator<char>());
}

std::string file_sha1(const std::filesystem::path& path) {
    std::ifstream in_file(path, std::ios::binary);
    if (!in_file.is_open()) {
        throw std::runtime_error("Cannot open " + path.string());
    }

    SHA_CTX context;
    SHA1_Init(&context);

    std::vector<char> buffer(0x10000);
    while (in_file) {
        in_file.read(buffer.data(), buffer.size());
        if (in_file.gcount() > 0) {
            SHA1_Update(&context, buffer.data(), static_cast<size_t>(in_file.gcount()));
        }
    }

    unsigned char hash[SHA_DIGEST_LENGTH];
    SHA1_Final(hash, &context);
    return StringUtils::bytes_to_hex_string(hash, SHA_DIGEST_LENGTH);
}

void write_file(const std::filesystem::path& path, const std::vector<char>& data) {
    std::ofstream out_file(path, std::ios::binary | std::ios::trunc);
    out_file.write(data.data(), data.size());
}

}; // namespace Tests
