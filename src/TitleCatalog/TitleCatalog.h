#ifndef _TITLE_CATALOG_H_
#define _TITLE_CATALOG_H_

#include <cstdint>
#include <string>
#include <optional>
#include <filesystem>
#include <unordered_map>

// Title ID to game name lookup, seeded with a built-in list
class TitleCatalog 
{
public:
    TitleCatalog();
    ~TitleCatalog() = default;

    std::optional<std::string> lookup(const uint32_t title_id) const;

    void add(const uint32_t title_id, const std::string& title_name);

    /*  Merges entries from a JSON title list, entries already present are replaced:
        [ { "Title ID": "4D5307E6", "Title Name": "Halo 3" }, ... ] */
    void load_json(const std::filesystem::path& json_path);
    void load_json_string(const std::string& json_string);

    size_t size() const { return titles_.size(); };

private:
    std::unordered_map<uint32_t, std::string> titles_;
};

#endif // _TITLE_CATALOG_H_
